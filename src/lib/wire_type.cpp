#include <bdt/wire_type.hpp>

#include <stdexcept>
#include <string>

namespace bdt {

  std::string_view
  to_string(wire_type type) {
    switch (type) {
      case wire_type::end_of_document:
        return "end_of_document";
      case wire_type::double_:
        return "double";
      case wire_type::string:
        return "string";
      case wire_type::document:
        return "document";
      case wire_type::array:
        return "array";
      case wire_type::date_time:
        return "date_time";
      case wire_type::int32:
        return "int32";
      case wire_type::int64:
        return "int64";
    }
    return "unknown";
  }

  wire_type
  parse_wire_type(std::string_view name) {
    static constexpr wire_type all[] = {
        wire_type::end_of_document, wire_type::double_,   wire_type::string,
        wire_type::document,        wire_type::array,     wire_type::date_time,
        wire_type::int32,           wire_type::int64,
    };
    for (auto type : all) {
      if (to_string(type) == name) { return type; }
    }
    throw std::invalid_argument("unknown wire type: " + std::string(name));
  }

} // namespace bdt
