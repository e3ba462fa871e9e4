#pragma once

#include <cstdint>
#include <ostream>
#include <string_view>

namespace bdt {

  // Primitive kinds of the document format. Doubles as the representation
  // selector of every codec.
  enum class wire_type : uint8_t {
    end_of_document,
    double_,
    string,
    document,
    array,
    date_time,
    int32,
    int64,
  };

  std::string_view
  to_string(wire_type type);

  // Inverse of to_string; throws std::invalid_argument for unknown names.
  wire_type
  parse_wire_type(std::string_view name);

  inline std::ostream&
  operator<<(std::ostream& os, wire_type type) {
    return os << to_string(type);
  }

} // namespace bdt
