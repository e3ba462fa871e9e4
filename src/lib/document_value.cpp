#include <bdt/document_value.hpp>
#include <bdt/errors.hpp>

#include <string>

namespace bdt {

  namespace {

    [[noreturn]] void
    type_mismatch(wire_type expected, wire_type actual) {
      throw decode_type_mismatch("expected " + std::string(to_string(expected)) +
                                 " but found " + std::string(to_string(actual)));
    }

    template <typename T>
    const T&
    get_as(const document_value::variant_type& value, wire_type expected,
           wire_type actual) {
      const T* p = std::get_if<T>(&value);
      if (p == nullptr) { type_mismatch(expected, actual); }
      return *p;
    }

  } // namespace

  wire_type
  document_value::type() const {
    switch (value_.index()) {
      case 0:
        return wire_type::double_;
      case 1:
        return wire_type::string;
      case 2:
        return wire_type::document;
      case 3:
        return wire_type::array;
      case 4:
        return wire_type::date_time;
      case 5:
        return wire_type::int32;
      default:
        return wire_type::int64;
    }
  }

  double
  document_value::as_double() const {
    return get_as<double>(value_, wire_type::double_, type());
  }

  const std::string&
  document_value::as_string() const {
    return get_as<std::string>(value_, wire_type::string, type());
  }

  const document&
  document_value::as_document() const {
    return get_as<document>(value_, wire_type::document, type());
  }

  document&
  document_value::as_document() {
    auto* p = std::get_if<document>(&value_);
    if (p == nullptr) { type_mismatch(wire_type::document, type()); }
    return *p;
  }

  const array&
  document_value::as_array() const {
    return get_as<array>(value_, wire_type::array, type());
  }

  array&
  document_value::as_array() {
    auto* p = std::get_if<array>(&value_);
    if (p == nullptr) { type_mismatch(wire_type::array, type()); }
    return *p;
  }

  utc_date_time
  document_value::as_date_time() const {
    return get_as<utc_date_time>(value_, wire_type::date_time, type());
  }

  int32_t
  document_value::as_int32() const {
    return get_as<int32_t>(value_, wire_type::int32, type());
  }

  int64_t
  document_value::as_int64() const {
    return get_as<int64_t>(value_, wire_type::int64, type());
  }

  const document_value::variant_type&
  document_value::variant() const {
    return value_;
  }

  bool
  document_value::operator==(const document_value& other) const {
    return value_ == other.value_;
  }

} // namespace bdt
