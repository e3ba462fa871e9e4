#pragma once

#include <bdt/wire_type.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace bdt {

  class document_value;
  struct document_field;

  // Fields keep their written order; names are not required to be unique.
  using document = std::vector<document_field>;
  using array = std::vector<document_value>;

  // Milliseconds since the Unix epoch, UTC.
  struct utc_date_time {
    int64_t millis = 0;

    bool
    operator==(const utc_date_time&) const = default;
  };

  class document_value {
  public:
    using variant_type = std::variant<double, std::string, document, array,
                                      utc_date_time, int32_t, int64_t>;

  private:
    variant_type value_;

  public:
    document_value() : value_(document{}) {}
    document_value(double value) : value_(value) {}
    document_value(std::string value) : value_(std::move(value)) {}
    document_value(std::string_view value) : value_(std::string(value)) {}
    document_value(const char* value) : value_(std::string(value)) {}
    document_value(document value) : value_(std::move(value)) {}
    document_value(array value) : value_(std::move(value)) {}
    document_value(utc_date_time value) : value_(value) {}
    document_value(int32_t value) : value_(value) {}
    document_value(int64_t value) : value_(value) {}

    wire_type
    type() const;

    // Typed accessors throw decode_type_mismatch on the wrong type.
    double
    as_double() const;
    const std::string&
    as_string() const;
    const document&
    as_document() const;
    document&
    as_document();
    const array&
    as_array() const;
    array&
    as_array();
    utc_date_time
    as_date_time() const;
    int32_t
    as_int32() const;
    int64_t
    as_int64() const;

    const variant_type&
    variant() const;

    bool
    operator==(const document_value& other) const;
  };

  struct document_field {
    std::string name;
    document_value value;

    bool
    operator==(const document_field&) const = default;
  };

} // namespace bdt
