#pragma once

#include <bdt/wire_type.hpp>

#include <cstdint>
#include <string>

namespace bdt {

  // Cursor over a document value. Every read_* call consumes the value at
  // the cursor and throws decode_type_mismatch when it has another type.
  class document_reader {
  public:
    virtual ~document_reader() = default;

    // Type of the value at the cursor.
    virtual wire_type
    current_type() const = 0;

    // Advances to the next element of the enclosing document or array and
    // returns its type, or wire_type::end_of_document when exhausted.
    virtual wire_type
    read_type() = 0;

    // Name of the current document field. Valid after read_type().
    virtual std::string
    read_name() = 0;

    virtual void
    read_start_document() = 0;

    virtual void
    read_end_document() = 0;

    virtual void
    read_start_array() = 0;

    virtual void
    read_end_array() = 0;

    virtual int32_t
    read_int32() = 0;

    virtual int64_t
    read_int64() = 0;

    virtual double
    read_double() = 0;

    virtual std::string
    read_string() = 0;

    // Milliseconds since the Unix epoch, UTC.
    virtual int64_t
    read_date_time() = 0;

    // Consumes the value at the cursor, including any children.
    virtual void
    skip_value() = 0;
  };

} // namespace bdt
