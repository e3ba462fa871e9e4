#pragma once

#include <cstdint>
#include <string_view>

namespace bdt {

  class document_writer {
  public:
    virtual ~document_writer() = default;

    virtual void
    write_start_document() = 0;

    virtual void
    write_end_document() = 0;

    virtual void
    write_start_array() = 0;

    virtual void
    write_end_array() = 0;

    // Name of the next value; only valid inside a document.
    virtual void
    write_name(std::string_view name) = 0;

    virtual void
    write_int32(int32_t value) = 0;

    virtual void
    write_int64(int64_t value) = 0;

    virtual void
    write_double(double value) = 0;

    virtual void
    write_string(std::string_view value) = 0;

    // Milliseconds since the Unix epoch, UTC.
    virtual void
    write_date_time(int64_t millis) = 0;

    void
    write_int32(std::string_view name, int32_t value) {
      write_name(name);
      write_int32(value);
    }

    void
    write_int64(std::string_view name, int64_t value) {
      write_name(name);
      write_int64(value);
    }

    void
    write_double(std::string_view name, double value) {
      write_name(name);
      write_double(value);
    }

    void
    write_string(std::string_view name, std::string_view value) {
      write_name(name);
      write_string(value);
    }

    void
    write_date_time(std::string_view name, int64_t millis) {
      write_name(name);
      write_date_time(millis);
    }
  };

} // namespace bdt
