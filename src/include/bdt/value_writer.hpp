#pragma once

#include <bdt/document_value.hpp>
#include <bdt/document_writer.hpp>

#include <memory>

namespace bdt {

  // Builds a document_value in memory. The root may be a scalar.
  class value_writer : public document_writer {
  public:
    value_writer();
    ~value_writer() override;

    value_writer(const value_writer&) = delete;
    value_writer&
    operator=(const value_writer&) = delete;
    value_writer(value_writer&&) noexcept;
    value_writer&
    operator=(value_writer&&) noexcept;

    using document_writer::write_date_time;
    using document_writer::write_double;
    using document_writer::write_int32;
    using document_writer::write_int64;
    using document_writer::write_string;

    void
    write_start_document() override;

    void
    write_end_document() override;

    void
    write_start_array() override;

    void
    write_end_array() override;

    void
    write_name(std::string_view name) override;

    void
    write_int32(int32_t value) override;

    void
    write_int64(int64_t value) override;

    void
    write_double(double value) override;

    void
    write_string(std::string_view value) override;

    void
    write_date_time(int64_t millis) override;

    // True once a complete root value has been written.
    bool
    done() const;

    // The written root value; throws std::logic_error if not done().
    const document_value&
    value() const;

  private:
    struct impl;
    std::unique_ptr<impl> impl_;
  };

} // namespace bdt
