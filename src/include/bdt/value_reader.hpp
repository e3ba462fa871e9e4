#pragma once

#include <bdt/document_reader.hpp>
#include <bdt/document_value.hpp>

#include <memory>

namespace bdt {

  // Reads a document_value through the document_reader protocol. The value
  // must outlive the reader.
  class value_reader : public document_reader {
  public:
    explicit value_reader(const document_value& root);
    ~value_reader() override;

    value_reader(const value_reader&) = delete;
    value_reader&
    operator=(const value_reader&) = delete;
    value_reader(value_reader&&) noexcept;
    value_reader&
    operator=(value_reader&&) noexcept;

    wire_type
    current_type() const override;

    wire_type
    read_type() override;

    std::string
    read_name() override;

    void
    read_start_document() override;

    void
    read_end_document() override;

    void
    read_start_array() override;

    void
    read_end_array() override;

    int32_t
    read_int32() override;

    int64_t
    read_int64() override;

    double
    read_double() override;

    std::string
    read_string() override;

    int64_t
    read_date_time() override;

    void
    skip_value() override;

  private:
    struct impl;
    std::unique_ptr<impl> impl_;
  };

} // namespace bdt
