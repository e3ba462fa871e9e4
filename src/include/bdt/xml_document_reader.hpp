#pragma once

#include <bdt/document_reader.hpp>
#include <bdt/document_value.hpp>

#include <memory>
#include <string_view>

namespace bdt {

  // Parses the XML text form written by xml_document_writer and reads it
  // back through the document_reader protocol.
  class xml_document_reader : public document_reader {
  public:
    explicit xml_document_reader(std::string_view xml);
    ~xml_document_reader() override;

    xml_document_reader(const xml_document_reader&) = delete;
    xml_document_reader&
    operator=(const xml_document_reader&) = delete;
    xml_document_reader(xml_document_reader&&) noexcept;
    xml_document_reader&
    operator=(xml_document_reader&&) noexcept;

    // The whole parsed value.
    const document_value&
    root() const;

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

  // Parses the XML text form into a value tree.
  document_value
  parse_xml_document(std::string_view xml);

} // namespace bdt
