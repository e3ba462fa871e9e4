#pragma once

#include <bdt/document_writer.hpp>

#include <memory>
#include <ostream>

namespace bdt {

  // Writes documents in their XML text form:
  //
  //   <document><int32 name="Year">2023</int32></document>
  //
  // Every value is one element named after its wire type. Document fields
  // carry their name in a "name" attribute.
  class xml_document_writer : public document_writer {
  public:
    explicit xml_document_writer(std::ostream& os);
    ~xml_document_writer() override;

    xml_document_writer(const xml_document_writer&) = delete;
    xml_document_writer&
    operator=(const xml_document_writer&) = delete;
    xml_document_writer(xml_document_writer&&) noexcept;
    xml_document_writer&
    operator=(xml_document_writer&&) noexcept;

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

  private:
    struct impl;
    std::unique_ptr<impl> impl_;
  };

} // namespace bdt
