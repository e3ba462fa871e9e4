#include <bdt/xml_document_writer.hpp>
#include <bdt/wire_type.hpp>

#include "xml_text.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace bdt {

  struct xml_document_writer::impl {
    std::ostream& os;

    // Open containers, innermost last.
    std::vector<wire_type> stack;
    std::optional<std::string> pending_name;
    bool root_written = false;

    // A container's start tag is left open until its first child or its end
    // arrives, so an empty container can be self-closing.
    bool tag_pending = false;

    explicit impl(std::ostream& os) : os(os) {}

    void
    close_pending_tag() {
      if (tag_pending) {
        os << '>';
        tag_pending = false;
      }
    }

    // Writes "<tag" plus the name attribute of a document field.
    void
    open_tag(wire_type type) {
      if (stack.empty()) {
        if (root_written) {
          throw std::logic_error(
              "xml_document_writer: root value already written");
        }
        root_written = true;
      } else if (stack.back() == wire_type::document && !pending_name) {
        throw std::logic_error("xml_document_writer: field name required");
      }

      close_pending_tag();
      os << '<' << to_string(type);
      if (pending_name) {
        os << " name=\"";
        detail::escape_xml(os, *pending_name, true);
        os << '"';
        pending_name.reset();
      }
    }

    void
    scalar(wire_type type, std::string_view text) {
      open_tag(type);
      os << '>';
      detail::escape_xml(os, text, false);
      os << "</" << to_string(type) << '>';
    }

    void
    start(wire_type type) {
      open_tag(type);
      stack.push_back(type);
      tag_pending = true;
    }

    void
    end(wire_type type) {
      if (stack.empty() || stack.back() != type) {
        throw std::logic_error("xml_document_writer: no open " +
                               std::string(to_string(type)));
      }
      if (pending_name) {
        throw std::logic_error("xml_document_writer: name without value");
      }
      stack.pop_back();
      if (tag_pending) {
        os << "/>";
        tag_pending = false;
      } else {
        os << "</" << to_string(type) << '>';
      }
    }
  };

  xml_document_writer::xml_document_writer(std::ostream& os)
      : impl_(std::make_unique<impl>(os)) {}

  xml_document_writer::~xml_document_writer() = default;
  xml_document_writer::xml_document_writer(xml_document_writer&&) noexcept =
      default;
  xml_document_writer&
  xml_document_writer::operator=(xml_document_writer&&) noexcept = default;

  void
  xml_document_writer::write_start_document() {
    impl_->start(wire_type::document);
  }

  void
  xml_document_writer::write_end_document() {
    impl_->end(wire_type::document);
  }

  void
  xml_document_writer::write_start_array() {
    impl_->start(wire_type::array);
  }

  void
  xml_document_writer::write_end_array() {
    impl_->end(wire_type::array);
  }

  void
  xml_document_writer::write_name(std::string_view name) {
    if (impl_->stack.empty() || impl_->stack.back() != wire_type::document) {
      throw std::logic_error(
          "xml_document_writer: name outside of a document");
    }
    if (impl_->pending_name) {
      throw std::logic_error("xml_document_writer: name already written");
    }
    impl_->pending_name = std::string(name);
  }

  void
  xml_document_writer::write_int32(int32_t value) {
    impl_->scalar(wire_type::int32, std::to_string(value));
  }

  void
  xml_document_writer::write_int64(int64_t value) {
    impl_->scalar(wire_type::int64, std::to_string(value));
  }

  void
  xml_document_writer::write_double(double value) {
    impl_->scalar(wire_type::double_, detail::format_double(value));
  }

  void
  xml_document_writer::write_string(std::string_view value) {
    impl_->scalar(wire_type::string, value);
  }

  void
  xml_document_writer::write_date_time(int64_t millis) {
    impl_->scalar(wire_type::date_time, std::to_string(millis));
  }

} // namespace bdt
