#include <bdt/value_writer.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace bdt {

  struct value_writer::impl {
    struct frame {
      // Open document or array. Stays valid while it is the innermost open
      // container: nothing is appended to its parent until it is closed.
      document_value* container;
      std::optional<std::string> pending_name;
    };

    document_value root;
    bool root_written = false;
    std::vector<frame> stack;

    document_value*
    add(document_value value) {
      if (stack.empty()) {
        if (root_written) {
          throw std::logic_error("value_writer: root value already written");
        }
        root = std::move(value);
        root_written = true;
        return &root;
      }

      auto& top = stack.back();
      if (top.container->type() == wire_type::document) {
        if (!top.pending_name) {
          throw std::logic_error("value_writer: field name required");
        }
        auto& doc = top.container->as_document();
        doc.push_back({std::move(*top.pending_name), std::move(value)});
        top.pending_name.reset();
        return &doc.back().value;
      }

      auto& arr = top.container->as_array();
      arr.push_back(std::move(value));
      return &arr.back();
    }

    void
    close(wire_type type) {
      if (stack.empty() || stack.back().container->type() != type) {
        throw std::logic_error("value_writer: no open " +
                               std::string(to_string(type)));
      }
      if (stack.back().pending_name) {
        throw std::logic_error("value_writer: name without value");
      }
      stack.pop_back();
    }
  };

  value_writer::value_writer() : impl_(std::make_unique<impl>()) {}

  value_writer::~value_writer() = default;
  value_writer::value_writer(value_writer&&) noexcept = default;
  value_writer&
  value_writer::operator=(value_writer&&) noexcept = default;

  void
  value_writer::write_start_document() {
    impl_->stack.push_back({impl_->add(document{}), std::nullopt});
  }

  void
  value_writer::write_end_document() {
    impl_->close(wire_type::document);
  }

  void
  value_writer::write_start_array() {
    impl_->stack.push_back({impl_->add(array{}), std::nullopt});
  }

  void
  value_writer::write_end_array() {
    impl_->close(wire_type::array);
  }

  void
  value_writer::write_name(std::string_view name) {
    if (impl_->stack.empty() ||
        impl_->stack.back().container->type() != wire_type::document) {
      throw std::logic_error("value_writer: name outside of a document");
    }
    if (impl_->stack.back().pending_name) {
      throw std::logic_error("value_writer: name already written");
    }
    impl_->stack.back().pending_name = std::string(name);
  }

  void
  value_writer::write_int32(int32_t value) {
    impl_->add(value);
  }

  void
  value_writer::write_int64(int64_t value) {
    impl_->add(value);
  }

  void
  value_writer::write_double(double value) {
    impl_->add(value);
  }

  void
  value_writer::write_string(std::string_view value) {
    impl_->add(value);
  }

  void
  value_writer::write_date_time(int64_t millis) {
    impl_->add(utc_date_time{millis});
  }

  bool
  value_writer::done() const {
    return impl_->root_written && impl_->stack.empty();
  }

  const document_value&
  value_writer::value() const {
    if (!done()) {
      throw std::logic_error("value_writer: value is not complete");
    }
    return impl_->root;
  }

} // namespace bdt
