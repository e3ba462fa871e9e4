#include <bdt/errors.hpp>
#include <bdt/value_reader.hpp>

#include <stdexcept>
#include <string>
#include <vector>

namespace bdt {

  namespace {

    enum class cursor_state {
      at_value,       // a value is at the cursor
      before_element, // inside a container, read_type() not yet called
      at_end,         // read_type() reached the end of the container
      done,           // the root value has been consumed
    };

  } // namespace

  struct value_reader::impl {
    struct frame {
      const document_value* container;
      std::size_t next = 0;
    };

    const document_value* current;
    std::string current_name;
    cursor_state state = cursor_state::at_value;
    std::vector<frame> stack;

    explicit impl(const document_value& root) : current(&root) {}

    const document_value&
    expect_value(wire_type expected) {
      if (state != cursor_state::at_value) {
        throw std::logic_error("value_reader: no value at the cursor");
      }
      if (current->type() != expected) {
        throw decode_type_mismatch(
            "expected " + std::string(to_string(expected)) + " but found " +
            std::string(to_string(current->type())));
      }
      return *current;
    }

    // The value at the cursor has been read.
    void
    consume() {
      current = nullptr;
      state = stack.empty() ? cursor_state::done : cursor_state::before_element;
    }

    void
    enter(wire_type type) {
      const auto& value = expect_value(type);
      stack.push_back({&value});
      current = nullptr;
      state = cursor_state::before_element;
    }

    void
    leave(wire_type type) {
      if (stack.empty() || stack.back().container->type() != type) {
        throw std::logic_error("value_reader: not inside a " +
                               std::string(to_string(type)));
      }
      if (state != cursor_state::at_end) {
        throw std::logic_error("value_reader: unread elements remain");
      }
      stack.pop_back();
      consume();
    }
  };

  value_reader::value_reader(const document_value& root)
      : impl_(std::make_unique<impl>(root)) {}

  value_reader::~value_reader() = default;
  value_reader::value_reader(value_reader&&) noexcept = default;
  value_reader&
  value_reader::operator=(value_reader&&) noexcept = default;

  wire_type
  value_reader::current_type() const {
    switch (impl_->state) {
      case cursor_state::at_value:
        return impl_->current->type();
      case cursor_state::before_element:
        throw std::logic_error("value_reader: call read_type() first");
      case cursor_state::at_end:
      case cursor_state::done:
        break;
    }
    return wire_type::end_of_document;
  }

  wire_type
  value_reader::read_type() {
    if (impl_->stack.empty()) {
      throw std::logic_error("value_reader: not inside a container");
    }
    if (impl_->state == cursor_state::at_value) {
      throw std::logic_error("value_reader: current value not consumed");
    }
    if (impl_->state == cursor_state::at_end) {
      return wire_type::end_of_document;
    }

    auto& top = impl_->stack.back();
    const document_value& container = *top.container;
    if (container.type() == wire_type::document) {
      const auto& doc = container.as_document();
      if (top.next == doc.size()) {
        impl_->state = cursor_state::at_end;
        return wire_type::end_of_document;
      }
      impl_->current_name = doc[top.next].name;
      impl_->current = &doc[top.next].value;
    } else {
      const auto& arr = container.as_array();
      if (top.next == arr.size()) {
        impl_->state = cursor_state::at_end;
        return wire_type::end_of_document;
      }
      impl_->current_name = std::to_string(top.next);
      impl_->current = &arr[top.next];
    }
    ++top.next;
    impl_->state = cursor_state::at_value;
    return impl_->current->type();
  }

  std::string
  value_reader::read_name() {
    if (impl_->state != cursor_state::at_value || impl_->stack.empty() ||
        impl_->stack.back().container->type() != wire_type::document) {
      throw std::logic_error("value_reader: no document field at the cursor");
    }
    return impl_->current_name;
  }

  void
  value_reader::read_start_document() {
    impl_->enter(wire_type::document);
  }

  void
  value_reader::read_end_document() {
    impl_->leave(wire_type::document);
  }

  void
  value_reader::read_start_array() {
    impl_->enter(wire_type::array);
  }

  void
  value_reader::read_end_array() {
    impl_->leave(wire_type::array);
  }

  int32_t
  value_reader::read_int32() {
    auto value = impl_->expect_value(wire_type::int32).as_int32();
    impl_->consume();
    return value;
  }

  int64_t
  value_reader::read_int64() {
    auto value = impl_->expect_value(wire_type::int64).as_int64();
    impl_->consume();
    return value;
  }

  double
  value_reader::read_double() {
    auto value = impl_->expect_value(wire_type::double_).as_double();
    impl_->consume();
    return value;
  }

  std::string
  value_reader::read_string() {
    auto value = impl_->expect_value(wire_type::string).as_string();
    impl_->consume();
    return value;
  }

  int64_t
  value_reader::read_date_time() {
    auto value = impl_->expect_value(wire_type::date_time).as_date_time();
    impl_->consume();
    return value.millis;
  }

  void
  value_reader::skip_value() {
    if (impl_->state != cursor_state::at_value) {
      throw std::logic_error("value_reader: no value at the cursor");
    }
    impl_->consume();
  }

} // namespace bdt
