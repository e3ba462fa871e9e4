#include <bdt/value_reader.hpp>
#include <bdt/xml_document_reader.hpp>

#include "xml_text.hpp"

#include <expat.h>

#include <cstring>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace bdt {

  namespace {

    bool
    is_whitespace(std::string_view text) {
      for (char c : text) {
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r') return false;
      }
      return true;
    }

    document_value
    parse_scalar(wire_type type, const std::string& text) {
      switch (type) {
        case wire_type::double_:
          return detail::parse_double(text);
        case wire_type::string:
          return text;
        case wire_type::date_time:
          return utc_date_time{detail::parse_integer<int64_t>(text)};
        case wire_type::int32:
          return detail::parse_integer<int32_t>(text);
        case wire_type::int64:
          return detail::parse_integer<int64_t>(text);
        default:
          break;
      }
      throw std::runtime_error("not a scalar type: " +
                               std::string(to_string(type)));
    }

    // Builds a document_value from expat callbacks. Errors are recorded and
    // parsing is stopped; exceptions must not cross the C parser.
    struct tree_builder {
      struct node {
        wire_type type;
        std::optional<std::string> name;
        std::string text;
        document_value value;
      };

      XML_Parser parser = nullptr;
      std::vector<node> stack;
      std::optional<document_value> root;
      std::string error;

      void
      fail(std::string message) {
        if (error.empty()) { error = std::move(message); }
        XML_StopParser(parser, XML_FALSE);
      }

      static void XMLCALL
      on_start_element(void* user_data, const char* name, const char** atts) {
        auto* self = static_cast<tree_builder*>(user_data);
        if (!self->error.empty()) return;

        node n;
        try {
          n.type = parse_wire_type(name);
        } catch (const std::invalid_argument& e) {
          self->fail(e.what());
          return;
        }
        if (n.type == wire_type::end_of_document) {
          self->fail("unknown element: " + std::string(name));
          return;
        }
        if (!self->stack.empty() &&
            self->stack.back().type != wire_type::document &&
            self->stack.back().type != wire_type::array) {
          self->fail("element inside scalar <" +
                     std::string(to_string(self->stack.back().type)) + ">");
          return;
        }

        for (const char** p = atts; *p != nullptr; p += 2) {
          if (std::strcmp(p[0], "name") == 0) {
            n.name = std::string(p[1]);
          } else {
            self->fail("unexpected attribute: " + std::string(p[0]));
            return;
          }
        }
        if (!self->stack.empty() &&
            self->stack.back().type == wire_type::document && !n.name) {
          self->fail("document field without a name");
          return;
        }

        if (n.type == wire_type::array) { n.value = array{}; }
        self->stack.push_back(std::move(n));
      }

      static void XMLCALL
      on_end_element(void* user_data, const char* /*name*/) {
        auto* self = static_cast<tree_builder*>(user_data);
        if (!self->error.empty()) return;

        node n = std::move(self->stack.back());
        self->stack.pop_back();

        document_value value;
        if (n.type == wire_type::document || n.type == wire_type::array) {
          value = std::move(n.value);
        } else {
          try {
            value = parse_scalar(n.type, n.text);
          } catch (const std::runtime_error& e) {
            self->fail(e.what());
            return;
          }
        }

        if (self->stack.empty()) {
          self->root = std::move(value);
          return;
        }
        auto& parent = self->stack.back();
        if (parent.type == wire_type::document) {
          parent.value.as_document().push_back(
              {std::move(*n.name), std::move(value)});
        } else {
          parent.value.as_array().push_back(std::move(value));
        }
      }

      static void XMLCALL
      on_character_data(void* user_data, const char* s, int len) {
        auto* self = static_cast<tree_builder*>(user_data);
        if (!self->error.empty() || self->stack.empty()) return;

        auto& top = self->stack.back();
        std::string_view text(s, static_cast<std::size_t>(len));
        if (top.type == wire_type::document || top.type == wire_type::array) {
          if (!is_whitespace(text)) {
            self->fail("text inside <" + std::string(to_string(top.type)) +
                       ">");
          }
          return;
        }
        top.text.append(text);
      }
    };

  } // namespace

  document_value
  parse_xml_document(std::string_view xml) {
    tree_builder builder;
    builder.parser = XML_ParserCreate(nullptr);
    if (builder.parser == nullptr) {
      throw std::runtime_error("failed to create expat parser");
    }

    XML_SetUserData(builder.parser, &builder);
    XML_SetElementHandler(builder.parser, tree_builder::on_start_element,
                          tree_builder::on_end_element);
    XML_SetCharacterDataHandler(builder.parser,
                                tree_builder::on_character_data);

    XML_Status status = XML_Parse(builder.parser, xml.data(),
                                  static_cast<int>(xml.size()), XML_TRUE);

    if (!builder.error.empty()) {
      std::string msg = "document parse error at line ";
      msg += std::to_string(XML_GetCurrentLineNumber(builder.parser));
      msg += ": ";
      msg += builder.error;
      XML_ParserFree(builder.parser);
      throw std::runtime_error(msg);
    }

    if (status == XML_STATUS_ERROR) {
      std::string msg = "XML parse error at line ";
      msg += std::to_string(XML_GetCurrentLineNumber(builder.parser));
      msg += ": ";
      msg += XML_ErrorString(XML_GetErrorCode(builder.parser));
      XML_ParserFree(builder.parser);
      throw std::runtime_error(msg);
    }

    XML_ParserFree(builder.parser);

    if (!builder.root) {
      throw std::runtime_error("XML parse error: no content");
    }
    return std::move(*builder.root);
  }

  struct xml_document_reader::impl {
    document_value root;
    value_reader cursor;

    explicit impl(std::string_view xml)
        : root(parse_xml_document(xml)), cursor(root) {}
  };

  xml_document_reader::xml_document_reader(std::string_view xml)
      : impl_(std::make_unique<impl>(xml)) {}

  xml_document_reader::~xml_document_reader() = default;
  xml_document_reader::xml_document_reader(xml_document_reader&&) noexcept =
      default;
  xml_document_reader&
  xml_document_reader::operator=(xml_document_reader&&) noexcept = default;

  const document_value&
  xml_document_reader::root() const {
    return impl_->root;
  }

  wire_type
  xml_document_reader::current_type() const {
    return impl_->cursor.current_type();
  }

  wire_type
  xml_document_reader::read_type() {
    return impl_->cursor.read_type();
  }

  std::string
  xml_document_reader::read_name() {
    return impl_->cursor.read_name();
  }

  void
  xml_document_reader::read_start_document() {
    impl_->cursor.read_start_document();
  }

  void
  xml_document_reader::read_end_document() {
    impl_->cursor.read_end_document();
  }

  void
  xml_document_reader::read_start_array() {
    impl_->cursor.read_start_array();
  }

  void
  xml_document_reader::read_end_array() {
    impl_->cursor.read_end_array();
  }

  int32_t
  xml_document_reader::read_int32() {
    return impl_->cursor.read_int32();
  }

  int64_t
  xml_document_reader::read_int64() {
    return impl_->cursor.read_int64();
  }

  double
  xml_document_reader::read_double() {
    return impl_->cursor.read_double();
  }

  std::string
  xml_document_reader::read_string() {
    return impl_->cursor.read_string();
  }

  int64_t
  xml_document_reader::read_date_time() {
    return impl_->cursor.read_date_time();
  }

  void
  xml_document_reader::skip_value() {
    impl_->cursor.skip_value();
  }

} // namespace bdt
