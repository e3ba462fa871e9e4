#include <bdt/standard_offset_date_time_codec.hpp>
#include <bdt/time_units.hpp>

#include "codec_support.hpp"

#include <optional>
#include <string>

namespace bdt {

  namespace {

    constexpr const char* codec_name = "standard_offset_date_time_codec";

    [[noreturn]] void
    malformed(const std::string& detail) {
      throw decode_value_error(std::string(codec_name) + ": " + detail);
    }

    offset_date_time
    make_value(int64_t local_ticks, int32_t offset_minutes) {
      if (offset_minutes < -offset_date_time::max_offset_minutes ||
          offset_minutes > offset_date_time::max_offset_minutes) {
        malformed("offset out of range: " + std::to_string(offset_minutes));
      }
      return detail::decode_value(codec_name, [&] {
        return offset_date_time::from_local_ticks(
            local_ticks, static_cast<int16_t>(offset_minutes));
      });
    }

    void
    expect_element(document_reader& reader, wire_type expected,
                   const char* what) {
      auto type = reader.read_type();
      if (type == wire_type::end_of_document) {
        malformed(std::string("array has no ") + what + " element");
      }
      if (type != expected) {
        malformed(std::string(what) + " element is a " +
                  std::string(to_string(type)) + ", expected " +
                  std::string(to_string(expected)));
      }
    }

    offset_date_time
    read_array(document_reader& reader) {
      reader.read_start_array();
      expect_element(reader, wire_type::int64, "ticks");
      int64_t ticks = reader.read_int64();
      expect_element(reader, wire_type::int32, "offset");
      int32_t offset = reader.read_int32();
      if (reader.read_type() != wire_type::end_of_document) {
        malformed("array has more than two elements");
      }
      reader.read_end_array();
      return make_value(ticks, offset);
    }

    template <typename T>
    void
    assign_once(std::optional<T>& slot, T value, const std::string& name) {
      if (slot) { malformed("duplicate field '" + name + "'"); }
      slot = value;
    }

    void
    expect_field_type(document_reader& reader, const std::string& name,
                      wire_type expected) {
      if (reader.current_type() != expected) {
        malformed("field '" + name + "' is a " +
                  std::string(to_string(reader.current_type())) +
                  ", expected " + std::string(to_string(expected)));
      }
    }

    offset_date_time
    read_document(document_reader& reader) {
      reader.read_start_document();

      std::optional<int64_t> date_time;
      std::optional<int64_t> ticks;
      std::optional<int32_t> offset;
      while (reader.read_type() != wire_type::end_of_document) {
        auto name = reader.read_name();
        if (name == "DateTime") {
          // Required but not read back; Ticks and Offset carry the value.
          expect_field_type(reader, name, wire_type::date_time);
          assign_once(date_time, reader.read_date_time(), name);
        } else if (name == "Ticks") {
          expect_field_type(reader, name, wire_type::int64);
          assign_once(ticks, reader.read_int64(), name);
        } else if (name == "Offset") {
          expect_field_type(reader, name, wire_type::int32);
          assign_once(offset, reader.read_int32(), name);
        } else {
          malformed("unexpected field '" + name + "'");
        }
      }

      reader.read_end_document();

      if (!date_time) { malformed("document has no 'DateTime' field"); }
      if (!ticks) { malformed("document has no 'Ticks' field"); }
      if (!offset) { malformed("document has no 'Offset' field"); }
      return make_value(*ticks, *offset);
    }

  } // namespace

  standard_offset_date_time_codec::standard_offset_date_time_codec(
      wire_type representation)
      : representation_(representation) {
    switch (representation) {
      case wire_type::array:
      case wire_type::document:
      case wire_type::string:
        break;
      default:
        detail::throw_bad_representation(codec_name, "offset_date_time",
                                         representation);
    }
  }

  const std::shared_ptr<const standard_offset_date_time_codec>&
  standard_offset_date_time_codec::instance() {
    static const std::shared_ptr<const standard_offset_date_time_codec>
        default_instance =
            std::make_shared<const standard_offset_date_time_codec>();
    return default_instance;
  }

  wire_type
  standard_offset_date_time_codec::representation() const {
    return representation_;
  }

  standard_offset_date_time_codec
  standard_offset_date_time_codec::with_representation(
      wire_type representation) const {
    return standard_offset_date_time_codec(representation);
  }

  void
  standard_offset_date_time_codec::serialize(
      document_writer& writer, const offset_date_time& value) const {
    switch (representation_) {
      case wire_type::array:
        writer.write_start_array();
        writer.write_int64(value.local_ticks());
        writer.write_int32(value.offset_minutes());
        writer.write_end_array();
        break;
      case wire_type::document:
        writer.write_start_document();
        writer.write_date_time("DateTime", value.to_unix_milliseconds());
        writer.write_int64("Ticks", value.local_ticks());
        writer.write_int32("Offset", value.offset_minutes());
        writer.write_end_document();
        break;
      case wire_type::string:
        writer.write_string(value.to_string());
        break;
      default:
        throw encode_error("'" + std::string(to_string(representation_)) +
                           "' is not a valid offset_date_time representation");
    }
  }

  offset_date_time
  standard_offset_date_time_codec::deserialize(document_reader& reader) const {
    auto type = reader.current_type();
    switch (type) {
      case wire_type::array:
        return read_array(reader);
      case wire_type::document:
        return read_document(reader);
      case wire_type::string: {
        auto text = reader.read_string();
        return detail::decode_value(codec_name,
                                    [&] { return offset_date_time(text); });
      }
      default:
        detail::throw_type_mismatch(codec_name, "offset_date_time", type);
    }
  }

} // namespace bdt
