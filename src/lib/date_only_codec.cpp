#include <bdt/date_only_codec.hpp>
#include <bdt/offset_date_time.hpp>
#include <bdt/time_units.hpp>

#include "codec_support.hpp"

#include <algorithm>
#include <string>
#include <unordered_map>

namespace bdt {

  namespace {

    constexpr const char* codec_name = "date_only_codec";

    date_only
    read_document(document_reader& reader) {
      reader.read_start_document();

      std::unordered_map<std::string, int32_t> values;
      while (reader.read_type() != wire_type::end_of_document) {
        auto name = reader.read_name();
        if (reader.current_type() != wire_type::int32) {
          throw decode_value_error(std::string(codec_name) + ": field '" +
                                   name + "' is a " +
                                   std::string(to_string(reader.current_type())) +
                                   ", expected int32");
        }
        if (!values.emplace(name, reader.read_int32()).second) {
          throw decode_value_error(std::string(codec_name) +
                                   ": duplicate field '" + name + "'");
        }
      }

      reader.read_end_document();

      for (const char* required : {"Year", "Month", "Day"}) {
        if (!values.contains(required)) {
          throw decode_value_error(std::string(codec_name) +
                                   ": document has no '" + required +
                                   "' field");
        }
      }

      int32_t year = values["Year"];
      int32_t month = values["Month"];
      int32_t day = values["Day"];
      if (month < 1 || month > 12 || day < 1 || day > 31) {
        throw decode_value_error(std::string(codec_name) + ": invalid date " +
                                 std::to_string(year) + "-" +
                                 std::to_string(month) + "-" +
                                 std::to_string(day));
      }
      return detail::decode_value(codec_name, [&] {
        return date_only(year, static_cast<uint8_t>(month),
                         static_cast<uint8_t>(day));
      });
    }

    // Date of a UTC instant. Instants outside the representable range are
    // clamped to it; the time of day is dropped.
    date_only
    date_of_instant(int64_t millis) {
      millis = std::clamp(millis, offset_date_time::min_unix_millis,
                          offset_date_time::max_unix_millis);
      int64_t ticks = millis * ticks_per_millisecond +
                      offset_date_time::unix_epoch_ticks;
      return date_only::from_day_number(
          static_cast<int32_t>(ticks / ticks_per_day));
    }

    int64_t
    midnight_millis(const date_only& value) {
      int64_t ticks = value.day_number() * ticks_per_day;
      return (ticks - offset_date_time::unix_epoch_ticks) /
             ticks_per_millisecond;
    }

  } // namespace

  date_only_codec::date_only_codec(wire_type representation)
      : representation_(representation) {
    switch (representation) {
      case wire_type::int32:
      case wire_type::document:
      case wire_type::string:
      case wire_type::date_time:
        break;
      default:
        detail::throw_bad_representation(codec_name, "date_only",
                                         representation);
    }
  }

  const std::shared_ptr<const date_only_codec>&
  date_only_codec::instance() {
    static const std::shared_ptr<const date_only_codec> default_instance =
        std::make_shared<const date_only_codec>();
    return default_instance;
  }

  wire_type
  date_only_codec::representation() const {
    return representation_;
  }

  date_only_codec
  date_only_codec::with_representation(wire_type representation) const {
    return date_only_codec(representation);
  }

  void
  date_only_codec::serialize(document_writer& writer,
                             const date_only& value) const {
    switch (representation_) {
      case wire_type::document:
        writer.write_start_document();
        writer.write_int32("Year", value.year());
        writer.write_int32("Month", value.month());
        writer.write_int32("Day", value.day());
        writer.write_end_document();
        break;
      case wire_type::string:
        writer.write_string(value.to_string());
        break;
      case wire_type::int32:
        writer.write_int32(value.day_number());
        break;
      case wire_type::date_time:
        writer.write_date_time(midnight_millis(value));
        break;
      default:
        throw encode_error("'" + std::string(to_string(representation_)) +
                           "' is not a valid date_only representation");
    }
  }

  date_only
  date_only_codec::deserialize(document_reader& reader) const {
    auto type = reader.current_type();
    switch (type) {
      case wire_type::document:
        return read_document(reader);
      case wire_type::string: {
        auto text = reader.read_string();
        return detail::decode_value(codec_name,
                                    [&] { return date_only(text); });
      }
      case wire_type::int32: {
        auto day_number = reader.read_int32();
        return detail::decode_value(
            codec_name, [&] { return date_only::from_day_number(day_number); });
      }
      case wire_type::date_time:
        return date_of_instant(reader.read_date_time());
      default:
        detail::throw_type_mismatch(codec_name, "date_only", type);
    }
  }

} // namespace bdt
