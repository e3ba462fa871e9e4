#include <bdt/time_only_codec.hpp>

#include "codec_support.hpp"

#include <string>

namespace bdt {

  namespace {

    constexpr const char* codec_name = "time_only_codec";

    template <typename T>
    time_only
    from_units(T value, time_unit unit) {
      return detail::decode_value(
          codec_name, [&] { return time_only(to_ticks(value, unit)); });
    }

  } // namespace

  time_only_codec::time_only_codec(wire_type representation, time_unit unit)
      : representation_(representation), unit_(unit) {
    switch (representation) {
      case wire_type::double_:
      case wire_type::int32:
      case wire_type::int64:
      case wire_type::string:
        break;
      default:
        detail::throw_bad_representation(codec_name, "time_only",
                                         representation);
    }
    if (unit > time_unit::days) {
      throw configuration_error("invalid time unit for a time_only_codec: " +
                                std::to_string(static_cast<int>(unit)));
    }
  }

  const std::shared_ptr<const time_only_codec>&
  time_only_codec::instance() {
    static const std::shared_ptr<const time_only_codec> default_instance =
        std::make_shared<const time_only_codec>();
    return default_instance;
  }

  wire_type
  time_only_codec::representation() const {
    return representation_;
  }

  time_unit
  time_only_codec::unit() const {
    return unit_;
  }

  time_only_codec
  time_only_codec::with_representation(wire_type representation) const {
    return time_only_codec(representation, unit_);
  }

  void
  time_only_codec::serialize(document_writer& writer,
                             const time_only& value) const {
    switch (representation_) {
      case wire_type::double_:
        writer.write_double(from_ticks<double>(value.ticks(), unit_));
        break;
      case wire_type::int32:
        writer.write_int32(from_ticks<int32_t>(value.ticks(), unit_));
        break;
      case wire_type::int64:
        writer.write_int64(from_ticks<int64_t>(value.ticks(), unit_));
        break;
      case wire_type::string:
        writer.write_string(value.to_time_span().to_string());
        break;
      default:
        throw encode_error("'" + std::string(to_string(representation_)) +
                           "' is not a valid time_only representation");
    }
  }

  time_only
  time_only_codec::deserialize(document_reader& reader) const {
    auto type = reader.current_type();
    switch (type) {
      case wire_type::double_:
        return from_units(reader.read_double(), unit_);
      case wire_type::int32:
        return from_units(reader.read_int32(), unit_);
      case wire_type::int64:
        return from_units(reader.read_int64(), unit_);
      case wire_type::string: {
        auto text = reader.read_string();
        return detail::decode_value(codec_name, [&] {
          return time_only::from_time_span(time_span(text));
        });
      }
      default:
        detail::throw_type_mismatch(codec_name, "time_only", type);
    }
  }

} // namespace bdt
