#include <bdt/offset_date_time_codec.hpp>
#include <bdt/standard_offset_date_time_codec.hpp>

#include "codec_support.hpp"

#include <string>
#include <utility>

namespace bdt {

  namespace {

    constexpr const char* codec_name = "offset_date_time_codec";

    void
    validate(wire_type representation) {
      switch (representation) {
        case wire_type::date_time:
        case wire_type::array:
        case wire_type::document:
        case wire_type::string:
          return;
        default:
          detail::throw_bad_representation(codec_name, "offset_date_time",
                                           representation);
      }
    }

    // The standard codec for `representation`, or its default when the
    // datetime form is handled here.
    std::shared_ptr<const codec<offset_date_time>>
    default_base(wire_type representation) {
      if (representation == wire_type::date_time) {
        return standard_offset_date_time_codec::instance();
      }
      return std::make_shared<const standard_offset_date_time_codec>(
          representation);
    }

    offset_date_time
    from_instant(int64_t millis) {
      if (millis < offset_date_time::min_unix_millis) {
        return offset_date_time::min_value();
      }
      if (millis > offset_date_time::max_unix_millis) {
        throw decode_value_error(std::string(codec_name) +
                                 ": datetime out of range: " +
                                 std::to_string(millis));
      }
      return offset_date_time::from_unix_milliseconds(millis);
    }

  } // namespace

  offset_date_time_codec::offset_date_time_codec(wire_type representation)
      : representation_(representation) {
    validate(representation);
    base_ = default_base(representation);
  }

  offset_date_time_codec::offset_date_time_codec(
      wire_type representation,
      std::shared_ptr<const codec<offset_date_time>> base)
      : representation_(representation), base_(std::move(base)),
        base_injected_(true) {
    validate(representation);
    if (!base_) {
      throw configuration_error(std::string(codec_name) + ": null base codec");
    }
  }

  const std::shared_ptr<const offset_date_time_codec>&
  offset_date_time_codec::instance() {
    static const std::shared_ptr<const offset_date_time_codec>
        default_instance = std::make_shared<const offset_date_time_codec>();
    return default_instance;
  }

  wire_type
  offset_date_time_codec::representation() const {
    return representation_;
  }

  const std::shared_ptr<const codec<offset_date_time>>&
  offset_date_time_codec::base() const {
    return base_;
  }

  offset_date_time_codec
  offset_date_time_codec::with_representation(wire_type representation) const {
    if (base_injected_) { return offset_date_time_codec(representation, base_); }
    return offset_date_time_codec(representation);
  }

  void
  offset_date_time_codec::serialize(document_writer& writer,
                                    const offset_date_time& value) const {
    if (representation_ == wire_type::date_time) {
      writer.write_date_time(value.to_unix_milliseconds());
      return;
    }
    base_->serialize(writer, value);
  }

  offset_date_time
  offset_date_time_codec::deserialize(document_reader& reader) const {
    if (reader.current_type() == wire_type::date_time) {
      return from_instant(reader.read_date_time());
    }
    return base_->deserialize(reader);
  }

} // namespace bdt
