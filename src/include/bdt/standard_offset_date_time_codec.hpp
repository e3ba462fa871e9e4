#pragma once

#include <bdt/codec.hpp>
#include <bdt/offset_date_time.hpp>

#include <memory>

namespace bdt {

  // The offset-preserving encodings of offset_date_time:
  //
  //   array     [local ticks (int64), offset minutes (int32)]
  //   document  {DateTime: utc datetime, Ticks: local ticks, Offset: minutes}
  //   string    "2023-05-09T10:30:00+02:00"
  //
  // Deserialization dispatches on the wire type and accepts all three.
  class standard_offset_date_time_codec final
      : public codec<offset_date_time> {
    wire_type representation_;

  public:
    // Throws configuration_error unless representation is array, document or
    // string.
    explicit standard_offset_date_time_codec(
        wire_type representation = wire_type::array);

    static const std::shared_ptr<const standard_offset_date_time_codec>&
    instance();

    wire_type
    representation() const;

    standard_offset_date_time_codec
    with_representation(wire_type representation) const;

    void
    serialize(document_writer& writer,
              const offset_date_time& value) const override;

    offset_date_time
    deserialize(document_reader& reader) const override;
  };

} // namespace bdt
