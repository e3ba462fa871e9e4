#pragma once

#include <bdt/codec.hpp>
#include <bdt/offset_date_time.hpp>

#include <memory>

namespace bdt {

  // offset_date_time as a UTC datetime. The datetime form carries only the
  // instant: it is written without the offset and read back with offset
  // zero. Every other representation and wire type is handled by a base
  // codec, by default a standard_offset_date_time_codec.
  class offset_date_time_codec final : public codec<offset_date_time> {
    wire_type representation_;
    std::shared_ptr<const codec<offset_date_time>> base_;
    bool base_injected_ = false;

  public:
    // Throws configuration_error unless representation is date_time, array,
    // document or string.
    explicit offset_date_time_codec(
        wire_type representation = wire_type::date_time);

    // Uses `base` for everything but the datetime form. Throws
    // configuration_error on a bad representation or a null base.
    offset_date_time_codec(wire_type representation,
                           std::shared_ptr<const codec<offset_date_time>> base);

    static const std::shared_ptr<const offset_date_time_codec>&
    instance();

    wire_type
    representation() const;

    const std::shared_ptr<const codec<offset_date_time>>&
    base() const;

    // Keeps an injected base; otherwise builds a default base for the new
    // representation.
    offset_date_time_codec
    with_representation(wire_type representation) const;

    void
    serialize(document_writer& writer,
              const offset_date_time& value) const override;

    offset_date_time
    deserialize(document_reader& reader) const override;
  };

} // namespace bdt
