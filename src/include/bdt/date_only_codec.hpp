#pragma once

#include <bdt/codec.hpp>
#include <bdt/date_only.hpp>

#include <memory>

namespace bdt {

  // date_only as a {Year, Month, Day} document, a "yyyy-MM-dd" string, an
  // int32 day number or a UTC datetime at midnight. Deserialization accepts
  // any of the four whatever the configured representation.
  class date_only_codec final : public codec<date_only> {
    wire_type representation_;

  public:
    // Throws configuration_error unless representation is document, string,
    // int32 or date_time.
    explicit date_only_codec(wire_type representation = wire_type::string);

    static const std::shared_ptr<const date_only_codec>&
    instance();

    wire_type
    representation() const;

    date_only_codec
    with_representation(wire_type representation) const;

    void
    serialize(document_writer& writer, const date_only& value) const override;

    date_only
    deserialize(document_reader& reader) const override;
  };

} // namespace bdt
