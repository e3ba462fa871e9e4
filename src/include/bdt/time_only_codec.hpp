#pragma once

#include <bdt/codec.hpp>
#include <bdt/time_only.hpp>
#include <bdt/time_units.hpp>

#include <memory>

namespace bdt {

  // time_only as a number of units since midnight (double, int32 or int64)
  // or as a duration string. Numeric wire values of any of the three types
  // are read in the configured unit.
  class time_only_codec final : public codec<time_only> {
    wire_type representation_;
    time_unit unit_;

  public:
    // Throws configuration_error unless representation is double_, int32,
    // int64 or string and unit is a known time_unit.
    explicit time_only_codec(wire_type representation = wire_type::string,
                             time_unit unit = time_unit::ticks);

    static const std::shared_ptr<const time_only_codec>&
    instance();

    wire_type
    representation() const;
    time_unit
    unit() const;

    // Keeps the unit.
    time_only_codec
    with_representation(wire_type representation) const;

    void
    serialize(document_writer& writer, const time_only& value) const override;

    time_only
    deserialize(document_reader& reader) const override;
  };

} // namespace bdt
