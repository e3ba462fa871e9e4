#include <bdt/errors.hpp>
#include <bdt/time_only_codec.hpp>
#include <bdt/value_reader.hpp>
#include <bdt/value_writer.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <cstdint>
#include <limits>

using bdt::time_unit;
using bdt::wire_type;

static bdt::document_value
encode(const bdt::time_only_codec& codec, const bdt::time_only& value) {
  bdt::value_writer writer;
  codec.serialize(writer, value);
  return writer.value();
}

static bdt::time_only
decode(const bdt::time_only_codec& codec, const bdt::document_value& value) {
  bdt::value_reader reader(value);
  return codec.deserialize(reader);
}

TEST_CASE("time_only_codec defaults", "[time_only_codec]") {
  const auto& codec = bdt::time_only_codec::instance();
  CHECK(codec->representation() == wire_type::string);
  CHECK(codec->unit() == time_unit::ticks);
}

TEST_CASE("time_only_codec int64 seconds", "[time_only_codec]") {
  bdt::time_only_codec codec(wire_type::int64, time_unit::seconds);
  const bdt::time_only one_hour(1, 0);

  CHECK(encode(codec, one_hour) == bdt::document_value(int64_t{3600}));
  CHECK(decode(codec, int64_t{3600}) == one_hour);

  SECTION("sub-second ticks are truncated") {
    CHECK(encode(codec, bdt::time_only(1, 0, 0, 999)) ==
          bdt::document_value(int64_t{3600}));
  }
}

TEST_CASE("time_only_codec double nanoseconds", "[time_only_codec]") {
  bdt::time_only_codec codec(wire_type::double_, time_unit::nanoseconds);
  const bdt::time_only value(int64_t{12'345});

  CHECK(encode(codec, value) == bdt::document_value(1'234'500.0));
  CHECK(decode(codec, 1'234'500.0) == value);

  SECTION("a partial tick is truncated") {
    CHECK(decode(codec, 1'234'599.0) == value);
  }
  SECTION("the largest time of day survives the round trip") {
    auto last = bdt::time_only::max_value();
    CHECK(decode(codec, encode(codec, last)) == last);
  }
}

TEST_CASE("time_only_codec other units", "[time_only_codec]") {
  const bdt::time_only value(13, 45, 30, 250);

  SECTION("int32 milliseconds") {
    bdt::time_only_codec codec(wire_type::int32, time_unit::milliseconds);
    CHECK(encode(codec, value) == bdt::document_value(int32_t{49'530'250}));
    CHECK(decode(codec, int32_t{49'530'250}) == value);
  }
  SECTION("double hours keep the fraction") {
    bdt::time_only_codec codec(wire_type::double_, time_unit::hours);
    CHECK(encode(codec, bdt::time_only(1, 30)) == bdt::document_value(1.5));
    CHECK(decode(codec, 1.5) == bdt::time_only(1, 30));
  }
  SECTION("int64 ticks") {
    bdt::time_only_codec codec(wire_type::int64, time_unit::ticks);
    CHECK(encode(codec, value) == bdt::document_value(value.ticks()));
  }
  SECTION("int32 days") {
    bdt::time_only_codec codec(wire_type::int32, time_unit::days);
    CHECK(encode(codec, value) == bdt::document_value(int32_t{0}));
    CHECK(decode(codec, int32_t{0}) == bdt::time_only::min_value());
  }
}

TEST_CASE("time_only_codec string representation", "[time_only_codec]") {
  bdt::time_only_codec codec(wire_type::string);
  CHECK(encode(codec, bdt::time_only(13, 45, 30, 250)) ==
        bdt::document_value("13:45:30.2500000"));
  CHECK(encode(codec, bdt::time_only(7, 5)) == bdt::document_value("07:05:00"));
  CHECK(decode(codec, "13:45:30.25") == bdt::time_only(13, 45, 30, 250));
  CHECK(decode(codec, "01:00") == bdt::time_only(1, 0));

  SECTION("durations that are not a time of day") {
    CHECK_THROWS_AS(decode(codec, "1.00:00:00"), bdt::decode_value_error);
    CHECK_THROWS_AS(decode(codec, "-00:01"), bdt::decode_value_error);
    CHECK_THROWS_AS(decode(codec, "noon"), bdt::decode_value_error);
  }
}

TEST_CASE("time_only_codec reads any supported wire type",
          "[time_only_codec]") {
  SECTION("numbers use the configured unit") {
    bdt::time_only_codec codec(wire_type::string, time_unit::seconds);
    CHECK(decode(codec, int32_t{60}) == bdt::time_only(0, 1));
    CHECK(decode(codec, int64_t{60}) == bdt::time_only(0, 1));
    CHECK(decode(codec, 60.5) == bdt::time_only(0, 1, 0, 500));
  }
  SECTION("strings ignore the unit") {
    bdt::time_only_codec codec(wire_type::int64, time_unit::seconds);
    CHECK(decode(codec, "00:01:00") == bdt::time_only(0, 1));
  }
  SECTION("other wire types") {
    bdt::time_only_codec codec;
    CHECK_THROWS_AS(decode(codec, bdt::utc_date_time{0}),
                    bdt::decode_type_mismatch);
    CHECK_THROWS_AS(decode(codec, bdt::document{}), bdt::decode_type_mismatch);
  }
}

TEST_CASE("time_only_codec out of range values", "[time_only_codec]") {
  bdt::time_only_codec codec(wire_type::int64, time_unit::seconds);
  CHECK_THROWS_AS(decode(codec, int64_t{86'400}), bdt::decode_value_error);
  CHECK_THROWS_AS(decode(codec, int64_t{-1}), bdt::decode_value_error);
  CHECK_THROWS_AS(decode(codec, std::numeric_limits<int64_t>::max()),
                  bdt::decode_value_error);
  CHECK_THROWS_AS(decode(codec, std::nan("")), bdt::decode_value_error);
  CHECK_THROWS_AS(decode(codec, std::numeric_limits<double>::infinity()),
                  bdt::decode_value_error);
}

TEST_CASE("time_only_codec configuration", "[time_only_codec]") {
  CHECK_THROWS_AS(bdt::time_only_codec(wire_type::document),
                  bdt::configuration_error);
  CHECK_THROWS_AS(bdt::time_only_codec(wire_type::date_time),
                  bdt::configuration_error);
  CHECK_THROWS_AS(
      bdt::time_only_codec(wire_type::int64, static_cast<time_unit>(42)),
      bdt::configuration_error);
}

TEST_CASE("time_only_codec with_representation", "[time_only_codec]") {
  auto shared = std::make_shared<const bdt::time_only_codec>(
      wire_type::int64, time_unit::milliseconds);

  CHECK(bdt::with_representation(shared, wire_type::int64) == shared);

  auto other = bdt::with_representation(shared, wire_type::double_);
  CHECK(other != shared);
  CHECK(other->representation() == wire_type::double_);
  CHECK(other->unit() == time_unit::milliseconds);
}
