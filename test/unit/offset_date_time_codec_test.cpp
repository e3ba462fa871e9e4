#include <bdt/errors.hpp>
#include <bdt/offset_date_time_codec.hpp>
#include <bdt/standard_offset_date_time_codec.hpp>
#include <bdt/value_reader.hpp>
#include <bdt/value_writer.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <limits>
#include <memory>

using bdt::wire_type;

template <typename Codec>
static bdt::document_value
encode(const Codec& codec, const bdt::offset_date_time& value) {
  bdt::value_writer writer;
  codec.serialize(writer, value);
  return writer.value();
}

template <typename Codec>
static bdt::offset_date_time
decode(const Codec& codec, const bdt::document_value& value) {
  bdt::value_reader reader(value);
  return codec.deserialize(reader);
}

static const bdt::offset_date_time sample{
    std::string_view("2023-05-09T10:30:00+02:00")};

// 2023-05-09T08:30:00Z
static constexpr int64_t sample_millis = 1'683'621'000'000;

namespace {

  // Writes every value as the string "fake" and reads anything as the
  // minimum value, counting calls.
  class fake_codec : public bdt::codec<bdt::offset_date_time> {
  public:
    mutable int serialized = 0;
    mutable int deserialized = 0;

    void
    serialize(bdt::document_writer& writer,
              const bdt::offset_date_time&) const override {
      ++serialized;
      writer.write_string("fake");
    }

    bdt::offset_date_time
    deserialize(bdt::document_reader& reader) const override {
      ++deserialized;
      reader.skip_value();
      return bdt::offset_date_time::min_value();
    }
  };

} // namespace

TEST_CASE("offset_date_time_codec defaults", "[offset_date_time_codec]") {
  const auto& codec = bdt::offset_date_time_codec::instance();
  CHECK(codec->representation() == wire_type::date_time);
  CHECK(codec->base() == bdt::standard_offset_date_time_codec::instance());
  CHECK(bdt::standard_offset_date_time_codec::instance()->representation() ==
        wire_type::array);
}

TEST_CASE("offset_date_time_codec date_time representation",
          "[offset_date_time_codec]") {
  bdt::offset_date_time_codec codec;

  SECTION("only the instant is written") {
    CHECK(encode(codec, sample) ==
          bdt::document_value(bdt::utc_date_time{sample_millis}));
  }
  SECTION("read back with offset zero") {
    auto value = decode(codec, bdt::utc_date_time{sample_millis});
    CHECK(value.utc_ticks() == sample.utc_ticks());
    CHECK(value.offset_minutes() == 0);
    CHECK(value == bdt::offset_date_time(
                       std::string_view("2023-05-09T08:30:00Z")));
    CHECK(value != sample);
  }
  SECTION("instants before year 1 clamp to the minimum") {
    CHECK(decode(codec, bdt::utc_date_time{
                            bdt::offset_date_time::min_unix_millis - 1}) ==
          bdt::offset_date_time::min_value());
    CHECK(decode(codec, bdt::utc_date_time{
                            std::numeric_limits<int64_t>::min()}) ==
          bdt::offset_date_time::min_value());
    CHECK(decode(codec, bdt::utc_date_time{
                            bdt::offset_date_time::min_unix_millis}) ==
          bdt::offset_date_time::min_value());
  }
  SECTION("instants after year 9999 are rejected") {
    CHECK_THROWS_AS(decode(codec, bdt::utc_date_time{
                                      bdt::offset_date_time::max_unix_millis +
                                      1}),
                    bdt::decode_value_error);
    CHECK(decode(codec,
                 bdt::utc_date_time{bdt::offset_date_time::max_unix_millis})
              .to_unix_milliseconds() ==
          bdt::offset_date_time::max_unix_millis);
  }
}

TEST_CASE("offset_date_time_codec offset-preserving representations",
          "[offset_date_time_codec]") {
  SECTION("array") {
    bdt::offset_date_time_codec codec(wire_type::array);
    bdt::array expected{sample.local_ticks(), int32_t{120}};
    CHECK(encode(codec, sample) == bdt::document_value(expected));
    CHECK(decode(codec, expected) == sample);
  }
  SECTION("document") {
    bdt::offset_date_time_codec codec(wire_type::document);
    bdt::document expected{
        {"DateTime", bdt::utc_date_time{sample_millis}},
        {"Ticks", sample.local_ticks()},
        {"Offset", int32_t{120}},
    };
    CHECK(encode(codec, sample) == bdt::document_value(expected));
    CHECK(decode(codec, expected) == sample);
  }
  SECTION("string") {
    bdt::offset_date_time_codec codec(wire_type::string);
    CHECK(encode(codec, sample) ==
          bdt::document_value("2023-05-09T10:30:00+02:00"));
    CHECK(decode(codec, "2023-05-09T10:30:00+02:00") == sample);
  }
  SECTION("the datetime codec reads every form") {
    const auto& codec = *bdt::offset_date_time_codec::instance();
    CHECK(decode(codec, bdt::array{sample.local_ticks(), int32_t{120}}) ==
          sample);
    CHECK(decode(codec, "2023-05-09T10:30:00+02:00") == sample);
    CHECK(decode(codec, bdt::document{{"Offset", int32_t{120}},
                                      {"Ticks", sample.local_ticks()},
                                      {"DateTime", bdt::utc_date_time{0}}}) ==
          sample);
  }
}

TEST_CASE("standard_offset_date_time_codec malformed input",
          "[offset_date_time_codec]") {
  bdt::standard_offset_date_time_codec codec;
  const int64_t ticks = sample.local_ticks();

  SECTION("arrays") {
    CHECK_THROWS_AS(decode(codec, bdt::array{ticks}), bdt::decode_value_error);
    CHECK_THROWS_AS(decode(codec, bdt::array{}), bdt::decode_value_error);
    CHECK_THROWS_AS(decode(codec, bdt::array{int32_t{1}, int32_t{120}}),
                    bdt::decode_value_error);
    CHECK_THROWS_AS(decode(codec, bdt::array{ticks, int32_t{120}, int32_t{0}}),
                    bdt::decode_value_error);
    CHECK_THROWS_AS(decode(codec, bdt::array{ticks, int32_t{900}}),
                    bdt::decode_value_error);
    CHECK_THROWS_AS(decode(codec, bdt::array{int64_t{-1}, int32_t{0}}),
                    bdt::decode_value_error);
  }
  SECTION("ticks at the int64 limits with a non-zero offset") {
    constexpr auto lowest = std::numeric_limits<int64_t>::min();
    constexpr auto highest = std::numeric_limits<int64_t>::max();
    CHECK_THROWS_AS(decode(codec, bdt::array{lowest, int32_t{60}}),
                    bdt::decode_value_error);
    CHECK_THROWS_AS(decode(codec, bdt::array{highest, int32_t{-60}}),
                    bdt::decode_value_error);
    CHECK_THROWS_AS(decode(codec, bdt::document{{"DateTime",
                                                 bdt::utc_date_time{0}},
                                                {"Ticks", lowest},
                                                {"Offset", int32_t{60}}}),
                    bdt::decode_value_error);
    CHECK_THROWS_AS(decode(codec, bdt::document{{"DateTime",
                                                 bdt::utc_date_time{0}},
                                                {"Ticks", highest},
                                                {"Offset", int32_t{-60}}}),
                    bdt::decode_value_error);
  }
  SECTION("documents") {
    CHECK_THROWS_AS(decode(codec, bdt::document{{"Offset", int32_t{0}}}),
                    bdt::decode_value_error);
    CHECK_THROWS_AS(decode(codec, bdt::document{{"Ticks", ticks}}),
                    bdt::decode_value_error);
    CHECK_THROWS_AS(decode(codec, bdt::document{{"Ticks", ticks},
                                                {"Offset", int32_t{0}}}),
                    bdt::decode_value_error);
    CHECK_THROWS_AS(decode(codec, bdt::document{{"Ticks", ticks},
                                                {"Offset", int32_t{0}},
                                                {"Zone", "UTC"}}),
                    bdt::decode_value_error);
    CHECK_THROWS_AS(decode(codec, bdt::document{{"Ticks", ticks},
                                                {"Ticks", ticks},
                                                {"Offset", int32_t{0}}}),
                    bdt::decode_value_error);
    CHECK_THROWS_AS(decode(codec, bdt::document{{"Ticks", int32_t{1}},
                                                {"Offset", int32_t{0}}}),
                    bdt::decode_value_error);
  }
  SECTION("strings") {
    CHECK_THROWS_AS(decode(codec, "2023-05-09T10:30:00"),
                    bdt::decode_value_error);
  }
  SECTION("other wire types") {
    CHECK_THROWS_AS(decode(codec, int32_t{0}), bdt::decode_type_mismatch);
    CHECK_THROWS_AS(decode(codec, bdt::utc_date_time{0}),
                    bdt::decode_type_mismatch);
    CHECK_THROWS_AS(decode(bdt::offset_date_time_codec(), int64_t{0}),
                    bdt::decode_type_mismatch);
  }
}

TEST_CASE("offset_date_time_codec configuration", "[offset_date_time_codec]") {
  CHECK_THROWS_AS(bdt::offset_date_time_codec(wire_type::int64),
                  bdt::configuration_error);
  CHECK_THROWS_AS(bdt::offset_date_time_codec(wire_type::array, nullptr),
                  bdt::configuration_error);
  CHECK_THROWS_AS(bdt::standard_offset_date_time_codec(wire_type::date_time),
                  bdt::configuration_error);
}

TEST_CASE("offset_date_time_codec delegates to its base",
          "[offset_date_time_codec]") {
  auto fake = std::make_shared<const fake_codec>();

  SECTION("non-datetime representations go to the base") {
    bdt::offset_date_time_codec codec(wire_type::string, fake);
    CHECK(encode(codec, sample) == bdt::document_value("fake"));
    CHECK(decode(codec, bdt::array{}) == bdt::offset_date_time::min_value());
    CHECK(fake->serialized == 1);
    CHECK(fake->deserialized == 1);
  }
  SECTION("the datetime form never reaches the base") {
    bdt::offset_date_time_codec codec(wire_type::date_time, fake);
    CHECK(encode(codec, sample) ==
          bdt::document_value(bdt::utc_date_time{sample_millis}));
    CHECK(decode(codec, bdt::utc_date_time{sample_millis}).utc_ticks() ==
          sample.utc_ticks());
    CHECK(fake->serialized == 0);
    CHECK(fake->deserialized == 0);
  }
}

TEST_CASE("offset_date_time_codec with_representation",
          "[offset_date_time_codec]") {
  const auto& shared = bdt::offset_date_time_codec::instance();

  CHECK(bdt::with_representation(shared, wire_type::date_time) == shared);

  auto other = bdt::with_representation(shared, wire_type::document);
  CHECK(other->representation() == wire_type::document);
  auto base = std::dynamic_pointer_cast<
      const bdt::standard_offset_date_time_codec>(other->base());
  REQUIRE(base != nullptr);
  CHECK(base->representation() == wire_type::document);
  CHECK(encode(*other, sample).type() == wire_type::document);
}

TEST_CASE("offset_date_time_codec with_representation keeps an injected base",
          "[offset_date_time_codec]") {
  auto fake = std::make_shared<const fake_codec>();
  auto codec = std::make_shared<const bdt::offset_date_time_codec>(
      wire_type::date_time, fake);

  SECTION("member form") {
    auto other = codec->with_representation(wire_type::document);
    CHECK(other.representation() == wire_type::document);
    CHECK(other.base() == fake);
    CHECK(encode(other, sample) == bdt::document_value("fake"));
  }
  SECTION("shared form") {
    auto other = bdt::with_representation(codec, wire_type::document);
    CHECK(other->representation() == wire_type::document);
    CHECK(other->base() == fake);
    CHECK(encode(*other, sample) == bdt::document_value("fake"));
  }
}
