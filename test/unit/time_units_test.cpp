#include <bdt/time_units.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>

using bdt::time_unit;

TEST_CASE("time unit names", "[time_units]") {
  CHECK(bdt::to_string(time_unit::ticks) == "ticks");
  CHECK(bdt::to_string(time_unit::nanoseconds) == "nanoseconds");
  CHECK(bdt::to_string(time_unit::days) == "days");
  CHECK(bdt::parse_time_unit("milliseconds") == time_unit::milliseconds);
  CHECK_THROWS_AS(bdt::parse_time_unit("weeks"), std::invalid_argument);
}

TEST_CASE("ticks per unit", "[time_units]") {
  CHECK(bdt::ticks_per_unit(time_unit::ticks) == 1);
  CHECK(bdt::ticks_per_unit(time_unit::microseconds) == 10);
  CHECK(bdt::ticks_per_unit(time_unit::milliseconds) == 10'000);
  CHECK(bdt::ticks_per_unit(time_unit::seconds) == 10'000'000);
  CHECK(bdt::ticks_per_unit(time_unit::minutes) == 600'000'000);
  CHECK(bdt::ticks_per_unit(time_unit::hours) == 36'000'000'000);
  CHECK(bdt::ticks_per_unit(time_unit::days) == 864'000'000'000);

  SECTION("units are ordered from finest to coarsest") {
    int64_t previous = 0;
    for (auto unit : {time_unit::ticks, time_unit::microseconds,
                      time_unit::milliseconds, time_unit::seconds,
                      time_unit::minutes, time_unit::hours, time_unit::days}) {
      CHECK(bdt::ticks_per_unit(unit) > previous);
      previous = bdt::ticks_per_unit(unit);
    }
  }
  SECTION("nanoseconds have no tick count") {
    CHECK_THROWS_AS(bdt::ticks_per_unit(time_unit::nanoseconds),
                    std::invalid_argument);
  }
  SECTION("unknown unit") {
    auto bogus = static_cast<time_unit>(42);
    CHECK_THROWS_AS(bdt::ticks_per_unit(bogus), std::invalid_argument);
    CHECK_THROWS_AS(bdt::from_ticks<int64_t>(1, bogus), std::invalid_argument);
    CHECK_THROWS_AS(bdt::to_ticks<int64_t>(1, bogus), std::invalid_argument);
  }
}

TEST_CASE("ticks to units", "[time_units]") {
  const int64_t one_hour = bdt::ticks_per_hour;

  SECTION("integer carriers") {
    CHECK(bdt::from_ticks<int64_t>(one_hour, time_unit::seconds) == 3600);
    CHECK(bdt::from_ticks<int32_t>(one_hour, time_unit::minutes) == 60);
    CHECK(bdt::from_ticks<int64_t>(one_hour, time_unit::ticks) == one_hour);
  }
  SECTION("integer carriers truncate toward zero") {
    CHECK(bdt::from_ticks<int64_t>(15'000'000, time_unit::seconds) == 1);
    CHECK(bdt::from_ticks<int64_t>(-15'000'000, time_unit::seconds) == -1);
    CHECK(bdt::from_ticks<int32_t>(9'999, time_unit::milliseconds) == 0);
  }
  SECTION("double keeps the fractional part") {
    CHECK(bdt::from_ticks<double>(15'000'000, time_unit::seconds) == 1.5);
    CHECK(bdt::from_ticks<double>(one_hour / 4, time_unit::hours) == 0.25);
  }
}

TEST_CASE("units to ticks", "[time_units]") {
  CHECK(bdt::to_ticks<int64_t>(3600, time_unit::seconds) ==
        bdt::ticks_per_hour);
  CHECK(bdt::to_ticks<int32_t>(86'400, time_unit::seconds) ==
        bdt::ticks_per_day);
  CHECK(bdt::to_ticks<double>(1.5, time_unit::seconds) == 15'000'000);
  CHECK(bdt::to_ticks<double>(0.5, time_unit::ticks) == 0);

  SECTION("round trip is the identity on whole units") {
    for (auto unit : {time_unit::ticks, time_unit::microseconds,
                      time_unit::milliseconds, time_unit::seconds,
                      time_unit::minutes, time_unit::hours, time_unit::days}) {
      int64_t ticks = 7 * bdt::ticks_per_unit(unit);
      CHECK(bdt::to_ticks(bdt::from_ticks<int64_t>(ticks, unit), unit) ==
            ticks);
      CHECK(bdt::to_ticks(bdt::from_ticks<double>(ticks, unit), unit) ==
            ticks);
    }
  }
  SECTION("out of range") {
    CHECK_THROWS_AS(bdt::to_ticks<int64_t>(
                        std::numeric_limits<int64_t>::max(), time_unit::hours),
                    std::invalid_argument);
    CHECK_THROWS_AS(bdt::to_ticks<int64_t>(
                        std::numeric_limits<int64_t>::min(), time_unit::days),
                    std::invalid_argument);
    CHECK_THROWS_AS(bdt::to_ticks<double>(1e300, time_unit::seconds),
                    std::invalid_argument);
    CHECK_THROWS_AS(
        bdt::to_ticks<double>(std::nan(""), time_unit::seconds),
        std::invalid_argument);
  }
}

TEST_CASE("nanoseconds are finer than a tick", "[time_units]") {
  SECTION("ticks to nanoseconds multiplies") {
    CHECK(bdt::from_ticks<int64_t>(123, time_unit::nanoseconds) == 12'300);
    CHECK(bdt::from_ticks<int32_t>(123, time_unit::nanoseconds) == 12'300);
    CHECK(bdt::from_ticks<double>(123, time_unit::nanoseconds) == 12'300.0);
  }
  SECTION("nanoseconds to ticks divides and truncates") {
    CHECK(bdt::to_ticks<int64_t>(12'300, time_unit::nanoseconds) == 123);
    CHECK(bdt::to_ticks<int64_t>(12'399, time_unit::nanoseconds) == 123);
    CHECK(bdt::to_ticks<int32_t>(-250, time_unit::nanoseconds) == -2);
    CHECK(bdt::to_ticks<double>(12'300.0, time_unit::nanoseconds) == 123);
    CHECK(bdt::to_ticks<double>(12'399.9, time_unit::nanoseconds) == 123);
  }
  SECTION("round trip") {
    const int64_t ticks = 3 * bdt::ticks_per_hour + 17;
    CHECK(bdt::to_ticks(bdt::from_ticks<double>(ticks, time_unit::nanoseconds),
                        time_unit::nanoseconds) == ticks);
    CHECK(bdt::to_ticks(bdt::from_ticks<int64_t>(ticks, time_unit::nanoseconds),
                        time_unit::nanoseconds) == ticks);
  }
}
