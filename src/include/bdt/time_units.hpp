#pragma once

#include <cstdint>
#include <ostream>
#include <string_view>

namespace bdt {

  // One tick is 100 nanoseconds.
  inline constexpr int64_t nanoseconds_per_tick = 100;
  inline constexpr int64_t ticks_per_microsecond = 10;
  inline constexpr int64_t ticks_per_millisecond = 10'000;
  inline constexpr int64_t ticks_per_second = 10'000'000;
  inline constexpr int64_t ticks_per_minute = 60 * ticks_per_second;
  inline constexpr int64_t ticks_per_hour = 60 * ticks_per_minute;
  inline constexpr int64_t ticks_per_day = 24 * ticks_per_hour;

  enum class time_unit : uint8_t {
    ticks,
    nanoseconds,
    microseconds,
    milliseconds,
    seconds,
    minutes,
    hours,
    days,
  };

  std::string_view
  to_string(time_unit unit);

  // Inverse of to_string; throws std::invalid_argument for unknown names.
  time_unit
  parse_time_unit(std::string_view name);

  inline std::ostream&
  operator<<(std::ostream& os, time_unit unit) {
    return os << to_string(unit);
  }

  // Ticks in one unit. Nanoseconds are finer than a tick and have no tick
  // count; they and unknown units throw std::invalid_argument.
  int64_t
  ticks_per_unit(time_unit unit);

  // Convert a tick count to a number of units. Defined for int32_t, int64_t
  // and double. Integer carriers truncate toward zero; int32_t narrows
  // without a range check.
  template <typename T>
  T
  from_ticks(int64_t ticks, time_unit unit);

  // Convert a number of units to a tick count. Defined for int32_t, int64_t
  // and double. Nanoseconds divide before converting; every other unit
  // multiplies first so a fractional double keeps its sub-unit part. Throws
  // std::invalid_argument when the tick count leaves the int64 range.
  template <typename T>
  int64_t
  to_ticks(T value, time_unit unit);

  template <>
  int32_t
  from_ticks<int32_t>(int64_t ticks, time_unit unit);
  template <>
  int64_t
  from_ticks<int64_t>(int64_t ticks, time_unit unit);
  template <>
  double
  from_ticks<double>(int64_t ticks, time_unit unit);

  template <>
  int64_t
  to_ticks<int32_t>(int32_t value, time_unit unit);
  template <>
  int64_t
  to_ticks<int64_t>(int64_t value, time_unit unit);
  template <>
  int64_t
  to_ticks<double>(double value, time_unit unit);

} // namespace bdt
