#include <bdt/time_units.hpp>

#include <limits>
#include <stdexcept>
#include <string>

namespace bdt {

  std::string_view
  to_string(time_unit unit) {
    switch (unit) {
      case time_unit::ticks:
        return "ticks";
      case time_unit::nanoseconds:
        return "nanoseconds";
      case time_unit::microseconds:
        return "microseconds";
      case time_unit::milliseconds:
        return "milliseconds";
      case time_unit::seconds:
        return "seconds";
      case time_unit::minutes:
        return "minutes";
      case time_unit::hours:
        return "hours";
      case time_unit::days:
        return "days";
    }
    return "unknown";
  }

  time_unit
  parse_time_unit(std::string_view name) {
    static constexpr time_unit all[] = {
        time_unit::ticks,        time_unit::nanoseconds,
        time_unit::microseconds, time_unit::milliseconds,
        time_unit::seconds,      time_unit::minutes,
        time_unit::hours,        time_unit::days,
    };
    for (auto unit : all) {
      if (to_string(unit) == name) { return unit; }
    }
    throw std::invalid_argument("unknown time unit: " + std::string(name));
  }

  int64_t
  ticks_per_unit(time_unit unit) {
    switch (unit) {
      case time_unit::days:
        return ticks_per_day;
      case time_unit::hours:
        return ticks_per_hour;
      case time_unit::minutes:
        return ticks_per_minute;
      case time_unit::seconds:
        return ticks_per_second;
      case time_unit::milliseconds:
        return ticks_per_millisecond;
      case time_unit::microseconds:
        return ticks_per_microsecond;
      case time_unit::ticks:
        return 1;
      case time_unit::nanoseconds:
        break;
    }
    throw std::invalid_argument(
        "no tick count for time unit: " +
        std::to_string(static_cast<int>(unit)) + " (" +
        std::string(to_string(unit)) + ")");
  }

  // ===== ticks to units =====

  template <>
  int32_t
  from_ticks<int32_t>(int64_t ticks, time_unit unit) {
    if (unit == time_unit::nanoseconds) {
      return static_cast<int32_t>(ticks * nanoseconds_per_tick);
    }
    return static_cast<int32_t>(ticks / ticks_per_unit(unit));
  }

  template <>
  int64_t
  from_ticks<int64_t>(int64_t ticks, time_unit unit) {
    if (unit == time_unit::nanoseconds) { return ticks * nanoseconds_per_tick; }
    return ticks / ticks_per_unit(unit);
  }

  template <>
  double
  from_ticks<double>(int64_t ticks, time_unit unit) {
    if (unit == time_unit::nanoseconds) {
      return static_cast<double>(ticks) *
             static_cast<double>(nanoseconds_per_tick);
    }
    // Cast before dividing so the result keeps its fractional part.
    return static_cast<double>(ticks) /
           static_cast<double>(ticks_per_unit(unit));
  }

  // ===== units to ticks =====

  template <>
  int64_t
  to_ticks<int32_t>(int32_t value, time_unit unit) {
    return to_ticks<int64_t>(value, unit);
  }

  template <>
  int64_t
  to_ticks<int64_t>(int64_t value, time_unit unit) {
    if (unit == time_unit::nanoseconds) { return value / nanoseconds_per_tick; }
    int64_t factor = ticks_per_unit(unit);
    if (value > std::numeric_limits<int64_t>::max() / factor ||
        value < std::numeric_limits<int64_t>::min() / factor) {
      throw std::invalid_argument("to_ticks: " + std::to_string(value) + " " +
                                  std::string(to_string(unit)) +
                                  " is out of range");
    }
    return value * factor;
  }

  namespace {

    int64_t
    truncate_ticks(double ticks) {
      // 2^63; the int64 range is [-2^63, 2^63).
      constexpr double limit = 9223372036854775808.0;
      if (!(ticks >= -limit && ticks < limit)) {
        throw std::invalid_argument("to_ticks: value out of range");
      }
      return static_cast<int64_t>(ticks);
    }

  } // namespace

  template <>
  int64_t
  to_ticks<double>(double value, time_unit unit) {
    if (unit == time_unit::nanoseconds) {
      // Divide, then truncate.
      return truncate_ticks(value / static_cast<double>(nanoseconds_per_tick));
    }
    // Multiply, then truncate: a fractional value keeps its sub-unit ticks.
    return truncate_ticks(value * static_cast<double>(ticks_per_unit(unit)));
  }

} // namespace bdt
