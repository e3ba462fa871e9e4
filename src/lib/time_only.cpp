#include <bdt/time_only.hpp>
#include <bdt/time_units.hpp>

#include "calendar.hpp"

#include <stdexcept>

namespace bdt {

  namespace {

    int64_t
    checked_ticks(int64_t ticks) {
      if (ticks < 0 || ticks >= ticks_per_day) {
        throw std::invalid_argument("time_only: ticks out of range: " +
                                    std::to_string(ticks));
      }
      return ticks;
    }

    int64_t
    component_ticks(int32_t hour, int32_t minute, int32_t second,
                    int32_t millisecond, int32_t microsecond) {
      if (hour < 0 || hour > 23) {
        throw std::invalid_argument("time_only: hour out of range");
      }
      if (minute < 0 || minute > 59) {
        throw std::invalid_argument("time_only: minute out of range");
      }
      if (second < 0 || second > 59) {
        throw std::invalid_argument("time_only: second out of range");
      }
      if (millisecond < 0 || millisecond > 999) {
        throw std::invalid_argument("time_only: millisecond out of range");
      }
      if (microsecond < 0 || microsecond > 999) {
        throw std::invalid_argument("time_only: microsecond out of range");
      }
      return hour * ticks_per_hour + minute * ticks_per_minute +
             second * ticks_per_second + millisecond * ticks_per_millisecond +
             microsecond * ticks_per_microsecond;
    }

    int64_t
    parse_time_only(std::string_view str) {
      std::size_t pos = 0;
      int32_t hour = detail::parse_fixed_digits(str, pos, 2, "time_only");
      detail::expect_char(str, pos, ':', "time_only");
      int32_t minute = detail::parse_fixed_digits(str, pos, 2, "time_only");
      detail::expect_char(str, pos, ':', "time_only");
      int32_t second = detail::parse_fixed_digits(str, pos, 2, "time_only");
      int32_t fraction = detail::parse_fraction_ticks(str, pos, "time_only");
      if (pos != str.size()) {
        throw std::invalid_argument("time_only: trailing characters");
      }
      return component_ticks(hour, minute, second, 0, 0) + fraction;
    }

  } // namespace

  time_only::time_only(int64_t ticks) : ticks_(checked_ticks(ticks)) {}

  time_only::time_only(int32_t hour, int32_t minute, int32_t second,
                       int32_t millisecond, int32_t microsecond)
      : ticks_(component_ticks(hour, minute, second, millisecond,
                               microsecond)) {}

  time_only::time_only(std::string_view str) : ticks_(parse_time_only(str)) {}

  time_only
  time_only::from_time_span(const time_span& span) {
    return time_only(span.ticks());
  }

  time_only
  time_only::min_value() {
    return time_only(int64_t{0});
  }

  time_only
  time_only::max_value() {
    return time_only(ticks_per_day - 1);
  }

  int64_t
  time_only::ticks() const {
    return ticks_;
  }

  int32_t
  time_only::hour() const {
    return static_cast<int32_t>(ticks_ / ticks_per_hour);
  }

  int32_t
  time_only::minute() const {
    return static_cast<int32_t>(ticks_ / ticks_per_minute % 60);
  }

  int32_t
  time_only::second() const {
    return static_cast<int32_t>(ticks_ / ticks_per_second % 60);
  }

  int32_t
  time_only::millisecond() const {
    return static_cast<int32_t>(ticks_ / ticks_per_millisecond % 1000);
  }

  int32_t
  time_only::microsecond() const {
    return static_cast<int32_t>(ticks_ / ticks_per_microsecond % 1000);
  }

  int32_t
  time_only::nanosecond() const {
    return static_cast<int32_t>(ticks_ % ticks_per_microsecond * 100);
  }

  time_span
  time_only::to_time_span() const {
    return time_span(ticks_);
  }

  std::string
  time_only::to_string() const {
    std::string result;
    detail::append_digits(result, hour(), 2);
    result += ':';
    detail::append_digits(result, minute(), 2);
    result += ':';
    detail::append_digits(result, second(), 2);
    detail::append_fraction_fixed(
        result, static_cast<int32_t>(ticks_ % ticks_per_second));
    return result;
  }

} // namespace bdt
