#include <bdt/offset_date_time.hpp>
#include <bdt/time_units.hpp>

#include "calendar.hpp"

#include <stdexcept>

namespace bdt {

  namespace {

    void
    check_ticks(int64_t ticks, const char* which) {
      if (ticks < offset_date_time::min_ticks ||
          ticks > offset_date_time::max_ticks) {
        throw std::invalid_argument(std::string("offset_date_time: ") + which +
                                    " ticks out of range: " +
                                    std::to_string(ticks));
      }
    }

    void
    check_offset(int16_t offset_minutes) {
      if (offset_minutes < -offset_date_time::max_offset_minutes ||
          offset_minutes > offset_date_time::max_offset_minutes) {
        throw std::invalid_argument("offset_date_time: offset out of range: " +
                                    std::to_string(offset_minutes));
      }
    }

    offset_date_time
    parse_offset_date_time(std::string_view str) {
      constexpr const char* what = "offset_date_time";
      std::size_t pos = 0;

      auto date_end = str.find('T');
      if (date_end == std::string_view::npos) {
        throw std::invalid_argument("offset_date_time: expected 'T'");
      }
      date_only date(str.substr(0, date_end));
      pos = date_end + 1;

      int32_t hour = detail::parse_fixed_digits(str, pos, 2, what);
      detail::expect_char(str, pos, ':', what);
      int32_t minute = detail::parse_fixed_digits(str, pos, 2, what);
      detail::expect_char(str, pos, ':', what);
      int32_t second = detail::parse_fixed_digits(str, pos, 2, what);
      int32_t fraction = detail::parse_fraction_ticks(str, pos, what);
      int16_t offset = detail::parse_offset(str, pos, what);
      if (pos != str.size()) {
        throw std::invalid_argument("offset_date_time: trailing characters");
      }

      time_only time(hour, minute, second);
      return offset_date_time::from_local(
          date, time_only(time.ticks() + fraction), offset);
    }

  } // namespace

  offset_date_time::offset_date_time(int64_t utc_ticks, int16_t offset_minutes)
      : utc_ticks_(utc_ticks), offset_minutes_(offset_minutes) {
    check_offset(offset_minutes);
    check_ticks(utc_ticks, "UTC");
    check_ticks(local_ticks(), "local");
  }

  offset_date_time::offset_date_time(std::string_view str)
      : offset_date_time(parse_offset_date_time(str)) {}

  offset_date_time
  offset_date_time::from_local_ticks(int64_t local_ticks,
                                     int16_t offset_minutes) {
    check_offset(offset_minutes);
    check_ticks(local_ticks, "local");
    return offset_date_time(local_ticks - offset_minutes * ticks_per_minute,
                            offset_minutes);
  }

  offset_date_time
  offset_date_time::from_local(const date_only& date, const time_only& time,
                               int16_t offset_minutes) {
    return from_local_ticks(date.day_number() * ticks_per_day + time.ticks(),
                            offset_minutes);
  }

  offset_date_time
  offset_date_time::from_unix_milliseconds(int64_t millis) {
    if (millis < min_unix_millis || millis > max_unix_millis) {
      throw std::invalid_argument(
          "offset_date_time: milliseconds out of range: " +
          std::to_string(millis));
    }
    return offset_date_time(millis * ticks_per_millisecond + unix_epoch_ticks);
  }

  offset_date_time
  offset_date_time::min_value() {
    return offset_date_time(min_ticks);
  }

  offset_date_time
  offset_date_time::max_value() {
    return offset_date_time(max_ticks);
  }

  int64_t
  offset_date_time::utc_ticks() const {
    return utc_ticks_;
  }

  int64_t
  offset_date_time::local_ticks() const {
    return utc_ticks_ + offset_minutes_ * ticks_per_minute;
  }

  int16_t
  offset_date_time::offset_minutes() const {
    return offset_minutes_;
  }

  date_only
  offset_date_time::date() const {
    return date_only::from_day_number(
        static_cast<int32_t>(local_ticks() / ticks_per_day));
  }

  time_only
  offset_date_time::time_of_day() const {
    return time_only(local_ticks() % ticks_per_day);
  }

  int64_t
  offset_date_time::to_unix_milliseconds() const {
    return (utc_ticks_ - unix_epoch_ticks) / ticks_per_millisecond;
  }

  std::string
  offset_date_time::to_string() const {
    auto time = time_of_day();
    std::string result = date().to_string();
    result += 'T';
    detail::append_digits(result, time.hour(), 2);
    result += ':';
    detail::append_digits(result, time.minute(), 2);
    result += ':';
    detail::append_digits(result, time.second(), 2);
    detail::append_fraction_trimmed(
        result, static_cast<int32_t>(time.ticks() % ticks_per_second));
    detail::append_offset(result, offset_minutes_);
    return result;
  }

} // namespace bdt
