#include <bdt/time_span.hpp>
#include <bdt/time_units.hpp>

#include "calendar.hpp"

#include <limits>
#include <stdexcept>

namespace bdt {

  namespace {

    constexpr int64_t max_days = std::numeric_limits<int64_t>::max() /
                                 ticks_per_day;

    uint64_t
    magnitude(int64_t ticks) {
      return ticks < 0 ? uint64_t{0} - static_cast<uint64_t>(ticks)
                       : static_cast<uint64_t>(ticks);
    }

    bool
    is_space(char c) {
      return c == ' ' || c == '\t';
    }

    // One to `max_digits` digits at pos.
    int64_t
    parse_number(std::string_view str, std::size_t& pos,
                 std::size_t max_digits) {
      std::size_t start = pos;
      int64_t value = 0;
      while (pos < str.size() && detail::is_digit(str[pos])) {
        if (pos - start == max_digits) {
          throw std::invalid_argument("time_span: too many digits");
        }
        value = value * 10 + (str[pos] - '0');
        ++pos;
      }
      if (pos == start) {
        throw std::invalid_argument("time_span: expected digit");
      }
      return value;
    }

    int64_t
    parse_time_span(std::string_view str) {
      while (!str.empty() && is_space(str.front())) {
        str.remove_prefix(1);
      }
      while (!str.empty() && is_space(str.back())) {
        str.remove_suffix(1);
      }
      if (str.empty()) { throw std::invalid_argument("time_span: empty string"); }

      std::size_t pos = 0;
      bool negative = false;
      if (str[pos] == '-') {
        negative = true;
        ++pos;
      }

      int64_t days = 0;
      int64_t hours = 0;
      int64_t minutes = 0;
      int64_t seconds = 0;
      int64_t fraction = 0;

      int64_t first = parse_number(str, pos, 8);
      if (pos == str.size()) {
        days = first;
      } else {
        if (str[pos] == '.') {
          days = first;
          ++pos;
          hours = parse_number(str, pos, 2);
        } else {
          hours = first;
        }
        detail::expect_char(str, pos, ':', "time_span");
        minutes = parse_number(str, pos, 2);
        if (pos < str.size() && str[pos] == ':') {
          ++pos;
          seconds = parse_number(str, pos, 2);
          fraction = detail::parse_fraction_ticks(str, pos, "time_span");
        }
        if (pos != str.size()) {
          throw std::invalid_argument("time_span: trailing characters");
        }
        if (hours > 23) {
          throw std::invalid_argument("time_span: hours out of range");
        }
        if (minutes > 59) {
          throw std::invalid_argument("time_span: minutes out of range");
        }
        if (seconds > 59) {
          throw std::invalid_argument("time_span: seconds out of range");
        }
      }

      int64_t rest = hours * ticks_per_hour + minutes * ticks_per_minute +
                     seconds * ticks_per_second + fraction;
      if (days > max_days ||
          days * ticks_per_day >
              std::numeric_limits<int64_t>::max() - rest) {
        throw std::invalid_argument("time_span: value out of range");
      }
      int64_t total = days * ticks_per_day + rest;
      return negative ? -total : total;
    }

  } // namespace

  time_span::time_span(int64_t ticks) : ticks_(ticks) {}

  time_span::time_span(std::string_view str) : ticks_(parse_time_span(str)) {}

  int64_t
  time_span::ticks() const {
    return ticks_;
  }

  bool
  time_span::is_negative() const {
    return ticks_ < 0;
  }

  int64_t
  time_span::days() const {
    return static_cast<int64_t>(magnitude(ticks_) / ticks_per_day);
  }

  int32_t
  time_span::hours() const {
    return static_cast<int32_t>(magnitude(ticks_) / ticks_per_hour % 24);
  }

  int32_t
  time_span::minutes() const {
    return static_cast<int32_t>(magnitude(ticks_) / ticks_per_minute % 60);
  }

  int32_t
  time_span::seconds() const {
    return static_cast<int32_t>(magnitude(ticks_) / ticks_per_second % 60);
  }

  int32_t
  time_span::fraction_ticks() const {
    return static_cast<int32_t>(magnitude(ticks_) % ticks_per_second);
  }

  std::string
  time_span::to_string() const {
    std::string result;
    if (is_negative()) { result += '-'; }
    if (days() != 0) {
      result += std::to_string(days());
      result += '.';
    }
    detail::append_digits(result, hours(), 2);
    result += ':';
    detail::append_digits(result, minutes(), 2);
    result += ':';
    detail::append_digits(result, seconds(), 2);
    detail::append_fraction_fixed(result, fraction_ticks());
    return result;
  }

} // namespace bdt
