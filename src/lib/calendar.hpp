#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace bdt::detail {

  inline bool
  is_leap_year(int32_t year) {
    return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
  }

  inline uint8_t
  days_in_month(int32_t year, uint8_t month) {
    static constexpr uint8_t table[] = {0,  31, 28, 31, 30, 31, 30,
                                        31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
      throw std::invalid_argument("days_in_month: invalid month");
    }
    if (month == 2 && is_leap_year(year)) { return 29; }
    return table[month];
  }

  inline bool
  is_digit(char c) {
    return c >= '0' && c <= '9';
  }

  // Exactly `count` digits at pos; advances pos.
  inline int32_t
  parse_fixed_digits(std::string_view str, std::size_t& pos, std::size_t count,
                     const char* what) {
    if (pos + count > str.size()) {
      throw std::invalid_argument(std::string(what) + ": string too short");
    }
    int32_t value = 0;
    for (std::size_t i = 0; i < count; ++i) {
      char c = str[pos + i];
      if (!is_digit(c)) {
        throw std::invalid_argument(std::string(what) + ": expected " +
                                    std::to_string(count) + " digits");
      }
      value = value * 10 + (c - '0');
    }
    pos += count;
    return value;
  }

  inline void
  expect_char(std::string_view str, std::size_t& pos, char expected,
              const char* what) {
    if (pos >= str.size() || str[pos] != expected) {
      throw std::invalid_argument(std::string(what) + ": expected '" +
                                  expected + "'");
    }
    ++pos;
  }

  inline void
  append_digits(std::string& out, int64_t value, std::size_t width) {
    std::string digits = std::to_string(value);
    if (digits.size() < width) { digits.insert(0, width - digits.size(), '0'); }
    out += digits;
  }

  // Parses ".f..." at pos into ticks (seven digits of precision). Returns 0
  // and leaves pos alone when there is no '.'. More than seven digits is an
  // error.
  inline int32_t
  parse_fraction_ticks(std::string_view str, std::size_t& pos,
                       const char* what) {
    if (pos >= str.size() || str[pos] != '.') { return 0; }
    ++pos;
    int32_t ticks = 0;
    int digits = 0;
    while (pos < str.size() && is_digit(str[pos])) {
      if (digits == 7) {
        throw std::invalid_argument(std::string(what) +
                                    ": more than 7 fraction digits");
      }
      ticks = ticks * 10 + (str[pos] - '0');
      ++digits;
      ++pos;
    }
    if (digits == 0) {
      throw std::invalid_argument(std::string(what) +
                                  ": expected digits after '.'");
    }
    while (digits < 7) {
      ticks *= 10;
      ++digits;
    }
    return ticks;
  }

  // ".fffffff", always seven digits; nothing for zero.
  inline void
  append_fraction_fixed(std::string& out, int32_t ticks) {
    if (ticks == 0) { return; }
    out += '.';
    append_digits(out, ticks, 7);
  }

  // ".f..." with trailing zeros trimmed; nothing for zero.
  inline void
  append_fraction_trimmed(std::string& out, int32_t ticks) {
    if (ticks == 0) { return; }
    std::string frac;
    append_digits(frac, ticks, 7);
    while (frac.back() == '0') {
      frac.pop_back();
    }
    out += '.';
    out += frac;
  }

  // "Z", "+hh:mm" or "-hh:mm" at pos, limited to +-14:00.
  inline int16_t
  parse_offset(std::string_view str, std::size_t& pos, const char* what) {
    if (pos < str.size() && str[pos] == 'Z') {
      ++pos;
      return 0;
    }
    if (pos >= str.size() || (str[pos] != '+' && str[pos] != '-')) {
      throw std::invalid_argument(std::string(what) + ": expected offset");
    }
    bool negative = str[pos] == '-';
    ++pos;
    int32_t hours = parse_fixed_digits(str, pos, 2, what);
    expect_char(str, pos, ':', what);
    int32_t minutes = parse_fixed_digits(str, pos, 2, what);
    if (minutes > 59 || hours > 14 || (hours == 14 && minutes > 0)) {
      throw std::invalid_argument(std::string(what) + ": offset out of range");
    }
    auto offset = static_cast<int16_t>(hours * 60 + minutes);
    return negative ? static_cast<int16_t>(-offset) : offset;
  }

  inline void
  append_offset(std::string& out, int16_t offset) {
    out += offset < 0 ? '-' : '+';
    int32_t magnitude = offset < 0 ? -offset : offset;
    append_digits(out, magnitude / 60, 2);
    out += ':';
    append_digits(out, magnitude % 60, 2);
  }

} // namespace bdt::detail
