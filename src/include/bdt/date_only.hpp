#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace bdt {

  // Proleptic Gregorian calendar date in 0001-01-01 .. 9999-12-31.
  class date_only {
    int32_t year_ = 1;
    uint8_t month_ = 1;
    uint8_t day_ = 1;

  public:
    static constexpr int32_t min_year = 1;
    static constexpr int32_t max_year = 9999;
    static constexpr int32_t max_day_number = 3'652'058;

    date_only() = default;

    // Strict "yyyy-MM-dd".
    explicit date_only(std::string_view str);
    date_only(int32_t year, uint8_t month, uint8_t day);

    // Days since 0001-01-01, which is day 0.
    static date_only
    from_day_number(int32_t day_number);

    static date_only
    min_value();
    static date_only
    max_value();

    std::string
    to_string() const;
    int32_t
    year() const;
    uint8_t
    month() const;
    uint8_t
    day() const;
    int32_t
    day_number() const;

    bool
    operator==(const date_only& other) const = default;
    std::strong_ordering
    operator<=>(const date_only& other) const = default;

    explicit
    operator std::chrono::year_month_day() const;
    explicit date_only(std::chrono::year_month_day ymd);

    friend std::ostream&
    operator<<(std::ostream& os, const date_only& d) {
      return os << d.to_string();
    }
  };

} // namespace bdt

template <>
struct std::hash<bdt::date_only> {
  std::size_t
  operator()(const bdt::date_only& d) const noexcept {
    return std::hash<int32_t>{}(d.day_number());
  }
};
