#include <bdt/date_only.hpp>

#include "calendar.hpp"

#include <stdexcept>

namespace bdt {

  namespace {

    constexpr std::chrono::sys_days day_zero{std::chrono::year{1} /
                                             std::chrono::January / 1};

    void
    validate(int32_t year, uint8_t month, uint8_t day) {
      if (year < date_only::min_year || year > date_only::max_year) {
        throw std::invalid_argument("date_only: year out of range");
      }
      if (month < 1 || month > 12) {
        throw std::invalid_argument("date_only: month out of range");
      }
      if (day < 1 || day > detail::days_in_month(year, month)) {
        throw std::invalid_argument("date_only: day out of range");
      }
    }

  } // namespace

  date_only::date_only(std::string_view str) {
    std::size_t pos = 0;
    int32_t year = detail::parse_fixed_digits(str, pos, 4, "date_only");
    detail::expect_char(str, pos, '-', "date_only");
    int32_t month = detail::parse_fixed_digits(str, pos, 2, "date_only");
    detail::expect_char(str, pos, '-', "date_only");
    int32_t day = detail::parse_fixed_digits(str, pos, 2, "date_only");
    if (pos != str.size()) {
      throw std::invalid_argument("date_only: trailing characters");
    }
    validate(year, static_cast<uint8_t>(month), static_cast<uint8_t>(day));
    year_ = year;
    month_ = static_cast<uint8_t>(month);
    day_ = static_cast<uint8_t>(day);
  }

  date_only::date_only(int32_t year, uint8_t month, uint8_t day)
      : year_(year), month_(month), day_(day) {
    validate(year, month, day);
  }

  date_only
  date_only::from_day_number(int32_t day_number) {
    if (day_number < 0 || day_number > max_day_number) {
      throw std::invalid_argument("date_only: day number out of range: " +
                                  std::to_string(day_number));
    }
    return date_only(std::chrono::year_month_day{
        day_zero + std::chrono::days{day_number}});
  }

  date_only
  date_only::min_value() {
    return date_only(min_year, 1, 1);
  }

  date_only
  date_only::max_value() {
    return date_only(max_year, 12, 31);
  }

  std::string
  date_only::to_string() const {
    std::string result;
    detail::append_digits(result, year_, 4);
    result += '-';
    detail::append_digits(result, month_, 2);
    result += '-';
    detail::append_digits(result, day_, 2);
    return result;
  }

  int32_t
  date_only::year() const {
    return year_;
  }

  uint8_t
  date_only::month() const {
    return month_;
  }

  uint8_t
  date_only::day() const {
    return day_;
  }

  int32_t
  date_only::day_number() const {
    auto days = std::chrono::sys_days{
                    static_cast<std::chrono::year_month_day>(*this)} -
                day_zero;
    return static_cast<int32_t>(days.count());
  }

  date_only::
  operator std::chrono::year_month_day() const {
    return std::chrono::year{year_} /
           std::chrono::month{static_cast<unsigned>(month_)} /
           std::chrono::day{static_cast<unsigned>(day_)};
  }

  date_only::date_only(std::chrono::year_month_day ymd)
      : year_(static_cast<int>(ymd.year())),
        month_(static_cast<uint8_t>(static_cast<unsigned>(ymd.month()))),
        day_(static_cast<uint8_t>(static_cast<unsigned>(ymd.day()))) {
    if (!ymd.ok()) { throw std::invalid_argument("date_only: invalid date"); }
    validate(year_, month_, day_);
  }

} // namespace bdt
