#pragma once

#include <bdt/date_only.hpp>
#include <bdt/time_only.hpp>

#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace bdt {

  // A UTC instant paired with the offset it was observed at. The offset is
  // informational: equality compares both fields.
  class offset_date_time {
    int64_t utc_ticks_ = 0;
    int16_t offset_minutes_ = 0;

  public:
    // Ticks of 0001-01-01T00:00:00 and 9999-12-31T23:59:59.9999999.
    static constexpr int64_t min_ticks = 0;
    static constexpr int64_t max_ticks = 3'155'378'975'999'999'999;
    // Ticks of 1970-01-01T00:00:00.
    static constexpr int64_t unix_epoch_ticks = 621'355'968'000'000'000;
    static constexpr int16_t max_offset_minutes = 14 * 60;

    // Unix milliseconds of min_ticks and of the last whole millisecond.
    static constexpr int64_t min_unix_millis = -62'135'596'800'000;
    static constexpr int64_t max_unix_millis = 253'402'300'799'999;

    offset_date_time() = default;
    explicit offset_date_time(int64_t utc_ticks, int16_t offset_minutes = 0);

    // "yyyy-MM-ddTHH:mm:ss[.f...](Z|+hh:mm|-hh:mm)".
    explicit offset_date_time(std::string_view str);

    static offset_date_time
    from_local_ticks(int64_t local_ticks, int16_t offset_minutes);
    static offset_date_time
    from_local(const date_only& date, const time_only& time,
               int16_t offset_minutes);
    static offset_date_time
    from_unix_milliseconds(int64_t millis);

    static offset_date_time
    min_value();
    static offset_date_time
    max_value();

    int64_t
    utc_ticks() const;
    int64_t
    local_ticks() const;
    int16_t
    offset_minutes() const;

    // Calendar parts of the local clock reading.
    date_only
    date() const;
    time_only
    time_of_day() const;

    // Milliseconds between the Unix epoch and the UTC instant, truncated
    // toward zero.
    int64_t
    to_unix_milliseconds() const;

    std::string
    to_string() const;

    bool
    operator==(const offset_date_time& other) const = default;

    friend std::ostream&
    operator<<(std::ostream& os, const offset_date_time& v) {
      return os << v.to_string();
    }
  };

} // namespace bdt

template <>
struct std::hash<bdt::offset_date_time> {
  std::size_t
  operator()(const bdt::offset_date_time& v) const noexcept {
    std::size_t seed = std::hash<int64_t>{}(v.utc_ticks());
    seed ^= std::hash<int16_t>{}(v.offset_minutes()) + 0x9e3779b9 +
            (seed << 6) + (seed >> 2);
    return seed;
  }
};
