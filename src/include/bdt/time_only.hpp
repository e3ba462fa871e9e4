#pragma once

#include <bdt/time_span.hpp>

#include <compare>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace bdt {

  // Time of day as ticks elapsed since midnight, in [0, 24h).
  class time_only {
    int64_t ticks_ = 0;

  public:
    time_only() = default;
    explicit time_only(int64_t ticks);
    time_only(int32_t hour, int32_t minute, int32_t second = 0,
              int32_t millisecond = 0, int32_t microsecond = 0);

    // Strict "HH:mm:ss" with an optional fraction of up to seven digits.
    explicit time_only(std::string_view str);

    static time_only
    from_time_span(const time_span& span);

    static time_only
    min_value();
    static time_only
    max_value();

    int64_t
    ticks() const;
    int32_t
    hour() const;
    int32_t
    minute() const;
    int32_t
    second() const;
    int32_t
    millisecond() const;
    int32_t
    microsecond() const;
    // Sub-microsecond part, a multiple of 100.
    int32_t
    nanosecond() const;

    time_span
    to_time_span() const;

    std::string
    to_string() const;

    bool
    operator==(const time_only& other) const = default;
    std::strong_ordering
    operator<=>(const time_only& other) const = default;

    friend std::ostream&
    operator<<(std::ostream& os, const time_only& t) {
      return os << t.to_string();
    }
  };

} // namespace bdt

template <>
struct std::hash<bdt::time_only> {
  std::size_t
  operator()(const bdt::time_only& t) const noexcept {
    return std::hash<int64_t>{}(t.ticks());
  }
};
