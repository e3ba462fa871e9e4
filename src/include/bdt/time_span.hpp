#pragma once

#include <compare>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace bdt {

  // Signed duration in ticks. Text form is "[-][d.]hh:mm:ss[.fffffff]".
  class time_span {
    int64_t ticks_ = 0;

  public:
    time_span() = default;
    explicit time_span(int64_t ticks);

    // Accepts "[ws][-]{ d | [d.]hh:mm[:ss[.f...]] }[ws]" with hours below
    // 24, minutes and seconds below 60 and at most seven fraction digits.
    explicit time_span(std::string_view str);

    int64_t
    ticks() const;
    bool
    is_negative() const;

    // Components of the magnitude.
    int64_t
    days() const;
    int32_t
    hours() const;
    int32_t
    minutes() const;
    int32_t
    seconds() const;
    int32_t
    fraction_ticks() const;

    std::string
    to_string() const;

    bool
    operator==(const time_span& other) const = default;
    std::strong_ordering
    operator<=>(const time_span& other) const = default;

    friend std::ostream&
    operator<<(std::ostream& os, const time_span& s) {
      return os << s.to_string();
    }
  };

} // namespace bdt

template <>
struct std::hash<bdt::time_span> {
  std::size_t
  operator()(const bdt::time_span& s) const noexcept {
    return std::hash<int64_t>{}(s.ticks());
  }
};
