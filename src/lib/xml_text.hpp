#pragma once

#include <charconv>
#include <cmath>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace bdt::detail {

  inline void
  escape_xml(std::ostream& os, std::string_view text, bool in_attribute) {
    for (char c : text) {
      switch (c) {
        case '<':
          os << "&lt;";
          break;
        case '>':
          os << "&gt;";
          break;
        case '&':
          os << "&amp;";
          break;
        case '"':
          if (in_attribute) {
            os << "&quot;";
          } else {
            os << c;
          }
          break;
        default:
          os << c;
          break;
      }
    }
  }

  inline std::string
  format_double(double value) {
    if (std::isinf(value)) return value > 0 ? "INF" : "-INF";
    if (std::isnan(value)) return "NaN";

    // Shortest form that reads back to the same double
    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc{})
      throw std::runtime_error("failed to format floating-point value");
    return std::string(buf, ptr);
  }

  inline double
  parse_double(std::string_view text) {
    if (text == "INF") return std::numeric_limits<double>::infinity();
    if (text == "-INF") return -std::numeric_limits<double>::infinity();
    if (text == "NaN") return std::numeric_limits<double>::quiet_NaN();

    double value{};
    auto [ptr, ec] =
        std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size())
      throw std::runtime_error("invalid floating-point value: " +
                               std::string(text));
    return value;
  }

  template <typename T>
  T
  parse_integer(std::string_view text) {
    T value{};
    auto [ptr, ec] =
        std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec == std::errc::result_out_of_range)
      throw std::runtime_error("integer value out of range: " +
                               std::string(text));
    if (ec != std::errc{} || ptr != text.data() + text.size())
      throw std::runtime_error("invalid integer value: " + std::string(text));
    return value;
  }

} // namespace bdt::detail
