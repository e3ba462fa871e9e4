#pragma once

#include <bdt/errors.hpp>
#include <bdt/wire_type.hpp>

#include <stdexcept>
#include <string>
#include <utility>

namespace bdt::detail {

  // Runs `make`, reporting value validation failures as decode_value_error.
  template <typename F>
  auto
  decode_value(const char* codec_name, F&& make) -> decltype(make()) {
    try {
      return std::forward<F>(make)();
    } catch (const std::invalid_argument& e) {
      throw decode_value_error(std::string(codec_name) + ": " + e.what());
    }
  }

  [[noreturn]] inline void
  throw_type_mismatch(const char* codec_name, const char* value_name,
                      wire_type type) {
    throw decode_type_mismatch(std::string(codec_name) +
                               ": cannot deserialize a " + value_name +
                               " from wire type " +
                               std::string(to_string(type)));
  }

  [[noreturn]] inline void
  throw_bad_representation(const char* codec_name, const char* value_name,
                           wire_type representation) {
    throw configuration_error("the " + std::string(to_string(representation)) +
                              " representation is not a valid representation"
                              " for a " +
                              codec_name + " (" + value_name + ")");
  }

} // namespace bdt::detail
