#pragma once

#include <stdexcept>
#include <string>

namespace bdt {

  // Invalid representation or unit given to a codec constructor.
  class configuration_error : public std::invalid_argument {
  public:
    using std::invalid_argument::invalid_argument;
  };

  // Representation inconsistent with a codec's encode logic.
  class encode_error : public std::logic_error {
  public:
    using std::logic_error::logic_error;
  };

  class decode_error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  // The wire type at the cursor is not one the codec understands.
  class decode_type_mismatch : public decode_error {
  public:
    using decode_error::decode_error;
  };

  // The wire data has an understood type but an unusable value.
  class decode_value_error : public decode_error {
  public:
    using decode_error::decode_error;
  };

} // namespace bdt
