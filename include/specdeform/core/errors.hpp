#pragma once

#include <stdexcept>
#include <string>

namespace specdeform::core {

/// \brief A scalar argument was not a number (NaN, or unparsable text).
class InvalidArgumentType : public std::invalid_argument {
public:
  explicit InvalidArgumentType(const std::string &what)
      : std::invalid_argument(what) {}
};

/// \brief A derivative accessor was used on a profile built without it.
class DerivativeNotConfigured : public std::logic_error {
public:
  explicit DerivativeNotConfigured(const std::string &what)
      : std::logic_error(what) {}
};

/// \brief Array lengths or row counts disagree in eigenmode post-processing.
class ShapeMismatch : public std::invalid_argument {
public:
  explicit ShapeMismatch(const std::string &what)
      : std::invalid_argument(what) {}
};

} // namespace specdeform::core
