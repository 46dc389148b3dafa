#pragma once

#include <cmath>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>

#include <specdeform/core/errors.hpp>
#include <specdeform/core/log.hpp>
#include <specdeform/core/types.hpp>

namespace specdeform::data {

/// \brief Closures defining a profile; derivatives may be left empty.
struct ProfileFunctions {
  /// \brief Profile value, required.
  core::ScalarFunction value;
  /// \brief First derivative, optional.
  core::ScalarFunction value_d;
  /// \brief Second derivative, optional.
  core::ScalarFunction value_d2;
};

/**
 * \brief Named analytic profile `Scalar -> Scalar` with optional derivatives.
 *
 * Used for background fields and, through composition, for the complex
 * coordinate map. The closures are fixed at construction.
 *
 * Real accessors complexify their argument as `(x, 0)`, evaluate, and return
 * the real part. A NaN argument is the typed stand-in for a non-numeric one
 * and is rejected with `InvalidArgumentType`; it is never propagated into the
 * closures. Failures are reported through the profile's logger and then
 * thrown.
 */
class Profile {
public:
  /**
   * \brief Build a profile.
   * \param name Identifier, also used as logger name.
   * \param functions Value and optional derivatives.
   * \param label Display label; defaults to `name`.
   * \throws std::invalid_argument if `functions.value` is empty.
   */
  Profile(std::string name, ProfileFunctions functions,
          std::optional<std::string> label = std::nullopt)
      : name_(std::move(name)), functions_(std::move(functions)),
        logger_(name_) {
    label_ = label.has_value() ? std::move(*label) : name_;
    if (!functions_.value) {
      logger_.error("Profile value function is empty.");
      throw std::invalid_argument("Profile '" + name_ +
                                  "' requires a value function");
    }
  }

  [[nodiscard]] const std::string &name() const { return name_; }
  [[nodiscard]] const std::string &label() const { return label_; }
  [[nodiscard]] const ProfileFunctions &functions() const { return functions_; }

  [[nodiscard]] bool has_value_d() const {
    return static_cast<bool>(functions_.value_d);
  }
  [[nodiscard]] bool has_value_d2() const {
    return static_cast<bool>(functions_.value_d2);
  }

  [[nodiscard]] core::Scalar value(core::Scalar z) const {
    return functions_.value(z);
  }

  /// \throws core::DerivativeNotConfigured if no first derivative was given.
  [[nodiscard]] core::Scalar value_d(core::Scalar z) const {
    return require(functions_.value_d, "first derivative")(z);
  }

  /// \throws core::DerivativeNotConfigured if no second derivative was given.
  [[nodiscard]] core::Scalar value_d2(core::Scalar z) const {
    return require(functions_.value_d2, "second derivative")(z);
  }

  /// \throws core::InvalidArgumentType if `x` is NaN.
  [[nodiscard]] double real_value(double x) const {
    require_number(x, "real_value");
    return functions_.value(core::Scalar(x, 0.0)).real();
  }

  /// \throws core::InvalidArgumentType, core::DerivativeNotConfigured
  [[nodiscard]] double real_first_derivative(double x) const {
    require_number(x, "real_first_derivative");
    return value_d(core::Scalar(x, 0.0)).real();
  }

  /// \throws core::InvalidArgumentType, core::DerivativeNotConfigured
  [[nodiscard]] double real_second_derivative(double x) const {
    require_number(x, "real_second_derivative");
    return value_d2(core::Scalar(x, 0.0)).real();
  }

private:
  void require_number(double x, std::string_view accessor) const {
    if (!std::isnan(x)) {
      return;
    }
    logger_.error("Invalid type of the argument.");
    throw core::InvalidArgumentType(
        fmt::format("{}: argument of {} is not a number", name_, accessor));
  }

  const core::ScalarFunction &require(const core::ScalarFunction &fn,
                                      std::string_view what) const {
    if (fn) {
      return fn;
    }
    logger_.error(fmt::format("The {} has not been set.", what));
    throw core::DerivativeNotConfigured(
        fmt::format("{}: {} was not configured", name_, what));
  }

  std::string name_;
  std::string label_;
  ProfileFunctions functions_;
  core::Logger logger_;
};

} // namespace specdeform::data
