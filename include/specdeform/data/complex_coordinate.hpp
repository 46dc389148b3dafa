#pragma once

/// \file
/// \brief Complex coordinate map `y(s)` for the spectral deformation method.
///
/// The contour from `y_start` to `y_end` is pushed off the real axis by a
/// cubic bump that vanishes at `s = +-1`, so the endpoints stay fixed.
///
/// References: J. D. Crawford and P. D. Hislop, Ann. Phys. 189, 265 (1989).

#include <map>
#include <string>
#include <utility>

#include <fmt/core.h>

#include <specdeform/core/types.hpp>
#include <specdeform/data/profile.hpp>

namespace specdeform::data {

/// \brief Deformation amplitude and shape coefficients.
struct DeformationParams {
  double alpha = 0.0;
  double beta_0 = 0.0;
  double beta_1 = 0.0;
};

namespace detail {

/// \brief Shortest round-trip text of `value`, keeping `.0` on integral values
/// so `0` reads `0.0` in run names.
inline std::string parameter_text(double value) {
  std::string text = fmt::format("{}", value);
  if (text.find_first_not_of("+-0123456789") == std::string::npos) {
    text += ".0";
  }
  return text;
}

} // namespace detail

/**
 * \brief Profile of the coordinate map together with the parameters that
 * determine it.
 */
class ComplexCoordinate {
public:
  ComplexCoordinate(Profile profile, DeformationParams params, double y_start,
                    double y_end)
      : profile_(std::move(profile)), params_(params), y_start_(y_start),
        y_end_(y_end) {}

  [[nodiscard]] const Profile &profile() const { return profile_; }
  [[nodiscard]] const DeformationParams &params() const { return params_; }
  [[nodiscard]] const std::string &name() const { return profile_.name(); }
  [[nodiscard]] double y_start() const { return y_start_; }
  [[nodiscard]] double y_end() const { return y_end_; }

  /// \return Parameters keyed `alpha`, `beta_0`, `beta_1`.
  [[nodiscard]] std::map<std::string, double> params_map() const {
    return {{"alpha", params_.alpha},
            {"beta_0", params_.beta_0},
            {"beta_1", params_.beta_1}};
  }

  [[nodiscard]] core::Scalar value(core::Scalar s_pos) const {
    return profile_.value(s_pos);
  }
  [[nodiscard]] core::Scalar value_d(core::Scalar s_pos) const {
    return profile_.value_d(s_pos);
  }
  [[nodiscard]] core::Scalar value_d2(core::Scalar s_pos) const {
    return profile_.value_d2(s_pos);
  }

private:
  Profile profile_;
  DeformationParams params_;
  double y_start_ = -1.0;
  double y_end_ = 1.0;
};

/**
 * \brief Build the deformed coordinate map
 * `y(s) = y_start + (y_end - y_start)(s+1)/2 - (alpha + i)(beta_0 + beta_1 s)(s^2 - 1)`
 * with its first and second derivatives.
 * \param y_start Image of `s = -1`.
 * \param y_end Image of `s = 1`.
 * \param params Deformation parameters.
 */
inline ComplexCoordinate make_complex_coordinate(double y_start, double y_end,
                                                 const DeformationParams &params) {
  const std::string name =
      fmt::format("[a{}b{}b{}]", detail::parameter_text(params.alpha),
                  detail::parameter_text(params.beta_0),
                  detail::parameter_text(params.beta_1));
  const std::string label = fmt::format(
      "y(s; alpha={}, beta_0={}, beta_1={})", detail::parameter_text(params.alpha),
      detail::parameter_text(params.beta_0), detail::parameter_text(params.beta_1));

  const core::Scalar amplitude(params.alpha, 1.0);
  const double half_width = (y_end - y_start) / 2.0;
  const double beta_0 = params.beta_0;
  const double beta_1 = params.beta_1;

  ProfileFunctions functions{
      .value =
          [=](core::Scalar s) {
            return y_start + half_width * (s + 1.0) -
                   amplitude * (beta_0 + beta_1 * s) * (s * s - 1.0);
          },
      .value_d =
          [=](core::Scalar s) {
            return half_width -
                   amplitude * (beta_1 * (3.0 * s * s - 1.0) + 2.0 * beta_0 * s);
          },
      .value_d2 =
          [=](core::Scalar s) {
            return -2.0 * amplitude * (3.0 * beta_1 * s + beta_0);
          },
  };

  return ComplexCoordinate(Profile(name, std::move(functions), label), params,
                           y_start, y_end);
}

/**
 * \brief Whether the map actually leaves the real axis.
 * \return `false` iff all deformation parameters are zero.
 */
inline bool is_deformed(const ComplexCoordinate &coordinate) {
  const auto &p = coordinate.params();
  return p.alpha != 0.0 || p.beta_0 != 0.0 || p.beta_1 != 0.0;
}

} // namespace specdeform::data
