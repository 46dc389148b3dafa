#pragma once

#include <complex>
#include <functional>

#include <Eigen/Dense>

namespace specdeform::core {

/// \brief Working scalar; real inputs are complexified before evaluation.
using Scalar = std::complex<double>;

/// \brief Analytic profile `Scalar -> Scalar`; may be empty when optional.
using ScalarFunction = std::function<Scalar(Scalar)>;

/// \brief `(size + 1) x size` eigenvector/eigenvalue matrix.
using EigenMatrix = Eigen::MatrixXcd;

/// \brief One flag per eigenmode, `true` for modes that pass screening.
using ValidityMask = Eigen::Array<bool, Eigen::Dynamic, 1>;

/// \brief Tag for the two ends of the basis domain `[-1, 1]`.
enum class Endpoint {
  Lower,
  Upper
};

/// \return `-1` for `Endpoint::Lower`, `+1` for `Endpoint::Upper`.
constexpr double endpoint_value(Endpoint side) {
  return side == Endpoint::Upper ? 1.0 : -1.0;
}

} // namespace specdeform::core
