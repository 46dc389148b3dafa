#pragma once

/// \file
/// \brief Chebyshev polynomials `T_n(s) = cos(n arccos s)` and their
/// derivatives up to third order, for real and complex arguments.
///
/// The derivative forms divide by `sin(arccos s)`, which vanishes at
/// `s = +-1`. They do not special-case these points: the result there is
/// non-finite and left to the caller, who should use
/// `chebyshev_endpoint_derivative` for boundary values.

#include <cmath>
#include <complex>
#include <concepts>
#include <stdexcept>
#include <string>

#include <specdeform/core/types.hpp>

namespace specdeform::ops {

/// \brief Scalars accepted by the basis evaluators.
template <typename T>
concept BasisScalar =
    std::same_as<T, double> || std::same_as<T, std::complex<double>>;

namespace detail {

inline void check_degree(int n_degree) {
  if (n_degree < 0) {
    throw std::invalid_argument("basis degree must be non-negative, got " +
                                std::to_string(n_degree));
  }
}

inline void check_order(int order) {
  if (order < 0 || order > 3) {
    throw std::invalid_argument(
        "basis derivative order must be in [0, 3], got " + std::to_string(order));
  }
}

} // namespace detail

template <BasisScalar T> T chebyshev(int n_degree, T s_pos) {
  detail::check_degree(n_degree);
  using std::acos;
  using std::cos;
  return cos(static_cast<double>(n_degree) * acos(s_pos));
}

template <BasisScalar T> T chebyshev_d(int n_degree, T s_pos) {
  detail::check_degree(n_degree);
  using std::acos;
  using std::sin;
  const double n = static_cast<double>(n_degree);
  const T t = acos(s_pos);
  return n * sin(n * t) / sin(t);
}

template <BasisScalar T> T chebyshev_d2(int n_degree, T s_pos) {
  detail::check_degree(n_degree);
  using std::acos;
  using std::cos;
  using std::sin;
  const double n = static_cast<double>(n_degree);
  const T t = acos(s_pos);
  const T sin_t = sin(t);
  return (-(n * n) * cos(n * t) + chebyshev_d(n_degree, s_pos) * cos(t)) /
         (sin_t * sin_t);
}

template <BasisScalar T> T chebyshev_d3(int n_degree, T s_pos) {
  detail::check_degree(n_degree);
  using std::acos;
  using std::cos;
  using std::sin;
  const double n = static_cast<double>(n_degree);
  const T t = acos(s_pos);
  const T sin_t = sin(t);
  return ((1.0 - n * n) * chebyshev_d(n_degree, s_pos) +
          3.0 * chebyshev_d2(n_degree, s_pos) * cos(t)) /
         (sin_t * sin_t);
}

/**
 * \brief Derivative of order 0..3 of `T_n` at `s_pos`.
 * \throws std::invalid_argument for a negative degree or an order outside 0..3.
 */
template <BasisScalar T> T chebyshev_derivative(int n_degree, int order, T s_pos) {
  detail::check_order(order);
  switch (order) {
  case 0:
    return chebyshev(n_degree, s_pos);
  case 1:
    return chebyshev_d(n_degree, s_pos);
  case 2:
    return chebyshev_d2(n_degree, s_pos);
  default:
    return chebyshev_d3(n_degree, s_pos);
  }
}

/**
 * \brief Closed-form limit of `T_n^(k)` at `s = +-1`.
 *
 * `T_n^(k)(+-1) = (+-1)^(n+k) prod_{j<k} (n^2 - j^2) / (2j + 1)`, so the first
 * derivative is `n^2` at `s = 1` and `(-1)^(n+1) n^2` at `s = -1`.
 * \param n_degree Polynomial degree.
 * \param order Derivative order (any non-negative value).
 * \param side Which endpoint.
 */
inline double chebyshev_endpoint_derivative(int n_degree, int order,
                                            core::Endpoint side) {
  detail::check_degree(n_degree);
  if (order < 0) {
    throw std::invalid_argument("basis derivative order must be non-negative, got " +
                                std::to_string(order));
  }

  const double n_sq = static_cast<double>(n_degree) * static_cast<double>(n_degree);
  double value = 1.0;
  for (int j = 0; j < order; ++j) {
    const double jd = static_cast<double>(j);
    value *= (n_sq - jd * jd) / (2.0 * jd + 1.0);
  }

  if (side == core::Endpoint::Lower && (n_degree + order) % 2 != 0) {
    value = -value;
  }
  return value;
}

} // namespace specdeform::ops
