#pragma once

/// \file
/// \brief Heinrichs basis `(1 - s^2) T_n(s)` and its derivatives up to third
/// order, built from the Chebyshev evaluators by the product rule.

#include <optional>

#include <specdeform/core/types.hpp>
#include <specdeform/ops/chebyshev.hpp>

namespace specdeform::ops {

namespace detail {

/// \return The endpoint `s_pos` sits on exactly, if any.
template <BasisScalar T> std::optional<core::Endpoint> exact_endpoint(T s_pos) {
  double re = 0.0;
  if constexpr (std::same_as<T, double>) {
    re = s_pos;
  } else {
    if (s_pos.imag() != 0.0) {
      return std::nullopt;
    }
    re = s_pos.real();
  }

  if (re == 1.0) {
    return core::Endpoint::Upper;
  }
  if (re == -1.0) {
    return core::Endpoint::Lower;
  }
  return std::nullopt;
}

/// \return `T_n^(order)` at `s_pos`, using the closed-form limit at `+-1`.
template <BasisScalar T>
T chebyshev_or_limit(int n_degree, int order, T s_pos,
                     const std::optional<core::Endpoint> &side) {
  if (side.has_value()) {
    return T(chebyshev_endpoint_derivative(n_degree, order, *side));
  }
  return chebyshev_derivative(n_degree, order, s_pos);
}

} // namespace detail

template <BasisScalar T> T heinrichs(int n_degree, T s_pos) {
  return (1.0 - s_pos * s_pos) * chebyshev(n_degree, s_pos);
}

// At s = +-1 the (1 - s^2) factor is zero, so only the lower-order terms of
// the product rule survive; they are evaluated from the endpoint limits.

template <BasisScalar T> T heinrichs_d(int n_degree, T s_pos) {
  const auto side = detail::exact_endpoint(s_pos);
  const T t0 = detail::chebyshev_or_limit(n_degree, 0, s_pos, side);
  if (side.has_value()) {
    return -2.0 * s_pos * t0;
  }
  return (1.0 - s_pos * s_pos) * chebyshev_d(n_degree, s_pos) - 2.0 * s_pos * t0;
}

template <BasisScalar T> T heinrichs_d2(int n_degree, T s_pos) {
  const auto side = detail::exact_endpoint(s_pos);
  const T t0 = detail::chebyshev_or_limit(n_degree, 0, s_pos, side);
  const T t1 = detail::chebyshev_or_limit(n_degree, 1, s_pos, side);
  if (side.has_value()) {
    return -4.0 * s_pos * t1 - 2.0 * t0;
  }
  return (1.0 - s_pos * s_pos) * chebyshev_d2(n_degree, s_pos) -
         4.0 * s_pos * t1 - 2.0 * t0;
}

template <BasisScalar T> T heinrichs_d3(int n_degree, T s_pos) {
  const auto side = detail::exact_endpoint(s_pos);
  const T t1 = detail::chebyshev_or_limit(n_degree, 1, s_pos, side);
  const T t2 = detail::chebyshev_or_limit(n_degree, 2, s_pos, side);
  if (side.has_value()) {
    return -6.0 * s_pos * t2 - 6.0 * t1;
  }
  return (1.0 - s_pos * s_pos) * chebyshev_d3(n_degree, s_pos) -
         6.0 * s_pos * t2 - 6.0 * t1;
}

/**
 * \brief Derivative of order 0..3 of the Heinrichs basis at `s_pos`.
 * \throws std::invalid_argument for a negative degree or an order outside 0..3.
 */
template <BasisScalar T> T heinrichs_derivative(int n_degree, int order, T s_pos) {
  detail::check_order(order);
  switch (order) {
  case 0:
    return heinrichs(n_degree, s_pos);
  case 1:
    return heinrichs_d(n_degree, s_pos);
  case 2:
    return heinrichs_d2(n_degree, s_pos);
  default:
    return heinrichs_d3(n_degree, s_pos);
  }
}

} // namespace specdeform::ops
