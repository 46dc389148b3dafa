#pragma once

#include <cmath>
#include <numbers>
#include <stdexcept>
#include <string>

#include <Eigen/Dense>

#include <specdeform/core/config.hpp>
#include <specdeform/core/parallel.hpp>
#include <specdeform/core/types.hpp>
#include <specdeform/ops/chebyshev.hpp>
#include <specdeform/ops/heinrichs.hpp>

namespace specdeform::ops {

/**
 * \brief Chebyshev Gauss-Lobatto points `cos(pi j / (n_points - 1))`.
 * \param n_points Number of points, at least 2.
 * \return Points in descending order from `1` to `-1`.
 */
inline Eigen::VectorXd gauss_lobatto_points(int n_points) {
  if (n_points < 2) {
    throw std::invalid_argument("gauss_lobatto_points requires n_points >= 2, got " +
                                std::to_string(n_points));
  }

  Eigen::VectorXd points(n_points);
  const double step = std::numbers::pi / static_cast<double>(n_points - 1);
  for (int j = 0; j < n_points; ++j) {
    points[j] = std::cos(step * static_cast<double>(j));
  }
  // cos() does not return the endpoints exactly for every n.
  points[0] = 1.0;
  points[n_points - 1] = -1.0;
  return points;
}

/**
 * \brief Gauss-Lobatto points strictly inside `(-1, 1)`.
 *
 * These are the collocation points of a Heinrichs expansion, whose basis
 * functions already vanish at the endpoints.
 * \param n_interior Number of interior points, at least 1.
 */
inline Eigen::VectorXd interior_gauss_lobatto_points(int n_interior) {
  if (n_interior < 1) {
    throw std::invalid_argument(
        "interior_gauss_lobatto_points requires n_interior >= 1, got " +
        std::to_string(n_interior));
  }
  const Eigen::VectorXd full = gauss_lobatto_points(n_interior + 2);
  return full.segment(1, n_interior);
}

namespace detail {

template <typename BasisFn>
Eigen::MatrixXcd basis_matrix(int n_modes, const Eigen::VectorXd &points,
                              int order, const core::RuntimeConfig &config,
                              BasisFn &&basis) {
  if (n_modes < 1) {
    throw std::invalid_argument("basis matrix requires n_modes >= 1, got " +
                                std::to_string(n_modes));
  }
  check_order(order);

  const int n_points = static_cast<int>(points.size());
  Eigen::MatrixXcd out(n_points, n_modes);
  core::parallel_for_index(
      0, n_points,
      [&](int j) {
        const core::Scalar s_pos(points[j], 0.0);
        for (int n = 0; n < n_modes; ++n) {
          out(j, n) = basis(n, order, s_pos);
        }
      },
      config, 16);
  return out;
}

} // namespace detail

/**
 * \brief Matrix of `T_n^(order)(s_j)`, rows indexed by point, columns by degree.
 *
 * Rows at `s = +-1` use the closed-form endpoint limits for `order >= 1`.
 * \param n_modes Number of basis functions (degrees `0..n_modes-1`).
 * \param points Evaluation points.
 * \param order Derivative order 0..3.
 * \param config Execution settings for the row loop.
 */
inline Eigen::MatrixXcd chebyshev_matrix(int n_modes, const Eigen::VectorXd &points,
                                         int order,
                                         const core::RuntimeConfig &config = {}) {
  return detail::basis_matrix(
      n_modes, points, order, config,
      [](int n, int k, core::Scalar s_pos) -> core::Scalar {
        if (const auto side = detail::exact_endpoint(s_pos); side.has_value()) {
          return core::Scalar(chebyshev_endpoint_derivative(n, k, *side));
        }
        return chebyshev_derivative(n, k, s_pos);
      });
}

/**
 * \brief Matrix of Heinrichs basis derivatives, rows by point, columns by degree.
 * \param n_modes Number of basis functions (degrees `0..n_modes-1`).
 * \param points Evaluation points.
 * \param order Derivative order 0..3.
 * \param config Execution settings for the row loop.
 */
inline Eigen::MatrixXcd heinrichs_matrix(int n_modes, const Eigen::VectorXd &points,
                                         int order,
                                         const core::RuntimeConfig &config = {}) {
  return detail::basis_matrix(n_modes, points, order, config,
                              [](int n, int k, core::Scalar s_pos) {
                                return heinrichs_derivative(n, k, s_pos);
                              });
}

} // namespace specdeform::ops
