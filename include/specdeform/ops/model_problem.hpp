#pragma once

/// \file
/// \brief Reference eigenproblem with a known spectrum: the Dirichlet
/// Laplacian `-d^2 u / dy^2 = lambda u` along a (possibly deformed) contour.
///
/// Its eigenvalues `(k pi / L)^2` do not depend on the deformation, which
/// makes it a check of the basis, the coordinate map and the eigenmode
/// post-processing working together.

#include <algorithm>
#include <cmath>
#include <complex>
#include <numbers>
#include <stdexcept>
#include <string>
#include <utility>

#include <Eigen/Dense>
#include <Eigen/Eigenvalues>

#include <specdeform/core/config.hpp>
#include <specdeform/core/types.hpp>
#include <specdeform/data/complex_coordinate.hpp>
#include <specdeform/ops/collocation.hpp>

namespace specdeform::ops {

/// \brief Raw eigenpairs in Heinrichs coefficient space.
struct ModelSpectrum {
  Eigen::VectorXcd eigenvalues;
  Eigen::MatrixXcd eigenvectors;
};

/**
 * \brief Heinrichs-collocation discretization `A c = lambda B c` of the
 * Dirichlet Laplacian on `coordinate`.
 *
 * With `y' = dy/ds`, `d^2/dy^2 = (d^2/ds^2 - (y''/y') d/ds) / y'^2`.
 * \param coordinate Contour map `s -> y(s)`.
 * \param n_modes Number of Heinrichs modes and interior collocation points.
 * \param config Execution settings for basis evaluation.
 * \return Matrices `A` (first) and `B` (second).
 */
inline std::pair<Eigen::MatrixXcd, Eigen::MatrixXcd>
assemble_dirichlet_laplacian(const data::ComplexCoordinate &coordinate, int n_modes,
                             const core::RuntimeConfig &config = {}) {
  const Eigen::VectorXd points = interior_gauss_lobatto_points(n_modes);
  Eigen::MatrixXcd B = heinrichs_matrix(n_modes, points, 0, config);
  const Eigen::MatrixXcd H1 = heinrichs_matrix(n_modes, points, 1, config);
  const Eigen::MatrixXcd H2 = heinrichs_matrix(n_modes, points, 2, config);

  Eigen::MatrixXcd A(n_modes, n_modes);
  for (int j = 0; j < n_modes; ++j) {
    const core::Scalar s_pos(points[j], 0.0);
    const core::Scalar yd = coordinate.value_d(s_pos);
    const core::Scalar ydd = coordinate.value_d2(s_pos);
    const core::Scalar inv_yd2 = 1.0 / (yd * yd);
    A.row(j) = -inv_yd2 * (H2.row(j) - (ydd / yd) * H1.row(j));
  }
  return {std::move(A), std::move(B)};
}

/**
 * \brief Solve the discretized Dirichlet Laplacian on `coordinate`.
 * \throws std::runtime_error if the eigensolver does not converge.
 */
inline ModelSpectrum solve_dirichlet_laplacian(const data::ComplexCoordinate &coordinate,
                                               int n_modes,
                                               const core::RuntimeConfig &config = {}) {
  const auto [A, B] = assemble_dirichlet_laplacian(coordinate, n_modes, config);
  const Eigen::MatrixXcd M = B.partialPivLu().solve(A);

  Eigen::ComplexEigenSolver<Eigen::MatrixXcd> es(M);
  if (es.info() != Eigen::Success) {
    throw std::runtime_error("eigensolve failed for " + std::to_string(n_modes) +
                             " modes");
  }
  return {es.eigenvalues(), es.eigenvectors()};
}

/// \return Exact eigenvalue `(k pi / length)^2` of the `k`-th mode, `k >= 1`.
inline double dirichlet_laplacian_eigenvalue(int k, double length) {
  const double wave_number = static_cast<double>(k) * std::numbers::pi / length;
  return wave_number * wave_number;
}

/**
 * \brief Validity mask from a two-resolution comparison.
 *
 * Mode `i` is valid when some eigenvalue in `reference` lies within
 * `rel_tol * max(1, |eigenvalues[i]|)` of it; unresolved modes move with the
 * resolution and fail.
 */
inline core::ValidityMask convergence_mask(const Eigen::VectorXcd &eigenvalues,
                                           const Eigen::VectorXcd &reference,
                                           double rel_tol) {
  core::ValidityMask mask(eigenvalues.size());
  for (Eigen::Index i = 0; i < eigenvalues.size(); ++i) {
    const core::Scalar value = eigenvalues[i];
    const double tol = rel_tol * std::max(1.0, std::abs(value));
    bool matched = false;
    for (Eigen::Index j = 0; j < reference.size() && !matched; ++j) {
      matched = std::abs(reference[j] - value) <= tol;
    }
    mask[i] = matched;
  }
  return mask;
}

} // namespace specdeform::ops
