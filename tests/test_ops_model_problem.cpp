#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cmath>
#include <complex>
#include <numbers>

#include <specdeform/specdeform.hpp>

#include "support/test_env.hpp"
#include "support/tolerances.hpp"

using namespace specdeform;
using core::Scalar;

namespace {

bool has_eigenvalue_near(const Eigen::VectorXcd &values, double target, double rel_tol) {
  for (Eigen::Index i = 0; i < values.size(); ++i) {
    if (std::abs(values[i] - target) <= rel_tol * target) {
      return true;
    }
  }
  return false;
}

} // namespace

TEST_CASE("Exact Dirichlet eigenvalues") {
  CHECK(ops::dirichlet_laplacian_eigenvalue(1, 1.0) ==
        doctest::Approx(std::numbers::pi * std::numbers::pi));
  CHECK(ops::dirichlet_laplacian_eigenvalue(2, 2.0) ==
        doctest::Approx(std::numbers::pi * std::numbers::pi));
  CHECK(ops::dirichlet_laplacian_eigenvalue(3, 2.0) ==
        doctest::Approx(9.0 * std::numbers::pi * std::numbers::pi / 4.0));
}

TEST_CASE("Assembled operator has one row per collocation point") {
  const auto config = test_support::serial_config();
  const auto coordinate = data::make_complex_coordinate(-1.0, 1.0, {});
  const auto [A, B] = ops::assemble_dirichlet_laplacian(coordinate, 10, config);
  CHECK(A.rows() == 10);
  CHECK(A.cols() == 10);
  CHECK(B.rows() == 10);
  CHECK(B.cols() == 10);
  CHECK(A.allFinite());
  CHECK(B.allFinite());
}

TEST_CASE("Undeformed Laplacian reproduces the exact spectrum") {
  const auto config = test_support::serial_config();
  const auto coordinate = data::make_complex_coordinate(-1.0, 1.0, {});
  const auto spectrum = ops::solve_dirichlet_laplacian(coordinate, 24, config);
  REQUIRE(spectrum.eigenvalues.size() == 24);
  REQUIRE(spectrum.eigenvectors.rows() == 24);

  const core::EigenMatrix sorted =
      ops::sort_by_eigenvalue(spectrum.eigenvalues, spectrum.eigenvectors);
  for (int k = 1; k <= 4; ++k) {
    const Scalar value = sorted(24, k - 1);
    const double exact = ops::dirichlet_laplacian_eigenvalue(k, 2.0);
    CHECK(value.real() == doctest::Approx(exact).epsilon(test_support::kTolMedium));
    CHECK(std::abs(value.imag()) <= test_support::kTolMedium * exact);
  }
}

TEST_CASE("Deformation leaves the physical eigenvalues in place") {
  const auto config = test_support::serial_config();
  const auto coordinate = data::make_complex_coordinate(-1.0, 1.0, {0.3, 0.1, 0.05});
  REQUIRE(data::is_deformed(coordinate));

  const auto spectrum = ops::solve_dirichlet_laplacian(coordinate, 32, config);
  for (int k = 1; k <= 4; ++k) {
    CHECK(has_eigenvalue_near(spectrum.eigenvalues,
                              ops::dirichlet_laplacian_eigenvalue(k, 2.0),
                              test_support::kTolMedium));
  }
}

TEST_CASE("Two-resolution screening keeps only converged modes") {
  const auto config = test_support::serial_config();
  const auto coordinate = data::make_complex_coordinate(0.0, 1.0, {0.2, 0.1, 0.0});

  const auto coarse = ops::solve_dirichlet_laplacian(coordinate, 24, config);
  const auto fine = ops::solve_dirichlet_laplacian(coordinate, 32, config);

  core::EigenMatrix matrix =
      ops::sort_by_eigenvalue(coarse.eigenvalues, coarse.eigenvectors);
  const Eigen::VectorXcd sorted_values = matrix.row(24).transpose();

  const core::ValidityMask mask = ops::convergence_mask(sorted_values, fine.eigenvalues,
                                                        test_support::kTolMedium);
  REQUIRE(mask.size() == 24);
  for (Eigen::Index i = 0; i < 4; ++i) {
    CHECK(mask[i]);
  }
  CHECK_FALSE(mask.all());

  Eigen::VectorXd magnitude = sorted_values.cwiseAbs();
  const Eigen::Index screened = ops::screen_eigenmodes(matrix, mask, magnitude);
  CHECK(screened > 0);

  const core::EigenMatrix resorted = ops::sort_by_eigenvalue(matrix);
  const Eigen::Index valid = ops::count_valid_modes(resorted);
  CHECK(valid == 24 - screened);
  CHECK(valid >= 4);
  for (int k = 1; k <= 4; ++k) {
    CHECK(resorted(24, k - 1).real() ==
          doctest::Approx(ops::dirichlet_laplacian_eigenvalue(k, 1.0))
              .epsilon(test_support::kTolMedium));
  }
}

TEST_CASE("Convergence mask compares against the nearest reference value") {
  Eigen::VectorXcd values(3);
  values << Scalar(1.0, 0.0), Scalar(2.0, 0.0), Scalar(10.0, 1.0);
  Eigen::VectorXcd reference(2);
  reference << Scalar(2.0 + 1e-9, 0.0), Scalar(1.0, 0.0);

  const core::ValidityMask mask = ops::convergence_mask(values, reference, 1e-6);
  CHECK(mask[0]);
  CHECK(mask[1]);
  CHECK_FALSE(mask[2]);
}
