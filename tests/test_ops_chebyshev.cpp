#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cmath>
#include <complex>
#include <stdexcept>
#include <vector>

#include <specdeform/ops/chebyshev.hpp>

#include "support/finite_difference.hpp"
#include "support/tolerances.hpp"

using namespace specdeform;
using specdeform::test_support::central_difference;
using specdeform::test_support::matches_derivative;

namespace {

const std::vector<double> kRealPoints = {-0.85, -0.6, -0.2, 0.0, 0.35, 0.7, 0.85};
const std::vector<std::complex<double>> kComplexPoints = {
    {-0.5, 0.2}, {0.1, -0.3}, {0.6, 0.15}};

} // namespace

TEST_CASE("Chebyshev values match the cubic closed form") {
  // T_3(s) = 4 s^3 - 3 s
  CHECK(ops::chebyshev(3, 0.5) == doctest::Approx(-1.0));
  CHECK(ops::chebyshev_d(3, 0.5) == doctest::Approx(0.0));
  CHECK(ops::chebyshev_d2(3, 0.5) == doctest::Approx(12.0));
  CHECK(ops::chebyshev_d3(3, 0.5) == doctest::Approx(24.0));

  CHECK(ops::chebyshev(0, 0.3) == doctest::Approx(1.0));
  CHECK(ops::chebyshev(1, 0.3) == doctest::Approx(0.3));
  CHECK(ops::chebyshev(2, 0.3) == doctest::Approx(2.0 * 0.09 - 1.0));
}

TEST_CASE("Chebyshev derivatives agree with finite differences on real points") {
  for (int n = 0; n <= 8; ++n) {
    for (double s : kRealPoints) {
      const auto t0 = [n](double x) { return ops::chebyshev(n, x); };
      const auto t1 = [n](double x) { return ops::chebyshev_d(n, x); };
      const auto t2 = [n](double x) { return ops::chebyshev_d2(n, x); };

      CHECK(matches_derivative(central_difference(t0, s), ops::chebyshev_d(n, s)));
      CHECK(matches_derivative(central_difference(t1, s), ops::chebyshev_d2(n, s)));
      CHECK(matches_derivative(central_difference(t2, s), ops::chebyshev_d3(n, s)));
    }
  }
}

TEST_CASE("Chebyshev derivatives agree with finite differences off the real axis") {
  using C = std::complex<double>;
  for (int n = 0; n <= 8; ++n) {
    for (const C &s : kComplexPoints) {
      const auto t0 = [n](C z) { return ops::chebyshev(n, z); };
      const auto t1 = [n](C z) { return ops::chebyshev_d(n, z); };
      const auto t2 = [n](C z) { return ops::chebyshev_d2(n, z); };

      CHECK(matches_derivative(central_difference(t0, s), ops::chebyshev_d(n, s)));
      CHECK(matches_derivative(central_difference(t1, s), ops::chebyshev_d2(n, s)));
      CHECK(matches_derivative(central_difference(t2, s), ops::chebyshev_d3(n, s)));
    }
  }
}

TEST_CASE("Complex evaluation on the real axis matches real evaluation") {
  for (int n = 0; n <= 6; ++n) {
    for (double s : kRealPoints) {
      const std::complex<double> z(s, 0.0);
      for (int order = 0; order <= 3; ++order) {
        const double expected = ops::chebyshev_derivative(n, order, s);
        const std::complex<double> actual = ops::chebyshev_derivative(n, order, z);
        CHECK(actual.real() ==
              doctest::Approx(expected).epsilon(test_support::kTolMedium));
        CHECK(std::abs(actual.imag()) <=
              test_support::kTolMedium * std::max(1.0, std::abs(expected)));
      }
    }
  }
}

TEST_CASE("Chebyshev derivative formulas are non-finite at s = 1") {
  CHECK(std::isnan(ops::chebyshev_d(4, 1.0)));
  CHECK_FALSE(std::isfinite(ops::chebyshev_d2(4, 1.0)));
  CHECK(ops::chebyshev(4, 1.0) == doctest::Approx(1.0));
}

TEST_CASE("Endpoint limits follow the closed form") {
  // T_3: T' = 12 s^2 - 3, T'' = 24 s, T''' = 24
  CHECK(ops::chebyshev_endpoint_derivative(3, 0, core::Endpoint::Upper) == 1.0);
  CHECK(ops::chebyshev_endpoint_derivative(3, 0, core::Endpoint::Lower) == -1.0);
  CHECK(ops::chebyshev_endpoint_derivative(3, 1, core::Endpoint::Upper) ==
        doctest::Approx(9.0));
  CHECK(ops::chebyshev_endpoint_derivative(3, 1, core::Endpoint::Lower) ==
        doctest::Approx(9.0));
  CHECK(ops::chebyshev_endpoint_derivative(3, 2, core::Endpoint::Upper) ==
        doctest::Approx(24.0));
  CHECK(ops::chebyshev_endpoint_derivative(3, 2, core::Endpoint::Lower) ==
        doctest::Approx(-24.0));
  CHECK(ops::chebyshev_endpoint_derivative(3, 3, core::Endpoint::Upper) ==
        doctest::Approx(24.0));
  CHECK(ops::chebyshev_endpoint_derivative(3, 3, core::Endpoint::Lower) ==
        doctest::Approx(24.0));

  SUBCASE("first derivative is n^2 with alternating sign at -1") {
    for (int n = 0; n <= 10; ++n) {
      const double n_sq = static_cast<double>(n * n);
      CHECK(ops::chebyshev_endpoint_derivative(n, 1, core::Endpoint::Upper) ==
            doctest::Approx(n_sq));
      const double sign = (n % 2 == 0) ? -1.0 : 1.0;
      CHECK(ops::chebyshev_endpoint_derivative(n, 1, core::Endpoint::Lower) ==
            doctest::Approx(sign * n_sq));
    }
  }

  SUBCASE("limits are approached from inside the interval") {
    constexpr double kInside = 1.0 - 1e-5;
    for (int n = 1; n <= 6; ++n) {
      CHECK(ops::chebyshev_d(n, kInside) ==
            doctest::Approx(ops::chebyshev_endpoint_derivative(n, 1,
                                                                core::Endpoint::Upper))
                .epsilon(test_support::kTolLoose));
      CHECK(ops::chebyshev_d(n, -kInside) ==
            doctest::Approx(ops::chebyshev_endpoint_derivative(n, 1,
                                                                core::Endpoint::Lower))
                .epsilon(test_support::kTolLoose));
    }
  }
}

TEST_CASE("Invalid degree or order is rejected") {
  CHECK_THROWS_AS(ops::chebyshev(-1, 0.2), std::invalid_argument);
  CHECK_THROWS_AS(ops::chebyshev_derivative(2, 4, 0.2), std::invalid_argument);
  CHECK_THROWS_AS(ops::chebyshev_derivative(2, -1, 0.2), std::invalid_argument);
  CHECK_THROWS_AS(
      ops::chebyshev_endpoint_derivative(2, -1, core::Endpoint::Upper),
      std::invalid_argument);
}
