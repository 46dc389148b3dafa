#pragma once

namespace specdeform::test_support {

constexpr double kTolLoose = 1e-2;
constexpr double kTolMedium = 1e-6;
constexpr double kTolTight = 1e-10;

// Relative bound for a 5-point stencil against an analytic derivative.
constexpr double kTolFiniteDiff = 1e-6;
constexpr double kFiniteDiffStep = 5e-4;

} // namespace specdeform::test_support
