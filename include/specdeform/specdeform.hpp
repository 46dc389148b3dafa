#pragma once

/// \file
/// \brief Umbrella header for the public specdeform API.

#include <specdeform/core/config.hpp>
#include <specdeform/core/errors.hpp>
#include <specdeform/core/input.hpp>
#include <specdeform/core/log.hpp>
#include <specdeform/core/parallel.hpp>
#include <specdeform/core/timer.hpp>
#include <specdeform/core/types.hpp>

#include <specdeform/data/complex_coordinate.hpp>
#include <specdeform/data/profile.hpp>

#include <specdeform/ops/chebyshev.hpp>
#include <specdeform/ops/collocation.hpp>
#include <specdeform/ops/eigenmodes.hpp>
#include <specdeform/ops/heinrichs.hpp>
#include <specdeform/ops/model_problem.hpp>
