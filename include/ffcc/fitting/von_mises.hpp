#pragma once

#include "ffcc/core/types.hpp"

#include <vector>

namespace ffcc::fitting {

constexpr float kDefaultPmfSumTolerance = 1e-4f;

/**
 * Approximately fit a bivariate von Mises distribution to a PMF by its local
 * moments, treating both axes as angles on a circle of circumference n.
 *
 * mu is the circular mean of each marginal in index space, (row, col) =
 * (u, v), in [0, n). sigma is the covariance of the wrapped (shortest path)
 * distances to mu.
 *
 * Throws ShapeMismatchError for an empty or non-square PMF and
 * InvariantViolationError if a PMF does not sum to 1 within `tolerance`.
 */
VonMisesFit bivariate_von_mises(const std::vector<Matrix2Df>& pmf,
                                float tolerance = kDefaultPmfSumTolerance,
                                int parallel_workers = 1);

VonMisesFit bivariate_von_mises(const Matrix2Df& pmf,
                                float tolerance = kDefaultPmfSumTolerance);

// Signed shortest-path distance from mu to bin on a circle of n bins, in [-n/2, n/2).
double wrapped_delta(double bin, double mu, int n);

} // namespace ffcc::fitting
