#pragma once

#include "ffcc/core/types.hpp"

#include <vector>

namespace ffcc::histogram {

/**
 * Linearly splat scalars over a non-uniform 1D grid.
 *
 * Each value is clamped into [bins.front(), bins.back()], its nearest bin is
 * paired with the adjacent bin on the side of the value, and the two weights
 * reconstruct the value under linear interpolation. Weights landing on the
 * same bin are summed.
 *
 * Example: splat_non_uniform({0.75}, {0, 0.5, 1}) -> [[0, 0.5, 0.5]].
 *
 * Returns [x.size() x bins.size()]. Throws InvalidInputError if bins is empty
 * or not strictly increasing.
 */
Matrix2Df splat_non_uniform(const std::vector<float>& x, const std::vector<float>& bins);

} // namespace ffcc::histogram
