#pragma once

#include "ffcc/core/types.hpp"

#include <vector>

namespace ffcc::fitting {

/**
 * Map a fit from histogram index space to UV units:
 *   mu = mu_idx * step_size + offset,  sigma = sigma_idx * step_size^2.
 * Throws ShapeMismatchError unless mu_idx is [batch x 2] with one 2x2 sigma
 * per batch row.
 */
VonMisesFit idx_to_uv(const Matrix2Df& mu_idx, const std::vector<Matrix2Df>& sigma_idx,
                      float step_size, float offset);

VonMisesFit idx_to_uv(const VonMisesFit& fit_idx, float step_size, float offset);

// Inverse of idx_to_uv. Throws InvalidInputError for step_size == 0.
VonMisesFit uv_to_idx(const VonMisesFit& fit_uv, float step_size, float offset);

} // namespace ffcc::fitting
