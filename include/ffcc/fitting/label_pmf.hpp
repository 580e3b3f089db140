#pragma once

#include "ffcc/core/types.hpp"

#include <vector>

namespace ffcc::fitting {

struct LabelPMF {
    std::vector<Matrix2Df> pmf;  // [batch] of n x n, row = u-bin, col = v-bin
    std::vector<bool> clamped;   // true where the label was outside the grid

    bool any_clamped() const {
        for (bool c : clamped) {
            if (c) return true;
        }
        return false;
    }
};

/**
 * Bilinearly splat ground-truth UV labels ([batch x 2]) onto an n x n
 * toroidal grid whose bin i sits at offset + i * step_size.
 *
 * Labels outside [offset, offset + (n - 1) * step_size] are clamped into
 * range; the clamp is flagged in the result and, with warn_on_clamp, logged
 * to stderr. Each PMF sums to 1.
 *
 * Throws ShapeMismatchError unless uv has two columns, InvalidInputError for
 * a non-positive step_size, n < 1 or a non-finite label.
 */
LabelPMF uv_to_pmf(const Matrix2Df& uv, float step_size, float offset, int n,
                   bool warn_on_clamp = true);

} // namespace ffcc::fitting
