#include "ffcc/histogram/splat.hpp"
#include "ffcc/core/errors.hpp"
#include "ffcc/core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace ffcc::histogram {

Matrix2Df splat_non_uniform(const std::vector<float>& x, const std::vector<float>& bins) {
    if (bins.empty()) {
        throw InvalidInputError("splat_non_uniform needs at least one bin");
    }
    if (!core::is_strictly_increasing(bins)) {
        throw InvalidInputError("splat_non_uniform bins must be strictly increasing");
    }

    const int n = static_cast<int>(bins.size());
    const float lo_edge = bins.front();
    const float hi_edge = bins.back();

    Matrix2Df weights = Matrix2Df::Zero(static_cast<Eigen::Index>(x.size()), n);
    for (size_t row = 0; row < x.size(); ++row) {
        if (!std::isfinite(x[row])) {
            throw InvalidInputError("splat_non_uniform value " + std::to_string(row) +
                                    " is not finite");
        }
        const float xc = std::min(std::max(x[row], lo_edge), hi_edge);

        // First bin wins on ties
        int nearest = 0;
        float best = std::fabs(bins[0] - xc);
        for (int i = 1; i < n; ++i) {
            const float d = std::fabs(bins[i] - xc);
            if (d < best) {
                best = d;
                nearest = i;
            }
        }

        int idx_lo = nearest;
        int idx_hi = nearest;
        if (n > 1) {
            if (xc < bins[nearest] && nearest > 0) {
                idx_lo = nearest - 1;
            } else if (nearest == n - 1) {
                idx_lo = n - 2;
            }
            idx_hi = idx_lo + 1;
        }

        const float b_lo = bins[idx_lo];
        const float b_hi = bins[idx_hi];
        const float w_hi = (xc - b_lo) / std::max(b_hi - b_lo, kEpsilon);
        const float w_lo = 1.0f - w_hi;

        const auto r = static_cast<Eigen::Index>(row);
        weights(r, idx_lo) += w_lo;
        weights(r, idx_hi) += w_hi;
    }
    return weights;
}

} // namespace ffcc::histogram
