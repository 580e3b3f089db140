#include "ffcc/fitting/label_pmf.hpp"
#include "ffcc/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <string>

namespace ffcc::fitting {

LabelPMF uv_to_pmf(const Matrix2Df& uv, float step_size, float offset, int n,
                   bool warn_on_clamp) {
    if (uv.cols() != 2) {
        throw ShapeMismatchError("uv_to_pmf expects uv [batch x 2], got " + shape_to_string(uv));
    }
    if (!(step_size > 0.0f) || !std::isfinite(step_size)) {
        throw InvalidInputError("uv_to_pmf needs a positive step_size");
    }
    if (n < 1) {
        throw InvalidInputError("uv_to_pmf needs n >= 1, got " + std::to_string(n));
    }
    if (!uv.allFinite()) {
        throw InvalidInputError("uv_to_pmf got a non-finite label");
    }

    const float uv_min = offset;
    const float uv_max = offset + static_cast<float>(n - 1) * step_size;

    LabelPMF out;
    out.pmf.reserve(static_cast<size_t>(uv.rows()));
    out.clamped.reserve(static_cast<size_t>(uv.rows()));

    for (Eigen::Index b = 0; b < uv.rows(); ++b) {
        int lo[2];
        int hi[2];
        float w1[2];
        bool clamped = false;

        for (int axis = 0; axis < 2; ++axis) {
            const float value = uv(b, axis);
            const float clipped = std::min(std::max(value, uv_min), uv_max);
            if (clipped != value) clamped = true;

            const float idx = (clipped - offset) / step_size;
            // Wrap hi instead of clamping so the two taps never share a bin;
            // at the top edge its weight is zero anyway
            lo[axis] = std::min(n - 1, std::max(0, static_cast<int>(std::floor(idx))));
            hi[axis] = (lo[axis] + 1) % n;
            w1[axis] = std::min(1.0f, std::max(0.0f, idx - static_cast<float>(lo[axis])));
        }

        if (clamped && warn_on_clamp) {
            std::cerr << "[LABEL] WARNING: uv_to_pmf() given (" << uv(b, 0) << ", " << uv(b, 1)
                      << ") outside [" << uv_min << ", " << uv_max << "], clipping." << std::endl;
        }

        const float w0_u = 1.0f - w1[0];
        const float w0_v = 1.0f - w1[1];

        Matrix2Df pmf = Matrix2Df::Zero(n, n);
        pmf(lo[0], lo[1]) += w0_u * w0_v;
        pmf(lo[0], hi[1]) += w0_u * w1[1];
        pmf(hi[0], lo[1]) += w1[0] * w0_v;
        pmf(hi[0], hi[1]) += w1[0] * w1[1];

        out.pmf.push_back(std::move(pmf));
        out.clamped.push_back(clamped);
    }
    return out;
}

} // namespace ffcc::fitting
