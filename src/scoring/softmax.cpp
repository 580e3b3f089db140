#include "ffcc/scoring/softmax.hpp"
#include "ffcc/core/errors.hpp"
#include "ffcc/core/parallel.hpp"

#include <cmath>

namespace ffcc::scoring {

Matrix2Df softmax2(const Matrix2Df& h) {
    if (h.size() == 0 || h.rows() != h.cols()) {
        throw ShapeMismatchError("softmax2 expects a non-empty square surface, got " +
                                 shape_to_string(h));
    }
    if (!h.allFinite()) {
        throw InvalidInputError("softmax2 got a non-finite score");
    }

    // Accumulate in double; the shifted maximum is exp(0) = 1 so the sum is >= 1
    const float max_score = h.maxCoeff();
    Matrix2Dd e = (h.array() - max_score).cast<double>().exp().matrix();
    const double total = e.sum();
    return (e / total).cast<float>();
}

std::vector<Matrix2Df> softmax2(const std::vector<Matrix2Df>& h, int parallel_workers) {
    std::vector<Matrix2Df> out(h.size());
    core::for_each_batch(h.size(), parallel_workers, [&](size_t b) {
        out[b] = softmax2(h[b]);
    });
    return out;
}

} // namespace ffcc::scoring
