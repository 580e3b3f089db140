#pragma once

#include "ffcc/core/types.hpp"

#include <vector>

namespace ffcc::scoring {

// Softmax over all entries of a square score surface (max-subtracted).
// Throws ShapeMismatchError for an empty or non-square surface.
Matrix2Df softmax2(const Matrix2Df& h);

std::vector<Matrix2Df> softmax2(const std::vector<Matrix2Df>& h, int parallel_workers = 1);

} // namespace ffcc::scoring
