#pragma once

#include "ffcc/core/types.hpp"

#include <vector>

namespace ffcc::color {

/**
 * Convert RGB rows ([N x 3]) to log-chroma rows ([N x 2]):
 * u = log(g) - log(r), v = log(g) - log(b).
 * Channels are floored at kEpsilon before the log.
 * Throws InvalidInputError on negative (or NaN) input and
 * ShapeMismatchError if rgb does not have 3 columns.
 */
Matrix2Df rgb_to_uv(const Matrix2Df& rgb);

// Planar variant; output planes have the input's size.
UVImage rgb_to_uv(const RGBImage& rgb);

/**
 * Convert log-chroma rows ([N x 2]) to unit-norm RGB rows ([N x 3]),
 * assuming g = 1: (exp(-u), 1, exp(-v)) / ||.||.
 */
Matrix2Df uv_to_rgb(const Matrix2Df& uv);

/**
 * Apply white-balance gains (exp(u), 1, exp(v)) of uv row b to images[b].
 * uv must be [batch x 2].
 */
std::vector<RGBImage> apply_wb(const std::vector<RGBImage>& images, const Matrix2Df& uv);

RGBImage apply_wb(const RGBImage& image, float u, float v);

// Throws ShapeMismatchError unless the three planes share their size.
void check_planes(const RGBImage& image, const char* what);

} // namespace ffcc::color
