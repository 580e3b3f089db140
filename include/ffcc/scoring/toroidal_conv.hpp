#pragma once

#include "ffcc/core/types.hpp"

#include <vector>

namespace ffcc::scoring {

// Forward 2D DFT of a real matrix (rows stay rows).
ComplexMatrix2Df fft2(const Matrix2Df& x);

// Real part of the scaled inverse 2D DFT.
Matrix2Df ifft2_real(const ComplexMatrix2Df& x_fft);

/**
 * Score one feature stack against a filter bank:
 *   H = real(ifft2(sum_c fft2(features[c]) * filters_fft[c])) + bias
 * i.e. a per-channel circular convolution summed across channels.
 * Throws ShapeMismatchError if channel counts or any spatial size differ.
 */
Matrix2Df eval_features(const FeatureStack& features, const FilterBank& bank);

// Batch form; features.size() must equal banks.size().
std::vector<Matrix2Df> eval_features(const std::vector<FeatureStack>& features,
                                     const std::vector<FilterBank>& banks,
                                     int parallel_workers = 1);

// Throws ShapeMismatchError unless every filter and the bias are rows x cols.
void check_bank(const FilterBank& bank, Eigen::Index rows, Eigen::Index cols, int channels);

} // namespace ffcc::scoring
