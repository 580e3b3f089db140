#pragma once

#include "ffcc/core/types.hpp"

#include <cstdint>
#include <vector>

namespace ffcc::histogram {

/**
 * Local absolute deviation (edge signal) of an RGB image.
 * Each channel is padded symmetrically by one pixel, then every output pixel
 * is the mean of |center - neighbour| over its 8-connected neighbours.
 * Output planes have the input's size.
 */
RGBImage local_absolute_deviation(const RGBImage& rgb);

using BinCounts = Eigen::Matrix<std::int64_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// Unnormalized pixel counts per (u-bin, v-bin).
struct ChromaCounts {
    BinCounts counts;
    std::int64_t valid_pixels = 0;  // pixels with min(r, g, b) > kEpsilon
};

struct ChromaHistogram {
    Matrix2Df bins;                  // nbins x nbins, row = u-bin, col = v-bin
    std::int64_t valid_pixels = 0;
};

// Counts every valid pixel into its toroidal bin. Counts are exact integers.
ChromaCounts count_chroma_bins(const RGBImage& rgb, const HistogramGrid& grid);

// Divides counts by max(kEpsilon, valid_pixels) in double, then narrows to float.
ChromaHistogram normalize_counts(const ChromaCounts& counts);

/**
 * 2D toroidal histogram of the log-chroma of an image.
 * Pixels with any channel <= kEpsilon are skipped. Each surviving pixel goes
 * to bin round((uv - first_bin) / bin_size) mod nbins on each axis. Counts
 * are divided by max(kEpsilon, valid_pixels), so the histogram sums to 1
 * unless no pixel is valid, in which case it is all zero.
 */
ChromaHistogram compute_chroma_histogram(const RGBImage& rgb, const HistogramGrid& grid);

// Histogram features of one image.
struct ImageFeatures {
    FeatureStack channels;     // [0] raw image, [1] edge image
    std::int64_t valid_pixels = 0;
    std::int64_t valid_edge_pixels = 0;

    bool degenerate() const { return valid_pixels == 0; }
};

ImageFeatures featurize_image(const RGBImage& rgb, const HistogramGrid& grid);

std::vector<ImageFeatures> featurize_images(const std::vector<RGBImage>& images,
                                            const HistogramGrid& grid,
                                            int parallel_workers = 1);

// Histogram features plus the splatted auxiliary scalar of every batch element.
struct PreprocessedBatch {
    std::vector<ImageFeatures> features;
    Matrix2Df extended_features;  // [batch x extended_feature_bins.size()]
};

PreprocessedBatch preprocess(const std::vector<RGBImage>& images,
                             const std::vector<float>& extended_feature,
                             const HistogramGrid& grid,
                             const std::vector<float>& extended_feature_bins,
                             int parallel_workers = 1);

// Throws InvalidInputError unless nbins >= 1 and bin_size > 0.
void check_grid(const HistogramGrid& grid);

} // namespace ffcc::histogram
