#include "ffcc/histogram/chroma_histogram.hpp"
#include "ffcc/histogram/splat.hpp"
#include "ffcc/color/color_space.hpp"
#include "ffcc/core/errors.hpp"
#include "ffcc/core/parallel.hpp"
#include "ffcc/core/utils.hpp"

#include <opencv2/opencv.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <string>

namespace ffcc::histogram {

namespace {

// 8-connected neighbour offsets (dy, dx), center excluded
constexpr int kNeighbourOffsets[8][2] = {
    {-1, -1}, {-1, 0}, {-1, 1},
    {0, -1},           {0, 1},
    {1, -1},  {1, 0},  {1, 1},
};

Matrix2Df plane_absolute_deviation(const Matrix2Df& plane) {
    const int h = static_cast<int>(plane.rows());
    const int w = static_cast<int>(plane.cols());
    Matrix2Df out(h, w);
    if (h == 0 || w == 0) return out;

    cv::Mat src(h, w, CV_32F, const_cast<float*>(plane.data()));
    cv::Mat padded;
    // BORDER_REFLECT repeats the edge pixel (fedcba|abcdef), so the border
    // does not manufacture an edge
    cv::copyMakeBorder(src, padded, 1, 1, 1, 1, cv::BORDER_REFLECT);

    for (int y = 0; y < h; ++y) {
        const float* rows[3] = {padded.ptr<float>(y), padded.ptr<float>(y + 1),
                                padded.ptr<float>(y + 2)};
        for (int x = 0; x < w; ++x) {
            const float center = rows[1][x + 1];
            float acc = 0.0f;
            for (const auto& off : kNeighbourOffsets) {
                acc += std::fabs(center - rows[1 + off[0]][x + 1 + off[1]]);
            }
            out(y, x) = acc / 8.0f;
        }
    }
    return out;
}

} // namespace

void check_grid(const HistogramGrid& grid) {
    if (grid.nbins < 1) {
        throw InvalidInputError("histogram grid needs nbins >= 1, got " +
                                std::to_string(grid.nbins));
    }
    if (!(grid.bin_size > 0.0f) || !std::isfinite(grid.bin_size)) {
        throw InvalidInputError("histogram grid needs a positive bin_size");
    }
    if (!std::isfinite(grid.first_bin)) {
        throw InvalidInputError("histogram grid needs a finite first_bin");
    }
}

RGBImage local_absolute_deviation(const RGBImage& rgb) {
    color::check_planes(rgb, "local_absolute_deviation");
    RGBImage out;
    out.R = plane_absolute_deviation(rgb.R);
    out.G = plane_absolute_deviation(rgb.G);
    out.B = plane_absolute_deviation(rgb.B);
    return out;
}

ChromaCounts count_chroma_bins(const RGBImage& rgb, const HistogramGrid& grid) {
    color::check_planes(rgb, "count_chroma_bins");
    check_grid(grid);

    const int h = rgb.rows();
    const int w = rgb.cols();
    const float n = static_cast<float>(grid.nbins);

    ChromaCounts out;
    out.counts = BinCounts::Zero(grid.nbins, grid.nbins);

    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            const float r = rgb.R(y, x);
            const float g = rgb.G(y, x);
            const float b = rgb.B(y, x);
            if (!(r > kEpsilon && g > kEpsilon && b > kEpsilon)) continue;

            const float log_g = std::log(g);
            const float u = log_g - std::log(r);
            const float v = log_g - std::log(b);
            const float iu = core::floor_mod(
                core::round_half_even((u - grid.first_bin) / grid.bin_size), n);
            const float iv = core::floor_mod(
                core::round_half_even((v - grid.first_bin) / grid.bin_size), n);
            const int row = std::min(grid.nbins - 1, static_cast<int>(iu));
            const int col = std::min(grid.nbins - 1, static_cast<int>(iv));
            ++out.counts(row, col);
            ++out.valid_pixels;
        }
    }
    return out;
}

ChromaHistogram normalize_counts(const ChromaCounts& counts) {
    const double denom = std::max(static_cast<double>(kEpsilon),
                                  static_cast<double>(counts.valid_pixels));
    ChromaHistogram hist;
    hist.bins = (counts.counts.cast<double>() / denom).cast<float>();
    hist.valid_pixels = counts.valid_pixels;
    return hist;
}

ChromaHistogram compute_chroma_histogram(const RGBImage& rgb, const HistogramGrid& grid) {
    return normalize_counts(count_chroma_bins(rgb, grid));
}

ImageFeatures featurize_image(const RGBImage& rgb, const HistogramGrid& grid) {
    ChromaHistogram raw = compute_chroma_histogram(rgb, grid);
    ChromaHistogram edge = compute_chroma_histogram(local_absolute_deviation(rgb), grid);

    if (raw.valid_pixels == 0) {
        std::cerr << "[HIST] Image has no valid pixels (all channels must exceed "
                  << kEpsilon << "); histogram is all zero" << std::endl;
    }

    ImageFeatures f;
    f.channels.reserve(2);
    f.channels.push_back(std::move(raw.bins));
    f.channels.push_back(std::move(edge.bins));
    f.valid_pixels = raw.valid_pixels;
    f.valid_edge_pixels = edge.valid_pixels;
    return f;
}

std::vector<ImageFeatures> featurize_images(const std::vector<RGBImage>& images,
                                            const HistogramGrid& grid,
                                            int parallel_workers) {
    check_grid(grid);
    std::vector<ImageFeatures> out(images.size());
    core::for_each_batch(images.size(), parallel_workers, [&](size_t b) {
        out[b] = featurize_image(images[b], grid);
    });
    return out;
}

PreprocessedBatch preprocess(const std::vector<RGBImage>& images,
                             const std::vector<float>& extended_feature,
                             const HistogramGrid& grid,
                             const std::vector<float>& extended_feature_bins,
                             int parallel_workers) {
    if (extended_feature.size() != images.size()) {
        throw ShapeMismatchError("preprocess expects one extended feature per image (" +
                                 std::to_string(images.size()) + "), got " +
                                 std::to_string(extended_feature.size()));
    }

    PreprocessedBatch out;
    out.extended_features = splat_non_uniform(extended_feature, extended_feature_bins);
    out.features = featurize_images(images, grid, parallel_workers);
    return out;
}

} // namespace ffcc::histogram
