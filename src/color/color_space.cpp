#include "ffcc/color/color_space.hpp"
#include "ffcc/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace ffcc::color {

namespace {

bool is_valid_channel(float x) {
    // NaN compares false and is rejected together with negatives
    return x >= 0.0f;
}

} // namespace

void check_planes(const RGBImage& image, const char* what) {
    if (image.G.rows() != image.R.rows() || image.G.cols() != image.R.cols() ||
        image.B.rows() != image.R.rows() || image.B.cols() != image.R.cols()) {
        throw ShapeMismatchError(std::string(what) + ": RGB planes differ in size (R=" +
                                 shape_to_string(image.R) + " G=" + shape_to_string(image.G) +
                                 " B=" + shape_to_string(image.B) + ")");
    }
}

Matrix2Df rgb_to_uv(const Matrix2Df& rgb) {
    if (rgb.cols() != 3) {
        throw ShapeMismatchError("rgb_to_uv expects [N x 3], got " + shape_to_string(rgb));
    }
    Matrix2Df uv(rgb.rows(), 2);
    for (Eigen::Index i = 0; i < rgb.rows(); ++i) {
        if (!is_valid_channel(rgb(i, 0)) || !is_valid_channel(rgb(i, 1)) ||
            !is_valid_channel(rgb(i, 2))) {
            throw InvalidInputError("rgb_to_uv requires non-negative RGB values (row " +
                                    std::to_string(i) + ")");
        }
        const float log_r = std::log(std::max(rgb(i, 0), kEpsilon));
        const float log_g = std::log(std::max(rgb(i, 1), kEpsilon));
        const float log_b = std::log(std::max(rgb(i, 2), kEpsilon));
        uv(i, 0) = log_g - log_r;
        uv(i, 1) = log_g - log_b;
    }
    return uv;
}

UVImage rgb_to_uv(const RGBImage& rgb) {
    check_planes(rgb, "rgb_to_uv");
    const int h = rgb.rows();
    const int w = rgb.cols();

    UVImage out;
    out.U.resize(h, w);
    out.V.resize(h, w);
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            const float r = rgb.R(y, x);
            const float g = rgb.G(y, x);
            const float b = rgb.B(y, x);
            if (!is_valid_channel(r) || !is_valid_channel(g) || !is_valid_channel(b)) {
                throw InvalidInputError("rgb_to_uv requires non-negative RGB values (pixel " +
                                        std::to_string(y) + "," + std::to_string(x) + ")");
            }
            const float log_g = std::log(std::max(g, kEpsilon));
            out.U(y, x) = log_g - std::log(std::max(r, kEpsilon));
            out.V(y, x) = log_g - std::log(std::max(b, kEpsilon));
        }
    }
    return out;
}

Matrix2Df uv_to_rgb(const Matrix2Df& uv) {
    if (uv.cols() != 2) {
        throw ShapeMismatchError("uv_to_rgb expects [N x 2], got " + shape_to_string(uv));
    }

    Matrix2Df rgb(uv.rows(), 3);
    for (Eigen::Index i = 0; i < uv.rows(); ++i) {
        const float r = std::exp(-uv(i, 0));
        const float g = 1.0f;
        const float b = std::exp(-uv(i, 1));
        const float norm = std::sqrt(r * r + g * g + b * b);
        rgb(i, 0) = r / norm;
        rgb(i, 1) = g / norm;
        rgb(i, 2) = b / norm;
    }
    return rgb;
}

RGBImage apply_wb(const RGBImage& image, float u, float v) {
    check_planes(image, "apply_wb");
    RGBImage out;
    out.R = image.R * std::exp(u);
    out.G = image.G;
    out.B = image.B * std::exp(v);
    return out;
}

std::vector<RGBImage> apply_wb(const std::vector<RGBImage>& images, const Matrix2Df& uv) {
    if (uv.cols() != 2 || uv.rows() != static_cast<Eigen::Index>(images.size())) {
        throw ShapeMismatchError("apply_wb expects uv [" + std::to_string(images.size()) +
                                 "x2], got " + shape_to_string(uv));
    }

    std::vector<RGBImage> out;
    out.reserve(images.size());
    for (size_t b = 0; b < images.size(); ++b) {
        const auto row = static_cast<Eigen::Index>(b);
        out.push_back(apply_wb(images[b], uv(row, 0), uv(row, 1)));
    }
    return out;
}

} // namespace ffcc::color
