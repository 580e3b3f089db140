#pragma once

#include <Eigen/Dense>
#include <complex>
#include <string>
#include <vector>

namespace ffcc {

// Matrix types (row-major so the buffers can be wrapped by cv::Mat)
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using Matrix2Dd = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using ComplexMatrix2Df =
    Eigen::Matrix<std::complex<float>, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// Floor applied to every log, division and normalization.
constexpr float kEpsilon = 1e-9f;

// Planar RGB image (linear, non-negative)
struct RGBImage {
    Matrix2Df R;
    Matrix2Df G;
    Matrix2Df B;

    int rows() const { return static_cast<int>(R.rows()); }
    int cols() const { return static_cast<int>(R.cols()); }
};

// Planar log-chroma image: U = log(g/r), V = log(g/b)
struct UVImage {
    Matrix2Df U;
    Matrix2Df V;
};

// Uniform toroidal bin grid shared by histograms and PMFs.
struct HistogramGrid {
    float first_bin = -0.53125f; // UV value of bin 0's center
    float bin_size = 0.03125f;   // pitch
    int nbins = 64;

    float bin_value(float index) const { return first_bin + index * bin_size; }
};

// Histogram channels of one image: [0] raw colors, [1] edge colors.
using FeatureStack = std::vector<Matrix2Df>;

// Frequency-domain filters plus spatial bias for one batch element.
struct FilterBank {
    std::vector<ComplexMatrix2Df> filters_fft; // one per feature channel
    Matrix2Df bias;

    int channels() const { return static_cast<int>(filters_fft.size()); }

    // Build a bank from real spatial kernels (forward 2D FFT of each kernel).
    static FilterBank from_spatial(const std::vector<Matrix2Df>& kernels,
                                   const Matrix2Df& bias);
};

// Bivariate wrapped-distribution fit, batch-major.
struct VonMisesFit {
    Matrix2Df mu;                   // [batch x 2], (u, v)
    std::vector<Matrix2Df> sigma;   // [batch] of 2x2

    int batch_size() const { return static_cast<int>(mu.rows()); }
};

inline std::string shape_to_string(const Matrix2Df& m) {
    return "[" + std::to_string(m.rows()) + "x" + std::to_string(m.cols()) + "]";
}

inline std::string shape_to_string(const ComplexMatrix2Df& m) {
    return "[" + std::to_string(m.rows()) + "x" + std::to_string(m.cols()) + "]";
}

// Pipeline stage enumeration (event stream)
enum class Stage {
    FEATURIZE = 0,
    SCORE = 1,
    NORMALIZE = 2,
    FIT = 3,
    RESCALE = 4
};

inline std::string stage_to_string(Stage stage) {
    switch (stage) {
        case Stage::FEATURIZE: return "FEATURIZE";
        case Stage::SCORE: return "SCORE";
        case Stage::NORMALIZE: return "NORMALIZE";
        case Stage::FIT: return "FIT";
        case Stage::RESCALE: return "RESCALE";
        default: return "UNKNOWN";
    }
}

inline int stage_to_int(Stage stage) {
    return static_cast<int>(stage);
}

} // namespace ffcc
