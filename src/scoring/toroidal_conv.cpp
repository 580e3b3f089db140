#include "ffcc/scoring/toroidal_conv.hpp"
#include "ffcc/core/errors.hpp"
#include "ffcc/core/parallel.hpp"

#include <opencv2/opencv.hpp>
#include <cstring>
#include <string>

namespace ffcc::scoring {

namespace {

cv::Mat wrap_complex(const ComplexMatrix2Df& m) {
    return cv::Mat(static_cast<int>(m.rows()), static_cast<int>(m.cols()), CV_32FC2,
                   const_cast<std::complex<float>*>(m.data()));
}

ComplexMatrix2Df to_complex_matrix(const cv::Mat& spectrum) {
    ComplexMatrix2Df out(spectrum.rows, spectrum.cols);
    for (int r = 0; r < spectrum.rows; ++r) {
        std::memcpy(out.data() + static_cast<size_t>(r) * static_cast<size_t>(spectrum.cols),
                    spectrum.ptr<cv::Vec2f>(r),
                    static_cast<size_t>(spectrum.cols) * sizeof(std::complex<float>));
    }
    return out;
}

Matrix2Df real_plane(const cv::Mat& complex_mat) {
    std::vector<cv::Mat> planes(2);
    cv::split(complex_mat, planes);
    Matrix2Df out(complex_mat.rows, complex_mat.cols);
    for (int r = 0; r < complex_mat.rows; ++r) {
        std::memcpy(out.data() + static_cast<size_t>(r) * static_cast<size_t>(complex_mat.cols),
                    planes[0].ptr<float>(r),
                    static_cast<size_t>(complex_mat.cols) * sizeof(float));
    }
    return out;
}

cv::Mat forward_spectrum(const Matrix2Df& x) {
    cv::Mat src(static_cast<int>(x.rows()), static_cast<int>(x.cols()), CV_32F,
                const_cast<float*>(x.data()));
    cv::Mat spectrum;
    cv::dft(src, spectrum, cv::DFT_COMPLEX_OUTPUT);
    return spectrum;
}

} // namespace

ComplexMatrix2Df fft2(const Matrix2Df& x) {
    if (x.size() == 0) {
        throw ShapeMismatchError("fft2 of an empty matrix");
    }
    return to_complex_matrix(forward_spectrum(x));
}

Matrix2Df ifft2_real(const ComplexMatrix2Df& x_fft) {
    if (x_fft.size() == 0) {
        throw ShapeMismatchError("ifft2 of an empty matrix");
    }
    cv::Mat spatial;
    cv::dft(wrap_complex(x_fft), spatial, cv::DFT_INVERSE | cv::DFT_SCALE);
    return real_plane(spatial);
}

void check_bank(const FilterBank& bank, Eigen::Index rows, Eigen::Index cols, int channels) {
    if (bank.channels() != channels) {
        throw ShapeMismatchError("filter bank has " + std::to_string(bank.channels()) +
                                 " channels, features have " + std::to_string(channels));
    }
    for (int c = 0; c < channels; ++c) {
        const auto& f = bank.filters_fft[static_cast<size_t>(c)];
        if (f.rows() != rows || f.cols() != cols) {
            throw ShapeMismatchError("filter " + std::to_string(c) + " is " + shape_to_string(f) +
                                     ", expected [" + std::to_string(rows) + "x" +
                                     std::to_string(cols) + "]");
        }
    }
    if (bank.bias.rows() != rows || bank.bias.cols() != cols) {
        throw ShapeMismatchError("bias is " + shape_to_string(bank.bias) + ", expected [" +
                                 std::to_string(rows) + "x" + std::to_string(cols) + "]");
    }
}

Matrix2Df eval_features(const FeatureStack& features, const FilterBank& bank) {
    if (features.empty()) {
        throw ShapeMismatchError("eval_features needs at least one feature channel");
    }
    const Eigen::Index h = features[0].rows();
    const Eigen::Index w = features[0].cols();
    if (h == 0 || w == 0) {
        throw ShapeMismatchError("eval_features got an empty feature channel");
    }
    for (size_t c = 1; c < features.size(); ++c) {
        if (features[c].rows() != h || features[c].cols() != w) {
            throw ShapeMismatchError("feature channel " + std::to_string(c) + " is " +
                                     shape_to_string(features[c]) + ", channel 0 is " +
                                     shape_to_string(features[0]));
        }
    }
    check_bank(bank, h, w, static_cast<int>(features.size()));

    cv::Mat accum = cv::Mat::zeros(static_cast<int>(h), static_cast<int>(w), CV_32FC2);
    cv::Mat product;
    for (size_t c = 0; c < features.size(); ++c) {
        cv::Mat spectrum = forward_spectrum(features[c]);
        cv::mulSpectrums(spectrum, wrap_complex(bank.filters_fft[c]), product, 0);
        accum += product;
    }

    // Keep the complex inverse: the bank need not be conjugate-symmetric,
    // only the real part is retained
    cv::Mat spatial;
    cv::dft(accum, spatial, cv::DFT_INVERSE | cv::DFT_SCALE);

    Matrix2Df H = real_plane(spatial);
    H += bank.bias;
    return H;
}

std::vector<Matrix2Df> eval_features(const std::vector<FeatureStack>& features,
                                     const std::vector<FilterBank>& banks,
                                     int parallel_workers) {
    if (features.size() != banks.size()) {
        throw ShapeMismatchError("eval_features batch sizes differ: features=" +
                                 std::to_string(features.size()) +
                                 " filters=" + std::to_string(banks.size()));
    }
    std::vector<Matrix2Df> out(features.size());
    core::for_each_batch(features.size(), parallel_workers, [&](size_t b) {
        out[b] = eval_features(features[b], banks[b]);
    });
    return out;
}

} // namespace ffcc::scoring

namespace ffcc {

FilterBank FilterBank::from_spatial(const std::vector<Matrix2Df>& kernels,
                                    const Matrix2Df& bias) {
    FilterBank bank;
    bank.filters_fft.reserve(kernels.size());
    for (const auto& k : kernels) {
        bank.filters_fft.push_back(scoring::fft2(k));
    }
    bank.bias = bias;
    return bank;
}

} // namespace ffcc
