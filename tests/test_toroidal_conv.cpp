#include "ffcc/scoring/toroidal_conv.hpp"
#include "ffcc/core/errors.hpp"

#include <cmath>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using ffcc::FeatureStack;
using ffcc::FilterBank;
using ffcc::Matrix2Df;
namespace scoring = ffcc::scoring;

namespace {

Matrix2Df ramp(int h, int w, float scale, float phase) {
  Matrix2Df m(h, w);
  for (int r = 0; r < h; ++r) {
    for (int c = 0; c < w; ++c) {
      m(r, c) = std::sin(scale * static_cast<float>(r * w + c) + phase);
    }
  }
  return m;
}

// Direct circular convolution, the reference the FFT path must reproduce.
Matrix2Df circular_conv(const Matrix2Df& x, const Matrix2Df& k) {
  const int h = static_cast<int>(x.rows());
  const int w = static_cast<int>(x.cols());
  Matrix2Df out = Matrix2Df::Zero(h, w);
  for (int i = 0; i < h; ++i) {
    for (int j = 0; j < w; ++j) {
      double acc = 0.0;
      for (int a = 0; a < h; ++a) {
        for (int b = 0; b < w; ++b) {
          acc += static_cast<double>(x(a, b)) * k(((i - a) % h + h) % h, ((j - b) % w + w) % w);
        }
      }
      out(i, j) = static_cast<float>(acc);
    }
  }
  return out;
}

Matrix2Df delta(int n, int r, int c, float value = 1.0f) {
  Matrix2Df d = Matrix2Df::Zero(n, n);
  d(r, c) = value;
  return d;
}

} // namespace

TEST_CASE("fft_round_trip_keeps_rows_and_columns") {
  Matrix2Df x = ramp(4, 6, 0.37f, 0.1f);
  Matrix2Df back = scoring::ifft2_real(scoring::fft2(x));
  REQUIRE(back.rows() == 4);
  REQUIRE(back.cols() == 6);
  for (int r = 0; r < 4; ++r) {
    for (int c = 0; c < 6; ++c) {
      REQUIRE(back(r, c) == Catch::Approx(x(r, c)).margin(1e-5));
    }
  }
}

TEST_CASE("eval_features_with_delta_filter_adds_bias") {
  const int n = 8;
  FeatureStack features{ramp(n, n, 0.21f, 0.0f), ramp(n, n, 0.13f, 1.0f)};
  Matrix2Df bias = ramp(n, n, 0.05f, 2.0f);
  FilterBank bank = FilterBank::from_spatial({delta(n, 0, 0), Matrix2Df::Zero(n, n)}, bias);

  Matrix2Df H = scoring::eval_features(features, bank);
  Matrix2Df expected = features[0] + bias;
  REQUIRE(H.isApprox(expected, 1e-4f));
}

TEST_CASE("eval_features_shifts_along_rows_for_row_offset_delta") {
  const int n = 8;
  Matrix2Df x = ramp(n, n, 0.3f, 0.0f);
  FilterBank bank = FilterBank::from_spatial({delta(n, 1, 0)}, Matrix2Df::Zero(n, n));

  Matrix2Df H = scoring::eval_features(FeatureStack{x}, bank);
  for (int r = 0; r < n; ++r) {
    for (int c = 0; c < n; ++c) {
      REQUIRE(H(r, c) == Catch::Approx(x((r - 1 + n) % n, c)).margin(1e-5));
    }
  }
}

TEST_CASE("eval_features_matches_direct_circular_convolution") {
  const int n = 8;
  FeatureStack features{ramp(n, n, 0.41f, 0.3f), ramp(n, n, 0.17f, 0.9f)};
  std::vector<Matrix2Df> kernels{ramp(n, n, 0.77f, 0.2f), ramp(n, n, 0.29f, 1.7f)};
  Matrix2Df bias = Matrix2Df::Constant(n, n, 0.5f);
  FilterBank bank = FilterBank::from_spatial(kernels, bias);

  Matrix2Df H = scoring::eval_features(features, bank);
  Matrix2Df expected = circular_conv(features[0], kernels[0]) +
                       circular_conv(features[1], kernels[1]) + bias;
  for (int r = 0; r < n; ++r) {
    for (int c = 0; c < n; ++c) {
      REQUIRE(H(r, c) == Catch::Approx(expected(r, c)).margin(1e-4));
    }
  }
}

TEST_CASE("eval_features_keeps_only_the_real_part") {
  // A bank without conjugate symmetry produces a complex spatial response
  const int n = 4;
  FilterBank bank;
  bank.filters_fft.push_back(ffcc::ComplexMatrix2Df::Constant(n, n, std::complex<float>(0.0f, 1.0f)));
  bank.bias = Matrix2Df::Zero(n, n);

  Matrix2Df H = scoring::eval_features(FeatureStack{delta(n, 0, 0)}, bank);
  // ifft2 of a constant i is i at the origin; its real part is zero
  REQUIRE(H.cwiseAbs().maxCoeff() == Catch::Approx(0.0f).margin(1e-6));
}

TEST_CASE("eval_features_batch_matches_single") {
  const int n = 6;
  std::vector<FeatureStack> features;
  std::vector<FilterBank> banks;
  for (int b = 0; b < 5; ++b) {
    features.push_back({ramp(n, n, 0.1f * (b + 1), 0.0f), ramp(n, n, 0.2f, 0.5f * b)});
    banks.push_back(FilterBank::from_spatial({delta(n, b % n, 0), delta(n, 0, b % n, 2.0f)},
                                             Matrix2Df::Constant(n, n, static_cast<float>(b))));
  }

  auto out = scoring::eval_features(features, banks, 3);
  REQUIRE(out.size() == 5);
  for (size_t b = 0; b < out.size(); ++b) {
    REQUIRE(out[b].isApprox(scoring::eval_features(features[b], banks[b])));
  }
}

TEST_CASE("eval_features_rejects_mismatched_shapes") {
  const int n = 4;
  FilterBank bank = FilterBank::from_spatial({delta(n, 0, 0), delta(n, 0, 0)}, Matrix2Df::Zero(n, n));

  SECTION("channel count") {
    REQUIRE_THROWS_AS(scoring::eval_features(FeatureStack{Matrix2Df::Zero(n, n)}, bank),
                      ffcc::ShapeMismatchError);
  }
  SECTION("feature size") {
    FeatureStack f{Matrix2Df::Zero(n, n), Matrix2Df::Zero(n + 1, n)};
    REQUIRE_THROWS_AS(scoring::eval_features(f, bank), ffcc::ShapeMismatchError);
  }
  SECTION("filter size") {
    FeatureStack f{Matrix2Df::Zero(n + 2, n + 2), Matrix2Df::Zero(n + 2, n + 2)};
    REQUIRE_THROWS_AS(scoring::eval_features(f, bank), ffcc::ShapeMismatchError);
  }
  SECTION("bias size") {
    FilterBank bad = bank;
    bad.bias = Matrix2Df::Zero(n, n - 1);
    FeatureStack f{Matrix2Df::Zero(n, n), Matrix2Df::Zero(n, n)};
    REQUIRE_THROWS_AS(scoring::eval_features(f, bad), ffcc::ShapeMismatchError);
  }
  SECTION("batch size") {
    std::vector<FeatureStack> f(2, FeatureStack{Matrix2Df::Zero(n, n), Matrix2Df::Zero(n, n)});
    std::vector<FilterBank> banks(1, bank);
    REQUIRE_THROWS_AS(scoring::eval_features(f, banks), ffcc::ShapeMismatchError);
  }
}
