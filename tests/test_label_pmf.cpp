#include "ffcc/fitting/label_pmf.hpp"
#include "ffcc/core/errors.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using ffcc::Matrix2Df;
namespace fitting = ffcc::fitting;

namespace {

constexpr float kStep = 0.25f;
constexpr float kOffset = -1.0f;
constexpr int kBins = 16;

Matrix2Df label(float u, float v) {
  Matrix2Df uv(1, 2);
  uv << u, v;
  return uv;
}

} // namespace

TEST_CASE("uv_to_pmf_on_a_bin_center_is_one_hot") {
  auto out = fitting::uv_to_pmf(label(kOffset + 3 * kStep, kOffset + 7 * kStep), kStep, kOffset, kBins);
  REQUIRE(out.pmf.size() == 1);
  REQUIRE(out.pmf[0].rows() == kBins);
  REQUIRE(out.pmf[0](3, 7) == Catch::Approx(1.0f));
  REQUIRE(out.pmf[0].sum() == Catch::Approx(1.0f));
  REQUIRE_FALSE(out.clamped[0]);
}

TEST_CASE("uv_to_pmf_centroid_recovers_the_label") {
  // u at index 3.25, v at index 10.5
  const float u = kOffset + 3.25f * kStep;
  const float v = kOffset + 10.5f * kStep;
  auto out = fitting::uv_to_pmf(label(u, v), kStep, kOffset, kBins);
  const Matrix2Df& pmf = out.pmf[0];

  REQUIRE(pmf(3, 10) == Catch::Approx(0.75f * 0.5f));
  REQUIRE(pmf(4, 10) == Catch::Approx(0.25f * 0.5f));
  REQUIRE(pmf(3, 11) == Catch::Approx(0.75f * 0.5f));
  REQUIRE(pmf(4, 11) == Catch::Approx(0.25f * 0.5f));

  float mean_u = 0.0f;
  float mean_v = 0.0f;
  for (int r = 0; r < kBins; ++r) {
    for (int c = 0; c < kBins; ++c) {
      mean_u += pmf(r, c) * (kOffset + r * kStep);
      mean_v += pmf(r, c) * (kOffset + c * kStep);
    }
  }
  REQUIRE(mean_u == Catch::Approx(u).margin(1e-6));
  REQUIRE(mean_v == Catch::Approx(v).margin(1e-6));
}

TEST_CASE("uv_to_pmf_clamps_out_of_range_labels") {
  Matrix2Df uv(2, 2);
  uv << 100.0f, 0.0f,
        -100.0f, -100.0f;
  auto out = fitting::uv_to_pmf(uv, kStep, kOffset, kBins, false);

  REQUIRE(out.clamped[0]);
  REQUIRE(out.clamped[1]);
  REQUIRE(out.any_clamped());
  // u clipped to the top bin, v = 0 sits on index 4
  REQUIRE(out.pmf[0](kBins - 1, 4) == Catch::Approx(1.0f));
  REQUIRE(out.pmf[1](0, 0) == Catch::Approx(1.0f));
  for (const auto& p : out.pmf) {
    REQUIRE(p.sum() == Catch::Approx(1.0f));
    REQUIRE(p.minCoeff() >= 0.0f);
  }
}

TEST_CASE("uv_to_pmf_batch_keeps_order") {
  Matrix2Df uv(3, 2);
  uv << kOffset, kOffset,
        kOffset + 5 * kStep, kOffset + 2 * kStep,
        kOffset + 9 * kStep, kOffset + 14 * kStep;
  auto out = fitting::uv_to_pmf(uv, kStep, kOffset, kBins);
  REQUIRE(out.pmf.size() == 3);
  REQUIRE_FALSE(out.any_clamped());
  REQUIRE(out.pmf[0](0, 0) == Catch::Approx(1.0f));
  REQUIRE(out.pmf[1](5, 2) == Catch::Approx(1.0f));
  REQUIRE(out.pmf[2](9, 14) == Catch::Approx(1.0f));
}

TEST_CASE("uv_to_pmf_rejects_bad_arguments") {
  REQUIRE_THROWS_AS(fitting::uv_to_pmf(Matrix2Df::Zero(1, 3), kStep, kOffset, kBins),
                    ffcc::ShapeMismatchError);
  REQUIRE_THROWS_AS(fitting::uv_to_pmf(label(0, 0), 0.0f, kOffset, kBins), ffcc::InvalidInputError);
  REQUIRE_THROWS_AS(fitting::uv_to_pmf(label(0, 0), kStep, kOffset, 0), ffcc::InvalidInputError);
}
