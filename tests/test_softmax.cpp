#include "ffcc/scoring/softmax.hpp"
#include "ffcc/core/errors.hpp"

#include <cmath>
#include <limits>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using ffcc::Matrix2Df;
using ffcc::scoring::softmax2;

TEST_CASE("softmax2_sums_to_one_and_keeps_order") {
  Matrix2Df h(3, 3);
  h << 0.1f, 2.0f, -1.0f,
       0.0f, 0.5f, 3.0f,
       -2.0f, 1.0f, 0.2f;
  Matrix2Df p = softmax2(h);

  REQUIRE(p.sum() == Catch::Approx(1.0f).margin(1e-6));
  REQUIRE(p.minCoeff() > 0.0f);
  Eigen::Index r = 0, c = 0;
  p.maxCoeff(&r, &c);
  REQUIRE(r == 1);
  REQUIRE(c == 2);
  REQUIRE(p(0, 1) / p(1, 1) == Catch::Approx(std::exp(1.5f)).epsilon(1e-4));
}

TEST_CASE("softmax2_of_constant_surface_is_uniform") {
  Matrix2Df p = softmax2(Matrix2Df::Constant(4, 4, 7.0f));
  REQUIRE(p.maxCoeff() == Catch::Approx(1.0f / 16.0f));
  REQUIRE(p.minCoeff() == Catch::Approx(1.0f / 16.0f));
}

TEST_CASE("softmax2_is_stable_for_large_scores") {
  Matrix2Df h(2, 2);
  h << 1000.0f, 1001.0f,
       -1000.0f, 999.0f;
  Matrix2Df p = softmax2(h);
  REQUIRE(p.allFinite());
  REQUIRE(p.sum() == Catch::Approx(1.0f).margin(1e-6));
  REQUIRE(p(0, 1) > p(0, 0));
  REQUIRE(p(1, 0) == Catch::Approx(0.0f).margin(1e-12));
}

TEST_CASE("softmax2_rejects_bad_surfaces") {
  REQUIRE_THROWS_AS(softmax2(Matrix2Df::Zero(2, 3)), ffcc::ShapeMismatchError);
  REQUIRE_THROWS_AS(softmax2(Matrix2Df()), ffcc::ShapeMismatchError);

  Matrix2Df h = Matrix2Df::Zero(2, 2);
  h(1, 1) = std::numeric_limits<float>::infinity();
  REQUIRE_THROWS_AS(softmax2(h), ffcc::InvalidInputError);
}

TEST_CASE("softmax2_batch_normalizes_each_element") {
  std::vector<Matrix2Df> h{Matrix2Df::Zero(3, 3), Matrix2Df::Constant(3, 3, -50.0f),
                           Matrix2Df::Identity(3, 3) * 4.0f};
  auto p = softmax2(h, 2);
  REQUIRE(p.size() == 3);
  for (const auto& m : p) {
    REQUIRE(m.sum() == Catch::Approx(1.0f).margin(1e-6));
  }
  REQUIRE(p[2](1, 1) > p[2](0, 1));
}
