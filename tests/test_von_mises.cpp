#include "ffcc/fitting/von_mises.hpp"
#include "ffcc/core/errors.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using ffcc::Matrix2Df;
using ffcc::VonMisesFit;
namespace fitting = ffcc::fitting;

TEST_CASE("von_mises_point_mass_has_zero_covariance") {
  Matrix2Df pmf = Matrix2Df::Zero(16, 16);
  pmf(5, 9) = 1.0f;

  VonMisesFit fit = fitting::bivariate_von_mises(pmf);
  REQUIRE(fit.batch_size() == 1);
  REQUIRE(fit.mu(0, 0) == Catch::Approx(5.0f).margin(1e-4));
  REQUIRE(fit.mu(0, 1) == Catch::Approx(9.0f).margin(1e-4));
  REQUIRE(fit.sigma[0].cwiseAbs().maxCoeff() == Catch::Approx(0.0f).margin(1e-6));
}

TEST_CASE("von_mises_mean_wraps_across_the_boundary") {
  // Half the mass in the first row, half in the last: the circular mean sits
  // between them at n - 0.5, not in the middle of the grid
  const int n = 16;
  Matrix2Df pmf = Matrix2Df::Zero(n, n);
  pmf(0, 3) = 0.5f;
  pmf(n - 1, 3) = 0.5f;

  VonMisesFit fit = fitting::bivariate_von_mises(pmf);
  REQUIRE(fit.mu(0, 0) == Catch::Approx(n - 0.5f).margin(1e-4));
  REQUIRE(fit.mu(0, 1) == Catch::Approx(3.0f).margin(1e-4));
  REQUIRE(fit.sigma[0](0, 0) == Catch::Approx(0.25f).margin(1e-5));
  REQUIRE(fit.sigma[0](1, 1) == Catch::Approx(0.0f).margin(1e-5));
  REQUIRE(fit.sigma[0](0, 1) == Catch::Approx(0.0f).margin(1e-5));
}

TEST_CASE("von_mises_covariance_of_correlated_pair") {
  Matrix2Df pmf = Matrix2Df::Zero(12, 12);
  pmf(4, 4) = 0.5f;
  pmf(6, 6) = 0.5f;

  VonMisesFit fit = fitting::bivariate_von_mises(pmf);
  REQUIRE(fit.mu(0, 0) == Catch::Approx(5.0f).margin(1e-4));
  REQUIRE(fit.mu(0, 1) == Catch::Approx(5.0f).margin(1e-4));
  REQUIRE(fit.sigma[0](0, 0) == Catch::Approx(1.0f).margin(1e-4));
  REQUIRE(fit.sigma[0](1, 1) == Catch::Approx(1.0f).margin(1e-4));
  REQUIRE(fit.sigma[0](0, 1) == Catch::Approx(1.0f).margin(1e-4));
  REQUIRE(fit.sigma[0](1, 0) == fit.sigma[0](0, 1));
}

TEST_CASE("von_mises_anticorrelated_pair_has_negative_covariance") {
  Matrix2Df pmf = Matrix2Df::Zero(12, 12);
  pmf(4, 6) = 0.5f;
  pmf(6, 4) = 0.5f;

  VonMisesFit fit = fitting::bivariate_von_mises(pmf);
  REQUIRE(fit.sigma[0](0, 1) == Catch::Approx(-1.0f).margin(1e-4));
}

TEST_CASE("von_mises_mu_stays_in_range") {
  const int n = 8;
  std::vector<Matrix2Df> batch;
  for (int i = 0; i < n; ++i) {
    Matrix2Df pmf = Matrix2Df::Constant(n, n, 0.5f / (n * n));
    pmf(i, (i + 3) % n) += 0.5f;
    batch.push_back(pmf);
  }

  VonMisesFit fit = fitting::bivariate_von_mises(batch, fitting::kDefaultPmfSumTolerance, 4);
  REQUIRE(fit.batch_size() == n);
  REQUIRE(fit.sigma.size() == static_cast<size_t>(n));
  for (int b = 0; b < n; ++b) {
    REQUIRE(fit.mu(b, 0) >= 0.0f);
    REQUIRE(fit.mu(b, 0) < static_cast<float>(n));
    REQUIRE(fit.mu(b, 1) >= 0.0f);
    REQUIRE(fit.mu(b, 1) < static_cast<float>(n));
    REQUIRE(fit.mu(b, 0) == Catch::Approx(static_cast<float>(b)).margin(1e-3));
  }
}

TEST_CASE("von_mises_rejects_unnormalized_pmf") {
  Matrix2Df pmf = Matrix2Df::Constant(4, 4, 1.0f / 16.0f);
  pmf(0, 0) += 0.01f;
  REQUIRE_THROWS_AS(fitting::bivariate_von_mises(pmf), ffcc::InvariantViolationError);
  REQUIRE_NOTHROW(fitting::bivariate_von_mises(pmf, 0.05f));
}

TEST_CASE("von_mises_rejects_non_square_pmf") {
  Matrix2Df pmf = Matrix2Df::Zero(4, 5);
  pmf(0, 0) = 1.0f;
  REQUIRE_THROWS_AS(fitting::bivariate_von_mises(pmf), ffcc::ShapeMismatchError);
}

TEST_CASE("wrapped_delta_takes_shortest_path") {
  REQUIRE(fitting::wrapped_delta(0.0, 15.5, 16) == Catch::Approx(0.5));
  REQUIRE(fitting::wrapped_delta(15.0, 0.5, 16) == Catch::Approx(-1.5));
  REQUIRE(fitting::wrapped_delta(3.0, 5.0, 16) == Catch::Approx(-2.0));
  REQUIRE(fitting::wrapped_delta(13.0, 5.0, 16) == Catch::Approx(-8.0));
}
