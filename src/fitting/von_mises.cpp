#include "ffcc/fitting/von_mises.hpp"
#include "ffcc/core/errors.hpp"
#include "ffcc/core/parallel.hpp"

#include <cmath>
#include <sstream>
#include <string>

namespace ffcc::fitting {

namespace {

constexpr double kTwoPi = 2.0 * M_PI;

double floor_mod(double x, double n) {
    double r = x - n * std::floor(x / n);
    if (r >= n) r -= n;
    if (r < 0.0) r = 0.0;
    return r;
}

struct ElementFit {
    double mu_u = 0.0;
    double mu_v = 0.0;
    Eigen::Matrix2d sigma = Eigen::Matrix2d::Zero();
};

void check_pmf(const Matrix2Df& pmf, size_t index, float tolerance) {
    if (pmf.size() == 0 || pmf.rows() != pmf.cols()) {
        throw ShapeMismatchError("bivariate_von_mises expects a non-empty square PMF, element " +
                                 std::to_string(index) + " is " + shape_to_string(pmf));
    }
    const double total = pmf.cast<double>().sum();
    if (!(std::fabs(total - 1.0) <= static_cast<double>(tolerance))) {
        std::ostringstream oss;
        oss << "PMF " << index << " sums to " << total << ", expected 1 +/- " << tolerance;
        throw InvariantViolationError(oss.str());
    }
}

ElementFit fit_element(const Matrix2Df& pmf_f) {
    const int n = static_cast<int>(pmf_f.rows());
    const Matrix2Dd pmf = pmf_f.cast<double>();

    // Marginals: sum_u over columns (function of row), sum_v over rows
    const Eigen::VectorXd sum_u = pmf.rowwise().sum();
    const Eigen::VectorXd sum_v = pmf.colwise().sum().transpose();

    const double angle_step = kTwoPi / static_cast<double>(n);
    Eigen::VectorXd cos_angles(n), sin_angles(n);
    for (int i = 0; i < n; ++i) {
        cos_angles(i) = std::cos(i * angle_step);
        sin_angles(i) = std::sin(i * angle_step);
    }

    // Expected sine and cosine handle the wrap-around boundary; atan2 lands
    // in [-pi, pi] and is shifted into [0, 2*pi)
    const double theta = floor_mod(std::atan2(sum_u.dot(sin_angles), sum_u.dot(cos_angles)), kTwoPi);
    const double phi = floor_mod(std::atan2(sum_v.dot(sin_angles), sum_v.dot(cos_angles)), kTwoPi);

    ElementFit fit;
    fit.mu_u = theta / angle_step;
    fit.mu_v = phi / angle_step;

    Eigen::VectorXd du(n), dv(n);
    for (int i = 0; i < n; ++i) {
        du(i) = wrapped_delta(i, fit.mu_u, n);
        dv(i) = wrapped_delta(i, fit.mu_v, n);
    }

    const double e_u = sum_u.dot(du);
    const double e_v = sum_v.dot(dv);
    const double var_u = sum_u.dot(du.cwiseProduct(du)) - e_u * e_u;
    const double var_v = sum_v.dot(dv.cwiseProduct(dv)) - e_v * e_v;
    const double e_uv = du.dot(pmf * dv);
    const double cov = e_uv - e_u * e_v;

    fit.sigma << var_u, cov,
                 cov, var_v;
    return fit;
}

} // namespace

double wrapped_delta(double bin, double mu, int n) {
    const double size = static_cast<double>(n);
    return floor_mod(bin - mu + size / 2.0, size) - size / 2.0;
}

VonMisesFit bivariate_von_mises(const std::vector<Matrix2Df>& pmf, float tolerance,
                                int parallel_workers) {
    for (size_t b = 0; b < pmf.size(); ++b) {
        check_pmf(pmf[b], b, tolerance);
    }

    std::vector<ElementFit> fits(pmf.size());
    core::for_each_batch(pmf.size(), parallel_workers, [&](size_t b) {
        fits[b] = fit_element(pmf[b]);
    });

    VonMisesFit out;
    out.mu.resize(static_cast<Eigen::Index>(pmf.size()), 2);
    out.sigma.reserve(pmf.size());
    for (size_t b = 0; b < fits.size(); ++b) {
        const auto row = static_cast<Eigen::Index>(b);
        const float n = static_cast<float>(pmf[b].rows());
        // Narrowing can round a mean just below n up to n itself
        float mu_u = static_cast<float>(fits[b].mu_u);
        float mu_v = static_cast<float>(fits[b].mu_v);
        if (mu_u >= n) mu_u -= n;
        if (mu_v >= n) mu_v -= n;
        out.mu(row, 0) = mu_u;
        out.mu(row, 1) = mu_v;
        out.sigma.emplace_back(fits[b].sigma.cast<float>());
    }
    return out;
}

VonMisesFit bivariate_von_mises(const Matrix2Df& pmf, float tolerance) {
    return bivariate_von_mises(std::vector<Matrix2Df>{pmf}, tolerance, 1);
}

} // namespace ffcc::fitting
