#include "ffcc/fitting/rescale.hpp"
#include "ffcc/core/errors.hpp"

#include <string>

namespace ffcc::fitting {

namespace {

void check_fit_shapes(const Matrix2Df& mu, const std::vector<Matrix2Df>& sigma,
                      const char* what) {
    if (mu.cols() != 2) {
        throw ShapeMismatchError(std::string(what) + " expects mu [batch x 2], got " +
                                 shape_to_string(mu));
    }
    if (static_cast<Eigen::Index>(sigma.size()) != mu.rows()) {
        throw ShapeMismatchError(std::string(what) + " got " + std::to_string(sigma.size()) +
                                 " sigma matrices for a batch of " + std::to_string(mu.rows()));
    }
    for (size_t b = 0; b < sigma.size(); ++b) {
        if (sigma[b].rows() != 2 || sigma[b].cols() != 2) {
            throw ShapeMismatchError(std::string(what) + " expects 2x2 sigma, element " +
                                     std::to_string(b) + " is " + shape_to_string(sigma[b]));
        }
    }
}

} // namespace

VonMisesFit idx_to_uv(const Matrix2Df& mu_idx, const std::vector<Matrix2Df>& sigma_idx,
                      float step_size, float offset) {
    check_fit_shapes(mu_idx, sigma_idx, "idx_to_uv");

    VonMisesFit out;
    out.mu = (mu_idx.array() * step_size + offset).matrix();
    out.sigma.reserve(sigma_idx.size());
    for (const auto& s : sigma_idx) {
        out.sigma.emplace_back(s * (step_size * step_size));
    }
    return out;
}

VonMisesFit idx_to_uv(const VonMisesFit& fit_idx, float step_size, float offset) {
    return idx_to_uv(fit_idx.mu, fit_idx.sigma, step_size, offset);
}

VonMisesFit uv_to_idx(const VonMisesFit& fit_uv, float step_size, float offset) {
    check_fit_shapes(fit_uv.mu, fit_uv.sigma, "uv_to_idx");
    if (step_size == 0.0f) {
        throw InvalidInputError("uv_to_idx needs a non-zero step_size");
    }

    VonMisesFit out;
    out.mu = ((fit_uv.mu.array() - offset) / step_size).matrix();
    out.sigma.reserve(fit_uv.sigma.size());
    for (const auto& s : fit_uv.sigma) {
        out.sigma.emplace_back(s / (step_size * step_size));
    }
    return out;
}

} // namespace ffcc::fitting
