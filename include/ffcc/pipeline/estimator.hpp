#pragma once

#include "ffcc/config/configuration.hpp"
#include "ffcc/core/events.hpp"
#include "ffcc/core/types.hpp"
#include "ffcc/fitting/von_mises.hpp"
#include "ffcc/histogram/chroma_histogram.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace ffcc::pipeline {

// Trained parameters, loaded once by the caller and treated as read-only.
struct Model {
    HistogramGrid grid;
    FilterBank bank;  // nbins x nbins filters for the raw and edge channels
};

// Throws ValidationError / ShapeMismatchError if the bank does not match the grid.
void validate_model(const Model& model);

struct EstimationResult {
    std::vector<histogram::ImageFeatures> features;
    std::vector<Matrix2Df> scores;   // filtered histograms H
    std::vector<Matrix2Df> pmf;      // softmax(H)
    VonMisesFit fit_idx;             // histogram index space
    VonMisesFit fit_uv;              // log-chroma units
    Matrix2Df illuminant_rgb;        // [batch x 3], unit norm
    std::vector<bool> degenerate;    // no valid pixels in the input image

    size_t size() const { return pmf.size(); }
};

/**
 * Runs featurize -> eval_features -> softmax2 -> bivariate_von_mises ->
 * idx_to_uv over a batch of images against one model. Batch elements are
 * independent and processed on up to parallel_workers threads.
 */
class IlluminantEstimator {
public:
    explicit IlluminantEstimator(Model model, int parallel_workers = 1,
                                 float pmf_sum_tolerance = fitting::kDefaultPmfSumTolerance);
    IlluminantEstimator(const config::Config& cfg, FilterBank bank);

    EstimationResult estimate(const std::vector<RGBImage>& images) const;

    // Same as estimate(), reporting stage_start/stage_end events.
    EstimationResult estimate(const std::vector<RGBImage>& images, core::EventEmitter& emitter,
                              const std::string& run_id, std::ostream& events) const;

    // Estimate the illuminant of each image and divide it out.
    std::vector<RGBImage> white_balance(const std::vector<RGBImage>& images) const;

    const Model& model() const { return model_; }
    int parallel_workers() const { return parallel_workers_; }

private:
    struct Reporter;

    EstimationResult run(const std::vector<RGBImage>& images, const Reporter* reporter) const;

    Model model_;
    int parallel_workers_;
    float pmf_sum_tolerance_;
};

} // namespace ffcc::pipeline
