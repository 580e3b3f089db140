#include "ffcc/pipeline/estimator.hpp"
#include "ffcc/color/color_space.hpp"
#include "ffcc/core/errors.hpp"
#include "ffcc/fitting/rescale.hpp"
#include "ffcc/scoring/softmax.hpp"
#include "ffcc/scoring/toroidal_conv.hpp"

#include <iostream>
#include <string>
#include <utility>

namespace ffcc::pipeline {

struct IlluminantEstimator::Reporter {
    core::EventEmitter& emitter;
    const std::string& run_id;
    std::ostream& out;

    void start(Stage stage) const { emitter.stage_start(run_id, stage, out); }
    void end(Stage stage, const core::json& extra = core::json::object()) const {
        emitter.stage_end(run_id, stage, "ok", extra, out);
    }
    void warn(const std::string& message) const { emitter.warning(run_id, message, out); }
};

void validate_model(const Model& model) {
    if (model.grid.nbins < 2) {
        throw ValidationError("model grid needs nbins >= 2");
    }
    if (!(model.grid.bin_size > 0.0f)) {
        throw ValidationError("model grid needs bin_size > 0");
    }
    if (model.bank.channels() != 2) {
        throw ValidationError("model filter bank needs 2 channels (raw, edge), got " +
                              std::to_string(model.bank.channels()));
    }
    scoring::check_bank(model.bank, model.grid.nbins, model.grid.nbins, 2);
}

IlluminantEstimator::IlluminantEstimator(Model model, int parallel_workers,
                                         float pmf_sum_tolerance)
    : model_(std::move(model)),
      parallel_workers_(parallel_workers < 1 ? 1 : parallel_workers),
      pmf_sum_tolerance_(pmf_sum_tolerance) {
    validate_model(model_);
}

IlluminantEstimator::IlluminantEstimator(const config::Config& cfg, FilterBank bank)
    : IlluminantEstimator(Model{cfg.histogram.grid(), std::move(bank)},
                          cfg.runtime.parallel_workers, cfg.fit.pmf_sum_tolerance) {}

EstimationResult IlluminantEstimator::estimate(const std::vector<RGBImage>& images) const {
    return run(images, nullptr);
}

EstimationResult IlluminantEstimator::estimate(const std::vector<RGBImage>& images,
                                               core::EventEmitter& emitter,
                                               const std::string& run_id,
                                               std::ostream& events) const {
    Reporter reporter{emitter, run_id, events};
    return run(images, &reporter);
}

EstimationResult IlluminantEstimator::run(const std::vector<RGBImage>& images,
                                          const Reporter* reporter) const {
    EstimationResult result;
    const HistogramGrid& grid = model_.grid;

    if (reporter) reporter->start(Stage::FEATURIZE);
    result.features = histogram::featurize_images(images, grid, parallel_workers_);
    result.degenerate.reserve(result.features.size());
    int degenerate_count = 0;
    for (size_t b = 0; b < result.features.size(); ++b) {
        const bool degenerate = result.features[b].degenerate();
        result.degenerate.push_back(degenerate);
        if (degenerate) {
            ++degenerate_count;
            const std::string msg = "element " + std::to_string(b) +
                                    " has no valid pixels; estimate comes from the bias alone";
            std::cerr << "[ESTIMATE] " << msg << std::endl;
            if (reporter) reporter->warn(msg);
        }
    }
    if (reporter) reporter->end(Stage::FEATURIZE, {{"images", images.size()},
                                                   {"degenerate", degenerate_count}});

    if (reporter) reporter->start(Stage::SCORE);
    std::vector<FeatureStack> stacks;
    stacks.reserve(result.features.size());
    for (const auto& f : result.features) {
        stacks.push_back(f.channels);
    }
    const std::vector<FilterBank> banks(stacks.size(), model_.bank);
    result.scores = scoring::eval_features(stacks, banks, parallel_workers_);
    if (reporter) reporter->end(Stage::SCORE);

    if (reporter) reporter->start(Stage::NORMALIZE);
    result.pmf = scoring::softmax2(result.scores, parallel_workers_);
    if (reporter) reporter->end(Stage::NORMALIZE);

    if (reporter) reporter->start(Stage::FIT);
    result.fit_idx = fitting::bivariate_von_mises(result.pmf, pmf_sum_tolerance_, parallel_workers_);
    if (reporter) reporter->end(Stage::FIT);

    if (reporter) reporter->start(Stage::RESCALE);
    result.fit_uv = fitting::idx_to_uv(result.fit_idx, grid.bin_size, grid.first_bin);
    result.illuminant_rgb = color::uv_to_rgb(result.fit_uv.mu);
    if (reporter) reporter->end(Stage::RESCALE);

    return result;
}

std::vector<RGBImage> IlluminantEstimator::white_balance(const std::vector<RGBImage>& images) const {
    const EstimationResult est = estimate(images);
    return color::apply_wb(images, est.fit_uv.mu);
}

} // namespace ffcc::pipeline
