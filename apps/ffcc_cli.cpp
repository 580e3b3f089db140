#include "ffcc/config/configuration.hpp"
#include "ffcc/core/errors.hpp"
#include "ffcc/core/events.hpp"
#include "ffcc/core/types.hpp"
#include "ffcc/core/utils.hpp"
#include "ffcc/fitting/label_pmf.hpp"
#include "ffcc/fitting/rescale.hpp"
#include "ffcc/fitting/von_mises.hpp"
#include "ffcc/histogram/chroma_histogram.hpp"
#include "ffcc/io/model_io.hpp"
#include "ffcc/pipeline/estimator.hpp"

#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include <cctype>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

using ffcc::Matrix2Df;
using ffcc::RGBImage;
using ffcc::io::matrix_to_json;

static void print_json(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

static int print_error(const std::string& message) {
    json result;
    result["error"] = message;
    print_json(result);
    return 1;
}

static ffcc::config::Config load_config_or_default(const std::string& path) {
    if (path.empty()) return ffcc::config::Config{};
    ffcc::config::Config cfg = ffcc::config::Config::load(path);
    cfg.validate();
    return cfg;
}

static json fit_to_json(const ffcc::VonMisesFit& fit, size_t b) {
    json out;
    const auto row = static_cast<Eigen::Index>(b);
    out["mu"] = {fit.mu(row, 0), fit.mu(row, 1)};
    out["sigma"] = matrix_to_json(fit.sigma[b]);
    return out;
}

static float srgb_to_linear(float c) {
    return c <= 0.04045f ? c / 12.92f : std::pow((c + 0.055f) / 1.055f, 2.4f);
}

static Matrix2Df plane_to_matrix(const cv::Mat& plane) {
    Matrix2Df out(plane.rows, plane.cols);
    for (int r = 0; r < plane.rows; ++r) {
        const float* src = plane.ptr<float>(r);
        std::memcpy(out.data() + static_cast<size_t>(r) * static_cast<size_t>(plane.cols), src,
                    static_cast<size_t>(plane.cols) * sizeof(float));
    }
    return out;
}

// Reads an 8/16-bit or float image into [0,1] RGB planes.
static RGBImage read_rgb_image(const fs::path& path, bool linearize) {
    cv::Mat raw = cv::imread(path.string(), cv::IMREAD_COLOR | cv::IMREAD_ANYDEPTH);
    if (raw.empty()) {
        throw ffcc::IOError("Cannot read image: " + path.string());
    }

    double scale = 1.0;
    if (raw.depth() == CV_8U) scale = 1.0 / 255.0;
    else if (raw.depth() == CV_16U) scale = 1.0 / 65535.0;

    cv::Mat img;
    raw.convertTo(img, CV_32FC3, scale);

    std::vector<cv::Mat> bgr;
    cv::split(img, bgr);

    RGBImage rgb;
    rgb.R = plane_to_matrix(bgr[2]);
    rgb.G = plane_to_matrix(bgr[1]);
    rgb.B = plane_to_matrix(bgr[0]);
    if (linearize) {
        auto lin = [](float c) { return srgb_to_linear(c); };
        rgb.R = rgb.R.unaryExpr(lin);
        rgb.G = rgb.G.unaryExpr(lin);
        rgb.B = rgb.B.unaryExpr(lin);
    }
    return rgb;
}

// ============================================================================
// schema
// ============================================================================
int cmd_schema() {
    std::cout << ffcc::config::get_schema_json() << std::endl;
    return 0;
}

// ============================================================================
// validate-config <path>
// ============================================================================
int cmd_validate_config(const std::string& path) {
    json result;
    result["path"] = path;
    result["valid"] = false;
    result["errors"] = json::array();

    try {
        ffcc::config::Config cfg = ffcc::config::Config::load(path);
        cfg.validate();
        result["valid"] = true;
    } catch (const ffcc::FfccError& e) {
        result["errors"].push_back(e.what());
    }

    print_json(result);
    return result["valid"].get<bool>() ? 0 : 1;
}

// ============================================================================
// featurize <image> [--config P] [--out P] [--extended X] [--linearize]
// ============================================================================
int cmd_featurize(const std::string& image_path, const std::string& config_path,
                  const std::string& out_path, const std::string& extended_arg,
                  bool linearize) {
    const ffcc::config::Config cfg = load_config_or_default(config_path);
    const RGBImage rgb = read_rgb_image(image_path, linearize);

    std::vector<float> extended;
    if (!extended_arg.empty()) {
        if (cfg.extended_feature.bins.empty()) {
            throw ffcc::InvalidInputError("--extended needs extended_feature.bins in the config");
        }
        try {
            extended.push_back(std::stof(extended_arg));
        } catch (const std::exception&) {
            throw ffcc::InvalidInputError("--extended must be a number, got '" + extended_arg + "'");
        }
    }

    ffcc::histogram::PreprocessedBatch batch;
    if (extended.empty()) {
        batch.features.push_back(ffcc::histogram::featurize_image(rgb, cfg.histogram.grid()));
    } else {
        batch = ffcc::histogram::preprocess({rgb}, extended, cfg.histogram.grid(),
                                            cfg.extended_feature.bins);
    }
    const ffcc::histogram::ImageFeatures& features = batch.features[0];

    json result;
    result["image"] = image_path;
    result["height"] = rgb.rows();
    result["width"] = rgb.cols();
    result["nbins"] = cfg.histogram.nbins;
    result["valid_pixels"] = features.valid_pixels;
    result["valid_edge_pixels"] = features.valid_edge_pixels;
    result["raw_sum"] = features.channels[0].sum();
    result["edge_sum"] = features.channels[1].sum();
    if (!extended.empty()) {
        json weights = json::array();
        for (Eigen::Index k = 0; k < batch.extended_features.cols(); ++k) {
            weights.push_back(batch.extended_features(0, k));
        }
        result["extended_feature"] = extended[0];
        result["extended_weights"] = weights;
    }

    if (!out_path.empty()) {
        json channels;
        channels["raw"] = matrix_to_json(features.channels[0]);
        channels["edge"] = matrix_to_json(features.channels[1]);
        ffcc::core::write_text(out_path, channels.dump() + "\n");
        result["out"] = out_path;
    }

    print_json(result);
    return 0;
}

// ============================================================================
// uv-to-pmf <u> <v> [--config P]
// ============================================================================
int cmd_uv_to_pmf(const std::string& u_arg, const std::string& v_arg,
                  const std::string& config_path) {
    const ffcc::config::Config cfg = load_config_or_default(config_path);

    Matrix2Df uv(1, 2);
    try {
        uv(0, 0) = std::stof(u_arg);
        uv(0, 1) = std::stof(v_arg);
    } catch (const std::exception&) {
        throw ffcc::InvalidInputError("u and v must be numbers, got '" + u_arg + "', '" + v_arg + "'");
    }

    const auto& h = cfg.histogram;
    const ffcc::fitting::LabelPMF label =
        ffcc::fitting::uv_to_pmf(uv, h.bin_size, h.first_bin, h.nbins, cfg.label.warn_on_clamp);

    json entries = json::array();
    const Matrix2Df& pmf = label.pmf[0];
    for (Eigen::Index r = 0; r < pmf.rows(); ++r) {
        for (Eigen::Index c = 0; c < pmf.cols(); ++c) {
            if (pmf(r, c) != 0.0f) {
                entries.push_back({{"u_bin", r}, {"v_bin", c}, {"weight", pmf(r, c)}});
            }
        }
    }

    json result;
    result["u"] = uv(0, 0);
    result["v"] = uv(0, 1);
    result["clamped"] = static_cast<bool>(label.clamped[0]);
    result["entries"] = entries;
    print_json(result);
    return 0;
}

// ============================================================================
// fit <pmf.json> [--config P]
// ============================================================================
int cmd_fit(const std::string& pmf_path, const std::string& config_path) {
    const ffcc::config::Config cfg = load_config_or_default(config_path);

    const Matrix2Df pmf = ffcc::io::read_matrix(pmf_path, "pmf");

    const ffcc::VonMisesFit fit_idx =
        ffcc::fitting::bivariate_von_mises(pmf, cfg.fit.pmf_sum_tolerance);
    const ffcc::VonMisesFit fit_uv =
        ffcc::fitting::idx_to_uv(fit_idx, cfg.histogram.bin_size, cfg.histogram.first_bin);

    json result;
    result["pmf"] = pmf_path;
    result["index"] = fit_to_json(fit_idx, 0);
    result["uv"] = fit_to_json(fit_uv, 0);
    print_json(result);
    return 0;
}

// ============================================================================
// estimate <image>... --model P [--config P] [--events] [--linearize]
// ============================================================================
int cmd_estimate(const std::vector<std::string>& image_paths, const std::string& model_path,
                 const std::string& config_path, bool events, bool linearize) {
    const ffcc::config::Config cfg = load_config_or_default(config_path);
    const ffcc::pipeline::IlluminantEstimator estimator(cfg, ffcc::io::read_filter_bank(model_path));

    std::vector<RGBImage> images;
    images.reserve(image_paths.size());
    for (const auto& p : image_paths) {
        images.push_back(read_rgb_image(p, linearize));
    }

    ffcc::pipeline::EstimationResult est;
    if (events) {
        ffcc::core::EventEmitter emitter;
        const std::string run_id = ffcc::core::get_run_id();
        emitter.run_start(run_id, {{"images", image_paths.size()}, {"model", model_path}}, std::cerr);
        try {
            est = estimator.estimate(images, emitter, run_id, std::cerr);
        } catch (const ffcc::FfccError& e) {
            emitter.error(run_id, e.what(), std::cerr);
            emitter.run_end(run_id, false, "error", std::cerr);
            throw;
        }
        emitter.run_end(run_id, true, "ok", std::cerr);
    } else {
        est = estimator.estimate(images);
    }

    json items = json::array();
    for (size_t b = 0; b < est.size(); ++b) {
        const auto row = static_cast<Eigen::Index>(b);
        json item;
        item["image"] = image_paths[b];
        item["index"] = fit_to_json(est.fit_idx, b);
        item["uv"] = fit_to_json(est.fit_uv, b);
        item["rgb"] = {est.illuminant_rgb(row, 0), est.illuminant_rgb(row, 1),
                       est.illuminant_rgb(row, 2)};
        item["valid_pixels"] = est.features[b].valid_pixels;
        item["degenerate"] = static_cast<bool>(est.degenerate[b]);
        items.push_back(item);
    }

    json result;
    result["model"] = model_path;
    result["results"] = items;
    print_json(result);
    return 0;
}

void print_usage() {
    std::cout << "Usage: ffcc_cli <command> [options]\n"
              << "\nCommands:\n"
              << "  schema                          Print JSON schema for config\n"
              << "  validate-config <path>          Validate config YAML file\n"
              << "  featurize <image> [--config P] [--out P] [--extended X] [--linearize]\n"
              << "                                  Raw/edge chroma histograms of an image\n"
              << "  uv-to-pmf <u> <v> [--config P]  Bilinear label PMF of a UV point\n"
              << "  fit <pmf.json> [--config P]     Von Mises fit of an n x n PMF\n"
              << "  estimate <image>... --model P [--config P] [--events] [--linearize]\n"
              << "                                  Estimate the illuminant of images\n";
}

static bool is_number_arg(const char* s) {
    return s[0] == '-' && (std::isdigit(static_cast<unsigned char>(s[1])) || s[1] == '.');
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];

    // Options taking a value; everything else starting with '-' is a flag
    auto takes_value = [](const char* name) {
        return std::strcmp(name, "--config") == 0 || std::strcmp(name, "--out") == 0 ||
               std::strcmp(name, "--model") == 0 || std::strcmp(name, "--extended") == 0;
    };

    auto get_arg = [&](const char* name) -> std::string {
        for (int i = 2; i < argc - 1; ++i) {
            if (std::strcmp(argv[i], name) == 0) return argv[i + 1];
        }
        return "";
    };

    auto has_flag = [&](const char* name) -> bool {
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], name) == 0) return true;
        }
        return false;
    };

    // Negative numbers count as positionals
    auto positionals = [&]() {
        std::vector<std::string> out;
        for (int i = 2; i < argc; ++i) {
            if (argv[i][0] != '-' || is_number_arg(argv[i])) {
                out.push_back(argv[i]);
            } else if (takes_value(argv[i])) {
                ++i;
            }
        }
        return out;
    }();

    const std::string config_path = get_arg("--config");

    try {
        if (command == "schema") {
            return cmd_schema();
        }

        if (command == "validate-config") {
            if (positionals.empty()) {
                std::cerr << "validate-config requires a path argument\n";
                return 1;
            }
            return cmd_validate_config(positionals[0]);
        }

        if (command == "featurize") {
            if (positionals.empty()) {
                std::cerr << "featurize requires an image path\n";
                return 1;
            }
            return cmd_featurize(positionals[0], config_path, get_arg("--out"),
                                 get_arg("--extended"), has_flag("--linearize"));
        }

        if (command == "uv-to-pmf") {
            if (positionals.size() < 2) {
                std::cerr << "uv-to-pmf requires <u> <v>\n";
                return 1;
            }
            return cmd_uv_to_pmf(positionals[0], positionals[1], config_path);
        }

        if (command == "fit") {
            if (positionals.empty()) {
                std::cerr << "fit requires a PMF JSON path\n";
                return 1;
            }
            return cmd_fit(positionals[0], config_path);
        }

        if (command == "estimate") {
            const std::string model_path = get_arg("--model");
            if (positionals.empty() || model_path.empty()) {
                std::cerr << "estimate requires image paths and --model\n";
                return 1;
            }
            return cmd_estimate(positionals, model_path, config_path, has_flag("--events"),
                                has_flag("--linearize"));
        }
    } catch (const ffcc::FfccError& e) {
        return print_error(e.what());
    } catch (const cv::Exception& e) {
        return print_error(std::string("OpenCV: ") + e.what());
    } catch (const std::exception& e) {
        return print_error(e.what());
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage();
    return 1;
}
