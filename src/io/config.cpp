#include "ffcc/config/configuration.hpp"
#include "ffcc/core/errors.hpp"
#include "ffcc/core/utils.hpp"

#include <cmath>
#include <fstream>

namespace ffcc::config {

static void read_float_list(const YAML::Node& n, std::vector<float>& out) {
    if (n && n.IsSequence()) {
        out.clear();
        out.reserve(n.size());
        for (const auto& item : n) {
            out.push_back(item.as<float>());
        }
    }
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        if (node["histogram"]) {
            auto h = node["histogram"];
            if (h["first_bin"]) cfg.histogram.first_bin = h["first_bin"].as<float>();
            if (h["bin_size"]) cfg.histogram.bin_size = h["bin_size"].as<float>();
            if (h["nbins"]) cfg.histogram.nbins = h["nbins"].as<int>();
        }

        if (node["extended_feature"]) {
            read_float_list(node["extended_feature"]["bins"], cfg.extended_feature.bins);
        }

        if (node["fit"]) {
            auto f = node["fit"];
            if (f["pmf_sum_tolerance"]) cfg.fit.pmf_sum_tolerance = f["pmf_sum_tolerance"].as<float>();
        }

        if (node["label"]) {
            auto l = node["label"];
            if (l["warn_on_clamp"]) cfg.label.warn_on_clamp = l["warn_on_clamp"].as<bool>();
        }

        if (node["runtime"]) {
            auto r = node["runtime"];
            if (r["parallel_workers"]) cfg.runtime.parallel_workers = r["parallel_workers"].as<int>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Malformed value: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["histogram"]["first_bin"] = histogram.first_bin;
    node["histogram"]["bin_size"] = histogram.bin_size;
    node["histogram"]["nbins"] = histogram.nbins;

    YAML::Node bins(YAML::NodeType::Sequence);
    for (float b : extended_feature.bins) {
        bins.push_back(b);
    }
    node["extended_feature"]["bins"] = bins;

    node["fit"]["pmf_sum_tolerance"] = fit.pmf_sum_tolerance;
    node["label"]["warn_on_clamp"] = label.warn_on_clamp;
    node["runtime"]["parallel_workers"] = runtime.parallel_workers;

    return node;
}

void Config::validate() const {
    if (histogram.nbins < 2) {
        throw ValidationError("histogram.nbins must be >= 2");
    }
    if (!(histogram.bin_size > 0.0f) || !std::isfinite(histogram.bin_size)) {
        throw ValidationError("histogram.bin_size must be > 0");
    }
    if (!std::isfinite(histogram.first_bin)) {
        throw ValidationError("histogram.first_bin must be finite");
    }

    for (float b : extended_feature.bins) {
        if (!std::isfinite(b)) {
            throw ValidationError("extended_feature.bins must be finite");
        }
    }
    if (!core::is_strictly_increasing(extended_feature.bins)) {
        throw ValidationError("extended_feature.bins must be strictly increasing");
    }

    if (!(fit.pmf_sum_tolerance > 0.0f) || !(fit.pmf_sum_tolerance < 1.0f)) {
        throw ValidationError("fit.pmf_sum_tolerance must be in (0,1)");
    }

    if (runtime.parallel_workers < 1 || runtime.parallel_workers > 64) {
        throw ValidationError("runtime.parallel_workers must be in [1,64]");
    }
}

std::string get_schema_json() {
    return R"({
  "$schema": "https://json-schema.org/draft/2020-12/schema",
  "title": "ffcc config",
  "type": "object",
  "properties": {
    "histogram": {
      "type": "object",
      "properties": {
        "first_bin": {"type": "number"},
        "bin_size": {"type": "number", "exclusiveMinimum": 0},
        "nbins": {"type": "integer", "minimum": 2}
      }
    },
    "extended_feature": {
      "type": "object",
      "properties": {
        "bins": {"type": "array", "items": {"type": "number"}}
      }
    },
    "fit": {
      "type": "object",
      "properties": {
        "pmf_sum_tolerance": {"type": "number", "exclusiveMinimum": 0, "exclusiveMaximum": 1}
      }
    },
    "label": {
      "type": "object",
      "properties": {
        "warn_on_clamp": {"type": "boolean"}
      }
    },
    "runtime": {
      "type": "object",
      "properties": {
        "parallel_workers": {"type": "integer", "minimum": 1, "maximum": 64}
      }
    }
  }
})";
}

} // namespace ffcc::config
