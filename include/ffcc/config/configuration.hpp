#pragma once

#include "ffcc/core/types.hpp"

#include <filesystem>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace ffcc::config {

namespace fs = std::filesystem;

struct HistogramConfig {
  float first_bin = -0.53125f;
  float bin_size = 0.03125f;
  int nbins = 64;

  HistogramGrid grid() const { return {first_bin, bin_size, nbins}; }
};

struct ExtendedFeatureConfig {
  std::vector<float> bins; // strictly increasing; empty = no auxiliary feature
};

struct FitConfig {
  float pmf_sum_tolerance = 1e-4f;
};

struct LabelConfig {
  bool warn_on_clamp = true;
};

struct RuntimeConfig {
  int parallel_workers = 4;
};

struct Config {
  HistogramConfig histogram;
  ExtendedFeatureConfig extended_feature;
  FitConfig fit;
  LabelConfig label;
  RuntimeConfig runtime;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

std::string get_schema_json();

} // namespace ffcc::config
