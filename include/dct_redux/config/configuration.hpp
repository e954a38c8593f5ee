#pragma once

#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>

namespace dct_redux::config {

namespace fs = std::filesystem;

struct FrameConfig {
  bool subtract_overscan = true;
  bool remove_cosmic_rays = true;
};

struct CosmicRayConfig {
  std::string method = "none"; // none | local_median
  float sigma_threshold = 5.0f;
  int kernel_size = 3;         // 3 | 5
};

struct RescaleConfig {
  std::string mode = "linear"; // linear | log | power
  float power = 1.0f;
  float min_cut = 0.0f;
  float max_cut = 65535.0f;
};

struct CentroidConfig {
  int half_window = 7;
};

struct InputConfig {
  std::string directory = ".";
  std::string bias;    // frame-list patterns
  std::string flat;
  std::string science;
};

struct PipelineConfig {
  bool combine_science = false;
  bool abort_on_fail = true;
};

struct Config {
  FrameConfig frame;
  CosmicRayConfig cosmic_rays;
  RescaleConfig rescale;
  CentroidConfig centroid;
  InputConfig input;
  PipelineConfig pipeline;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

std::string get_schema_json();

} // namespace dct_redux::config
