#include "dct_redux/config/configuration.hpp"
#include "dct_redux/core/errors.hpp"
#include "dct_redux/core/utils.hpp"

#include <fstream>

namespace dct_redux::config {

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
        if (node["frame"]) {
            auto f = node["frame"];
            if (f["subtract_overscan"]) cfg.frame.subtract_overscan = f["subtract_overscan"].as<bool>();
            if (f["remove_cosmic_rays"]) cfg.frame.remove_cosmic_rays = f["remove_cosmic_rays"].as<bool>();
        }

        if (node["cosmic_rays"]) {
            auto c = node["cosmic_rays"];
            if (c["method"]) cfg.cosmic_rays.method = c["method"].as<std::string>();
            if (c["sigma_threshold"]) cfg.cosmic_rays.sigma_threshold = c["sigma_threshold"].as<float>();
            if (c["kernel_size"]) cfg.cosmic_rays.kernel_size = c["kernel_size"].as<int>();
        }

        if (node["rescale"]) {
            auto r = node["rescale"];
            if (r["mode"]) cfg.rescale.mode = r["mode"].as<std::string>();
            if (r["power"]) cfg.rescale.power = r["power"].as<float>();
            if (r["min_cut"]) cfg.rescale.min_cut = r["min_cut"].as<float>();
            if (r["max_cut"]) cfg.rescale.max_cut = r["max_cut"].as<float>();
        }

        if (node["centroid"]) {
            auto c = node["centroid"];
            if (c["half_window"]) cfg.centroid.half_window = c["half_window"].as<int>();
        }

        if (node["input"]) {
            auto i = node["input"];
            if (i["directory"]) cfg.input.directory = i["directory"].as<std::string>();
            if (i["bias"]) cfg.input.bias = i["bias"].as<std::string>();
            if (i["flat"]) cfg.input.flat = i["flat"].as<std::string>();
            if (i["science"]) cfg.input.science = i["science"].as<std::string>();
        }

        if (node["pipeline"]) {
            auto p = node["pipeline"];
            if (p["combine_science"]) cfg.pipeline.combine_science = p["combine_science"].as<bool>();
            if (p["abort_on_fail"]) cfg.pipeline.abort_on_fail = p["abort_on_fail"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid value: ") + e.what());
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

    node["frame"]["subtract_overscan"] = frame.subtract_overscan;
    node["frame"]["remove_cosmic_rays"] = frame.remove_cosmic_rays;

    node["cosmic_rays"]["method"] = cosmic_rays.method;
    node["cosmic_rays"]["sigma_threshold"] = cosmic_rays.sigma_threshold;
    node["cosmic_rays"]["kernel_size"] = cosmic_rays.kernel_size;

    node["rescale"]["mode"] = rescale.mode;
    node["rescale"]["power"] = rescale.power;
    node["rescale"]["min_cut"] = rescale.min_cut;
    node["rescale"]["max_cut"] = rescale.max_cut;

    node["centroid"]["half_window"] = centroid.half_window;

    node["input"]["directory"] = input.directory;
    node["input"]["bias"] = input.bias;
    node["input"]["flat"] = input.flat;
    node["input"]["science"] = input.science;

    node["pipeline"]["combine_science"] = pipeline.combine_science;
    node["pipeline"]["abort_on_fail"] = pipeline.abort_on_fail;

    return node;
}

void Config::validate() const {
    if (cosmic_rays.method != "none" && cosmic_rays.method != "local_median") {
        throw ValidationError("cosmic_rays.method must be 'none' or 'local_median'");
    }
    if (!(cosmic_rays.sigma_threshold > 0.0f)) {
        throw ValidationError("cosmic_rays.sigma_threshold must be > 0");
    }
    if (cosmic_rays.kernel_size != 3 && cosmic_rays.kernel_size != 5) {
        throw ValidationError("cosmic_rays.kernel_size must be 3 or 5");
    }

    const std::string mode = core::to_lower(core::trim(rescale.mode));
    if (mode != "linear" && mode != "log" && mode != "power") {
        throw ValidationError("rescale.mode must be 'linear', 'log' or 'power'");
    }
    if (!(rescale.power > 0.0f)) {
        throw ValidationError("rescale.power must be > 0");
    }
    if (!(rescale.max_cut > rescale.min_cut)) {
        throw ValidationError("rescale.max_cut must be > rescale.min_cut");
    }

    if (centroid.half_window < 1) {
        throw ValidationError("centroid.half_window must be >= 1");
    }

    if (input.science.empty()) {
        throw ValidationError("input.science must name at least one frame");
    }
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "frame": {
      "type": "object",
      "properties": {
        "subtract_overscan": {"type": "boolean"},
        "remove_cosmic_rays": {"type": "boolean"}
      }
    },
    "cosmic_rays": {
      "type": "object",
      "properties": {
        "method": {"type": "string", "enum": ["none", "local_median"]},
        "sigma_threshold": {"type": "number", "exclusiveMinimum": 0},
        "kernel_size": {"type": "integer", "enum": [3, 5]}
      }
    },
    "rescale": {
      "type": "object",
      "properties": {
        "mode": {"type": "string", "enum": ["linear", "log", "power"]},
        "power": {"type": "number", "exclusiveMinimum": 0},
        "min_cut": {"type": "number"},
        "max_cut": {"type": "number"}
      }
    },
    "centroid": {
      "type": "object",
      "properties": {
        "half_window": {"type": "integer", "minimum": 1}
      }
    },
    "input": {
      "type": "object",
      "properties": {
        "directory": {"type": "string"},
        "bias": {"type": "string"},
        "flat": {"type": "string"},
        "science": {"type": "string", "minLength": 1}
      },
      "required": ["science"]
    },
    "pipeline": {
      "type": "object",
      "properties": {
        "combine_science": {"type": "boolean"},
        "abort_on_fail": {"type": "boolean"}
      }
    }
  }
})";
}

} // namespace dct_redux::config
