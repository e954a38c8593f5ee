#include "dct_redux/core/errors.hpp"
#include "dct_redux/core/types.hpp"
#include "dct_redux/core/utils.hpp"
#include "dct_redux/config/configuration.hpp"
#include "dct_redux/frame/calibrated_frame.hpp"
#include "dct_redux/pipeline/reduction.hpp"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <iostream>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace frame = dct_redux::frame;
namespace config = dct_redux::config;

static void print_json(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

// ============================================================================
// get-schema
// ============================================================================
int cmd_get_schema() {
    std::cout << config::get_schema_json() << std::endl;
    return 0;
}

// ============================================================================
// validate-config --path <path> [--strict-exit-codes]
// ============================================================================
int cmd_validate_config(const std::string& path, bool strict_exit) {
    json result;
    result["valid"] = false;
    result["errors"] = json::array();
    result["path"] = path;

    try {
        config::Config cfg = config::Config::load(path);
        cfg.validate();
        result["valid"] = true;
    } catch (const dct_redux::DctReduxError& e) {
        result["errors"].push_back(e.what());
    }

    print_json(result);
    if (strict_exit) {
        return result["valid"].get<bool>() ? 0 : 1;
    }
    return 0;
}

// ============================================================================
// summary <fits...> [--no-overscan] [--combine] [--json]
// ============================================================================
int cmd_summary(const std::vector<std::string>& paths, bool subtract_overscan,
                bool combine, bool as_json) {
    frame::FrameOptions options;
    options.subtract_overscan = subtract_overscan;
    options.remove_cosmic_rays = false;

    try {
        std::vector<frame::CalibratedFrame> frames;
        frames.reserve(paths.size());
        for (const auto& p : paths) {
            frames.push_back(frame::CalibratedFrame::load(dct_redux::FrameRole::SCIENCE, p, options));
        }
        if (combine) {
            frame::CalibratedFrame avg = frame::CalibratedFrame::average(frames);
            frames.clear();
            frames.push_back(std::move(avg));
        }

        if (as_json) {
            json out = json::array();
            for (const auto& f : frames) {
                out.push_back(dct_redux::pipeline::frame_to_json(f));
            }
            print_json(out);
        } else {
            for (const auto& f : frames) {
                std::cout << f.summary();
            }
        }
    } catch (const dct_redux::DctReduxError& e) {
        std::cerr << "summary: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

// ============================================================================
// reduce --config <path> [--run-id ID]
// ============================================================================
int cmd_reduce(const std::string& config_path, const std::string& run_id_arg) {
    config::Config cfg;
    try {
        cfg = config::Config::load(config_path);
    } catch (const dct_redux::DctReduxError& e) {
        std::cerr << "reduce: " << e.what() << "\n";
        return 1;
    }

    const std::string run_id = run_id_arg.empty() ? dct_redux::core::get_run_id() : run_id_arg;

    try {
        dct_redux::pipeline::ReductionRunner runner(cfg);
        auto result = runner.run(run_id, std::cout);

        json out;
        out["ok"] = true;
        out["run_id"] = run_id;
        out["science"] = json::array();
        for (size_t i = 0; i < result.science.size(); ++i) {
            json entry = dct_redux::pipeline::frame_to_json(result.science[i].frame());
            const auto& c = result.centroids[i];
            entry["centroid"] = {{"x", c.x}, {"y", c.y}, {"flux", c.flux}, {"valid", c.valid}};
            out["science"].push_back(entry);
        }
        if (result.combined) {
            out["combined"] = dct_redux::pipeline::frame_to_json(result.combined->frame());
        }
        out["preview"] = {{"width", result.preview.cols()}, {"height", result.preview.rows()}};
        out["live_frames"] = {
            {"bias", frame::BiasFrame::live_count()},
            {"flat", frame::FlatFrame::live_count()},
            {"science", frame::ScienceFrame::live_count()}
        };
        print_json(out);
    } catch (const dct_redux::DctReduxError& e) {
        std::cerr << "reduce: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    CLI::App app{"DCT frame calibration"};
    app.require_subcommand(1);

    auto schema_cmd = app.add_subcommand("get-schema", "Print JSON schema for config");

    std::string validate_path;
    bool strict_exit = false;
    auto validate_cmd = app.add_subcommand("validate-config", "Validate a config file");
    validate_cmd->add_option("--path", validate_path, "Path to config.yaml")->required();
    validate_cmd->add_flag("--strict-exit-codes", strict_exit, "Exit 1 when invalid");

    std::vector<std::string> summary_paths;
    bool no_overscan = false;
    bool combine = false;
    bool as_json = false;
    auto summary_cmd = app.add_subcommand("summary", "Print frame summaries");
    summary_cmd->add_option("frames", summary_paths, "FITS frames")->required();
    summary_cmd->add_flag("--no-overscan", no_overscan, "Skip overscan subtraction");
    summary_cmd->add_flag("--combine", combine, "Average the frames first");
    summary_cmd->add_flag("--json", as_json, "Print JSON instead of text");

    std::string config_path;
    std::string run_id;
    auto reduce_cmd = app.add_subcommand("reduce", "Run bias/flat calibration of science frames");
    reduce_cmd->add_option("--config", config_path, "Path to config.yaml")->required();
    reduce_cmd->add_option("--run-id", run_id, "Run identifier (generated when empty)");

    CLI11_PARSE(app, argc, argv);

    if (schema_cmd->parsed()) {
        return cmd_get_schema();
    }
    if (validate_cmd->parsed()) {
        return cmd_validate_config(validate_path, strict_exit);
    }
    if (summary_cmd->parsed()) {
        return cmd_summary(summary_paths, !no_overscan, combine, as_json);
    }
    if (reduce_cmd->parsed()) {
        return cmd_reduce(config_path, run_id);
    }

    std::cerr << app.help() << std::endl;
    return 1;
}
