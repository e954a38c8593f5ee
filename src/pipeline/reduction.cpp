#include "dct_redux/pipeline/reduction.hpp"
#include "dct_redux/core/errors.hpp"
#include "dct_redux/core/utils.hpp"
#include "dct_redux/image/centroid.hpp"
#include "dct_redux/image/cosmic_rays.hpp"
#include "dct_redux/image/stretch.hpp"
#include "dct_redux/io/frame_list.hpp"

namespace dct_redux::pipeline {

using json = core::json;

namespace {

json paths_to_json(const std::vector<fs::path>& paths) {
    json arr = json::array();
    for (const auto& p : paths) {
        arr.push_back(p.string());
    }
    return arr;
}

} // namespace

json frame_to_json(const frame::CalibratedFrame& f) {
    json j;
    j["role"] = frame_role_to_string(f.role());
    j["num_combined"] = f.num_combined();
    j["names"] = f.names();
    j["bias_corrected"] = f.bias_corrected();
    j["flat_corrected"] = f.flat_corrected();
    j["width"] = f.width();
    j["height"] = f.height();

    const Matrix2Df& a = f.active();
    if (a.size() > 0) {
        j["active"] = {
            {"mean", a.cast<double>().mean()},
            {"min", a.minCoeff()},
            {"max", a.maxCoeff()}
        };
    }

    json summaries = json::array();
    for (const auto& s : f.summaries()) {
        summaries.push_back({
            {"name", s.name},
            {"obs_type", s.obs_type},
            {"filter", s.filter},
            {"ra", s.ra},
            {"dec", s.dec},
            {"date", s.date},
            {"hour_angle", s.hour_angle},
            {"exp_time", s.exp_time},
            {"airmass", s.airmass},
            {"width", s.width},
            {"height", s.height},
            {"plate_scale", s.plate_scale}
        });
    }
    j["summaries"] = summaries;
    return j;
}

ReductionRunner::ReductionRunner(const config::Config& cfg) : cfg_(cfg) {}

template <typename RoleT>
std::vector<RoleT> ReductionRunner::load_frames(const std::string& run_id,
                                                const std::vector<fs::path>& paths,
                                                const frame::FrameOptions& options,
                                                std::ostream& log_stream) {
    std::vector<RoleT> frames;
    frames.reserve(paths.size());
    const int total = static_cast<int>(paths.size());

    for (int i = 0; i < total; ++i) {
        const fs::path& p = paths[static_cast<size_t>(i)];
        try {
            frames.push_back(RoleT::load(p, options));
        } catch (const DctReduxError& e) {
            if (cfg_.pipeline.abort_on_fail) {
                throw;
            }
            emitter_.warning(run_id, std::string("skipping ") + p.string() + ": " + e.what(),
                             log_stream);
            continue;
        }

        json extra;
        extra["path"] = p.string();
        extra["sha256"] = core::sha256_file(p);
        emitter_.frame_loaded(run_id, RoleT::kRole, i, total, frames.back().frame().names().front(),
                              extra, log_stream);
    }
    return frames;
}

ReductionResult ReductionRunner::run(const std::string& run_id, std::ostream& log_stream) {
    cfg_.validate();

    json start;
    start["directory"] = cfg_.input.directory;
    start["bias"] = cfg_.input.bias;
    start["flat"] = cfg_.input.flat;
    start["science"] = cfg_.input.science;
    start["subtract_overscan"] = cfg_.frame.subtract_overscan;
    start["cosmic_rays"] = cfg_.frame.remove_cosmic_rays ? cfg_.cosmic_rays.method : "off";
    const image::StretchParams stretch_params = image::stretch_params_from_config(cfg_.rescale);
    start["rescale"] = stretch_mode_to_string(stretch_params.mode);
    emitter_.run_start(run_id, start, log_stream);

    ReductionResult result;
    Phase phase = Phase::SCAN_INPUT;

    try {
        // --- SCAN_INPUT ---
        emitter_.phase_start(run_id, phase, log_stream);
        const fs::path dir(cfg_.input.directory);
        const auto bias_paths = io::expand_frame_list(dir, cfg_.input.bias);
        const auto flat_paths = io::expand_frame_list(dir, cfg_.input.flat);
        const auto science_paths = io::expand_frame_list(dir, cfg_.input.science);
        if (science_paths.empty()) {
            throw EmptyInputError("no science frames match '" + cfg_.input.science + "'");
        }
        emitter_.phase_end(run_id, phase, "ok",
                           {{"bias", paths_to_json(bias_paths)},
                            {"flat", paths_to_json(flat_paths)},
                            {"science", paths_to_json(science_paths)}},
                           log_stream);

        auto cosmic_filter = image::make_cosmic_ray_filter(cfg_.cosmic_rays);
        frame::FrameOptions options;
        options.subtract_overscan = cfg_.frame.subtract_overscan;
        options.remove_cosmic_rays = cfg_.frame.remove_cosmic_rays;
        options.cosmic_ray_filter = cosmic_filter.get();

        // --- MASTER_BIAS ---
        phase = Phase::MASTER_BIAS;
        emitter_.phase_start(run_id, phase, log_stream);
        auto biases = load_frames<frame::BiasFrame>(run_id, bias_paths, options, log_stream);
        if (biases.empty()) {
            emitter_.warning(run_id, "no bias frames; bias subtraction skipped", log_stream);
            emitter_.phase_end(run_id, phase, "skipped", json::object(), log_stream);
        } else {
            result.master_bias = frame::BiasFrame::average(biases);
            emitter_.phase_end(run_id, phase, "ok", frame_to_json(result.master_bias->frame()),
                               log_stream);
        }

        // --- MASTER_FLAT ---
        phase = Phase::MASTER_FLAT;
        emitter_.phase_start(run_id, phase, log_stream);
        auto flats = load_frames<frame::FlatFrame>(run_id, flat_paths, options, log_stream);
        if (flats.empty()) {
            emitter_.warning(run_id, "no flat frames; flat division skipped", log_stream);
            emitter_.phase_end(run_id, phase, "skipped", json::object(), log_stream);
        } else {
            result.master_flat = frame::FlatFrame::average(flats);
            if (result.master_bias) {
                result.master_flat->subtract_bias(*result.master_bias);
            }
            const float flat_level = result.master_flat->normalize();
            if (!(flat_level > 0.0f)) {
                emitter_.warning(run_id, "master flat mean is not positive; flat left unnormalised",
                                 log_stream);
            }
            json flat_out = frame_to_json(result.master_flat->frame());
            flat_out["level"] = flat_level;
            emitter_.phase_end(run_id, phase, "ok", flat_out, log_stream);
        }

        // --- SCIENCE_CALIBRATION ---
        phase = Phase::SCIENCE_CALIBRATION;
        emitter_.phase_start(run_id, phase, log_stream);
        result.science = load_frames<frame::ScienceFrame>(run_id, science_paths, options, log_stream);
        if (result.science.empty()) {
            throw EmptyInputError("no science frame could be loaded");
        }
        const image::MomentCentroidFinder finder(cfg_.centroid.half_window);
        json calibrated = json::array();
        for (auto& sci : result.science) {
            if (result.master_bias) {
                sci.subtract_bias(*result.master_bias);
            }
            if (result.master_flat) {
                sci.divide_flat(*result.master_flat);
            }
            const image::Centroid c = sci.find_centroid(finder);
            result.centroids.push_back(c);

            json entry = frame_to_json(sci.frame());
            entry["centroid"] = {{"x", c.x}, {"y", c.y}, {"flux", c.flux}, {"valid", c.valid}};
            calibrated.push_back(entry);
        }
        emitter_.phase_end(run_id, phase, "ok", {{"frames", calibrated}}, log_stream);

        // --- COMBINE ---
        phase = Phase::COMBINE;
        emitter_.phase_start(run_id, phase, log_stream);
        if (cfg_.pipeline.combine_science) {
            result.combined = frame::ScienceFrame::average(result.science);
            emitter_.phase_end(run_id, phase, "ok", frame_to_json(result.combined->frame()),
                               log_stream);
        } else {
            emitter_.phase_end(run_id, phase, "skipped", json::object(), log_stream);
        }

        const frame::ScienceFrame& reference =
            result.combined ? *result.combined : result.science.front();
        result.preview = image::stretch(reference.frame().original(), stretch_params);
    } catch (const std::exception& e) {
        json err;
        err["error"] = e.what();
        emitter_.phase_end(run_id, phase, "error", err, log_stream);
        emitter_.error(run_id, e.what(), log_stream);
        emitter_.run_end(run_id, false, "error", log_stream);
        throw;
    }

    emitter_.phase_start(run_id, Phase::DONE, log_stream);
    emitter_.phase_end(run_id, Phase::DONE, "ok", json::object(), log_stream);
    emitter_.run_end(run_id, true, "ok", log_stream);
    return result;
}

} // namespace dct_redux::pipeline
