#pragma once

#include "dct_redux/config/configuration.hpp"
#include "dct_redux/core/events.hpp"
#include "dct_redux/frame/role_frames.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace dct_redux::pipeline {

struct ReductionResult {
    std::optional<frame::BiasFrame> master_bias;
    std::optional<frame::FlatFrame> master_flat;
    std::vector<frame::ScienceFrame> science;
    std::vector<image::Centroid> centroids;  // one per science frame
    std::optional<frame::ScienceFrame> combined;
    // Display stretch of the combined frame, or of the first science frame
    Matrix2Df preview;
};

// Provenance, correction state and active-region statistics of a frame.
core::json frame_to_json(const frame::CalibratedFrame& frame);

// Master bias from the bias list, master flat (bias-subtracted) from the flat
// list, then bias subtraction and flat division of every science frame. Each
// calibrated science frame is centroided; the reference frame is stretched
// into a preview.
// Missing calibration sets are reported as warnings and skipped. Events are
// written to `log_stream`; errors are reported and rethrown.
class ReductionRunner {
public:
    explicit ReductionRunner(const config::Config& cfg);

    ReductionResult run(const std::string& run_id, std::ostream& log_stream);

private:
    template <typename RoleT>
    std::vector<RoleT> load_frames(const std::string& run_id,
                                   const std::vector<fs::path>& paths,
                                   const frame::FrameOptions& options,
                                   std::ostream& log_stream);

    config::Config cfg_;
    core::EventEmitter emitter_;
};

} // namespace dct_redux::pipeline
