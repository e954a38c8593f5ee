#pragma once

#include "dct_redux/core/types.hpp"
#include "dct_redux/frame/live_counter.hpp"
#include "dct_redux/image/cosmic_rays.hpp"
#include "dct_redux/image/stretch.hpp"
#include "dct_redux/io/fits_io.hpp"

#include <string>
#include <vector>

namespace dct_redux::frame {

// Construction-time corrections. A null cosmic_ray_filter with
// remove_cosmic_rays set applies the no-op policy.
struct FrameOptions {
    bool subtract_overscan = true;
    bool remove_cosmic_rays = true;
    const image::CosmicRayFilter* cosmic_ray_filter = nullptr;
};

// Per-constituent summary record
struct FrameSummary {
    std::string name;
    std::string obs_type;
    std::string filter;
    std::string ra;
    std::string dec;
    std::string date;
    std::string hour_angle;
    double exp_time = 0.0;
    double airmass = 0.0;
    int width = 0;
    int height = 0;
    double plate_scale = 0.0;
};

// A detector frame split into prescan, active and postscan regions, together
// with the provenance (names and headers) of every raw frame combined into it.
//
// Header-derived accessors always return one value per constituent, in
// combination order; an unmerged frame yields a single-element vector.
class CalibratedFrame {
public:
    CalibratedFrame(FrameRole role, std::string name, io::HeaderRecord header,
                    const Matrix2Df& raw, const FrameOptions& options = FrameOptions{});

    static CalibratedFrame load(FrameRole role, const fs::path& path,
                                const FrameOptions& options = FrameOptions{});

    // Element-wise on prescan, active, postscan and original. Provenance is
    // this frame's followed by other's. Operands are left untouched.
    CalibratedFrame combine(const CalibratedFrame& other, CombineOp op) const;

    // Sum of all frames divided by frames.size(); keeps every constituent's provenance.
    static CalibratedFrame average(const std::vector<CalibratedFrame>& frames);

    // In place. No guard against repeated application: each call subtracts again.
    void subtract_bias(const CalibratedFrame& bias);
    // In place on active and original; prescan and postscan are left as they are.
    // All-or-nothing: throws DivisionByZeroError before writing anything.
    void divide_flat(const CalibratedFrame& flat);

    // Divides active and original by the mean of active and returns that mean.
    // A non-positive mean leaves the frame unchanged.
    float normalize();

    // Recomputes active from original; prescan, postscan and provenance are untouched.
    void rescale(const image::StretchParams& params);

    FrameRole role() const { return token_.role(); }
    int num_combined() const { return static_cast<int>(headers_.size()); }
    const std::vector<std::string>& names() const { return names_; }
    const std::vector<io::HeaderRecord>& headers() const { return headers_; }

    bool bias_corrected() const { return bias_corrected_; }
    bool flat_corrected() const { return flat_corrected_; }

    const Matrix2Df& prescan() const { return prescan_; }
    const Matrix2Df& active() const { return active_; }
    const Matrix2Df& postscan() const { return postscan_; }
    const Matrix2Df& original() const { return original_; }

    // Full-width readout: prescan | active | postscan
    Matrix2Df assemble() const;

    std::vector<double> airmass() const;
    std::vector<std::string> date() const;
    std::vector<std::string> dec() const;
    std::vector<double> exp_time() const;
    std::vector<std::string> filter() const;
    std::vector<double> gain() const;
    std::vector<std::string> hour_angle() const;
    std::vector<double> plate_scale() const;
    std::vector<std::string> obs_type() const;
    std::vector<std::string> ra() const;

    // From headers[0]; geometry is identical across constituents.
    int width() const;
    int height() const;
    int prescan_width() const;
    int postscan_width() const;

    std::vector<FrameSummary> summaries() const;
    std::string summary() const;

private:
    void require_same_shape(const CalibratedFrame& other, const char* operation) const;
    static void require_nonzero_divisor(const CalibratedFrame& divisor, const char* operation);
    void apply(const CalibratedFrame& other, CombineOp op);
    void append_provenance(const CalibratedFrame& other);

    const io::HeaderRecord& first_header() const;
    std::vector<double> numeric_values(const std::string& key) const;
    std::vector<std::string> string_values(const std::string& key) const;

    LiveFrameToken token_;
    std::vector<std::string> names_;
    std::vector<io::HeaderRecord> headers_;
    Matrix2Df prescan_;
    Matrix2Df active_;
    Matrix2Df postscan_;
    Matrix2Df original_;
    bool bias_corrected_ = false;
    bool flat_corrected_ = false;
};

} // namespace dct_redux::frame
