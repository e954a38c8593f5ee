#pragma once

#include "dct_redux/frame/calibrated_frame.hpp"
#include "dct_redux/frame/display.hpp"
#include "dct_redux/image/centroid.hpp"

#include <string>
#include <utility>
#include <vector>

namespace dct_redux::frame {

// Shared surface of the role wrappers. Combination results keep the role of
// the wrapper they were produced from.
template <typename Derived, FrameRole R>
class RoleFrame {
public:
    static constexpr FrameRole kRole = R;

    RoleFrame(std::string name, io::HeaderRecord header, const Matrix2Df& raw,
              const FrameOptions& options = FrameOptions{})
        : frame_(R, std::move(name), std::move(header), raw, options) {}

    static Derived load(const fs::path& path, const FrameOptions& options = FrameOptions{}) {
        return Derived(CalibratedFrame::load(R, path, options));
    }

    static Derived average(const std::vector<Derived>& frames) {
        std::vector<CalibratedFrame> inner;
        inner.reserve(frames.size());
        for (const auto& f : frames) {
            inner.push_back(f.frame());
        }
        return Derived(CalibratedFrame::average(inner));
    }

    Derived combine(const Derived& other, CombineOp op) const {
        return Derived(frame_.combine(other.frame(), op));
    }

    static int live_count() { return dct_redux::frame::live_count(R); }

    const CalibratedFrame& frame() const { return frame_; }

    std::string summary() const { return frame_.summary(); }

protected:
    explicit RoleFrame(CalibratedFrame frame) : frame_(std::move(frame)) {}

    CalibratedFrame frame_;
};

class BiasFrame : public RoleFrame<BiasFrame, FrameRole::BIAS> {
public:
    using RoleFrame::RoleFrame;

private:
    friend class RoleFrame<BiasFrame, FrameRole::BIAS>;
    explicit BiasFrame(CalibratedFrame frame) : RoleFrame(std::move(frame)) {}
};

class FlatFrame : public RoleFrame<FlatFrame, FrameRole::FLAT> {
public:
    using RoleFrame::RoleFrame;

    void subtract_bias(const BiasFrame& bias);
    bool bias_corrected() const { return frame_.bias_corrected(); }

    // Scales the image to unit mean; returns the level divided out.
    float normalize() { return frame_.normalize(); }

private:
    friend class RoleFrame<FlatFrame, FrameRole::FLAT>;
    explicit FlatFrame(CalibratedFrame frame) : RoleFrame(std::move(frame)) {}
};

class ScienceFrame : public RoleFrame<ScienceFrame, FrameRole::SCIENCE> {
public:
    using RoleFrame::RoleFrame;

    void subtract_bias(const BiasFrame& bias);
    void divide_flat(const FlatFrame& flat);
    bool bias_corrected() const { return frame_.bias_corrected(); }
    bool flat_corrected() const { return frame_.flat_corrected(); }

    void rescale(const image::StretchParams& params);

    image::Centroid find_centroid(const image::CentroidFinder& finder) const;
    void show(FrameRenderer& renderer, const std::string& colormap = "gray") const;

private:
    friend class RoleFrame<ScienceFrame, FrameRole::SCIENCE>;
    explicit ScienceFrame(CalibratedFrame frame) : RoleFrame(std::move(frame)) {}
};

} // namespace dct_redux::frame
