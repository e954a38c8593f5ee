#include "dct_redux/frame/role_frames.hpp"

namespace dct_redux::frame {

void FlatFrame::subtract_bias(const BiasFrame& bias) {
    frame_.subtract_bias(bias.frame());
}

void ScienceFrame::subtract_bias(const BiasFrame& bias) {
    frame_.subtract_bias(bias.frame());
}

void ScienceFrame::divide_flat(const FlatFrame& flat) {
    frame_.divide_flat(flat.frame());
}

void ScienceFrame::rescale(const image::StretchParams& params) {
    frame_.rescale(params);
}

image::Centroid ScienceFrame::find_centroid(const image::CentroidFinder& finder) const {
    return finder.find(frame_.active());
}

void ScienceFrame::show(FrameRenderer& renderer, const std::string& colormap) const {
    renderer.render(frame_.active(), colormap);
}

} // namespace dct_redux::frame
