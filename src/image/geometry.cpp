#include "dct_redux/image/geometry.hpp"
#include "dct_redux/core/errors.hpp"

#include <limits>
#include <string>

namespace dct_redux::image {

FrameGeometry compute_frame_geometry(const io::HeaderRecord& header) {
    const long naxis1 = header.require_int("NAXIS1");
    const long naxis2 = header.require_int("NAXIS2");
    const long prescan = header.require_int("PRESCAN");
    const long postscan = header.require_int("POSTSCAN");

    if (prescan < 0 || postscan < 0) {
        throw GeometryError("negative scan width (PRESCAN=" + std::to_string(prescan) +
                            ", POSTSCAN=" + std::to_string(postscan) + ")");
    }
    if (naxis1 > std::numeric_limits<int>::max() || naxis2 > std::numeric_limits<int>::max()) {
        throw GeometryError("image dimensions " + std::to_string(naxis1) + "x" +
                            std::to_string(naxis2) + " exceed the supported range");
    }
    // no prescan + postscan sum: it can overflow
    if (prescan >= naxis1 || postscan >= naxis1 - prescan) {
        throw GeometryError("PRESCAN=" + std::to_string(prescan) + " + POSTSCAN=" +
                            std::to_string(postscan) +
                            " leaves no active columns in NAXIS1=" + std::to_string(naxis1));
    }
    if (naxis2 < 1) {
        throw GeometryError("NAXIS2 must be >= 1, got " + std::to_string(naxis2));
    }

    FrameGeometry g;
    g.naxis1 = static_cast<int>(naxis1);
    g.height = static_cast<int>(naxis2);
    g.prescan_width = static_cast<int>(prescan);
    g.postscan_width = static_cast<int>(postscan);
    return g;
}

FrameRegions split_regions(const Matrix2Df& raw, const FrameGeometry& geometry) {
    if (raw.rows() != geometry.height || raw.cols() != geometry.naxis1) {
        throw GeometryError("raw array is " + std::to_string(raw.cols()) + "x" +
                            std::to_string(raw.rows()) + " but header declares " +
                            std::to_string(geometry.naxis1) + "x" +
                            std::to_string(geometry.height));
    }

    const int h = geometry.height;
    FrameRegions regions;
    regions.prescan = raw.block(0, geometry.prescan().begin, h, geometry.prescan().width());
    regions.active = raw.block(0, geometry.active().begin, h, geometry.active().width());
    regions.postscan = raw.block(0, geometry.postscan().begin, h, geometry.postscan().width());
    return regions;
}

} // namespace dct_redux::image
