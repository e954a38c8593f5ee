#pragma once

#include "dct_redux/core/types.hpp"
#include "dct_redux/io/fits_io.hpp"

namespace dct_redux::image {

// Column partition of a raw CCD readout.
struct FrameGeometry {
    int naxis1 = 0;
    int height = 0;
    int prescan_width = 0;
    int postscan_width = 0;

    int active_width() const { return naxis1 - prescan_width - postscan_width; }

    ColumnRange prescan() const { return {0, prescan_width}; }
    ColumnRange active() const { return {prescan_width, naxis1 - postscan_width}; }
    ColumnRange postscan() const { return {naxis1 - postscan_width, naxis1}; }
};

struct FrameRegions {
    Matrix2Df prescan;
    Matrix2Df active;
    Matrix2Df postscan;
};

// Reads PRESCAN, POSTSCAN, NAXIS1 and NAXIS2. Throws GeometryError for an
// empty or negative active width, negative scan widths or NAXIS2 < 1.
FrameGeometry compute_frame_geometry(const io::HeaderRecord& header);

// Throws GeometryError if `raw` is not NAXIS2 x NAXIS1.
FrameRegions split_regions(const Matrix2Df& raw, const FrameGeometry& geometry);

} // namespace dct_redux::image
