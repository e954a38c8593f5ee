#pragma once

#include "dct_redux/core/types.hpp"

namespace dct_redux::image {

struct Centroid {
    float x = 0.0f;      // column, pixels
    float y = 0.0f;      // row, pixels
    float flux = 0.0f;   // background-subtracted sum in the window
    bool valid = false;
};

class CentroidFinder {
public:
    virtual ~CentroidFinder() = default;

    virtual Centroid find(const Matrix2Df& image) const = 0;
};

// First-moment centroid in a (2 half_window + 1)^2 window around the brightest
// sample, after subtracting the window median and zeroing negative samples.
class MomentCentroidFinder : public CentroidFinder {
public:
    explicit MomentCentroidFinder(int half_window = 7);

    Centroid find(const Matrix2Df& image) const override;

private:
    int half_window_;
};

} // namespace dct_redux::image
