#pragma once

#include "dct_redux/core/types.hpp"
#include "dct_redux/config/configuration.hpp"

#include <memory>
#include <string>

namespace dct_redux::image {

// Detects and suppresses cosmic-ray hits in an active region. Implementations
// must return an array with the shape of their input.
class CosmicRayFilter {
public:
    virtual ~CosmicRayFilter() = default;

    virtual Matrix2Df apply(const Matrix2Df& active) const = 0;
    virtual std::string name() const = 0;
};

class NullCosmicRayFilter : public CosmicRayFilter {
public:
    Matrix2Df apply(const Matrix2Df& active) const override { return active; }
    std::string name() const override { return "none"; }
};

// Replaces samples lying more than sigma_threshold robust sigmas above their
// kernel_size x kernel_size median with that median.
class LocalMedianCosmicRayFilter : public CosmicRayFilter {
public:
    LocalMedianCosmicRayFilter(float sigma_threshold, int kernel_size);

    Matrix2Df apply(const Matrix2Df& active) const override;
    std::string name() const override { return "local_median"; }

    float sigma_threshold() const { return sigma_threshold_; }
    int kernel_size() const { return kernel_size_; }

private:
    float sigma_threshold_;
    int kernel_size_;
};

std::unique_ptr<CosmicRayFilter> make_cosmic_ray_filter(const config::CosmicRayConfig& cfg);

// Runs `filter` and throws ShapeMismatchError if it changed the array shape.
Matrix2Df filter_cosmic_rays(const CosmicRayFilter& filter, const Matrix2Df& active);

} // namespace dct_redux::image
