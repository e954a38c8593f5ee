#include "dct_redux/image/cosmic_rays.hpp"
#include "dct_redux/core/errors.hpp"
#include "dct_redux/core/utils.hpp"

#include <opencv2/imgproc.hpp>

#include <cstring>
#include <string>

namespace dct_redux::image {

LocalMedianCosmicRayFilter::LocalMedianCosmicRayFilter(float sigma_threshold, int kernel_size)
    : sigma_threshold_(sigma_threshold), kernel_size_(kernel_size) {
    if (!(sigma_threshold_ > 0.0f)) {
        throw ValidationError("cosmic-ray sigma threshold must be > 0");
    }
    // medianBlur on CV_32F only supports 3 and 5
    if (kernel_size_ != 3 && kernel_size_ != 5) {
        throw ValidationError("cosmic-ray kernel size must be 3 or 5");
    }
}

Matrix2Df LocalMedianCosmicRayFilter::apply(const Matrix2Df& active) const {
    if (active.size() == 0) return active;

    const float sigma = core::compute_robust_sigma(active);
    if (!(sigma > 0.0f)) {
        return active;
    }

    cv::Mat cv_active(static_cast<int>(active.rows()), static_cast<int>(active.cols()), CV_32F,
                      const_cast<float*>(active.data()));
    cv::Mat local_median;
    cv::medianBlur(cv_active, local_median, kernel_size_);

    Matrix2Df median(active.rows(), active.cols());
    std::memcpy(median.data(), local_median.ptr<float>(), active.size() * sizeof(float));

    const float threshold = sigma_threshold_ * sigma;
    Matrix2Df result = active;
    for (Eigen::Index y = 0; y < active.rows(); ++y) {
        for (Eigen::Index x = 0; x < active.cols(); ++x) {
            if (active(y, x) - median(y, x) > threshold) {
                result(y, x) = median(y, x);
            }
        }
    }
    return result;
}

std::unique_ptr<CosmicRayFilter> make_cosmic_ray_filter(const config::CosmicRayConfig& cfg) {
    if (cfg.method == "none") {
        return std::make_unique<NullCosmicRayFilter>();
    }
    if (cfg.method == "local_median") {
        return std::make_unique<LocalMedianCosmicRayFilter>(cfg.sigma_threshold, cfg.kernel_size);
    }
    throw ConfigError("unknown cosmic-ray method: " + cfg.method);
}

Matrix2Df filter_cosmic_rays(const CosmicRayFilter& filter, const Matrix2Df& active) {
    Matrix2Df out = filter.apply(active);
    if (out.rows() != active.rows() || out.cols() != active.cols()) {
        throw ShapeMismatchError("cosmic-ray filter '" + filter.name() + "' changed shape from " +
                                 std::to_string(active.cols()) + "x" + std::to_string(active.rows()) +
                                 " to " + std::to_string(out.cols()) + "x" + std::to_string(out.rows()));
    }
    return out;
}

} // namespace dct_redux::image
