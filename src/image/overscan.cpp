#include "dct_redux/image/overscan.hpp"
#include "dct_redux/core/errors.hpp"

#include <string>

namespace dct_redux::image {

float compute_overscan_level(const Matrix2Df& prescan, const Matrix2Df& postscan) {
    if (prescan.size() > 0 && postscan.size() > 0 && prescan.rows() != postscan.rows()) {
        throw ShapeMismatchError("prescan has " + std::to_string(prescan.rows()) +
                                 " rows, postscan has " + std::to_string(postscan.rows()));
    }

    const Eigen::Index n = prescan.size() + postscan.size();
    if (n == 0) {
        throw EmptyRegionError("overscan correction requested but prescan and postscan are empty");
    }

    double sum = 0.0;
    if (prescan.size() > 0) sum += prescan.cast<double>().sum();
    if (postscan.size() > 0) sum += postscan.cast<double>().sum();
    return static_cast<float>(sum / static_cast<double>(n));
}

Matrix2Df correct_overscan(const Matrix2Df& active, const Matrix2Df& prescan,
                           const Matrix2Df& postscan, bool enabled) {
    if (!enabled) {
        return active;
    }
    const float level = compute_overscan_level(prescan, postscan);
    Matrix2Df result = active.array() - level;
    return result;
}

} // namespace dct_redux::image
