#include "dct_redux/image/centroid.hpp"
#include "dct_redux/core/errors.hpp"
#include "dct_redux/core/utils.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>

namespace dct_redux::image {

MomentCentroidFinder::MomentCentroidFinder(int half_window) : half_window_(half_window) {
    if (half_window_ < 1) {
        throw ValidationError("centroid half window must be >= 1");
    }
}

Centroid MomentCentroidFinder::find(const Matrix2Df& image) const {
    Centroid c;
    if (image.size() == 0) return c;

    Eigen::Index peak_y = 0;
    Eigen::Index peak_x = 0;
    image.maxCoeff(&peak_y, &peak_x);

    const int rows = static_cast<int>(image.rows());
    const int cols = static_cast<int>(image.cols());
    const int x0 = std::max(0, static_cast<int>(peak_x) - half_window_);
    const int y0 = std::max(0, static_cast<int>(peak_y) - half_window_);
    const int x1 = std::min(cols, static_cast<int>(peak_x) + half_window_ + 1);
    const int y1 = std::min(rows, static_cast<int>(peak_y) + half_window_ + 1);

    Matrix2Df window = image.block(y0, x0, y1 - y0, x1 - x0);
    const float background = core::compute_median(window);
    window = (window.array() - background).max(0.0f).matrix();

    cv::Mat cv_window(static_cast<int>(window.rows()), static_cast<int>(window.cols()), CV_32F,
                      window.data());
    cv::Moments m = cv::moments(cv_window, false);
    if (!(m.m00 > 0.0)) {
        return c;
    }

    c.x = static_cast<float>(x0 + m.m10 / m.m00);
    c.y = static_cast<float>(y0 + m.m01 / m.m00);
    c.flux = static_cast<float>(m.m00);
    c.valid = true;
    return c;
}

} // namespace dct_redux::image
