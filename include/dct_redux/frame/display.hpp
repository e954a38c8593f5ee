#pragma once

#include "dct_redux/core/types.hpp"
#include <string>

namespace dct_redux::frame {

// External rendering collaborator used by ScienceFrame::show.
class FrameRenderer {
public:
    virtual ~FrameRenderer() = default;

    virtual void render(const Matrix2Df& image, const std::string& colormap) = 0;
};

} // namespace dct_redux::frame
