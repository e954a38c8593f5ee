#pragma once

#include "dct_redux/core/types.hpp"

namespace dct_redux::image {

// Mean of all prescan and postscan samples taken together.
// Throws EmptyRegionError when both regions are empty and ShapeMismatchError
// when their heights differ.
float compute_overscan_level(const Matrix2Df& prescan, const Matrix2Df& postscan);

// Returns a copy of `active` with the overscan level subtracted, or an
// unchanged copy when `enabled` is false.
Matrix2Df correct_overscan(const Matrix2Df& active, const Matrix2Df& prescan,
                           const Matrix2Df& postscan, bool enabled = true);

} // namespace dct_redux::image
