#pragma once

#include "dct_redux/core/types.hpp"
#include "dct_redux/config/configuration.hpp"

#include <string>

namespace dct_redux::image {

struct StretchParams {
    StretchMode mode = StretchMode::LINEAR;
    float power = 1.0f;
    float min_cut = 0.0f;
    float max_cut = 65535.0f;
};

StretchMode string_to_stretch_mode(const std::string& s);

StretchParams stretch_params_from_config(const config::RescaleConfig& cfg);

// Clips to [min_cut, max_cut], maps to [0, 1] and applies the display curve:
//   LINEAR  v
//   LOG     log1p(1000 v) / log1p(1000)
//   POWER   v^power
// Throws ValidationError if max_cut <= min_cut or power <= 0.
Matrix2Df stretch(const Matrix2Df& src, const StretchParams& params);

} // namespace dct_redux::image
