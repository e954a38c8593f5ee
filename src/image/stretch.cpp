#include "dct_redux/image/stretch.hpp"
#include "dct_redux/core/errors.hpp"
#include "dct_redux/core/utils.hpp"

#include <cmath>

namespace dct_redux::image {

namespace {
constexpr float kLogExponent = 1000.0f;
}

StretchMode string_to_stretch_mode(const std::string& s) {
    const std::string norm = core::to_lower(core::trim(s));
    if (norm == "linear") return StretchMode::LINEAR;
    if (norm == "log") return StretchMode::LOG;
    if (norm == "power") return StretchMode::POWER;
    throw ConfigError("unknown stretch mode: " + s);
}

StretchParams stretch_params_from_config(const config::RescaleConfig& cfg) {
    StretchParams p;
    p.mode = string_to_stretch_mode(cfg.mode);
    p.power = cfg.power;
    p.min_cut = cfg.min_cut;
    p.max_cut = cfg.max_cut;
    return p;
}

Matrix2Df stretch(const Matrix2Df& src, const StretchParams& params) {
    if (!(params.max_cut > params.min_cut)) {
        throw ValidationError("stretch max_cut must be > min_cut");
    }
    if (!(params.power > 0.0f)) {
        throw ValidationError("stretch power must be > 0");
    }

    const float range = params.max_cut - params.min_cut;
    Matrix2Df v = ((src.array() - params.min_cut) / range).max(0.0f).min(1.0f).matrix();

    switch (params.mode) {
        case StretchMode::LINEAR:
            return v;
        case StretchMode::LOG: {
            const float norm = std::log1p(kLogExponent);
            return v.unaryExpr([norm](float x) { return std::log1p(kLogExponent * x) / norm; });
        }
        case StretchMode::POWER: {
            const float p = params.power;
            return v.unaryExpr([p](float x) { return std::pow(x, p); });
        }
    }
    return v;
}

} // namespace dct_redux::image
