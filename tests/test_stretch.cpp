#include "dct_redux/image/stretch.hpp"
#include "dct_redux/image/centroid.hpp"
#include "dct_redux/core/errors.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <cmath>

using namespace dct_redux;
using namespace dct_redux::image;

TEST_CASE("stretch_linear_clips_and_normalises") {
    Matrix2Df m(1, 4);
    m << -10, 25, 50, 300;
    StretchParams p;
    p.min_cut = 0.0f;
    p.max_cut = 100.0f;

    Matrix2Df out = stretch(m, p);
    REQUIRE(out(0, 0) == Catch::Approx(0.0f));
    REQUIRE(out(0, 1) == Catch::Approx(0.25f));
    REQUIRE(out(0, 2) == Catch::Approx(0.5f));
    REQUIRE(out(0, 3) == Catch::Approx(1.0f));
}

TEST_CASE("stretch_log_and_power_curves") {
    Matrix2Df m(1, 3);
    m << 0, 50, 100;
    StretchParams p;
    p.max_cut = 100.0f;

    p.mode = StretchMode::LOG;
    Matrix2Df log_out = stretch(m, p);
    REQUIRE(log_out(0, 0) == Catch::Approx(0.0f));
    REQUIRE(log_out(0, 1) == Catch::Approx(std::log1p(500.0f) / std::log1p(1000.0f)));
    REQUIRE(log_out(0, 2) == Catch::Approx(1.0f));

    p.mode = StretchMode::POWER;
    p.power = 2.0f;
    Matrix2Df pow_out = stretch(m, p);
    REQUIRE(pow_out(0, 1) == Catch::Approx(0.25f));
    REQUIRE(pow_out(0, 2) == Catch::Approx(1.0f));
}

TEST_CASE("stretch_rejects_bad_parameters") {
    Matrix2Df m = Matrix2Df::Zero(2, 2);
    StretchParams p;
    p.min_cut = 10.0f;
    p.max_cut = 10.0f;
    REQUIRE_THROWS_AS(stretch(m, p), ValidationError);

    p.max_cut = 20.0f;
    p.power = 0.0f;
    REQUIRE_THROWS_AS(stretch(m, p), ValidationError);
}

TEST_CASE("stretch_mode_parsing") {
    REQUIRE(string_to_stretch_mode("linear") == StretchMode::LINEAR);
    REQUIRE(string_to_stretch_mode(" LOG ") == StretchMode::LOG);
    REQUIRE(string_to_stretch_mode("Power") == StretchMode::POWER);
    REQUIRE_THROWS_AS(string_to_stretch_mode("asinh"), ConfigError);

    config::RescaleConfig cfg;
    cfg.mode = "power";
    cfg.power = 0.5f;
    cfg.max_cut = 4000.0f;
    StretchParams p = stretch_params_from_config(cfg);
    REQUIRE(p.mode == StretchMode::POWER);
    REQUIRE(p.power == Catch::Approx(0.5f));
    REQUIRE(p.max_cut == Catch::Approx(4000.0f));
}

TEST_CASE("moment_centroid_finds_symmetric_star") {
    Matrix2Df img = Matrix2Df::Constant(30, 30, 10.0f);
    img(8, 12) += 100.0f;
    img(7, 12) += 50.0f;
    img(9, 12) += 50.0f;
    img(8, 11) += 50.0f;
    img(8, 13) += 50.0f;
    img(7, 11) += 25.0f;
    img(7, 13) += 25.0f;
    img(9, 11) += 25.0f;
    img(9, 13) += 25.0f;

    MomentCentroidFinder finder(5);
    Centroid c = finder.find(img);
    REQUIRE(c.valid);
    REQUIRE(c.x == Catch::Approx(12.0f).margin(1e-3));
    REQUIRE(c.y == Catch::Approx(8.0f).margin(1e-3));
    REQUIRE(c.flux == Catch::Approx(400.0f).margin(1e-2));
}

TEST_CASE("moment_centroid_on_flat_image_is_invalid") {
    MomentCentroidFinder finder;
    REQUIRE_FALSE(finder.find(Matrix2Df::Constant(10, 10, 3.0f)).valid);
    REQUIRE_THROWS_AS(MomentCentroidFinder(0), ValidationError);
}
