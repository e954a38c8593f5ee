#include "dct_redux/config/configuration.hpp"
#include "dct_redux/core/errors.hpp"
#include "test_helpers.hpp"

#include <nlohmann/json.hpp>

#include <fstream>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace dct_redux;
using dct_redux::config::Config;

TEST_CASE("config_defaults") {
    Config cfg;
    REQUIRE(cfg.frame.subtract_overscan);
    REQUIRE(cfg.frame.remove_cosmic_rays);
    REQUIRE(cfg.cosmic_rays.method == "none");
    REQUIRE(cfg.rescale.mode == "linear");
    REQUIRE(cfg.centroid.half_window == 7);
    REQUIRE(cfg.pipeline.abort_on_fail);
    REQUIRE_FALSE(cfg.pipeline.combine_science);
    // science list is mandatory
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);
}

TEST_CASE("config_from_yaml_overrides_given_keys") {
    YAML::Node node = YAML::Load(R"(
frame:
  subtract_overscan: false
cosmic_rays:
  method: local_median
  sigma_threshold: 4.5
  kernel_size: 5
rescale:
  mode: power
  power: 0.5
input:
  directory: /data/night1
  bias: bias_*
  science: sci_0[1,2]
pipeline:
  combine_science: true
)");
    Config cfg = Config::from_yaml(node);
    REQUIRE_FALSE(cfg.frame.subtract_overscan);
    REQUIRE(cfg.frame.remove_cosmic_rays);
    REQUIRE(cfg.cosmic_rays.method == "local_median");
    REQUIRE(cfg.cosmic_rays.sigma_threshold == Catch::Approx(4.5f));
    REQUIRE(cfg.cosmic_rays.kernel_size == 5);
    REQUIRE(cfg.rescale.mode == "power");
    REQUIRE(cfg.rescale.max_cut == Catch::Approx(65535.0f));
    REQUIRE(cfg.input.directory == "/data/night1");
    REQUIRE(cfg.input.bias == "bias_*");
    REQUIRE(cfg.input.flat.empty());
    REQUIRE(cfg.input.science == "sci_0[1,2]");
    REQUIRE(cfg.pipeline.combine_science);
    REQUIRE_NOTHROW(cfg.validate());
}

TEST_CASE("config_rejects_bad_values") {
    Config cfg;
    cfg.input.science = "sci_01";
    REQUIRE_NOTHROW(cfg.validate());

    Config c1 = cfg;
    c1.cosmic_rays.method = "laplacian";
    REQUIRE_THROWS_AS(c1.validate(), ValidationError);

    Config c2 = cfg;
    c2.cosmic_rays.kernel_size = 4;
    REQUIRE_THROWS_AS(c2.validate(), ValidationError);

    Config c3 = cfg;
    c3.rescale.max_cut = c3.rescale.min_cut;
    REQUIRE_THROWS_AS(c3.validate(), ValidationError);

    Config c4 = cfg;
    c4.rescale.mode = "asinh";
    REQUIRE_THROWS_AS(c4.validate(), ValidationError);

    Config c5 = cfg;
    c5.centroid.half_window = 0;
    REQUIRE_THROWS_AS(c5.validate(), ValidationError);

    REQUIRE_THROWS_AS(Config::from_yaml(YAML::Load("cosmic_rays: {kernel_size: three}")),
                      ConfigError);
}

TEST_CASE("config_accepts_rescale_mode_in_any_case") {
    Config cfg;
    cfg.input.science = "sci_01";
    cfg.rescale.mode = "LINEAR";
    REQUIRE_NOTHROW(cfg.validate());
    cfg.rescale.mode = " Log ";
    REQUIRE_NOTHROW(cfg.validate());
    cfg.rescale.mode = "Power";
    REQUIRE_NOTHROW(cfg.validate());
}

TEST_CASE("config_save_then_load") {
    dct_redux::testing::TempDir dir("config");
    Config cfg;
    cfg.input.science = "sci_*";
    cfg.cosmic_rays.method = "local_median";
    cfg.pipeline.abort_on_fail = false;
    cfg.save(dir.path() / "redux.yaml");

    Config back = Config::load(dir.path() / "redux.yaml");
    REQUIRE(back.input.science == "sci_*");
    REQUIRE(back.cosmic_rays.method == "local_median");
    REQUIRE_FALSE(back.pipeline.abort_on_fail);

    REQUIRE_THROWS_AS(Config::load(dir.path() / "missing.yaml"), ConfigError);
    std::ofstream(dir.path() / "broken.yaml") << "frame: [unterminated";
    REQUIRE_THROWS_AS(Config::load(dir.path() / "broken.yaml"), ConfigError);
}

TEST_CASE("schema_is_valid_json") {
    auto schema = nlohmann::json::parse(config::get_schema_json());
    REQUIRE(schema["type"] == "object");
    REQUIRE(schema["properties"].contains("input"));
    REQUIRE(schema["properties"].contains("cosmic_rays"));
}
