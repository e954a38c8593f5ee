#include "dct_redux/frame/role_frames.hpp"
#include "dct_redux/core/errors.hpp"
#include "test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <optional>

using namespace dct_redux;
using namespace dct_redux::frame;
using dct_redux::testing::make_header;
using dct_redux::testing::make_raw;

namespace {

FrameOptions raw_options() {
    FrameOptions o;
    o.subtract_overscan = false;
    o.remove_cosmic_rays = false;
    return o;
}

template <typename RoleT>
RoleT make_role(const std::string& name, float level) {
    return RoleT(name, make_header(20, 6, 2, 3), make_raw(20, 6, 2, 3, level, level), raw_options());
}

class RecordingRenderer : public FrameRenderer {
public:
    void render(const Matrix2Df& image, const std::string& colormap) override {
        rows = image.rows();
        cols = image.cols();
        last_colormap = colormap;
        ++calls;
    }
    Eigen::Index rows = 0;
    Eigen::Index cols = 0;
    std::string last_colormap;
    int calls = 0;
};

} // namespace

TEST_CASE("live_counts_track_each_role") {
    const int bias0 = BiasFrame::live_count();
    const int flat0 = FlatFrame::live_count();
    const int sci0 = ScienceFrame::live_count();
    {
        BiasFrame b1 = make_role<BiasFrame>("b1", 10.0f);
        BiasFrame b2 = make_role<BiasFrame>("b2", 10.0f);
        FlatFrame f1 = make_role<FlatFrame>("f1", 10.0f);
        REQUIRE(BiasFrame::live_count() == bias0 + 2);
        REQUIRE(FlatFrame::live_count() == flat0 + 1);
        REQUIRE(ScienceFrame::live_count() == sci0);

        BiasFrame copy = b1;
        REQUIRE(BiasFrame::live_count() == bias0 + 3);

        BiasFrame sum = b1.combine(b2, CombineOp::ADD);
        REQUIRE(BiasFrame::live_count() == bias0 + 4);
        REQUIRE(sum.frame().role() == FrameRole::BIAS);
    }
    REQUIRE(BiasFrame::live_count() == bias0);
    REQUIRE(FlatFrame::live_count() == flat0);
    REQUIRE(live_count(FrameRole::BIAS) == bias0);
}

TEST_CASE("live_count_survives_optional_and_vector_moves") {
    const int sci0 = ScienceFrame::live_count();
    {
        std::vector<ScienceFrame> frames;
        frames.push_back(make_role<ScienceFrame>("s1", 5.0f));
        frames.push_back(make_role<ScienceFrame>("s2", 5.0f));
        std::optional<ScienceFrame> avg = ScienceFrame::average(frames);
        REQUIRE(ScienceFrame::live_count() == sci0 + 3);
        REQUIRE(avg->frame().num_combined() == 2);
    }
    REQUIRE(ScienceFrame::live_count() == sci0);
}

TEST_CASE("flat_bias_subtraction") {
    FlatFrame flat = make_role<FlatFrame>("flat", 1000.0f);
    BiasFrame bias = make_role<BiasFrame>("bias", 100.0f);
    flat.subtract_bias(bias);
    REQUIRE(flat.bias_corrected());
    REQUIRE(flat.frame().active()(0, 0) == Catch::Approx(900.0f));
    REQUIRE(flat.frame().role() == FrameRole::FLAT);
}

TEST_CASE("science_full_calibration") {
    ScienceFrame sci = make_role<ScienceFrame>("sci", 2100.0f);
    BiasFrame bias = make_role<BiasFrame>("bias", 100.0f);
    FlatFrame flat("flat", make_header(20, 6, 2, 3), Matrix2Df::Constant(6, 20, 2.0f),
                   raw_options());

    sci.subtract_bias(bias);
    sci.divide_flat(flat);

    REQUIRE(sci.bias_corrected());
    REQUIRE(sci.flat_corrected());
    REQUIRE(sci.frame().active()(2, 2) == Catch::Approx(1000.0f));
    REQUIRE(sci.frame().names() == std::vector<std::string>{"sci", "bias", "flat"});
    REQUIRE(sci.summary().find("combination of 3 images") != std::string::npos);
}

TEST_CASE("science_centroid_and_show") {
    Matrix2Df raw = make_raw(40, 30, 2, 3, 100.0f, 0.0f);
    raw.block(0, 2, 30, 35).setConstant(10.0f);
    raw(15, 20) = 500.0f;
    ScienceFrame sci("star", make_header(40, 30, 2, 3), raw, raw_options());

    image::MomentCentroidFinder finder(4);
    image::Centroid c = sci.find_centroid(finder);
    REQUIRE(c.valid);
    // active column 18 is raw column 20
    REQUIRE(c.x == Catch::Approx(18.0f).margin(1e-3));
    REQUIRE(c.y == Catch::Approx(15.0f).margin(1e-3));

    RecordingRenderer renderer;
    sci.show(renderer);
    REQUIRE(renderer.calls == 1);
    REQUIRE(renderer.rows == 30);
    REQUIRE(renderer.cols == 35);
    REQUIRE(renderer.last_colormap == "gray");
    sci.show(renderer, "viridis");
    REQUIRE(renderer.last_colormap == "viridis");
}

TEST_CASE("science_rescale_keeps_provenance") {
    ScienceFrame sci = make_role<ScienceFrame>("sci", 500.0f);
    image::StretchParams p;
    p.max_cut = 1000.0f;
    sci.rescale(p);
    // first active sample is 501
    REQUIRE(sci.frame().active()(0, 0) == Catch::Approx(0.501f));
    REQUIRE(sci.frame().names().size() == 1);
}
