#include "dct_redux/image/geometry.hpp"
#include "dct_redux/core/errors.hpp"
#include "test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>

#include <limits>

using dct_redux::GeometryError;
using dct_redux::HeaderError;
using dct_redux::Matrix2Df;
using dct_redux::image::compute_frame_geometry;
using dct_redux::image::split_regions;
using dct_redux::testing::make_header;
using dct_redux::testing::make_raw;

TEST_CASE("geometry_splits_110_column_readout_into_5_100_5") {
    auto g = compute_frame_geometry(make_header(110, 50, 5, 5));

    REQUIRE(g.active_width() == 100);
    REQUIRE(g.height == 50);
    REQUIRE(g.prescan().begin == 0);
    REQUIRE(g.prescan().end == 5);
    REQUIRE(g.active().begin == 5);
    REQUIRE(g.active().end == 105);
    REQUIRE(g.postscan().begin == 105);
    REQUIRE(g.postscan().end == 110);

    auto regions = split_regions(make_raw(110, 50, 5, 5, 100.0f, 1000.0f), g);
    REQUIRE(regions.prescan.cols() == 5);
    REQUIRE(regions.prescan.rows() == 50);
    REQUIRE(regions.active.cols() == 100);
    REQUIRE(regions.active.rows() == 50);
    REQUIRE(regions.postscan.cols() == 5);
    REQUIRE(regions.postscan.rows() == 50);
}

TEST_CASE("geometry_widths_sum_to_naxis1") {
    const int cases[][4] = {{110, 50, 5, 5}, {64, 8, 0, 4}, {64, 8, 4, 0}, {2, 1, 0, 1}, {2080, 2056, 20, 20}};
    for (const auto& c : cases) {
        auto g = compute_frame_geometry(make_header(c[0], c[1], c[2], c[3]));
        REQUIRE(g.active_width() + g.prescan_width + g.postscan_width == c[0]);
        REQUIRE(g.height == c[1]);
    }
}

TEST_CASE("geometry_rejects_scans_covering_the_whole_row") {
    REQUIRE_THROWS_AS(compute_frame_geometry(make_header(10, 4, 5, 5)), GeometryError);
    REQUIRE_THROWS_AS(compute_frame_geometry(make_header(10, 4, 8, 5)), GeometryError);
}

TEST_CASE("geometry_rejects_negative_scan_widths") {
    REQUIRE_THROWS_AS(compute_frame_geometry(make_header(10, 4, -1, 2)), GeometryError);
    REQUIRE_THROWS_AS(compute_frame_geometry(make_header(10, 4, 2, -1)), GeometryError);
}

TEST_CASE("geometry_rejects_scan_widths_beyond_int_range") {
    const long int_max = std::numeric_limits<int>::max();

    // 2^32 + 5 must not wrap to a plausible width of 5
    auto wrapped = make_header(110, 50, 5, 5);
    wrapped.set("PRESCAN", 4294967301L);
    REQUIRE_THROWS_AS(compute_frame_geometry(wrapped), GeometryError);

    auto huge = make_header(110, 50, 5, 5);
    huge.set("PRESCAN", int_max);
    huge.set("POSTSCAN", int_max);
    REQUIRE_THROWS_AS(compute_frame_geometry(huge), GeometryError);

    auto wide = make_header(110, 50, 5, 5);
    wide.set("NAXIS1", int_max + 10);
    REQUIRE_THROWS_AS(compute_frame_geometry(wide), GeometryError);
}

TEST_CASE("geometry_accepts_scans_leaving_one_active_column") {
    auto g = compute_frame_geometry(make_header(110, 50, 100, 9));
    REQUIRE(g.active_width() == 1);
    REQUIRE(g.postscan().begin == 101);
}

TEST_CASE("geometry_reports_missing_cards") {
    auto h = make_header(10, 4, 1, 1);
    dct_redux::io::HeaderRecord partial;
    partial.set("NAXIS1", 10);
    partial.set("NAXIS2", 4);
    partial.set("PRESCAN", 1);
    REQUIRE_THROWS_AS(compute_frame_geometry(partial), HeaderError);
    REQUIRE_NOTHROW(compute_frame_geometry(h));
}

TEST_CASE("split_regions_rejects_array_not_matching_header") {
    auto g = compute_frame_geometry(make_header(20, 6, 2, 2));
    Matrix2Df wrong = Matrix2Df::Zero(6, 19);
    REQUIRE_THROWS_AS(split_regions(wrong, g), GeometryError);
}

TEST_CASE("split_regions_copies_the_right_columns") {
    Matrix2Df raw(2, 6);
    raw << 1, 2, 3, 4, 5, 6,
           7, 8, 9, 10, 11, 12;
    auto g = compute_frame_geometry(make_header(6, 2, 1, 2));
    auto r = split_regions(raw, g);

    REQUIRE(r.prescan(0, 0) == 1.0f);
    REQUIRE(r.prescan(1, 0) == 7.0f);
    REQUIRE(r.active(0, 0) == 2.0f);
    REQUIRE(r.active(1, 2) == 10.0f);
    REQUIRE(r.postscan(0, 0) == 5.0f);
    REQUIRE(r.postscan(1, 1) == 12.0f);
}
