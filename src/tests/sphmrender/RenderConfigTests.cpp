// -------------------------------------------------------//
//
// SPHMAP code for SPH particle rendering
// Copyright (c) 2024-2026 The Sphmap developers
// SPDX-License-Identifier: CeCILL Free Software License Agreement v2.1
// Sphmap is licensed under the CeCILL 2.1 License, see LICENSE for more information
//
// -------------------------------------------------------//

#include "sphmrender/RenderConfig.hpp"
#include "sphmrender/exceptions.hpp"
#include "sphmtest/sphmtest.hpp"
#include <nlohmann/json.hpp>
#include <limits>
#include <stdexcept>

TestStart(Unittest, "sphmrender/RenderConfig/PixelGrid/validate", test_pixel_grid_validate, 1) {

    using Grid = sphmrender::PixelGrid<f64>;

    Grid def{};
    REQUIRE_EQUAL(def.xmin, 0);
    REQUIRE_EQUAL(def.ymin, 0);
    REQUIRE_EQUAL(def.pixcountx, 480);
    REQUIRE_EQUAL(def.pixcounty, 480);

    // pixel widths have no meaningful default
    REQUIRE_EXCEPTION_THROW(def.validate(), sphmrender::InvalidParameter);

    Grid ok{};
    ok.pixwidthx = 0.1;
    ok.pixwidthy = 0.2;
    ok.validate();
    REQUIRE_FLOAT_EQUAL(ok.xmax(), 48., 1e-12);
    REQUIRE_FLOAT_EQUAL(ok.ymax(), 96., 1e-12);

    Grid g = ok;
    g.pixwidthx = 0;
    REQUIRE_EXCEPTION_THROW(g.validate(), sphmrender::InvalidParameter);

    g           = ok;
    g.pixwidthy = -1;
    REQUIRE_EXCEPTION_THROW(g.validate(), sphmrender::InvalidParameter);

    g           = ok;
    g.pixwidthx = std::numeric_limits<f64>::quiet_NaN();
    REQUIRE_EXCEPTION_THROW(g.validate(), sphmrender::InvalidParameter);

    g           = ok;
    g.pixcountx = 0;
    REQUIRE_EXCEPTION_THROW(g.validate(), sphmrender::InvalidParameter);

    g           = ok;
    g.pixcounty = -3;
    REQUIRE_EXCEPTION_THROW(g.validate(), sphmrender::InvalidParameter);

    g           = ok;
    g.pixcounty = i64(u32_max) + 1;
    REQUIRE_EXCEPTION_THROW(g.validate(), sphmrender::InvalidParameter);

    // InvalidParameter is an invalid_argument
    REQUIRE_EXCEPTION_THROW(def.validate(), std::invalid_argument);
}

TestStart(Unittest, "sphmrender/RenderConfig/PixelGrid/from_bounds", test_pixel_grid_bounds, 1) {

    using Grid = sphmrender::PixelGrid<f64>;

    Grid g = Grid::from_bounds(-1, 1, 0, 4, 10, 20);
    REQUIRE_EQUAL(g.xmin, -1);
    REQUIRE_EQUAL(g.ymin, 0);
    REQUIRE_FLOAT_EQUAL(g.pixwidthx, 0.2, 1e-15);
    REQUIRE_FLOAT_EQUAL(g.pixwidthy, 0.2, 1e-15);
    REQUIRE_EQUAL(g.pixcountx, 10);
    REQUIRE_EQUAL(g.pixcounty, 20);

    REQUIRE_EXCEPTION_THROW(Grid::from_bounds(0, 0, 0, 1, 10, 10), sphmrender::InvalidParameter);
    REQUIRE_EXCEPTION_THROW(Grid::from_bounds(1, 0, 0, 1, 10, 10), sphmrender::InvalidParameter);
    REQUIRE_EXCEPTION_THROW(Grid::from_bounds(0, 1, 0, 1, 0, 10), sphmrender::InvalidParameter);
}

TestStart(
    Unittest, "sphmrender/RenderConfig/PixelGrid/fit_particles", test_pixel_grid_fit, 1) {

    using Grid = sphmrender::PixelGrid<f64>;

    sphmdata::ParticleTable<f64> table;
    table.add_column("x", std::vector<f64>{-1, 3, 0});
    table.add_column("y", std::vector<f64>{0, 1, 2});

    Grid g = Grid::fit_particles(table, "x", "y", 4, 2);
    REQUIRE_EQUAL(g.xmin, -1);
    REQUIRE_EQUAL(g.ymin, 0);
    REQUIRE_EQUAL(g.pixwidthx, 1);
    REQUIRE_EQUAL(g.pixwidthy, 1);

    REQUIRE_EXCEPTION_THROW(Grid::fit_particles(table, "x", "z", 4, 2), sphmdata::MissingColumn);

    sphmdata::ParticleTable<f64> empty;
    empty.add_column("x", {});
    empty.add_column("y", {});
    REQUIRE_EXCEPTION_THROW(
        Grid::fit_particles(empty, "x", "y", 4, 2), sphmrender::InvalidParameter);
}

TestStart(Unittest, "sphmrender/RenderConfig/PixelGrid/json", test_pixel_grid_json, 1) {

    using Grid = sphmrender::PixelGrid<f64>;

    Grid g           = Grid::from_bounds(0, 1, 0, 2, 10, 20);
    nlohmann::json j = g;

    REQUIRE_EQUAL(j.at("pixcountx").get<i64>(), 10);
    REQUIRE_EQUAL(j.at("pixcounty").get<i64>(), 20);

    Grid back = j.get<Grid>();
    REQUIRE_EQUAL(back.pixwidthx, g.pixwidthx);
    REQUIRE_EQUAL(back.pixwidthy, g.pixwidthy);
    REQUIRE_EQUAL(back.pixcounty, g.pixcounty);

    // only the pixel widths are required
    Grid partial = nlohmann::json::parse(R"({"pixwidthx": 0.5, "pixwidthy": 0.25})").get<Grid>();
    REQUIRE_EQUAL(partial.pixwidthx, 0.5);
    REQUIRE_EQUAL(partial.pixcountx, 480);
    REQUIRE_EQUAL(partial.xmin, 0);

    REQUIRE_EXCEPTION_THROW(
        nlohmann::json::parse(R"({"pixwidthx": 0.5})").get<Grid>(), std::runtime_error);
}

TestStart(Unittest, "sphmrender/RenderConfig/CrossSectionLine", test_cross_section_line, 1) {

    using Line = sphmrender::CrossSectionLine<f64>;

    Line def{};
    REQUIRE_EQUAL(def.x1, 0);
    REQUIRE_EQUAL(def.y1, 0);
    REQUIRE_EQUAL(def.x2, 1);
    REQUIRE_EQUAL(def.y2, 1);
    REQUIRE_EQUAL(def.pixcount, 500);
    def.validate();

    Line l{0, 0, 3, 4, 10};
    REQUIRE_EQUAL(l.length(), 5.);

    Line zero{1, 1, 1, 1, 10};
    REQUIRE_EXCEPTION_THROW(zero.validate(), sphmrender::InvalidParameter);

    // endpoints closer than the tolerance count as coincident
    Line almost{1, 1, 1 + 1e-12, 1, 10};
    REQUIRE_EXCEPTION_THROW(almost.validate(), sphmrender::InvalidParameter);

    // vertical lines are valid
    Line vertical{0.5, 0, 0.5, 1, 10};
    vertical.validate();

    // the closeness tolerance is relative to the first endpoint, as for the vertical test of
    // the cross section : |x2 - x1| = 1.000005 is above 1e-5 * |x1| but below 1e-5 * |x2|
    Line rel_to_start{1e5, 0, 1e5 + 1.000005, 0, 10};
    bool start_thrown = false;
    try {
        rel_to_start.validate();
    } catch (const sphmrender::InvalidParameter &) {
        start_thrown = true;
    }
    REQUIRE_NAMED("tolerance taken relative to x1", !start_thrown);

    Line rel_to_start_rev{1e5 + 1.000005, 0, 1e5, 0, 10};
    REQUIRE_EXCEPTION_THROW(rel_to_start_rev.validate(), sphmrender::InvalidParameter);

    Line no_pix{0, 0, 1, 0, 0};
    REQUIRE_EXCEPTION_THROW(no_pix.validate(), sphmrender::InvalidParameter);

    Line neg_pix{0, 0, 1, 0, -5};
    REQUIRE_EXCEPTION_THROW(neg_pix.validate(), sphmrender::InvalidParameter);

    nlohmann::json j = l;
    Line back        = j.get<Line>();
    REQUIRE_EQUAL(back.x2, 3);
    REQUIRE_EQUAL(back.y2, 4);
    REQUIRE_EQUAL(back.pixcount, 10);

    Line from_empty = nlohmann::json::object().get<Line>();
    REQUIRE_EQUAL(from_empty.pixcount, 500);
    REQUIRE_EQUAL(from_empty.x2, 1);
}
