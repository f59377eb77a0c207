// -------------------------------------------------------//
//
// SPHMAP code for SPH particle rendering
// Copyright (c) 2024-2026 The Sphmap developers
// SPDX-License-Identifier: CeCILL Free Software License Agreement v2.1
// Sphmap is licensed under the CeCILL 2.1 License, see LICENSE for more information
//
// -------------------------------------------------------//

#include "sphmrender/ContributionGeometry.hpp"
#include "sphmtest/sphmtest.hpp"
#include <cmath>
#include <limits>

TestStart(Unittest, "sphmrender/ContributionGeometry/pixel_range", test_pixel_range, 1) {

    using namespace sphmrender;

    {
        PixelRange r = pixel_range<f64>(0.5, 2.0, 0, 0.25, 10);
        REQUIRE_EQUAL(r.begin, 2);
        REQUIRE_EQUAL(r.end, 8);
        REQUIRE_EQUAL(r.size(), 6);
    }

    {
        // ties are rounded to the even index : 2.5 -> 2, 3.5 -> 4
        PixelRange r = pixel_range<f64>(0.625, 0.875, 0, 0.25, 10);
        REQUIRE_EQUAL(r.begin, 2);
        REQUIRE_EQUAL(r.end, 4);
    }

    {
        // origin offset
        PixelRange r = pixel_range<f64>(1.5, 2.0, 1.0, 0.25, 10);
        REQUIRE_EQUAL(r.begin, 2);
        REQUIRE_EQUAL(r.end, 4);
    }

    {
        // clamped to [0, count]
        PixelRange r = pixel_range<f64>(-1.0, 5.0, 0, 0.25, 10);
        REQUIRE_EQUAL(r.begin, 0);
        REQUIRE_EQUAL(r.end, 10);
    }

    {
        // entirely on one side of the axis
        REQUIRE(pixel_range<f64>(3.0, 4.0, 0, 0.25, 10).is_empty());
        REQUIRE(pixel_range<f64>(-4.0, -3.0, 0, 0.25, 10).is_empty());
        REQUIRE_EQUAL(pixel_range<f64>(3.0, 4.0, 0, 0.25, 10).size(), 0);
    }

    {
        // support smaller than half a pixel around an edge gives nothing
        REQUIRE(pixel_range<f64>(0.49, 0.51, 0, 0.25, 10).is_empty());
    }

    {
        constexpr f64 nan = std::numeric_limits<f64>::quiet_NaN();
        constexpr f64 inf = std::numeric_limits<f64>::infinity();
        REQUIRE(pixel_range<f64>(nan, 1.0, 0, 0.25, 10).is_empty());
        REQUIRE(pixel_range<f64>(-inf, inf, 0, 0.25, 10).is_empty());
    }

    {
        // f32(u32_max) rounds up to 2^32, the bound must still clamp to the count
        PixelRange r = pixel_range<f32>(0.f, 4294967296.f, 0.f, 1.f, u32_max);
        REQUIRE_EQUAL(r.begin, 0);
        REQUIRE_EQUAL(r.end, u32_max);

        PixelRange r_far = pixel_range<f32>(1e10f, 2e10f, 0.f, 1.f, u32_max);
        REQUIRE(r_far.is_empty());
        REQUIRE_EQUAL(r_far.begin, u32_max);
    }
}

TestStart(Unittest, "sphmrender/ContributionGeometry/segment_range", test_segment_range, 1) {

    using namespace sphmrender;

    PixelRange r1 = segment_range<f64>(0.25, 0.75, 0.25, 10);
    PixelRange r2 = segment_range<f64>(0.75, 0.25, 0.25, 10);

    REQUIRE_EQUAL(r1.begin, 1);
    REQUIRE_EQUAL(r1.end, 3);
    REQUIRE_EQUAL(r2.begin, r1.begin);
    REQUIRE_EQUAL(r2.end, r1.end);

    REQUIRE_EQUAL(pixel_center<f64>(1.0, 0.5, 2), 2.25);
    REQUIRE_EQUAL(pixel_center<f64>(0.0, 1.0, 0), 0.5);
}

TestStart(
    Unittest, "sphmrender/ContributionGeometry/intersect_line_circle", test_line_circle, 1) {

    using namespace sphmrender;

    {
        // y = 0 through the unit circle
        auto inter = intersect_line_circle<f64>(0, 0, 0, 0, 1);
        REQUIRE(inter.has_value());
        REQUIRE_EQUAL(inter->x_enter, -1.);
        REQUIRE_EQUAL(inter->x_exit, 1.);
    }

    {
        // y = x through the circle of center (1,1), radius 1
        auto inter = intersect_line_circle<f64>(1, 0, 1, 1, 1);
        REQUIRE(inter.has_value());
        REQUIRE_FLOAT_EQUAL(inter->x_enter, 1 - 1 / std::sqrt(2.), 1e-14);
        REQUIRE_FLOAT_EQUAL(inter->x_exit, 1 + 1 / std::sqrt(2.), 1e-14);
    }

    {
        // tangent
        auto inter = intersect_line_circle<f64>(0, 1, 0, 0, 1);
        REQUIRE(inter.has_value());
        REQUIRE_EQUAL(inter->x_enter, inter->x_exit);
    }

    // y = 2 misses the unit circle
    REQUIRE(!intersect_line_circle<f64>(0, 2, 0, 0, 1).has_value());

    REQUIRE_EQUAL(line_arc_length<f64>(3, 0, 0, 1, 0), 2.);
    REQUIRE_FLOAT_EQUAL(line_arc_length<f64>(2, 1, 0, 0, 0), 2 * std::sqrt(2.), 1e-14);
}

TestStart(Unittest, "sphmrender/ContributionGeometry/has_positive_weight", test_weight_sign, 1) {

    using namespace sphmrender;

    REQUIRE(has_positive_weight<f64>(1, 1));
    REQUIRE(!has_positive_weight<f64>(0, 1));
    REQUIRE(!has_positive_weight<f64>(1, 0));
    REQUIRE(!has_positive_weight<f64>(-1, -1));
    REQUIRE(!has_positive_weight<f64>(std::numeric_limits<f64>::quiet_NaN(), 1));
}
