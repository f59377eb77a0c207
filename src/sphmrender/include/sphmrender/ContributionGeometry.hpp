// -------------------------------------------------------//
//
// SPHMAP code for SPH particle rendering
// Copyright (c) 2024-2026 The Sphmap developers
// SPDX-License-Identifier: CeCILL Free Software License Agreement v2.1
// Sphmap is licensed under the CeCILL 2.1 License, see LICENSE for more information
//
// -------------------------------------------------------//

#pragma once

/**
 * @file ContributionGeometry.hpp
 * @brief Index ranges of the pixels reached by a particle support
 *
 */

#include "sphmbase/aliases_float.hpp"
#include "sphmbase/aliases_int.hpp"
#include "sphmmath/float_utils.hpp"
#include <algorithm>
#include <cmath>
#include <optional>

namespace sphmrender {

    /**
     * @brief Whether a particle contributes to a render
     *
     * Only particles with a strictly positive mass and density are rendered, this covers every
     * particle with a non positive weight m / (rho h^2).
     */
    template<class Tscal>
    inline bool has_positive_weight(Tscal mass, Tscal rho) {
        return mass > 0 && rho > 0;
    }

    /// Half open range of pixel indexes [begin, end)
    struct PixelRange {
        u32 begin;
        u32 end;

        inline bool is_empty() const { return begin >= end; }
        inline u32 size() const { return (is_empty()) ? 0 : end - begin; }
    };

    namespace details {

        /// convert an already rounded index to [0, count], non finite values give none
        template<class Tscal>
        inline std::optional<u32> clamp_index(Tscal idx, u32 count) {
            if (!std::isfinite(idx)) {
                return {};
            }
            if (idx < 0) {
                return 0;
            }
            // f64 holds every u32 exactly, Tscal(count) may round up for f32
            if (f64(idx) >= f64(count)) {
                return count;
            }
            return static_cast<u32>(idx);
        }

    } // namespace details

    /**
     * @brief Pixels of an axis covered by the data space interval [lo, hi]
     *
     * The bounds are mapped to pixel units, rounded to the nearest integer (ties to even) and
     * clamped to [0, count]. A non finite bound gives an empty range.
     *
     * @param lo lower data space coordinate (ex : x - Rkern*h)
     * @param hi upper data space coordinate (ex : x + Rkern*h)
     * @param origin data space coordinate of the edge of pixel 0
     * @param width data space width of a pixel
     * @param count number of pixels along the axis
     */
    template<class Tscal>
    inline PixelRange pixel_range(Tscal lo, Tscal hi, Tscal origin, Tscal width, u32 count) {
        auto imin = details::clamp_index(sphmmath::round_half_even((lo - origin) / width), count);
        auto imax = details::clamp_index(sphmmath::round_half_even((hi - origin) / width), count);
        if (!(imin && imax)) {
            return {0, 0};
        }
        return {*imin, *imax};
    }

    /**
     * @brief Segments of a cross section covered by the arc lengths [rstart, rend]
     *
     * The two lengths may be given in any order.
     */
    template<class Tscal>
    inline PixelRange segment_range(Tscal rstart, Tscal rend, Tscal pixwidth, u32 count) {
        return pixel_range(
            std::min(rstart, rend), std::max(rstart, rend), Tscal(0), pixwidth, count);
    }

    /// data space coordinate of the center of pixel i
    template<class Tscal>
    inline Tscal pixel_center(Tscal origin, Tscal width, u32 i) {
        return origin + (Tscal(i) + Tscal(0.5)) * width;
    }

    /// x coordinates where the line enters and leaves a circle (enter <= exit)
    template<class Tscal>
    struct LineCircleIntersection {
        Tscal x_enter;
        Tscal x_exit;
    };

    /**
     * @brief Intersect the line y = gradient * x + yint with a circle
     *
     * Solves aa x^2 + bb x + cc = 0 for the circle of center (cx, cy) and the given radius.
     *
     * @return none if the line misses the circle (negative or undefined discriminant)
     */
    template<class Tscal>
    inline std::optional<LineCircleIntersection<Tscal>>
    intersect_line_circle(Tscal gradient, Tscal yint, Tscal cx, Tscal cy, Tscal radius) {
        Tscal aa = 1 + gradient * gradient;
        Tscal bb = 2 * gradient * (yint - cy) - 2 * cx;
        Tscal cc = cx * cx + cy * cy - 2 * yint * cy + yint * yint - radius * radius;

        Tscal det = bb * bb - 4 * aa * cc;
        if (!(det >= 0)) {
            return {};
        }

        Tscal sqrt_det = std::sqrt(det);
        return LineCircleIntersection<Tscal>{
            (-bb - sqrt_det) / (2 * aa), (-bb + sqrt_det) / (2 * aa)};
    }

    /// distance along the line y = gradient * x + yint between (x1, y1) and the point of abscissa x
    template<class Tscal>
    inline Tscal line_arc_length(Tscal x, Tscal gradient, Tscal yint, Tscal x1, Tscal y1) {
        Tscal dx = x - x1;
        Tscal dy = (gradient * x + yint) - y1;
        return std::sqrt(dx * dx + dy * dy);
    }

} // namespace sphmrender
