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
 * @file RenderConfig.hpp
 * @brief Pixel grid and cross section line parameters of a render
 *
 */

#include "sphmbase/aliases_float.hpp"
#include "sphmbase/aliases_int.hpp"
#include "sphmbase/exception.hpp"
#include "sphmdata/ParticleTable.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace sphmrender {

    /**
     * @brief Regular 2D pixel grid, pixel (row, col) covers
     * [xmin + col * pixwidthx, xmin + (col+1) * pixwidthx] x [ymin + row * pixwidthy, ...]
     */
    template<class Tscal>
    struct PixelGrid {
        Tscal pixwidthx = 0;
        Tscal pixwidthy = 0;
        Tscal xmin      = 0;
        Tscal ymin      = 0;
        i64 pixcountx   = 480;
        i64 pixcounty   = 480;

        /**
         * @brief Check the grid parameters
         *
         * @throws InvalidParameter if a pixel width is not strictly positive or if a pixel count
         * is not in [1, u32_max]
         */
        void validate() const;

        inline Tscal xmax() const { return xmin + pixwidthx * Tscal(pixcountx); }
        inline Tscal ymax() const { return ymin + pixwidthy * Tscal(pixcounty); }

        /// grid of nx x ny pixels spanning [xmin, xmax] x [ymin, ymax]
        static PixelGrid
        from_bounds(Tscal xmin, Tscal xmax, Tscal ymin, Tscal ymax, i64 nx, i64 ny);

        /**
         * @brief grid of nx x ny pixels spanning the bounding box of the particle positions
         *
         * @throws InvalidParameter if the table is empty or if the positions are all aligned
         * along one axis
         * @throws sphmdata::MissingColumn if a position column is absent
         */
        static PixelGrid fit_particles(
            const sphmdata::ParticleTable<Tscal> &table,
            const std::string &x,
            const std::string &y,
            i64 nx,
            i64 ny);
    };

    /// Straight segment from (x1, y1) to (x2, y2) sampled by pixcount segments
    template<class Tscal>
    struct CrossSectionLine {
        Tscal x1     = 0;
        Tscal y1     = 0;
        Tscal x2     = 1;
        Tscal y2     = 1;
        i64 pixcount = 500;

        /**
         * @brief Check the line parameters
         *
         * @throws InvalidParameter if the endpoints coincide or if pixcount is not in
         * [1, u32_max]
         */
        void validate() const;

        /// euclidean length of the segment
        Tscal length() const;
    };

    template<class Tscal>
    inline void to_json(nlohmann::json &j, const PixelGrid<Tscal> &p) {
        j = {
            {"pixwidthx", p.pixwidthx},
            {"pixwidthy", p.pixwidthy},
            {"xmin", p.xmin},
            {"ymin", p.ymin},
            {"pixcountx", p.pixcountx},
            {"pixcounty", p.pixcounty},
        };
    }

    /**
     * @brief Read a PixelGrid, the pixel widths are required, other fields keep their default
     * value when absent
     */
    template<class Tscal>
    inline void from_json(const nlohmann::json &j, PixelGrid<Tscal> &p) {
        if (!j.contains("pixwidthx") || !j.contains("pixwidthy")) {
            sphmbase::throw_with_loc<std::runtime_error>(
                "a pixel grid requires the fields pixwidthx and pixwidthy");
        }

        PixelGrid<Tscal> def{};

        j.at("pixwidthx").get_to(p.pixwidthx);
        j.at("pixwidthy").get_to(p.pixwidthy);
        p.xmin      = j.value("xmin", def.xmin);
        p.ymin      = j.value("ymin", def.ymin);
        p.pixcountx = j.value("pixcountx", def.pixcountx);
        p.pixcounty = j.value("pixcounty", def.pixcounty);
    }

    template<class Tscal>
    inline void to_json(nlohmann::json &j, const CrossSectionLine<Tscal> &p) {
        j = {
            {"x1", p.x1},
            {"y1", p.y1},
            {"x2", p.x2},
            {"y2", p.y2},
            {"pixcount", p.pixcount},
        };
    }

    template<class Tscal>
    inline void from_json(const nlohmann::json &j, CrossSectionLine<Tscal> &p) {
        CrossSectionLine<Tscal> def{};

        p.x1       = j.value("x1", def.x1);
        p.y1       = j.value("y1", def.y1);
        p.x2       = j.value("x2", def.x2);
        p.y2       = j.value("y2", def.y2);
        p.pixcount = j.value("pixcount", def.pixcount);
    }

} // namespace sphmrender
