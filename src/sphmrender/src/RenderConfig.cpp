// -------------------------------------------------------//
//
// SPHMAP code for SPH particle rendering
// Copyright (c) 2024-2026 The Sphmap developers
// SPDX-License-Identifier: CeCILL Free Software License Agreement v2.1
// Sphmap is licensed under the CeCILL 2.1 License, see LICENSE for more information
//
// -------------------------------------------------------//

/**
 * @file RenderConfig.cpp
 * @brief
 *
 */

#include "sphmrender/RenderConfig.hpp"
#include "sphmbase/aliases_int.hpp"
#include "sphmbase/exception_ctx.hpp"
#include "sphmbase/string.hpp"
#include "sphmmath/float_utils.hpp"
#include "sphmrender/exceptions.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

namespace {

    template<class Tscal>
    void check_width(const char *name, Tscal value) {
        if (!(value > 0)) {
            sphmbase::throw_with_loc<sphmrender::InvalidParameter>(
                sphmbase::format("pixel width {} must be > 0 (got {})", name, value));
        }
    }

    void check_count(const char *name, i64 value) {
        if (value <= 0) {
            sphmbase::throw_with_loc<sphmrender::InvalidParameter>(
                sphmbase::format("pixel count {} must be > 0 (got {})", name, value));
        }
        if (value > i64(u32_max)) {
            sphmbase::throw_with_loc<sphmrender::InvalidParameter>(
                sphmbase::format("pixel count {} is too large (got {})", name, value));
        }
    }

} // namespace

namespace sphmrender {

    template<class Tscal>
    void PixelGrid<Tscal>::validate() const {
        check_width("pixwidthx", pixwidthx);
        check_width("pixwidthy", pixwidthy);
        check_count("pixcountx", pixcountx);
        check_count("pixcounty", pixcounty);
    }

    template<class Tscal>
    PixelGrid<Tscal> PixelGrid<Tscal>::from_bounds(
        Tscal xmin, Tscal xmax, Tscal ymin, Tscal ymax, i64 nx, i64 ny) {

        check_count("pixcountx", nx);
        check_count("pixcounty", ny);

        PixelGrid<Tscal> ret{};
        ret.xmin      = xmin;
        ret.ymin      = ymin;
        ret.pixcountx = nx;
        ret.pixcounty = ny;
        ret.pixwidthx = (xmax - xmin) / Tscal(nx);
        ret.pixwidthy = (ymax - ymin) / Tscal(ny);

        ret.validate();
        return ret;
    }

    template<class Tscal>
    PixelGrid<Tscal> PixelGrid<Tscal>::fit_particles(
        const sphmdata::ParticleTable<Tscal> &table,
        const std::string &x,
        const std::string &y,
        i64 nx,
        i64 ny) {

        const std::vector<Tscal> &xs = table.get_column(x);
        const std::vector<Tscal> &ys = table.get_column(y);

        if (xs.empty()) {
            sphmbase::throw_with_loc<InvalidParameter>(
                "cannot fit a pixel grid on a table without particles");
        }

        auto [xlo, xhi] = std::minmax_element(xs.begin(), xs.end());
        auto [ylo, yhi] = std::minmax_element(ys.begin(), ys.end());

        return from_bounds(*xlo, *xhi, *ylo, *yhi, nx, ny);
    }

    template<class Tscal>
    void CrossSectionLine<Tscal>::validate() const {
        if (sphmmath::is_close(x2, x1) && sphmmath::is_close(y2, y1)) {
            throw sphmbase::make_except_with_loc_with_ctx<InvalidParameter>(
                "Zero length cross section!",
                std::vector<sphmbase::args_info>{
                    sphmbase::args_info("x1", x1),
                    sphmbase::args_info("y1", y1),
                    sphmbase::args_info("x2", x2),
                    sphmbase::args_info("y2", y2)});
        }
        check_count("pixcount", pixcount);
    }

    template<class Tscal>
    Tscal CrossSectionLine<Tscal>::length() const {
        Tscal dx = x2 - x1;
        Tscal dy = y2 - y1;
        return std::sqrt(dx * dx + dy * dy);
    }

    template struct PixelGrid<f32>;
    template struct PixelGrid<f64>;
    template struct CrossSectionLine<f32>;
    template struct CrossSectionLine<f64>;

} // namespace sphmrender
