// -------------------------------------------------------//
//
// SPHMAP code for SPH particle rendering
// Copyright (c) 2024-2026 The Sphmap developers
// SPDX-License-Identifier: CeCILL Free Software License Agreement v2.1
// Sphmap is licensed under the CeCILL 2.1 License, see LICENSE for more information
//
// -------------------------------------------------------//

/**
 * @file LineInterpolator.cpp
 * @brief
 *
 */

#include "sphmrender/LineInterpolator.hpp"
#include "sphmbase/assert.hpp"
#include "sphmlog/logs.hpp"
#include "sphmmath/float_utils.hpp"
#include "sphmrender/ContributionGeometry.hpp"
#include "sphmrender/exceptions.hpp"
#include <algorithm>
#include <cmath>

namespace sphmrender {

    template<class Tscal>
    std::vector<Tscal> LineInterpolator<Tscal>::interpolate_cross_section(
        const sphmdata::ParticleTable<Tscal> &table,
        const std::string &x,
        const std::string &y,
        const std::string &target,
        const Kernel &kernel,
        const CrossSectionLine<Tscal> &line) const {

        line.validate();
        check_kernel_dimension(kernel, 2);

        sphmdata::ParticleFieldRefs<Tscal> fields = sphmdata::resolve_fields(table, x, y, target);

        sphmlog_debug_ln(
            "LineInterpolator",
            "cross section of",
            target,
            "with kernel",
            kernel.get_name(),
            "along",
            nlohmann::json(line).dump());

        return render(fields, kernel, line);
    }

    template<class Tscal>
    std::vector<Tscal> LineInterpolator<Tscal>::render(
        const sphmdata::ParticleFieldRefs<Tscal> &fields,
        const Kernel &kernel,
        const CrossSectionLine<Tscal> &line) const {

        const u32 pixcount = static_cast<u32>(line.pixcount);
        const Tscal x1     = line.x1;
        const Tscal y1     = line.y1;
        const Tscal x2     = line.x2;
        const Tscal y2     = line.y2;

        // y = gradient * x + yint, near vertical lines are approximated as horizontal
        Tscal gradient = 0;
        if (!sphmmath::is_close(x2, x1)) {
            gradient = (y2 - y1) / (x2 - x1);
        }
        const Tscal yint = y2 - gradient * x2;

        const Tscal pixwidth  = line.length() / Tscal(pixcount);
        const Tscal xpixwidth = (x2 - x1) / Tscal(pixcount);

        const Tscal seg_xmin = std::min(x1, x2);
        const Tscal seg_xmax = std::max(x1, x2);

        const Tscal Rkern = kernel.get_radkernel();

        std::vector<Tscal> output(pixcount, Tscal(0));

        u32 skipped    = 0;
        u32 missed     = 0;
        u32 nonpos_h   = 0;
        u64 pix_visits = 0;

        // summation order independent of the row order of the table
        const std::vector<u32> order = sphmdata::canonical_order(fields);

        for (u32 a : order) {

            const Tscal h_a = fields.hpart[a];
            if (!(h_a > 0)) {
                nonpos_h++;
            }

            if (!has_positive_weight(fields.mass[a], fields.rho[a])) {
                skipped++;
                continue;
            }

            const Tscal weight = fields.mass[a] / (fields.rho[a] * h_a * h_a);

            const Tscal x_a  = fields.x[a];
            const Tscal y_a  = fields.y[a];
            const Tscal term = weight * fields.target[a];
            const Tscal hi21 = 1 / (h_a * h_a);

            auto inter = intersect_line_circle(gradient, yint, x_a, y_a, Rkern * h_a);
            if (!inter) {
                missed++;
                continue;
            }

            Tscal xstart = std::clamp(inter->x_enter, seg_xmin, seg_xmax);
            Tscal xend   = std::clamp(inter->x_exit, seg_xmin, seg_xmax);

            Tscal rstart = line_arc_length(xstart, gradient, yint, x1, y1);
            Tscal rend   = line_arc_length(xend, gradient, yint, x1, y1);

            PixelRange pixs = segment_range(rstart, rend, pixwidth, pixcount);
            SPHM_ASSERT("segment range out of the profile", pixs.end <= pixcount);

            for (u32 i = pixs.begin; i < pixs.end; i++) {
                Tscal xpix = pixel_center(x1, xpixwidth, i);
                Tscal ypix = gradient * xpix + yint;
                Tscal dx   = xpix - x_a;
                Tscal dy   = ypix - y_a;
                Tscal q2   = (dx * dx + dy * dy) * hi21;
                output[i] += term * kernel.w(std::sqrt(q2));
            }

            pix_visits += pixs.size();
        }

        if (nonpos_h > 0) {
            sphmlog_warn_ln(
                "LineInterpolator",
                nonpos_h,
                "particles have a smoothing length <= 0, the profile may contain inf or nan");
        }

        sphmlog_debug_ln(
            "LineInterpolator",
            sphmbase::format(
                "{} particles crossing the line ({} skipped, {} missed), {} pixel updates",
                fields.obj_cnt - skipped - missed,
                skipped,
                missed,
                pix_visits));

        return output;
    }

    template<class Tscal>
    std::vector<Tscal> interpolate_cross_section(
        const sphmdata::ParticleTable<Tscal> &table,
        const std::string &x,
        const std::string &y,
        const std::string &target,
        const sphmmath::SmoothingKernel<Tscal> &kernel,
        sphmbase::type_identity_t<Tscal> x1,
        sphmbase::type_identity_t<Tscal> y1,
        sphmbase::type_identity_t<Tscal> x2,
        sphmbase::type_identity_t<Tscal> y2,
        i64 pixcount) {

        CrossSectionLine<Tscal> line{x1, y1, x2, y2, pixcount};

        return LineInterpolator<Tscal>{}.interpolate_cross_section(
            table, x, y, target, kernel, line);
    }

    template class LineInterpolator<f32>;
    template class LineInterpolator<f64>;

#define X(_arg_)                                                                                   \
    template std::vector<_arg_> interpolate_cross_section<_arg_>(                                  \
        const sphmdata::ParticleTable<_arg_> &,                                                    \
        const std::string &,                                                                       \
        const std::string &,                                                                       \
        const std::string &,                                                                       \
        const sphmmath::SmoothingKernel<_arg_> &,                                                  \
        _arg_,                                                                                     \
        _arg_,                                                                                     \
        _arg_,                                                                                     \
        _arg_,                                                                                     \
        i64);

    X(f32)
    X(f64)

#undef X

} // namespace sphmrender
