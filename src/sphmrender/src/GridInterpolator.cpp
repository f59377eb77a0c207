// -------------------------------------------------------//
//
// SPHMAP code for SPH particle rendering
// Copyright (c) 2024-2026 The Sphmap developers
// SPDX-License-Identifier: CeCILL Free Software License Agreement v2.1
// Sphmap is licensed under the CeCILL 2.1 License, see LICENSE for more information
//
// -------------------------------------------------------//

/**
 * @file GridInterpolator.cpp
 * @brief
 *
 */

#include "sphmrender/GridInterpolator.hpp"
#include "sphmbase/assert.hpp"
#include "sphmlog/logs.hpp"
#include "sphmrender/ContributionGeometry.hpp"
#include "sphmrender/exceptions.hpp"
#include <cmath>
#include <vector>

namespace sphmrender {

    template<class Tscal>
    GridImage<Tscal> GridInterpolator<Tscal>::interpolate_2d(
        const sphmdata::ParticleTable<Tscal> &table,
        const std::string &x,
        const std::string &y,
        const std::string &target,
        const Kernel &kernel,
        const PixelGrid<Tscal> &grid) const {

        grid.validate();
        check_kernel_dimension(kernel, 2);

        sphmdata::ParticleFieldRefs<Tscal> fields = sphmdata::resolve_fields(table, x, y, target);

        sphmlog_debug_ln(
            "GridInterpolator",
            "render of",
            target,
            "with kernel",
            kernel.get_name(),
            "on grid",
            nlohmann::json(grid).dump());

        return render(fields, kernel, grid);
    }

    template<class Tscal>
    GridImage<Tscal> GridInterpolator<Tscal>::render(
        const sphmdata::ParticleFieldRefs<Tscal> &fields,
        const Kernel &kernel,
        const PixelGrid<Tscal> &grid) const {

        const u32 nx = static_cast<u32>(grid.pixcountx);
        const u32 ny = static_cast<u32>(grid.pixcounty);

        GridImage<Tscal> image(nx, ny);

        const Tscal Rkern = kernel.get_radkernel();

        // squared dimensionless x distances of the columns of the current bounding box
        std::vector<Tscal> dx2i;

        u32 skipped      = 0;
        u32 nonpos_h     = 0;
        u64 pixel_visits = 0;

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

            const Tscal x_a     = fields.x[a];
            const Tscal y_a     = fields.y[a];
            const Tscal radkern = Rkern * h_a;
            const Tscal term    = weight * fields.target[a];
            const Tscal hi1     = 1 / h_a;
            const Tscal hi21    = hi1 * hi1;

            PixelRange cols
                = pixel_range(x_a - radkern, x_a + radkern, grid.xmin, grid.pixwidthx, nx);
            PixelRange rows
                = pixel_range(y_a - radkern, y_a + radkern, grid.ymin, grid.pixwidthy, ny);

            if (cols.is_empty() || rows.is_empty()) {
                continue;
            }

            SPHM_ASSERT("column range out of the image", cols.end <= nx);
            SPHM_ASSERT("row range out of the image", rows.end <= ny);

            dx2i.resize(cols.size());
            for (u32 col = cols.begin; col < cols.end; col++) {
                Tscal dx               = pixel_center(grid.xmin, grid.pixwidthx, col) - x_a;
                dx2i[col - cols.begin] = dx * dx * hi21;
            }

            for (u32 row = rows.begin; row < rows.end; row++) {
                Tscal dy  = pixel_center(grid.ymin, grid.pixwidthy, row) - y_a;
                Tscal dy2 = dy * dy * hi21;

                Tscal *img_row = image.row_ptr(row);
                for (u32 col = cols.begin; col < cols.end; col++) {
                    Tscal q2 = dx2i[col - cols.begin] + dy2;
                    img_row[col] += term * kernel.w(std::sqrt(q2));
                }
            }

            pixel_visits += u64(rows.size()) * cols.size();
        }

        if (nonpos_h > 0) {
            sphmlog_warn_ln(
                "GridInterpolator",
                nonpos_h,
                "particles have a smoothing length <= 0, the image may contain inf or nan");
        }

        sphmlog_debug_ln(
            "GridInterpolator",
            sphmbase::format(
                "rendered {} particles ({} skipped) on {}x{} pixels, {} pixel updates",
                fields.obj_cnt - skipped,
                skipped,
                nx,
                ny,
                pixel_visits));

        return image;
    }

    template<class Tscal>
    GridImage<Tscal> interpolate_2d(
        const sphmdata::ParticleTable<Tscal> &table,
        const std::string &x,
        const std::string &y,
        const std::string &target,
        const sphmmath::SmoothingKernel<Tscal> &kernel,
        sphmbase::type_identity_t<Tscal> pixwidthx,
        sphmbase::type_identity_t<Tscal> pixwidthy,
        sphmbase::type_identity_t<Tscal> xmin,
        sphmbase::type_identity_t<Tscal> ymin,
        i64 pixcountx,
        i64 pixcounty) {

        PixelGrid<Tscal> grid{};
        grid.pixwidthx = pixwidthx;
        grid.pixwidthy = pixwidthy;
        grid.xmin      = xmin;
        grid.ymin      = ymin;
        grid.pixcountx = pixcountx;
        grid.pixcounty = pixcounty;

        return GridInterpolator<Tscal>{}.interpolate_2d(table, x, y, target, kernel, grid);
    }

    template class GridInterpolator<f32>;
    template class GridInterpolator<f64>;

#define X(_arg_)                                                                                   \
    template GridImage<_arg_> interpolate_2d<_arg_>(                                               \
        const sphmdata::ParticleTable<_arg_> &,                                                    \
        const std::string &,                                                                       \
        const std::string &,                                                                       \
        const std::string &,                                                                       \
        const sphmmath::SmoothingKernel<_arg_> &,                                                  \
        _arg_,                                                                                     \
        _arg_,                                                                                     \
        _arg_,                                                                                     \
        _arg_,                                                                                     \
        i64,                                                                                       \
        i64);

    X(f32)
    X(f64)

#undef X

} // namespace sphmrender
