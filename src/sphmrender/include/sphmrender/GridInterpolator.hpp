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
 * @file GridInterpolator.hpp
 * @brief SPH interpolation of a particle field onto a 2D pixel grid
 *
 */

#include "sphmbase/aliases_float.hpp"
#include "sphmbase/aliases_int.hpp"
#include "sphmbase/type_traits.hpp"
#include "sphmdata/ParticleTable.hpp"
#include "sphmmath/SmoothingKernel.hpp"
#include "sphmrender/GridImage.hpp"
#include "sphmrender/RenderConfig.hpp"
#include <string>

namespace sphmrender {

    /**
     * @brief Scatter each particle onto the pixels its kernel support overlaps
     *
     * Pixel (row, col) receives, for every particle a with a strictly positive weight
     * m_a / (rho_a h_a^2), the contribution
     * `m_a / (rho_a h_a^2) * target_a * w(|r_pix - r_a| / h_a)`
     * where r_pix is the center of the pixel.
     *
     * Particles are visited in table order, two calls with identical inputs give bitwise
     * identical images.
     */
    template<class Tscal>
    class GridInterpolator {
        public:
        using Kernel = sphmmath::SmoothingKernel<Tscal>;

        /**
         * @brief Render the column target of the table
         *
         * @param table particles, must have the mass, density and smoothing length columns
         * @param x name of the column used as horizontal coordinate
         * @param y name of the column used as vertical coordinate
         * @param target name of the column to interpolate
         * @param kernel 2D normalised kernel
         * @param grid pixel grid
         * @return image of grid.pixcounty rows by grid.pixcountx columns
         *
         * @throws InvalidParameter if the grid is invalid
         * @throws DimensionMismatch if the kernel is not 2D
         * @throws sphmdata::MissingColumn if a column is absent
         */
        GridImage<Tscal> interpolate_2d(
            const sphmdata::ParticleTable<Tscal> &table,
            const std::string &x,
            const std::string &y,
            const std::string &target,
            const Kernel &kernel,
            const PixelGrid<Tscal> &grid) const;

        /// scatter loop on already resolved fields, the grid and kernel must have been checked
        GridImage<Tscal> render(
            const sphmdata::ParticleFieldRefs<Tscal> &fields,
            const Kernel &kernel,
            const PixelGrid<Tscal> &grid) const;
    };

    /**
     * @brief Interpolate a particle field onto a 2D grid
     *
     * @code{.cpp}
     * auto kernel = sphmmath::make_kernel<f64>("M4", 2);
     * sphmrender::GridImage<f64> img
     *     = sphmrender::interpolate_2d(table, "x", "y", "rho", *kernel, 0.01, 0.01);
     * @endcode
     *
     * @see GridInterpolator::interpolate_2d
     */
    template<class Tscal>
    GridImage<Tscal> interpolate_2d(
        const sphmdata::ParticleTable<Tscal> &table,
        const std::string &x,
        const std::string &y,
        const std::string &target,
        const sphmmath::SmoothingKernel<Tscal> &kernel,
        sphmbase::type_identity_t<Tscal> pixwidthx,
        sphmbase::type_identity_t<Tscal> pixwidthy,
        sphmbase::type_identity_t<Tscal> xmin = 0,
        sphmbase::type_identity_t<Tscal> ymin = 0,
        i64 pixcountx                         = 480,
        i64 pixcounty                         = 480);

} // namespace sphmrender
