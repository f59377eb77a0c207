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
 * @file LineInterpolator.hpp
 * @brief SPH interpolation of a particle field along a straight cross section
 *
 */

#include "sphmbase/aliases_float.hpp"
#include "sphmbase/aliases_int.hpp"
#include "sphmbase/type_traits.hpp"
#include "sphmdata/ParticleTable.hpp"
#include "sphmmath/SmoothingKernel.hpp"
#include "sphmrender/RenderConfig.hpp"
#include <string>
#include <vector>

namespace sphmrender {

    /**
     * @brief Sample a particle field at the centers of the pixcount segments of a line
     *
     * Only the particles whose support circle crosses the line contribute. When x1 and x2 are
     * close the line is treated as horizontal (gradient 0).
     */
    template<class Tscal>
    class LineInterpolator {
        public:
        using Kernel = sphmmath::SmoothingKernel<Tscal>;

        /**
         * @brief Render the column target of the table along the line
         *
         * @return profile of line.pixcount values, index 0 is next to (x1, y1)
         *
         * @throws InvalidParameter if the line is invalid
         * @throws DimensionMismatch if the kernel is not 2D
         * @throws sphmdata::MissingColumn if a column is absent
         */
        std::vector<Tscal> interpolate_cross_section(
            const sphmdata::ParticleTable<Tscal> &table,
            const std::string &x,
            const std::string &y,
            const std::string &target,
            const Kernel &kernel,
            const CrossSectionLine<Tscal> &line) const;

        std::vector<Tscal> render(
            const sphmdata::ParticleFieldRefs<Tscal> &fields,
            const Kernel &kernel,
            const CrossSectionLine<Tscal> &line) const;
    };

    /**
     * @brief Interpolate a particle field along the segment (x1, y1) -> (x2, y2)
     *
     * @see LineInterpolator::interpolate_cross_section
     */
    template<class Tscal>
    std::vector<Tscal> interpolate_cross_section(
        const sphmdata::ParticleTable<Tscal> &table,
        const std::string &x,
        const std::string &y,
        const std::string &target,
        const sphmmath::SmoothingKernel<Tscal> &kernel,
        sphmbase::type_identity_t<Tscal> x1 = 0,
        sphmbase::type_identity_t<Tscal> y1 = 0,
        sphmbase::type_identity_t<Tscal> x2 = 1,
        sphmbase::type_identity_t<Tscal> y2 = 1,
        i64 pixcount                        = 500);

} // namespace sphmrender
