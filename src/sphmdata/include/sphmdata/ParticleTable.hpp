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
 * @file ParticleTable.hpp
 * @brief Named columns of per-particle scalars
 *
 */

#include "sphmbase/aliases_float.hpp"
#include "sphmbase/aliases_int.hpp"
#include "sphmdata/FieldNames.hpp"
#include "sphmdata/MissingColumn.hpp"
#include <string>
#include <vector>

namespace sphmdata {

    /**
     * @brief Ordered set of named columns sharing the same particle count
     *
     * The table owns its data. Columns are looked up by name, the first column added fixes the
     * number of particles.
     *
     * @code{.cpp}
     * sphmdata::ParticleTable<f64> table;
     * table.add_column("x", {0.0, 1.0});
     * table.add_column("y", {0.5, 0.5});
     * const std::vector<f64> &x = table.get_column("x");
     * @endcode
     *
     * @tparam Tscal scalar type of the columns
     */
    template<class Tscal>
    class ParticleTable {
        public:
        /**
         * @brief Add a column to the table
         *
         * @throws std::invalid_argument if the name is already used or if the size differs from
         * the size of the existing columns
         */
        void add_column(std::string name, std::vector<Tscal> values);

        bool has_column(const std::string &name) const;

        /**
         * @brief Get a column by name
         *
         * @throws MissingColumn if no column has this name
         */
        const std::vector<Tscal> &get_column(const std::string &name) const;

        /// number of particles
        u32 get_obj_cnt() const { return obj_cnt; }

        /// column names in insertion order
        std::vector<std::string> get_column_names() const;

        inline const std::string &get_mass_column() const { return mass_column; }
        inline const std::string &get_density_column() const { return density_column; }
        inline const std::string &get_hpart_column() const { return hpart_column; }

        inline void set_mass_column(std::string name) { mass_column = std::move(name); }
        inline void set_density_column(std::string name) { density_column = std::move(name); }
        inline void set_hpart_column(std::string name) { hpart_column = std::move(name); }

        private:
        struct Column {
            std::string name;
            std::vector<Tscal> values;
        };

        std::vector<Column> columns;
        u32 obj_cnt = 0;

        std::string mass_column    = names::mass;
        std::string density_column = names::density;
        std::string hpart_column   = names::hpart;
    };

    /**
     * @brief Direct access to the columns needed by an interpolation
     *
     * All the pointers refer to the data of the table the refs were resolved from, which must
     * outlive them.
     */
    template<class Tscal>
    struct ParticleFieldRefs {
        const Tscal *x;
        const Tscal *y;
        const Tscal *target;
        const Tscal *mass;
        const Tscal *rho;
        const Tscal *hpart;
        u32 obj_cnt;
    };

    /**
     * @brief Resolve the named columns of an interpolation once
     *
     * @throws MissingColumn if any of the columns (including mass, density and smoothing length)
     * is absent
     */
    template<class Tscal>
    ParticleFieldRefs<Tscal> resolve_fields(
        const ParticleTable<Tscal> &table,
        const std::string &x,
        const std::string &y,
        const std::string &target);

    /**
     * @brief Visiting order of the particles that only depends on their values
     *
     * Indices are sorted by (x, y, h, m, rho, target), each compared with a total order
     * (-0 before +0, nan after every number). Accumulating in this order makes a sum over the
     * particles bitwise independent of the row order of the table.
     */
    template<class Tscal>
    std::vector<u32> canonical_order(const ParticleFieldRefs<Tscal> &fields);

} // namespace sphmdata
