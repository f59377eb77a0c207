// -------------------------------------------------------//
//
// SPHMAP code for SPH particle rendering
// Copyright (c) 2024-2026 The Sphmap developers
// SPDX-License-Identifier: CeCILL Free Software License Agreement v2.1
// Sphmap is licensed under the CeCILL 2.1 License, see LICENSE for more information
//
// -------------------------------------------------------//

/**
 * @file ParticleTable.cpp
 * @brief
 *
 */

#include "sphmdata/ParticleTable.hpp"
#include "sphmbase/exception.hpp"
#include "sphmbase/narrowing.hpp"
#include "sphmbase/string.hpp"
#include "sphmlog/logs.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace {

    /// -1, 0 or 1, total order on the values with -0 < +0 and every nan after the numbers
    template<class Tscal>
    int total_order_cmp(Tscal a, Tscal b) {
        bool a_nan = std::isnan(a);
        bool b_nan = std::isnan(b);
        if (a_nan || b_nan) {
            return int(a_nan) - int(b_nan);
        }
        if (a < b) {
            return -1;
        }
        if (b < a) {
            return 1;
        }
        return int(std::signbit(b)) - int(std::signbit(a));
    }

} // namespace

namespace sphmdata {

    template<class Tscal>
    void ParticleTable<Tscal>::add_column(std::string name, std::vector<Tscal> values) {

        if (has_column(name)) {
            sphmbase::throw_with_loc<std::invalid_argument>(
                "a column named " + name + " already exists in this table");
        }

        u32 cnt = sphmbase::narrow_check<u32>(values.size());

        if (!columns.empty() && cnt != obj_cnt) {
            sphmbase::throw_with_loc<std::invalid_argument>(sphmbase::format(
                "column {} has {} values but the table holds {} particles", name, cnt, obj_cnt));
        }

        obj_cnt = cnt;
        columns.push_back(Column{std::move(name), std::move(values)});
    }

    template<class Tscal>
    bool ParticleTable<Tscal>::has_column(const std::string &name) const {
        for (const Column &col : columns) {
            if (col.name == name) {
                return true;
            }
        }
        return false;
    }

    template<class Tscal>
    const std::vector<Tscal> &ParticleTable<Tscal>::get_column(const std::string &name) const {
        for (const Column &col : columns) {
            if (col.name == name) {
                return col.values;
            }
        }

        throw MissingColumn(
            name,
            sphmbase::format(
                "no column named {} in the particle table, available columns : {}\n{}",
                name,
                get_column_names(),
                SourceLocation{}.format_one_line_func()));
    }

    template<class Tscal>
    std::vector<std::string> ParticleTable<Tscal>::get_column_names() const {
        std::vector<std::string> ret;
        ret.reserve(columns.size());
        for (const Column &col : columns) {
            ret.push_back(col.name);
        }
        return ret;
    }

    template<class Tscal>
    ParticleFieldRefs<Tscal> resolve_fields(
        const ParticleTable<Tscal> &table,
        const std::string &x,
        const std::string &y,
        const std::string &target) {

        sphmlog_debug_ln(
            "ParticleTable",
            "resolving fields x =",
            x,
            "y =",
            y,
            "target =",
            target,
            "over",
            table.get_obj_cnt(),
            "particles");

        return ParticleFieldRefs<Tscal>{
            table.get_column(x).data(),
            table.get_column(y).data(),
            table.get_column(target).data(),
            table.get_column(table.get_mass_column()).data(),
            table.get_column(table.get_density_column()).data(),
            table.get_column(table.get_hpart_column()).data(),
            table.get_obj_cnt()};
    }

    template<class Tscal>
    std::vector<u32> canonical_order(const ParticleFieldRefs<Tscal> &fields) {
        std::vector<u32> order(fields.obj_cnt);
        std::iota(order.begin(), order.end(), u32(0));

        const Tscal *keys[] = {
            fields.x, fields.y, fields.hpart, fields.mass, fields.rho, fields.target};

        std::sort(order.begin(), order.end(), [&](u32 i, u32 j) {
            for (const Tscal *key : keys) {
                int c = total_order_cmp(key[i], key[j]);
                if (c != 0) {
                    return c < 0;
                }
            }
            return false;
        });

        return order;
    }

} // namespace sphmdata

template class sphmdata::ParticleTable<f32>;
template class sphmdata::ParticleTable<f64>;

template sphmdata::ParticleFieldRefs<f32> sphmdata::resolve_fields<f32>(
    const ParticleTable<f32> &, const std::string &, const std::string &, const std::string &);
template sphmdata::ParticleFieldRefs<f64> sphmdata::resolve_fields<f64>(
    const ParticleTable<f64> &, const std::string &, const std::string &, const std::string &);

template std::vector<u32> sphmdata::canonical_order<f32>(const ParticleFieldRefs<f32> &);
template std::vector<u32> sphmdata::canonical_order<f64>(const ParticleFieldRefs<f64> &);
