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
 * @file MissingColumn.hpp
 * @brief Error raised when a requested column does not exist in a particle table
 *
 */

#include <stdexcept>
#include <string>

namespace sphmdata {

    class MissingColumn : public std::out_of_range {
        public:
        MissingColumn(const std::string &column_name, const std::string &msg)
            : std::out_of_range(msg), column_name(column_name) {}

        /// name of the column that was requested
        const std::string &get_column_name() const { return column_name; }

        private:
        std::string column_name;
    };

} // namespace sphmdata
