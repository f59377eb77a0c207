// -------------------------------------------------------//
//
// SPHMAP code for SPH particle rendering
// Copyright (c) 2024-2026 The Sphmap developers
// SPDX-License-Identifier: CeCILL Free Software License Agreement v2.1
// Sphmap is licensed under the CeCILL 2.1 License, see LICENSE for more information
//
// -------------------------------------------------------//

/**
 * @file SourceLocation.cpp
 * @brief
 *
 */

#include "sphmbase/SourceLocation.hpp"
#include "sphmbase/string.hpp"

std::string SourceLocation::format_one_line() const {
    return sphmbase::format("{}:{}", loc.file_name, loc.line);
}

std::string SourceLocation::format_one_line_func() const {
    return sphmbase::format("{}:{}:{}", loc.file_name, loc.line, loc.function_name);
}
