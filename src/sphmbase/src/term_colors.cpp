// -------------------------------------------------------//
//
// SPHMAP code for SPH particle rendering
// Copyright (c) 2024-2026 The Sphmap developers
// SPDX-License-Identifier: CeCILL Free Software License Agreement v2.1
// Sphmap is licensed under the CeCILL 2.1 License, see LICENSE for more information
//
// -------------------------------------------------------//

/**
 * @file term_colors.cpp
 * @brief
 *
 */

#include "sphmbase/term_colors.hpp"

namespace sphmbase {

    details::TermColors details::_int_term_colors = details::TermColors::get_config_colors();

    void term_colors::disable_colors() {
        details::_int_term_colors = details::TermColors::get_config_nocolors();
    }

} // namespace sphmbase
