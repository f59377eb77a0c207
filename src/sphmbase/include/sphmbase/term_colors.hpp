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
 * @file term_colors.hpp
 * @brief Terminal escape sequences, can be globally disabled
 *
 */

#include <string>

/// Escape character for terminal control sequences.
#define SPHM_TERM_ESCAPE_CHAR "\x1b["

namespace sphmbase {

    namespace details {

        /**
         * @brief Escape sequences of the terminal colors used for printing.
         */
        struct TermColors {
            bool colors_on = true; ///< are colors on in this config

            std::string reset     = SPHM_TERM_ESCAPE_CHAR "0m";
            std::string bold      = SPHM_TERM_ESCAPE_CHAR "1m";
            std::string faint     = SPHM_TERM_ESCAPE_CHAR "2m";
            std::string underline = SPHM_TERM_ESCAPE_CHAR "4m";

            std::string col8b_black   = SPHM_TERM_ESCAPE_CHAR "30m";
            std::string col8b_red     = SPHM_TERM_ESCAPE_CHAR "31m";
            std::string col8b_green   = SPHM_TERM_ESCAPE_CHAR "32m";
            std::string col8b_yellow  = SPHM_TERM_ESCAPE_CHAR "33m";
            std::string col8b_blue    = SPHM_TERM_ESCAPE_CHAR "34m";
            std::string col8b_magenta = SPHM_TERM_ESCAPE_CHAR "35m";
            std::string col8b_cyan    = SPHM_TERM_ESCAPE_CHAR "36m";
            std::string col8b_white   = SPHM_TERM_ESCAPE_CHAR "37m";

            /// Returns a `TermColors` struct with all colors disabled.
            static TermColors get_config_nocolors() {
                return {false, "", "", "", "", "", "", "", "", "", "", "", ""};
            }

            /// Returns a `TermColors` struct with all colors enabled.
            static TermColors get_config_colors() { return {}; }
        };

        /// Global instance of `TermColors`, defined in term_colors.cpp
        extern TermColors _int_term_colors;

    } // namespace details

    namespace term_colors {

        void disable_colors();

        inline const std::string empty() { return ""; };
        inline const std::string reset() { return details::_int_term_colors.reset; };
        inline const std::string bold() { return details::_int_term_colors.bold; };
        inline const std::string faint() { return details::_int_term_colors.faint; };
        inline const std::string underline() { return details::_int_term_colors.underline; };
        inline const std::string col8b_black() { return details::_int_term_colors.col8b_black; };
        inline const std::string col8b_red() { return details::_int_term_colors.col8b_red; };
        inline const std::string col8b_green() { return details::_int_term_colors.col8b_green; };
        inline const std::string col8b_yellow() { return details::_int_term_colors.col8b_yellow; };
        inline const std::string col8b_blue() { return details::_int_term_colors.col8b_blue; };
        inline const std::string col8b_magenta() {
            return details::_int_term_colors.col8b_magenta;
        };
        inline const std::string col8b_cyan() { return details::_int_term_colors.col8b_cyan; };
        inline const std::string col8b_white() { return details::_int_term_colors.col8b_white; };

    } // namespace term_colors

} // namespace sphmbase
