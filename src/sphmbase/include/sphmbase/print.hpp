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
 * @file print.hpp
 * @brief Output functions, the printer can be swapped (ex: python stdout)
 *
 */

#include <string>

namespace sphmbase {

    void print(std::string s);
    void println(std::string s);
    void flush();

    void change_printer(
        void (*func_printer_normal)(std::string),
        void (*func_printer_ln)(std::string),
        void (*func_flush_func)());

    void reset_std_behavior();

} // namespace sphmbase
