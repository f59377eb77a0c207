// -------------------------------------------------------//
//
// SPHMAP code for SPH particle rendering
// Copyright (c) 2024-2026 The Sphmap developers
// SPDX-License-Identifier: CeCILL Free Software License Agreement v2.1
// Sphmap is licensed under the CeCILL 2.1 License, see LICENSE for more information
//
// -------------------------------------------------------//

/**
 * @file print.cpp
 * @brief
 *
 */

#include "sphmbase/print.hpp"
#include <iostream>

namespace {

    void fallback_printer_normal(std::string s) { std::cout << s; }
    void fallback_printer_ln(std::string s) { std::cout << s << "\n"; }
    void fallback_flush_func() { std::cout << std::flush; }

    void (*_printer_normal)(std::string) = fallback_printer_normal;
    void (*_printer_ln)(std::string)     = fallback_printer_ln;
    void (*_flush_func)()                = fallback_flush_func;

} // namespace

namespace sphmbase {

    void print(std::string s) { _printer_normal(s); }
    void println(std::string s) { _printer_ln(s); }
    void flush() { _flush_func(); }

    void change_printer(
        void (*func_printer_normal)(std::string),
        void (*func_printer_ln)(std::string),
        void (*func_flush_func)()) {
        _printer_normal = func_printer_normal;
        _printer_ln     = func_printer_ln;
        _flush_func     = func_flush_func;
    }

    void reset_std_behavior() {
        _printer_normal = fallback_printer_normal;
        _printer_ln     = fallback_printer_ln;
        _flush_func     = fallback_flush_func;
    }

} // namespace sphmbase
