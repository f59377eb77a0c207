// -------------------------------------------------------//
//
// SPHMAP code for SPH particle rendering
// Copyright (c) 2024-2026 The Sphmap developers
// SPDX-License-Identifier: CeCILL Free Software License Agreement v2.1
// Sphmap is licensed under the CeCILL 2.1 License, see LICENSE for more information
//
// -------------------------------------------------------//

/**
 * @file pybindings.cpp
 * @brief Entry point of the sphmap python module
 *
 */

#include "sphmbase/print.hpp"
#include "sphmlog/logs.hpp"
#include "sphmpylib/pybindaliases.hpp"
#include <string>
#include <utility>
#include <vector>

namespace {

    /// With pybind we print using python out stream
    void py_func_printer_normal(std::string s) {
        using namespace pybind11::literals;
        py::print(s, "end"_a = "");
    }

    /// With pybind we print using python out stream
    void py_func_printer_ln(std::string s) { py::print(s); }

    /// Python print performs already a flush so we need nothing here
    void py_func_flush_func() {}

    std::vector<fct_sig> &get_pybind_init_funcs() {
        static std::vector<fct_sig> funcs{};
        return funcs;
    }

} // namespace

void register_pybind_init_func(fct_sig fct) { get_pybind_init_funcs().push_back(std::move(fct)); }

SPHM_PY_MODULE(sphmap, m) {
    sphmbase::change_printer(&py_func_printer_normal, &py_func_printer_ln, &py_func_flush_func);

    logger::init_from_env();

    // python stdout is gone once the interpreter is finalizing
    py::module_::import("atexit").attr("register")(
        py::cpp_function([]() { sphmbase::reset_std_behavior(); }));

    for (auto &fct : get_pybind_init_funcs()) {
        fct(m);
    }
}
