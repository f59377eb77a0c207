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
 * @file pybindaliases.hpp
 * @brief Aliases and static registration of the python bindings
 *
 */

#include <pybind11/pybind11.h>
#include <functional>
#include <utility>

namespace py = pybind11;

/// function signature of a python module init function
using fct_sig = std::function<void(py::module &)>;

/// Add a python module init function to the init list
void register_pybind_init_func(fct_sig fct);

/**
 * @brief helper class to statically register python module init functions
 */
struct PyBindStaticInit {
    inline explicit PyBindStaticInit(fct_sig t) { register_pybind_init_func(std::move(t)); }
};

/**
 * @brief Register a python module init function using static initialisation
 *
 * Usage :
 * \code{.cpp}
 * Register_pymod(pysomething) {
 *     m.def("answer", []() { return 42; });
 * }
 * \endcode
 */
#define Register_pymod(placeholdername)                                                            \
    void pymod_##placeholdername(py::module &m);                                                   \
    void (*pymod_ptr_##placeholdername)(py::module & m) = pymod_##placeholdername;                 \
    PyBindStaticInit pymod_class_obj_##placeholdername(pymod_ptr_##placeholdername);               \
    void pymod_##placeholdername(py::module &m)

/// Declare the python module entry point
#define SPHM_PY_MODULE(name, module) PYBIND11_MODULE(name, module)
