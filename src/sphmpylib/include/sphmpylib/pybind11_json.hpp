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
 * @file pybind11_json.hpp
 * @brief Conversion of nlohmann json values to python objects
 */

#include "sphmbase/exception.hpp"
#include "sphmbase/string.hpp"
#include <nlohmann/json.hpp>
#include <pybind11/pybind11.h>

namespace sphmpylib {

    inline pybind11::object json_to_pyobject(const nlohmann::json &j) {
        if (j.is_null()) {
            return pybind11::none();
        } else if (j.is_boolean()) {
            return pybind11::bool_(j.get<bool>());
        } else if (j.is_number_unsigned()) {
            return pybind11::int_(j.get<nlohmann::json::number_unsigned_t>());
        } else if (j.is_number_integer()) {
            return pybind11::int_(j.get<nlohmann::json::number_integer_t>());
        } else if (j.is_number_float()) {
            return pybind11::float_(j.get<double>());
        } else if (j.is_string()) {
            return pybind11::str(j.get<std::string>());
        } else if (j.is_array()) {
            pybind11::list obj(j.size());
            for (std::size_t i = 0; i < j.size(); i++) {
                obj[i] = json_to_pyobject(j[i]);
            }
            return std::move(obj);
        } else if (j.is_object()) {
            pybind11::dict obj;
            for (nlohmann::json::const_iterator it = j.cbegin(); it != j.cend(); ++it) {
                obj[pybind11::str(it.key())] = json_to_pyobject(it.value());
            }
            return std::move(obj);
        }

        sphmbase::throw_unimplemented(
            sphmbase::format("Unsupported json type : \n the object = {}", j.dump(4)));
    }

} // namespace sphmpylib
