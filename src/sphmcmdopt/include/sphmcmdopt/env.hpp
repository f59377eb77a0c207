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
 * @file env.hpp
 * @brief Environment variable access and documentation
 */

#include <optional>
#include <string>

namespace sphmcmdopt {

    /**
     * @brief Get the content of the environment variable if it exist
     *
     * @param env_var the name of the env variable
     * @return std::optional<std::string> the value of the env variable if it exist, none otherwise
     */
    std::optional<std::string> getenv_str(const char *env_var);

    /**
     * @brief Register the documentation of an environment variable
     *
     * Registered variables are listed by print_help_env_var
     */
    void register_env_var_doc(std::string env_var, std::string desc);

    /// Print the list of documented environment variables
    void print_help_env_var();

} // namespace sphmcmdopt
