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
 * @file logs.hpp
 * @brief Leveled logger, messages are `[module] Level: content`
 *
 */

#include "sphmbase/aliases_int.hpp"
#include "sphmbase/print.hpp"
#include "sphmbase/string.hpp"
#include "sphmbase/term_colors.hpp"
#include <string>
#include <type_traits>

namespace sphmlog::logs {
    namespace details {
        inline i8 loglevel = 0;
    } // namespace details

    ////////////////////////////////////////////////////////////////////////////////////////////////
    // Log level manip
    ////////////////////////////////////////////////////////////////////////////////////////////////

    inline void set_loglevel(i8 val) { details::loglevel = val; }
    inline i8 get_loglevel() { return details::loglevel; }

    /**
     * @brief Set the log level and the colors from the environment
     *
     * `SPHM_LOGLEVEL` : integer log level, `SPHM_NOCOLOR` : disable colors if set
     */
    void init_from_env();

} // namespace sphmlog::logs

namespace sphmlog::logs {

    ////////////////////////////////////////////////////////////////////////////////////////////////
    // Log message formatting
    ////////////////////////////////////////////////////////////////////////////////////////////////
    inline std::string format_message() { return ""; }

    template<typename T, typename... Types>
    std::string format_message(T var1, Types... var2);

    template<typename... Types>
    inline std::string format_message(std::string s, Types... var2) {
        return s + " " + format_message(var2...);
    }

    template<typename T, typename... Types>
    inline std::string format_message(T var1, Types... var2) {
        if constexpr (std::is_same_v<T, const char *>) {
            return std::string(var1) + " " + format_message(var2...);
        } else if constexpr (std::is_pointer_v<T>) {
            return sphmbase::format("{} ", static_cast<const void *>(var1))
                   + format_message(var2...);
        } else {
            return sphmbase::format("{} ", var1) + format_message(var2...);
        }
    }

    ////////////////////////////////////////////////////////////////////////////////////////////////
    // log message printing
    ////////////////////////////////////////////////////////////////////////////////////////////////

    inline void print() {}

    template<typename T, typename... Types>
    void print(T var1, Types... var2) {
        sphmbase::print(sphmlog::logs::format_message(var1, var2...));
    }

    inline void print_ln() {}

    template<typename T, typename... Types>
    void print_ln(T var1, Types... var2) {
        sphmbase::println(sphmlog::logs::format_message(var1, var2...));
        sphmbase::flush();
    }
} // namespace sphmlog::logs

struct LogLevel_Debug {
    constexpr static i8 logval              = 10;
    constexpr static const char *level_name = "Debug";

    static std::string reformat(const std::string &in, std::string module_name);
};
struct LogLevel_Info {
    constexpr static i8 logval              = 1;
    constexpr static const char *level_name = "";

    static std::string reformat(const std::string &in, std::string module_name);
};
struct LogLevel_Normal {
    constexpr static i8 logval              = 0;
    constexpr static const char *level_name = "";

    static std::string reformat(const std::string &in, std::string module_name);
};
struct LogLevel_Warning {
    constexpr static i8 logval              = -1;
    constexpr static const char *level_name = "Warning";

    static std::string reformat(const std::string &in, std::string module_name);
};
struct LogLevel_Error {
    constexpr static i8 logval              = -10;
    constexpr static const char *level_name = "Error";

    static std::string reformat(const std::string &in, std::string module_name);
};

#define SPHM_LIST_LEVEL                                                                            \
    X(debug, LogLevel_Debug)                                                                       \
    X(info, LogLevel_Info)                                                                         \
    X(normal, LogLevel_Normal)                                                                     \
    X(warn, LogLevel_Warning)                                                                      \
    X(err, LogLevel_Error)

namespace sphmlog::logs {

    ////////////////////////////////////////////////////////////////////////////////////////////////
    // Base print without decoration
    ////////////////////////////////////////////////////////////////////////////////////////////////

    template<typename... Types>
    inline void raw(Types... var2) {
        print(var2...);
    }

    template<typename... Types>
    inline void raw_ln(Types... var2) {
        print_ln(var2...);
    }

    inline void print_faint_row() {
        raw_ln(
            sphmbase::term_colors::faint() + "-----------------------------------------------------"
            + sphmbase::term_colors::reset());
    }

    ////////////////////////////////////////////////////////////////////////////////////////////////
    // Log levels
    ////////////////////////////////////////////////////////////////////////////////////////////////

#define DECLARE_LOG_LEVEL(_name, StructREF)                                                        \
                                                                                                   \
    constexpr i8 log_##_name = (StructREF::logval);                                                \
                                                                                                   \
    template<typename... Types>                                                                    \
    inline void _name(std::string module_name, Types... var2) {                                    \
        if (details::loglevel >= log_##_name) {                                                    \
            sphmlog::logs::print(                                                                  \
                StructREF::reformat(sphmlog::logs::format_message(var2...), module_name));         \
        }                                                                                          \
    }                                                                                              \
                                                                                                   \
    template<typename... Types>                                                                    \
    inline void _name##_ln(std::string module_name, Types... var2) {                               \
        if (details::loglevel >= log_##_name) {                                                    \
            sphmlog::logs::print_ln(                                                               \
                StructREF::reformat(sphmlog::logs::format_message(var2...), module_name));         \
        }                                                                                          \
    }

#define X DECLARE_LOG_LEVEL
    SPHM_LIST_LEVEL
#undef X

#undef DECLARE_LOG_LEVEL


} // namespace sphmlog::logs

namespace logger {

    using namespace sphmlog::logs;

}

/// Debug log, the arguments are not evaluated if the debug level is off
#define sphmlog_debug_ln(...)                                                                      \
    do {                                                                                           \
        if (sphmlog::logs::get_loglevel() >= sphmlog::logs::log_debug) {                           \
            sphmlog::logs::debug_ln(__VA_ARGS__);                                                  \
        }                                                                                          \
    } while (false)

#define sphmlog_info_ln(...) sphmlog::logs::info_ln(__VA_ARGS__)
#define sphmlog_warn_ln(...) sphmlog::logs::warn_ln(__VA_ARGS__)
#define sphmlog_error_ln(...) sphmlog::logs::err_ln(__VA_ARGS__)
