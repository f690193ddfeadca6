/*
 * <Halo Logging System>
 * Copyright (C) 2025 Conrad Hübler <Conrad.Huebler@gmx.net>
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 *
 */

#pragma once

#include <nlohmann/json.hpp>
#include <fmt/color.h>
#include <fmt/core.h>
#include <string>
#include <type_traits>

using json = nlohmann::json;

/*! \brief Verbosity-controlled terminal logger
 *
 * Verbosity levels:
 *  0 - silent (errors only)
 *  1 - warnings and results (default)
 *  2 - informative output, parameter tables
 *  3 - verbose
 */
class HaloLogger {
public:
    enum class OutputFormat {
        TERMINAL,
        RAW
    };

private:
    static int m_verbosity;
    static bool m_use_colors;
    static OutputFormat m_format;
    static int m_warning_count;

public:
    // Configuration methods
    static void set_verbosity(int level) { m_verbosity = level; }
    static void set_colors(bool enable) { m_use_colors = enable; }
    static void set_format(OutputFormat fmt) { m_format = fmt; }
    static int get_verbosity() { return m_verbosity; }
    static bool colors_enabled() { return m_use_colors; }

    // Initialize logger with environment detection
    static void initialize(int verbosity = 1, bool auto_detect_colors = true);

    // Core logging functions with verbosity control
    static void error(const std::string& msg);
    static void warn(const std::string& msg);
    static void success(const std::string& msg);
    static void info(const std::string& msg);

    // Parameter logging with different types
    static void param(const std::string& key, const std::string& value);
    static void param(const std::string& key, int value);
    static void param(const std::string& key, double value);
    static void param(const std::string& key, bool value);

    static void param_table(const json& parameters, const std::string& title = "Parameters");
    static void header(const std::string& title);

    /*! \brief Number of warnings issued since start or the last reset
     *
     * Warnings are counted even when the verbosity suppresses their output.
     */
    static int warning_count() { return m_warning_count; }
    static void reset_warning_count() { m_warning_count = 0; }

    template <typename... Args>
    static void error_fmt(fmt::format_string<Args...> format_str, Args&&... args)
    {
        std::string msg = fmt::format(format_str, std::forward<Args>(args)...);
        error(msg);
    }

    template <typename... Args>
    static void warn_fmt(fmt::format_string<Args...> format_str, Args&&... args)
    {
        std::string msg = fmt::format(format_str, std::forward<Args>(args)...);
        warn(msg);
    }

    template <typename... Args>
    static void success_fmt(fmt::format_string<Args...> format_str, Args&&... args)
    {
        std::string msg = fmt::format(format_str, std::forward<Args>(args)...);
        success(msg);
    }

    template <typename... Args>
    static void info_fmt(fmt::format_string<Args...> format_str, Args&&... args)
    {
        std::string msg = fmt::format(format_str, std::forward<Args>(args)...);
        info(msg);
    }

    // Template-based param function for any type
    template <typename T>
    static void param_value(const std::string& key, const T& value)
    {
        if constexpr (std::is_same_v<T, std::string>) {
            param(key, value);
        } else if constexpr (std::is_same_v<T, bool>) {
            param(key, value);
        } else if constexpr (std::is_integral_v<T>) {
            param(key, static_cast<int>(value));
        } else if constexpr (std::is_floating_point_v<T>) {
            param(key, static_cast<double>(value));
        } else {
            std::string value_str = fmt::format("{}", value);
            param(key, value_str);
        }
    }

private:
    static void log_colored(fmt::color color, const std::string& prefix, const std::string& msg, bool force_visible = false);
    static void log_plain(const std::string& msg);
    static std::string format_json_value(const json& value);
};
