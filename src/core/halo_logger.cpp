/*
 * <Halo Logging System Implementation>
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

#include "halo_logger.h"

#include <fmt/color.h>
#include <fmt/core.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <unistd.h>

int HaloLogger::m_verbosity = 1;
bool HaloLogger::m_use_colors = true;
HaloLogger::OutputFormat HaloLogger::m_format = HaloLogger::OutputFormat::TERMINAL;
int HaloLogger::m_warning_count = 0;

void HaloLogger::initialize(int verbosity, bool auto_detect_colors)
{
    m_verbosity = verbosity;
    if (auto_detect_colors) {
        // NO_COLOR convention, see https://no-color.org
        const bool no_color = std::getenv("NO_COLOR") != nullptr;
        m_use_colors = !no_color && isatty(fileno(stdout));
    }
}

void HaloLogger::error(const std::string& msg)
{
    log_colored(fmt::color::red, "[ERROR] ", msg, true);
}

void HaloLogger::warn(const std::string& msg)
{
    ++m_warning_count;
    if (m_verbosity < 1)
        return;
    log_colored(fmt::color::orange, "[WARN] ", msg);
}

void HaloLogger::success(const std::string& msg)
{
    if (m_verbosity < 1)
        return;
    log_colored(fmt::color::green, "[OK] ", msg);
}

void HaloLogger::info(const std::string& msg)
{
    if (m_verbosity < 2)
        return;
    log_plain(msg);
}

void HaloLogger::param(const std::string& key, const std::string& value)
{
    if (m_verbosity < 2)
        return;
    log_plain(fmt::format("  {:<24} {}", key + ":", value));
}

void HaloLogger::param(const std::string& key, int value)
{
    param(key, fmt::format("{}", value));
}

void HaloLogger::param(const std::string& key, double value)
{
    if (std::isinf(value))
        param(key, std::string(value > 0 ? "inf" : "-inf"));
    else
        param(key, fmt::format("{:.6g}", value));
}

void HaloLogger::param(const std::string& key, bool value)
{
    param(key, std::string(value ? "true" : "false"));
}

void HaloLogger::param_table(const json& parameters, const std::string& title)
{
    if (m_verbosity < 2)
        return;
    header(title);
    for (const auto& item : parameters.items())
        param(item.key(), format_json_value(item.value()));
}

void HaloLogger::header(const std::string& title)
{
    if (m_verbosity < 2)
        return;
    const std::string rule(std::max<std::size_t>(title.size() + 4, 40), '=');
    if (m_use_colors && m_format == OutputFormat::TERMINAL) {
        fmt::print(fmt::emphasis::bold, "\n{}\n  {}\n{}\n", rule, title, rule);
    } else {
        fmt::print("\n{}\n  {}\n{}\n", rule, title, rule);
    }
}

void HaloLogger::log_colored(fmt::color color, const std::string& prefix, const std::string& msg, bool force_visible)
{
    if (!force_visible && m_verbosity < 1)
        return;
    if (m_use_colors && m_format == OutputFormat::TERMINAL) {
        fmt::print(stderr, fg(color), "{}", prefix);
        fmt::print(stderr, "{}\n", msg);
    } else {
        fmt::print(stderr, "{}{}\n", prefix, msg);
    }
}

void HaloLogger::log_plain(const std::string& msg)
{
    fmt::print("{}\n", msg);
}

std::string HaloLogger::format_json_value(const json& value)
{
    if (value.is_string())
        return value.get<std::string>();
    if (value.is_boolean())
        return value.get<bool>() ? "true" : "false";
    if (value.is_number_float()) {
        const double number = value.get<double>();
        if (std::isinf(number))
            return number > 0 ? "inf" : "-inf";
        return fmt::format("{:.6g}", number);
    }
    if (value.is_null())
        return "none";
    return value.dump();
}
