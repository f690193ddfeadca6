/*
 * <Configuration Manager Implementation>
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

#include "config_manager.h"
#include "parameter_registry.h"

#include "src/core/halo_logger.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace {
std::string to_lower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), ::tolower);
    return value;
}
}

ConfigManager::ConfigManager(const std::string& module, const json& user_input)
    : m_module(module)
{
    auto& registry = ParameterRegistry::getInstance();
    m_config = registry.getDefaultJson(module);

    // controller["neighbors"] = {...} takes precedence over a flat controller
    json module_input = json::object();
    if (user_input.is_object()) {
        if (user_input.contains(module) && user_input[module].is_object())
            module_input = user_input[module];
        else
            module_input = user_input;
    }

    for (const auto& item : module_input.items()) {
        const std::string& user_key = item.key();

        // First, try alias resolution (case-insensitive)
        std::string resolved_key = registry.resolveAlias(module, user_key);
        if (!resolved_key.empty() && m_config.contains(resolved_key)) {
            m_config[resolved_key] = item.value();
            continue;
        }

        bool found = false;
        const std::string user_key_lower = to_lower(user_key);
        for (const auto& def_item : m_config.items()) {
            if (to_lower(def_item.key()) == user_key_lower) {
                m_config[def_item.key()] = item.value();
                found = true;
                break;
            }
        }

        if (!found) {
            HaloLogger::warn_fmt("ConfigManager: unknown parameter '{}' for module '{}' kept as is", user_key, module);
            m_config[user_key] = item.value();
        }
    }
}

bool ConfigManager::has(const std::string& key) const
{
    try {
        findKey(key);
        return true;
    } catch (const std::runtime_error&) {
        return false;
    }
}

bool ConfigManager::isNull(const std::string& key) const
{
    return findKey(key).is_null();
}

json ConfigManager::findKey(const std::string& key) const
{
    if (m_config.contains(key))
        return m_config[key];

    const std::string canonical = ParameterRegistry::getInstance().resolveAlias(m_module, key);
    if (!canonical.empty() && m_config.contains(canonical))
        return m_config[canonical];

    const std::string key_lower = to_lower(key);
    for (const auto& item : m_config.items()) {
        if (to_lower(item.key()) == key_lower)
            return item.value();
    }

    throw std::runtime_error("ConfigManager: Parameter '" + key + "' not found in module '" + m_module + "'");
}
