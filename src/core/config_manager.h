/*
 * <Configuration Manager for the neighbor engine>
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

#include <algorithm>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

/*! \brief Configuration manager with typed access
 *
 * Merges the defaults registered in ParameterRegistry with the user-provided
 * configuration.
 *
 * **Key Features:**
 * - Automatic default loading from ParameterRegistry
 * - Type-safe parameter access via get<T>()
 * - Case-insensitive parameter names and alias resolution
 * - json null preserved for parameters that accept "none"
 *
 * **Example Usage:**
 * ```cpp
 * ConfigManager config("neighbors", user_json);
 * double width_buffer = config.get<double>("width_buffer");
 * int tolerance = config.get<int>("tolerance", 2);
 * ```
 */
class ConfigManager
{
public:
    /*! \brief Loads defaults of a module and merges the user input
     *
     * @param module Module name (e.g., "neighbors")
     * @param user_input User-provided configuration; a nested object under the
     *                   module name is used when present
     */
    ConfigManager(const std::string& module, const json& user_input);

    /*! \brief Type-safe parameter access with exception on missing key
     *
     * @throws std::runtime_error if parameter not found or of the wrong type
     */
    template <typename T>
    T get(const std::string& key) const;

    /*! \brief Type-safe parameter access with default value */
    template <typename T>
    T get(const std::string& key, T default_value) const;

    bool has(const std::string& key) const;

    /*! \brief True if the parameter exists and holds json null ("none") */
    bool isNull(const std::string& key) const;

    json exportConfig() const { return m_config; }

    std::string getModule() const { return m_module; }

private:
    std::string m_module;
    json m_config; //!< Merged configuration (defaults + user_input)

    /*! \brief Case-insensitive key lookup
     * @throws std::runtime_error if not found
     */
    json findKey(const std::string& key) const;
};

template <typename T>
T ConfigManager::get(const std::string& key) const
{
    json value = findKey(key);
    try {
        return value.get<T>();
    } catch (const json::exception& e) {
        throw std::runtime_error("ConfigManager: Parameter '" + key + "' in module '" + m_module + "' has wrong type: " + e.what());
    }
}

template <typename T>
T ConfigManager::get(const std::string& key, T default_value) const
{
    if (!has(key) || isNull(key))
        return default_value;
    return get<T>(key);
}
