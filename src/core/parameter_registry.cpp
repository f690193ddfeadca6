/*
 * <Parameter registry implementation>
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

#include "parameter_registry.h"
#include "src/core/halo_logger.h"

#include <algorithm>
#include <cmath>
#include <iostream>

#include <fmt/core.h>

using json = nlohmann::json;

ParameterRegistry& ParameterRegistry::getInstance()
{
    static ParameterRegistry instance;
    static const bool initialized = [] {
        initialize_halo_registry(instance);
        return true;
    }();
    (void)initialized;
    return instance;
}

void ParameterRegistry::addDefinition(const std::string& module, ParameterDefinition&& def)
{
    std::string canonical_name = def.name;
    def.module = module;
    registry[module].push_back(std::move(def));

    // Map the canonical name to itself
    alias_to_name_map[module][canonical_name] = canonical_name;
    // Map all aliases to the canonical name
    const auto& added_def = registry[module].back();
    for (const auto& alias : added_def.aliases) {
        alias_to_name_map[module][alias] = canonical_name;
    }
}

const ParameterDefinition* ParameterRegistry::findDefinition(const std::string& module, const std::string& alias) const
{
    const std::string canonical_name = resolveAlias(module, alias);
    if (canonical_name.empty())
        return nullptr;

    auto registry_it = registry.find(module);
    if (registry_it != registry.end()) {
        for (const auto& def : registry_it->second) {
            if (def.name == canonical_name) {
                return &def;
            }
        }
    }

    return nullptr;
}

std::vector<ParameterDefinition> ParameterRegistry::getForModule(const std::string& module) const
{
    auto it = registry.find(module);
    if (it != registry.end()) {
        return it->second;
    }
    return {};
}

void ParameterRegistry::printHelp(const std::string& module) const
{
    auto it = registry.find(module);
    if (it == registry.end()) {
        std::cout << "No parameters registered for module: " << module << std::endl;
        return;
    }

    std::cout << "Parameters for module: " << module << std::endl;
    std::cout << std::string(60, '=') << std::endl;

    // Group parameters by category
    std::map<std::string, std::vector<const ParameterDefinition*>> by_category;
    for (const auto& param : it->second) {
        by_category[param.category].push_back(&param);
    }

    for (const auto& [category, params] : by_category) {
        std::cout << "\n[" << category << "]" << std::endl;

        for (const auto* param : params) {
            std::cout << "  -" << param->name;

            std::cout << " <";
            switch (param->type) {
            case ParamType::String:
                std::cout << "string";
                break;
            case ParamType::Int:
                std::cout << "int";
                break;
            case ParamType::Double:
                std::cout << "double";
                break;
            case ParamType::Bool:
                std::cout << "bool";
                break;
            }
            if (param->nullable)
                std::cout << "|none";
            std::cout << ">";

            std::cout << " (default: ";
            switch (param->type) {
            case ParamType::String:
                std::cout << std::any_cast<std::string>(param->defaultValue);
                break;
            case ParamType::Int:
                std::cout << std::any_cast<int>(param->defaultValue);
                break;
            case ParamType::Double: {
                const double value = std::any_cast<double>(param->defaultValue);
                if (std::isinf(value))
                    std::cout << "inf";
                else
                    std::cout << value;
                break;
            }
            case ParamType::Bool:
                std::cout << (std::any_cast<bool>(param->defaultValue) ? "true" : "false");
                break;
            }
            std::cout << ")" << std::endl;

            std::cout << "      " << param->helpText << std::endl;

            if (!param->aliases.empty()) {
                std::cout << "      Aliases: ";
                for (size_t i = 0; i < param->aliases.size(); ++i) {
                    if (i > 0)
                        std::cout << ", ";
                    std::cout << param->aliases[i];
                }
                std::cout << std::endl;
            }
        }
    }
    std::cout << std::endl;
}

void ParameterRegistry::printAllModules() const
{
    std::cout << "Available modules:" << std::endl;
    for (const auto& [module, params] : registry) {
        std::cout << "  " << module << " (" << params.size() << " parameters)" << std::endl;
    }
}

json ParameterRegistry::getDefaultJson(const std::string& module) const
{
    json result = json::object();

    auto it = registry.find(module);
    if (it == registry.end()) {
        return result;
    }

    for (const auto& param : it->second) {
        try {
            switch (param.type) {
            case ParamType::String:
                result[param.name] = std::any_cast<std::string>(param.defaultValue);
                break;
            case ParamType::Int:
                result[param.name] = std::any_cast<int>(param.defaultValue);
                break;
            case ParamType::Double:
                result[param.name] = std::any_cast<double>(param.defaultValue);
                break;
            case ParamType::Bool:
                result[param.name] = std::any_cast<bool>(param.defaultValue);
                break;
            }
        } catch (const std::bad_any_cast& e) {
            HaloLogger::warn_fmt("Failed to cast default value for parameter {} in module {}: {}",
                param.name, module, e.what());
        }
    }

    return result;
}

bool ParameterRegistry::validateRegistry() const
{
    bool valid = true;

    // Check for duplicate parameter names within each module
    for (const auto& [module, params] : registry) {
        std::map<std::string, int> name_counts;

        for (const auto& param : params) {
            name_counts[param.name]++;
            if (name_counts[param.name] > 1) {
                HaloLogger::error_fmt("Duplicate parameter '{}' in module '{}'", param.name, module);
                valid = false;
            }

            for (const auto& alias : param.aliases) {
                name_counts[alias]++;
                if (name_counts[alias] > 1) {
                    HaloLogger::error_fmt("Alias '{}' conflicts with another name/alias in module '{}'", alias, module);
                    valid = false;
                }
            }
        }
    }

    return valid;
}

std::string ParameterRegistry::resolveAlias(const std::string& module, const std::string& alias) const
{
    auto module_it = alias_to_name_map.find(module);
    if (module_it == alias_to_name_map.end()) {
        return "";
    }

    // case-insensitive lookup
    std::string alias_lower = alias;
    std::transform(alias_lower.begin(), alias_lower.end(), alias_lower.begin(), ::tolower);

    for (const auto& [known, canonical] : module_it->second) {
        std::string known_lower = known;
        std::transform(known_lower.begin(), known_lower.end(), known_lower.begin(), ::tolower);
        if (known_lower == alias_lower)
            return canonical;
    }

    return "";
}
