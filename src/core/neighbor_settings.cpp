/*
 * <Typed settings of the neighbor engine>
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

#include "neighbor_settings.h"

#include "src/core/config_manager.h"
#include "src/core/neighbor_errors.h"
#include "src/core/parameter_registry.h"

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <cmath>

void initialize_halo_registry(ParameterRegistry& registry)
{
    const double unbounded = std::numeric_limits<double>::infinity();

    registry.addDefinition("neighbors", { "num_neighbors", "", ParamType::Int, 12, "Number of neighbors per atom, none: estimated from cutoff_radius", "Search", { "k", "nn" }, true });
    registry.addDefinition("neighbors", { "cutoff_radius", "", ParamType::Double, unbounded, "Upper bound of the neighbor distance (Angstroms), none: unbounded", "Search", { "cutoff", "rc" }, true });
    registry.addDefinition("neighbors", { "width_buffer", "", ParamType::Double, 1.2, "Safety factor applied to the periodic halo thickness", "Search", { "buffer" } });
    registry.addDefinition("neighbors", { "norm_order", "", ParamType::Int, 2, "Order p of the Lp distance, fixed for the lifetime of an engine", "Search", { "p", "norm" } });
    registry.addDefinition("neighbors", { "mode", "", ParamType::String, std::string("filled"), "Output layout: filled, ragged or flattened", "Output", {} });
    registry.addDefinition("neighbors", { "wrap_positions", "", ParamType::Bool, false, "Fold query positions into the primary cell before searching", "Search", { "wrap" } });
    registry.addDefinition("neighbors", { "tolerance", "", ParamType::Int, 2, "Decimal places used to round distances into shells", "Shells", { "decimals" } });
    registry.addDefinition("neighbors", { "linkage", "", ParamType::String, std::string("complete"), "Agglomerative clustering linkage: single, complete, average or ward", "Shells", {} });
    registry.addDefinition("neighbors", { "affinity", "", ParamType::String, std::string("euclidean"), "Agglomerative clustering metric: euclidean, l1, manhattan or cosine", "Shells", { "metric" } });
    registry.addDefinition("neighbors", { "seed", "", ParamType::Int, -1, "Seed of the random rotation used by Steinhardt parameters, negative: nondeterministic", "Order parameters", {} });
}

namespace halo {

Mode ParseMode(const std::string& name)
{
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    if (lower == "filled")
        return Mode::Filled;
    if (lower == "ragged")
        return Mode::Ragged;
    if (lower == "flattened")
        return Mode::Flattened;
    throw ConfigurationError(fmt::format("Unknown mode '{}'. Available: filled, ragged, flattened", name));
}

std::string ModeName(Mode mode)
{
    switch (mode) {
    case Mode::Filled:
        return "filled";
    case Mode::Ragged:
        return "ragged";
    case Mode::Flattened:
        return "flattened";
    }
    return "filled";
}

NeighborSettings NeighborSettings::FromJson(const json& controller)
{
    ConfigManager config("neighbors", controller);
    NeighborSettings settings;

    try {
        if (config.isNull("num_neighbors"))
            settings.num_neighbors.reset();
        else
            settings.num_neighbors = config.get<int>("num_neighbors");

        settings.cutoff_radius = config.get<double>("cutoff_radius", std::numeric_limits<double>::infinity());
        settings.width_buffer = config.get<double>("width_buffer");
        settings.norm_order = config.get<int>("norm_order");
        settings.mode = ParseMode(config.get<std::string>("mode"));
        settings.wrap_positions = config.get<bool>("wrap_positions");
        settings.tolerance = config.get<int>("tolerance");
        settings.linkage = config.get<std::string>("linkage");
        settings.affinity = config.get<std::string>("affinity");
        settings.seed = config.get<int>("seed");
    } catch (const ConfigurationError&) {
        throw;
    } catch (const std::runtime_error& e) {
        throw ConfigurationError(e.what());
    }

    settings.Validate();
    return settings;
}

json NeighborSettings::toJson() const
{
    json result;
    result["num_neighbors"] = num_neighbors ? json(*num_neighbors) : json(nullptr);
    result["cutoff_radius"] = std::isinf(cutoff_radius) ? json(nullptr) : json(cutoff_radius);
    result["width_buffer"] = width_buffer;
    result["norm_order"] = norm_order;
    result["mode"] = ModeName(mode);
    result["wrap_positions"] = wrap_positions;
    result["tolerance"] = tolerance;
    result["linkage"] = linkage;
    result["affinity"] = affinity;
    result["seed"] = seed;
    return result;
}

void NeighborSettings::Validate() const
{
    if (num_neighbors && *num_neighbors <= 0)
        throw ConfigurationError(fmt::format("num_neighbors must be a positive integer, got {}", *num_neighbors));
    if (width_buffer < 0)
        throw ConfigurationError(fmt::format("width_buffer must be a positive float, got {}", width_buffer));
    if (norm_order < 1)
        throw ConfigurationError(fmt::format("norm_order must be at least 1, got {}", norm_order));
    if (!(cutoff_radius > 0))
        throw ConfigurationError(fmt::format("cutoff_radius must be positive, got {}", cutoff_radius));
    if (tolerance < 0)
        throw ConfigurationError(fmt::format("tolerance must not be negative, got {}", tolerance));
}

} // namespace halo
