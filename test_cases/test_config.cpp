/*
 * <Tests for neighbor settings and the parameter registry>
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

#include "src/core/config_manager.h"
#include "src/core/halo_logger.h"
#include "src/core/neighbor_errors.h"
#include "src/core/neighbor_settings.h"
#include "src/core/parameter_registry.h"

#include "core/halo_tester.h"

#include <cmath>
#include <iostream>

using namespace halo;

void test_defaults(HaloTester& tester)
{
    tester.section("Defaults");

    const NeighborSettings settings = NeighborSettings::FromJson(json::object());
    tester.assert_equal(12, settings.num_neighbors.value_or(-1), "num_neighbors");
    tester.assert_true(std::isinf(settings.cutoff_radius), "cutoff_radius unbounded");
    tester.assert_near(1.2, settings.width_buffer, 1e-12, "width_buffer");
    tester.assert_equal(2, settings.norm_order, "norm_order");
    tester.assert_true(settings.mode == Mode::Filled, "mode");
    tester.assert_false(settings.wrap_positions, "wrap_positions");
    tester.assert_equal(2, settings.tolerance, "tolerance");
    tester.assert_true(settings.linkage == "complete", "linkage");
    tester.assert_true(settings.affinity == "euclidean", "affinity");
    tester.assert_equal(-1, settings.seed, "seed");
}

void test_aliases(HaloTester& tester)
{
    tester.section("Aliases and case");

    json input = {
        { "k", 6 },
        { "rc", 3.5 },
        { "buffer", 1.5 },
        { "p", 1 },
        { "MODE", "Ragged" },
        { "wrap", true },
        { "decimals", 3 },
        { "metric", "l1" },
        { "Linkage", "single" }
    };
    const NeighborSettings settings = NeighborSettings::FromJson(input);
    tester.assert_equal(6, settings.num_neighbors.value_or(-1), "k");
    tester.assert_near(3.5, settings.cutoff_radius, 1e-12, "rc");
    tester.assert_near(1.5, settings.width_buffer, 1e-12, "buffer");
    tester.assert_equal(1, settings.norm_order, "p");
    tester.assert_true(settings.mode == Mode::Ragged, "MODE");
    tester.assert_true(settings.wrap_positions, "wrap");
    tester.assert_equal(3, settings.tolerance, "decimals");
    tester.assert_true(settings.affinity == "l1", "metric");
    tester.assert_true(settings.linkage == "single", "Linkage");

    json nested = { { "neighbors", { { "nn", 4 } } } };
    tester.assert_equal(4, NeighborSettings::FromJson(nested).num_neighbors.value_or(-1), "nested module object");

    json none = { { "num_neighbors", nullptr }, { "cutoff", 3.0 } };
    const NeighborSettings by_cutoff = NeighborSettings::FromJson(none);
    tester.assert_false(by_cutoff.num_neighbors.has_value(), "null num_neighbors");
    tester.assert_near(3.0, by_cutoff.cutoff_radius, 1e-12, "cutoff");

    HaloLogger::reset_warning_count();
    json unknown = { { "radius_of_gyration", 1 } };
    NeighborSettings::FromJson(unknown);
    tester.assert_equal(1, HaloLogger::warning_count(), "unknown keys warn");
}

void test_invalid(HaloTester& tester)
{
    tester.section("Invalid settings");

    tester.assert_throws<ConfigurationError>([]() { NeighborSettings::FromJson({ { "mode", "jagged" } }); }, "unknown mode");
    tester.assert_throws<ConfigurationError>([]() { NeighborSettings::FromJson({ { "num_neighbors", 0 } }); }, "zero neighbors");
    tester.assert_throws<ConfigurationError>([]() { NeighborSettings::FromJson({ { "num_neighbors", -3 } }); }, "negative neighbors");
    tester.assert_throws<ConfigurationError>([]() { NeighborSettings::FromJson({ { "width_buffer", -0.1 } }); }, "negative buffer");
    tester.assert_throws<ConfigurationError>([]() { NeighborSettings::FromJson({ { "norm_order", 0 } }); }, "norm order 0");
    tester.assert_throws<ConfigurationError>([]() { NeighborSettings::FromJson({ { "cutoff_radius", 0.0 } }); }, "zero cutoff");
    tester.assert_throws<ConfigurationError>([]() { NeighborSettings::FromJson({ { "width_buffer", "wide" } }); }, "wrong type");

    NeighborSettings settings;
    settings.tolerance = -1;
    tester.assert_throws<ConfigurationError>([&]() { settings.Validate(); }, "negative tolerance");
}

void test_export(HaloTester& tester)
{
    tester.section("Export");

    NeighborSettings settings;
    json exported = settings.toJson();
    tester.assert_true(exported["cutoff_radius"].is_null(), "unbounded cutoff exports as null");
    tester.assert_true(exported["mode"] == "filled", "mode name");

    settings.num_neighbors.reset();
    settings.cutoff_radius = 4.0;
    settings.mode = Mode::Flattened;
    exported = settings.toJson();
    tester.assert_true(exported["num_neighbors"].is_null(), "absent count exports as null");

    const NeighborSettings restored = NeighborSettings::FromJson(exported);
    tester.assert_false(restored.num_neighbors.has_value(), "count survives the round trip");
    tester.assert_near(4.0, restored.cutoff_radius, 1e-12, "cutoff survives the round trip");
    tester.assert_true(restored.mode == Mode::Flattened, "mode survives the round trip");
}

void test_registry(HaloTester& tester)
{
    tester.section("Parameter registry");

    const ParameterRegistry& registry = ParameterRegistry::getInstance();
    tester.assert_true(registry.validateRegistry(), "no duplicate names or aliases");
    tester.assert_equal(10, static_cast<int>(registry.getForModule("neighbors").size()), "neighbors parameters");
    tester.assert_equal(10, static_cast<int>(registry.getDefaultJson("neighbors").size()), "defaults for every parameter");
    tester.assert_true(registry.resolveAlias("neighbors", "RC") == "cutoff_radius", "alias lookup is case-insensitive");
    tester.assert_true(registry.resolveAlias("neighbors", "unknown").empty(), "unknown alias");

    const ParameterDefinition* definition = registry.findDefinition("neighbors", "k");
    tester.assert_true(definition != nullptr && definition->name == "num_neighbors", "definition by alias");
    tester.assert_true(definition != nullptr && definition->nullable, "num_neighbors accepts none");
    tester.assert_true(registry.getForModule("optimizer").empty(), "unknown module");

    ConfigManager config("neighbors", { { "P", 3 } });
    tester.assert_equal(3, config.get<int>("norm_order"), "config manager resolves aliases");
    tester.assert_equal(3, config.get<int>("norm"), "and reads through them");
    tester.assert_true(config.has("seed"), "defaults are present");
    tester.assert_false(config.has("missing"), "missing keys");
    tester.assert_equal(7, config.get<int>("missing", 7), "fallback for missing keys");

    registry.printAllModules();
    registry.printHelp("neighbors");
}

int main()
{
    HaloLogger::initialize(1, false);

    std::cout << "=== Configuration Test Suite ===" << std::endl;

    HaloTester tester;
    test_defaults(tester);
    test_aliases(tester);
    test_invalid(tester);
    test_export(tester);
    test_registry(tester);

    return tester.print_summary();
}
