/*
 * <Tests for the k-d tree search over periodic halos>
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

#include "src/core/halo_logger.h"
#include "src/core/neighbor_errors.h"
#include "src/core/neighbors.h"
#include "src/core/periodic_halo.h"
#include "src/core/spatial_index.h"

#include "core/halo_tester.h"
#include "core/test_structures.h"

#include <algorithm>
#include <iostream>
#include <limits>
#include <memory>
#include <random>

using namespace halo;
using TestStructures::TestStructureRegistry;

namespace {

const double unbounded = std::numeric_limits<double>::infinity();

std::vector<double> BruteForce(const Geometry& cloud, const Position& point, int p)
{
    std::vector<double> distances;
    for (int i = 0; i < cloud.rows(); ++i)
        distances.push_back(LpNorm(cloud.row(i).transpose() - point, p));
    std::sort(distances.begin(), distances.end());
    return distances;
}

Geometry RandomPoints(int count, double extent, unsigned seed)
{
    std::mt19937 generator(seed);
    std::uniform_real_distribution<double> uniform(0.0, extent);
    Geometry points(count, 3);
    for (int i = 0; i < count; ++i)
        for (int j = 0; j < 3; ++j)
            points(i, j) = uniform(generator);
    return points;
}

}

void test_brute_force_agreement(HaloTester& tester)
{
    tester.section("Agreement with brute force search");

    const Structure bcc = TestStructureRegistry::createStructure("Fe_bcc_2x2x2");
    const Geometry queries = RandomPoints(10, 5.66, 7);
    const int k = 20;

    for (int p : { 1, 2, 3 }) {
        auto halo = std::make_shared<const PeriodicHalo>(bcc, 4.0, p);
        const SpatialIndex index(halo, p);
        tester.assert_equal(halo->Size(), index.Size(), "index covers the whole halo");
        tester.assert_equal(p, index.NormOrder(), "norm order is kept");

        Matrix distances;
        IndexMatrix extended;
        index.Query(queries, k, unbounded, distances, extended);

        bool match = true;
        bool ascending = true;
        bool consistent = true;
        for (int row = 0; row < queries.rows(); ++row) {
            const std::vector<double> expected = BruteForce(halo->Positions(), queries.row(row).transpose(), p);
            for (int slot = 0; slot < k; ++slot) {
                match = match && std::abs(expected[slot] - distances(row, slot)) < 1e-9;
                if (slot > 0)
                    ascending = ascending && distances(row, slot - 1) <= distances(row, slot);
                const Position neighbor = halo->Positions().row(extended(row, slot)).transpose();
                consistent = consistent && std::abs(LpNorm(neighbor - queries.row(row).transpose(), p) - distances(row, slot)) < 1e-9;
            }
        }
        const std::string label = " (p = " + std::to_string(p) + ")";
        tester.assert_true(match, "k nearest distances match brute force" + label);
        tester.assert_true(ascending, "rows are ascending" + label);
        tester.assert_true(consistent, "indices point at the reported distances" + label);
    }
}

void test_radius_sentinels(HaloTester& tester)
{
    tester.section("Radius bound");

    const Structure bcc = TestStructureRegistry::createStructure("Fe_bcc");
    auto halo = std::make_shared<const PeriodicHalo>(bcc, 4.0);
    const SpatialIndex index(halo);

    Matrix distances;
    IndexMatrix extended;
    index.Query(bcc.Positions(), 20, 2.6, distances, extended);

    bool sentinels = true;
    for (int row = 0; row < distances.rows(); ++row) {
        // self plus 8 nearest neighbors at 2.4508
        for (int slot = 0; slot < 9; ++slot)
            sentinels = sentinels && distances(row, slot) < 2.6;
        for (int slot = 9; slot < 20; ++slot)
            sentinels = sentinels && IsSentinel(distances(row, slot)) && extended(row, slot) == SentinelIndex;
    }
    tester.assert_true(sentinels, "entries beyond the radius become sentinels");

    index.Query(bcc.Positions(), 20, 2.83, distances, extended);
    tester.assert_true(IsSentinel(distances(0, 9)), "the radius bound is strict");
}

void test_small_clouds(HaloTester& tester)
{
    tester.section("Small and empty clouds");

    const Structure cluster = TestStructureRegistry::createStructure("Cu5_cluster");
    auto halo = std::make_shared<const PeriodicHalo>(cluster, 0.0);
    const SpatialIndex index(halo);

    Matrix distances;
    IndexMatrix extended;
    index.Query(cluster.Positions(), 8, unbounded, distances, extended);
    tester.assert_equal(8, static_cast<int>(distances.cols()), "requested slot count is kept");
    tester.assert_true(!IsSentinel(distances(0, 4)) && IsSentinel(distances(0, 5)), "missing points are sentinels");

    const Structure empty(Geometry(0, 3), StringList());
    auto empty_halo = std::make_shared<const PeriodicHalo>(empty, 0.0);
    const SpatialIndex empty_index(empty_halo);
    index.Query(cluster.Positions(), 0, unbounded, distances, extended);
    tester.assert_equal(0, static_cast<int>(distances.cols()), "zero slots");
    empty_index.Query(cluster.Positions(), 3, unbounded, distances, extended);
    tester.assert_true(IsSentinel(distances(2, 0)), "an empty cloud yields only sentinels");

    tester.assert_throws<ConfigurationError>([&]() { SpatialIndex(halo, 0); }, "norm order below 1");

    NeighborSettings settings;
    settings.num_neighbors = 10;
    tester.assert_throws<InfeasibleSearchError>([&]() { GetNeighbors(cluster, settings); },
        "unbounded search for more neighbors than points");
}

int main()
{
    HaloLogger::initialize(1, false);

    std::cout << "=== Spatial Index Test Suite ===" << std::endl;

    HaloTester tester;
    test_brute_force_agreement(tester);
    test_radius_sentinels(tester);
    test_small_clouds(tester);

    return tester.print_summary();
}
