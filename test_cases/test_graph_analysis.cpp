/*
 * <Tests for neighbor graph analyses>
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

#include "core/halo_tester.h"
#include "core/test_structures.h"

#include <algorithm>
#include <iostream>
#include <limits>
#include <vector>

using namespace halo;
using TestStructures::TestStructureRegistry;

namespace {

NeighborSettings WithNeighbors(int k, double cutoff = std::numeric_limits<double>::infinity())
{
    NeighborSettings settings;
    settings.num_neighbors = k;
    settings.cutoff_radius = cutoff;
    return settings;
}

}

void test_cluster_analysis(HaloTester& tester)
{
    tester.section("Connected clusters");

    const Structure dimers = TestStructureRegistry::createStructure("Ar_dimers");
    Neighbors neighbors = GetNeighbors(dimers, WithNeighbors(3, 2.0));

    const auto all = neighbors.ClusterAnalysis({ 0, 1, 2, 3 });
    tester.assert_equal(2, static_cast<int>(all.clusters.size()), "two dimers");
    tester.assert_true(all.clusters.at(1) == std::vector<int>({ 0, 1 }), "first dimer");
    tester.assert_true(all.clusters.at(2) == std::vector<int>({ 2, 3 }), "second dimer");
    tester.assert_true(all.sizes == std::vector<int>({ 2, 2 }), "cluster sizes");

    const auto reversed = neighbors.ClusterAnalysis({ 3, 0 });
    tester.assert_true(reversed.clusters.at(1) == std::vector<int>({ 3 }), "ids are assigned in the order of the list");
    tester.assert_true(reversed.clusters.at(2) == std::vector<int>({ 0 }), "unselected partners are not followed");

    tester.assert_throws<ConfigurationError>([&]() { neighbors.ClusterAnalysis({ 4 }); }, "atom id out of range");

    const Structure bcc = TestStructureRegistry::createStructure("Fe_bcc_2x2x2");
    Neighbors crystal = GetNeighbors(bcc, WithNeighbors(8));
    std::vector<int> everything;
    for (int i = 0; i < bcc.AtomCount(); ++i)
        everything.push_back(i);
    const auto connected = crystal.ClusterAnalysis(everything);
    tester.assert_equal(1, static_cast<int>(connected.clusters.size()), "a crystal is one cluster");
    tester.assert_equal(16, connected.sizes[0], "holding every atom");
}

void test_bonds(HaloTester& tester)
{
    tester.section("Bonds");

    const Structure bcc = TestStructureRegistry::createStructure("Fe_bcc_2x2x2");
    Neighbors neighbors = GetNeighbors(bcc, WithNeighbors(14));

    const auto bonds = neighbors.Bonds();
    tester.assert_equal(16, static_cast<int>(bonds.size()), "one entry per atom");
    tester.assert_equal(2, static_cast<int>(bonds[0].at("Fe").size()), "two shells of Fe neighbors");
    tester.assert_equal(8, static_cast<int>(bonds[0].at("Fe")[0].size()), "first shell");
    tester.assert_equal(6, static_cast<int>(bonds[0].at("Fe")[1].size()), "second shell");
    tester.assert_true(std::is_sorted(bonds[0].at("Fe")[0].begin(), bonds[0].at("Fe")[0].end()), "ids sorted within a shell");

    const auto limited = neighbors.Bonds(std::numeric_limits<double>::infinity(), 1);
    tester.assert_equal(1, static_cast<int>(limited[0].at("Fe").size()), "max_shells keeps the first shell");

    const auto near = neighbors.Bonds(2.6);
    tester.assert_equal(1, static_cast<int>(near[3].at("Fe").size()), "radius keeps the first shell");

    const auto merged = neighbors.Bonds(std::numeric_limits<double>::infinity(), std::nullopt, 0.5);
    tester.assert_equal(1, static_cast<int>(merged[0].at("Fe").size()), "a coarse precision merges both shells");
    tester.assert_equal(14, static_cast<int>(merged[0].at("Fe")[0].size()), "with all neighbors");

    const Structure b2 = TestStructureRegistry::createStructure("FeAl_B2");
    Neighbors alloy = GetNeighbors(b2, WithNeighbors(14));
    const auto alloy_bonds = alloy.Bonds();
    tester.assert_equal(1, static_cast<int>(alloy_bonds[0].at("Al").size()), "Fe sees one shell of Al");
    tester.assert_equal(8, static_cast<int>(alloy_bonds[0].at("Al")[0].size()), "8 Al neighbors");
    tester.assert_equal(1, static_cast<int>(alloy_bonds[0].at("Fe").size()), "and one shell of Fe");
    tester.assert_equal(6, static_cast<int>(alloy_bonds[0].at("Fe")[0].size()), "6 Fe neighbors");
}

void test_find_by_vector(HaloTester& tester)
{
    tester.section("Neighbors along a vector");

    const double a = 2.83;
    const Structure bcc = TestStructureRegistry::createStructure("Fe_bcc_2x2x2");
    Neighbors neighbors = GetNeighbors(bcc, WithNeighbors(14));

    const auto match = neighbors.FindNeighborsByVector(Position(0.0, 0.0, a));
    // cell (0, 0, 1) holds atoms 2 and 3
    tester.assert_equal(2, match.ids[0], "corner atom above the origin");
    tester.assert_equal(3, match.ids[1], "center atom above the first center");
    bool exact = true;
    for (double deviation : match.deviations)
        exact = exact && deviation < 1e-8;
    tester.assert_true(exact, "lattice vectors are matched exactly");

    const auto self = neighbors.FindNeighborsByVector(Position::Zero());
    bool identity = true;
    for (int atom = 0; atom < bcc.AtomCount(); ++atom)
        identity = identity && self.ids[atom] == atom && self.deviations[atom] == 0.0;
    tester.assert_true(identity, "the zero vector selects the atom itself");

    const auto off = neighbors.FindNeighborsByVector(Position(0.1, 0.0, a));
    tester.assert_equal(2, off.ids[0], "closest match for a slightly tilted vector");
    tester.assert_near(0.1, off.deviations[0], 1e-8, "deviation of the closest match");
}

void test_adjacency_mask(HaloTester& tester)
{
    tester.section("Adjacency mask");

    const Structure bcc = TestStructureRegistry::createStructure("Fe_bcc_2x2x2");
    Neighbors neighbors = GetNeighbors(bcc, WithNeighbors(8));

    const Eigen::SparseMatrix<int> mask = neighbors.AdjacencyMask();
    const Eigen::MatrixXi dense = Eigen::MatrixXi(mask);
    tester.assert_equal(16, static_cast<int>(mask.rows()), "atom x atom");
    tester.assert_true(dense == dense.transpose(), "mask is symmetric");
    tester.assert_equal(16, dense.diagonal().sum(), "every atom is adjacent to itself");
    tester.assert_equal(16 * 9, static_cast<int>(mask.nonZeros()), "self plus 8 neighbors per atom");
    tester.assert_equal(1, dense.maxCoeff(), "entries are flags");

    const Eigen::SparseMatrix<int> short_range = neighbors.AdjacencyMask(2.0);
    tester.assert_equal(16, static_cast<int>(short_range.nonZeros()), "a short cutoff leaves the diagonal");

    const Eigen::SparseMatrix<int> cartesian = neighbors.AdjacencyMask(std::numeric_limits<double>::infinity(), true);
    tester.assert_equal(48, static_cast<int>(cartesian.rows()), "3N x 3N for Cartesian components");
    tester.assert_equal(16 * 9 * 9, static_cast<int>(cartesian.nonZeros()), "3 x 3 blocks per adjacent pair");
}

void test_selected_rows(HaloTester& tester)
{
    tester.section("Graph analysis of selected atoms");

    Geometry positions(3, 3);
    positions << 0.0, 0.0, 0.0,
        1.0, 0.0, 0.0,
        5.0, 0.0, 0.0;
    const Structure line(positions, { "Fe", "Fe", "Al" });

    Neighbors aluminium = GetNeighbors(line, WithNeighbors(2), std::vector<int>({ 2 }));
    tester.assert_true(aluminium.RowAtoms() == std::vector<int>({ 2 }), "the only row belongs to atom 2");

    const Eigen::MatrixXi mask = Eigen::MatrixXi(aluminium.AdjacencyMask());
    tester.assert_equal(3, static_cast<int>(mask.rows()), "mask spans all atoms");
    tester.assert_equal(1, mask(2, 1), "atom 2 is adjacent to atom 1");
    tester.assert_equal(1, mask(0, 2), "and to atom 0");
    tester.assert_equal(0, mask(0, 1), "the iron pair has no row");
    tester.assert_equal(7, mask.sum(), "diagonal plus two symmetric pairs");

    const auto matrices = aluminium.ShellMatrix(std::make_pair(std::string("Al"), std::string("Fe")));
    tester.assert_equal(2, static_cast<int>(matrices.size()), "shells at 4 and 5");
    tester.assert_equal(1, Eigen::MatrixXi(matrices[0])(1, 2), "first shell of atom 2 holds atom 1");
    tester.assert_equal(1, Eigen::MatrixXi(matrices[1])(0, 2), "second shell of atom 2 holds atom 0");

    tester.assert_equal(2, aluminium.FindNeighborsByVector(Position::Zero()).ids[0], "the zero vector selects atom 2");
    tester.assert_equal(1, aluminium.FindNeighborsByVector(Position(-4.0, 0.0, 0.0)).ids[0], "translation from atom 2");

    const auto clusters = aluminium.ClusterAnalysis({ 2 });
    tester.assert_true(clusters.clusters.at(1) == std::vector<int>({ 2 }), "cluster of the selected atom");
    tester.assert_throws<ConfigurationError>([&]() { aluminium.ClusterAnalysis({ 0 }); }, "atom without a row");

    Neighbors repeated = GetNeighbors(line, WithNeighbors(2), std::vector<int>({ 0, 1, 2, 0 }));
    const Eigen::SparseMatrix<int> full = repeated.AdjacencyMask();
    tester.assert_equal(3, static_cast<int>(full.rows()), "repeated ids keep the atom dimension");
    tester.assert_equal(9, static_cast<int>(full.nonZeros()), "every pair is adjacent");

    Geometry points(2, 3);
    points << 0.5, 0.0, 0.0,
        3.0, 0.0, 0.0;
    repeated.Populate(points, 2, std::numeric_limits<double>::infinity(), 1.2, false);
    tester.assert_throws<ConfigurationError>([&]() { repeated.AdjacencyMask(); }, "rows of arbitrary points are not atoms");
    tester.assert_throws<ConfigurationError>([&]() { repeated.ShellMatrix(); }, "no shell matrices for arbitrary points");
}

int main()
{
    HaloLogger::initialize(1, false);

    std::cout << "=== Graph Analysis Test Suite ===" << std::endl;

    HaloTester tester;
    test_cluster_analysis(tester);
    test_bonds(tester);
    test_find_by_vector(tester);
    test_adjacency_mask(tester);
    test_selected_rows(tester);

    return tester.print_summary();
}
