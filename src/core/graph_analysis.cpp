/*
 * <Graph analysis on the implicit neighbor graph>
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

#include "graph_analysis.h"

#include "src/core/neighbor_errors.h"

#include <fmt/core.h>

#include <algorithm>
#include <stack>

namespace halo {
namespace GraphAnalysis {

namespace {

void checkRowAtoms(int rows, const std::vector<int>& row_atoms, int atom_count)
{
    if (static_cast<int>(row_atoms.size()) != rows)
        throw ConfigurationError(fmt::format("{} row atom ids given for a table of {} rows", row_atoms.size(), rows));
    for (int atom : row_atoms)
        if (atom < 0 || atom >= atom_count)
            throw ConfigurationError(fmt::format("Row atom id {} out of range [0, {})", atom, atom_count));
}

} // namespace

ClusterResult ClusterAnalysis(const IndexMatrix& indices, const std::vector<int>& row_atoms, int atom_count,
    const std::vector<int>& id_list)
{
    checkRowAtoms(static_cast<int>(indices.rows()), row_atoms, atom_count);

    std::vector<int> atom_row(atom_count, -1);
    for (int row = static_cast<int>(row_atoms.size()) - 1; row >= 0; --row)
        atom_row[row_atoms[row]] = row;

    std::vector<bool> selected(atom_count, false);
    for (int id : id_list) {
        if (id < 0 || id >= atom_count)
            throw ConfigurationError(fmt::format("Atom id {} out of range [0, {})", id, atom_count));
        if (atom_row[id] < 0)
            throw ConfigurationError(fmt::format("Atom {} has no row in the neighbor table", id));
        selected[id] = true;
    }

    std::vector<int> cluster(atom_count, 0);
    int cluster_id = 1;
    for (int seed : id_list) {
        if (cluster[seed] != 0)
            continue;

        std::stack<int> stack;
        stack.push(seed);
        cluster[seed] = cluster_id;

        while (!stack.empty()) {
            const int current = atom_row[stack.top()];
            stack.pop();

            for (int slot = 0; slot < indices.cols(); ++slot) {
                const int neighbor = indices(current, slot);
                if (neighbor < 0 || neighbor >= atom_count)
                    continue;
                if (cluster[neighbor] == 0 && selected[neighbor]) {
                    cluster[neighbor] = cluster_id;
                    stack.push(neighbor);
                }
            }
        }
        cluster_id++;
    }

    ClusterResult result;
    result.sizes.assign(cluster_id - 1, 0);
    for (int c = 1; c < cluster_id; ++c)
        result.clusters[c] = {};
    for (int atom = 0; atom < atom_count; ++atom) {
        if (cluster[atom] == 0)
            continue;
        result.clusters[cluster[atom]].push_back(atom);
        result.sizes[cluster[atom] - 1]++;
    }
    return result;
}

BondList Bonds(const Matrix& distances, const IndexMatrix& indices, const StringList& symbols,
    double radius, std::optional<int> max_shells, double prec)
{
    BondList bonds(distances.rows());
    for (int row = 0; row < distances.rows(); ++row) {
        std::vector<std::vector<int>> groups;
        double previous = 0;
        for (int slot = 0; slot < distances.cols(); ++slot) {
            const double d = distances(row, slot);
            if (!(d < radius))
                continue;
            if (groups.empty() || d - previous > prec)
                groups.emplace_back();
            groups.back().push_back(indices(row, slot));
            previous = d;
        }

        auto& shells = bonds[row];
        for (auto& group : groups) {
            std::sort(group.begin(), group.end());
            std::vector<std::string> elements;
            std::map<std::string, std::vector<int>> by_element;
            for (int id : group) {
                const std::string& element = symbols.at(id);
                if (by_element.find(element) == by_element.end())
                    elements.push_back(element);
                by_element[element].push_back(id);
            }
            for (const auto& element : elements) {
                auto& element_shells = shells[element];
                if (max_shells && static_cast<int>(element_shells.size()) + 1 > *max_shells)
                    continue;
                element_shells.push_back(by_element[element]);
            }
        }
    }
    return bonds;
}

VectorMatch FindNeighborsByVector(const NeighborTable& table, const std::vector<int>& row_atoms, const Position& vector,
    int norm_order)
{
    if (static_cast<int>(row_atoms.size()) != table.Rows())
        throw ConfigurationError(fmt::format("{} row atom ids given for a table of {} rows", row_atoms.size(), table.Rows()));

    VectorMatch match;
    match.ids.resize(table.Rows());
    match.deviations.resize(table.Rows());

    for (int row = 0; row < table.Rows(); ++row) {
        int best = row_atoms[row];
        double best_deviation = LpNorm(-vector, norm_order);
        for (int slot = 0; slot < table.Columns(); ++slot) {
            if (IsSentinel(table.distances()(row, slot)))
                continue;
            const double deviation = LpNorm(table.Vector(row, slot) - vector, norm_order);
            if (deviation < best_deviation) {
                best_deviation = deviation;
                best = table.indices()(row, slot);
            }
        }
        match.ids[row] = best;
        match.deviations[row] = best_deviation;
    }
    return match;
}

Eigen::SparseMatrix<int> AdjacencyMask(const NeighborTable& table, const std::vector<int>& row_atoms, int atom_count,
    double cutoff_radius, bool expand_cartesian)
{
    checkRowAtoms(table.Rows(), row_atoms, atom_count);

    typedef Eigen::Triplet<int> T;
    std::vector<IntPair> pairs;
    for (int atom = 0; atom < atom_count; ++atom)
        pairs.emplace_back(atom, atom);
    for (int row = 0; row < table.Rows(); ++row)
        for (int slot = 0; slot < table.Columns(); ++slot) {
            if (!(table.distances()(row, slot) < cutoff_radius))
                continue;
            const int atom = row_atoms[row];
            const int neighbor = table.indices()(row, slot);
            pairs.emplace_back(atom, neighbor);
            pairs.emplace_back(neighbor, atom);
        }

    const int block = expand_cartesian ? 3 : 1;
    std::vector<T> triplets;
    triplets.reserve(pairs.size() * block * block);
    for (const auto& pair : pairs)
        for (int a = 0; a < block; ++a)
            for (int b = 0; b < block; ++b)
                triplets.emplace_back(pair.first * block + a, pair.second * block + b, 1);

    Eigen::SparseMatrix<int> mask(atom_count * block, atom_count * block);
    mask.setFromTriplets(triplets.begin(), triplets.end(), [](const int& a, const int&) { return a; });
    return mask;
}

} // namespace GraphAnalysis
} // namespace halo
