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

#pragma once

#include <limits>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <Eigen/Sparse>

#include "src/core/global.h"
#include "src/core/neighbor_table.h"

namespace halo {
namespace GraphAnalysis {

struct ClusterResult {
    std::map<int, std::vector<int>> clusters; //!< cluster id (from 1) -> ascending atom ids
    std::vector<int> sizes; //!< sizes[c - 1] is the size of cluster c
};

struct VectorMatch {
    std::vector<int> ids; //!< matched atom per row, the row itself for the zero vector
    std::vector<double> deviations; //!< Lp distance between the matched and the requested vector
};

/*! \brief Per row: element -> groups of neighbor ids */
typedef std::vector<std::map<std::string, std::vector<std::vector<int>>>> BondList;

/*! \brief Connected components of the neighbor graph restricted to id_list
 *
 * row_atoms[r] is the atom whose neighbors are listed in row r. Seeds are taken
 * in the order of id_list; edges are followed from an atom to the entries of
 * its row, only to atoms that are part of id_list. Sentinel entries are ignored.
 *
 * \throws ConfigurationError if an atom of id_list is out of range or has no row
 */
ClusterResult ClusterAnalysis(const IndexMatrix& indices, const std::vector<int>& row_atoms, int atom_count,
    const std::vector<int>& id_list);

/*! \brief Neighbor groups separated by distance gaps
 *
 * Per row, the neighbors strictly closer than radius are split wherever two
 * consecutive distances differ by more than prec. Each group is sorted and
 * split by element; an element receives at most max_shells groups.
 */
BondList Bonds(const Matrix& distances, const IndexMatrix& indices, const StringList& symbols,
    double radius = std::numeric_limits<double>::infinity(), std::optional<int> max_shells = std::nullopt, double prec = 0.1);

/*! \brief Neighbor reached by a translation vector
 *
 * A virtual zero vector pointing to the atom itself is considered together
 * with all neighbor vectors of the row; the candidate closest to vector in the
 * Lp norm wins, the first one on ties.
 */
VectorMatch FindNeighborsByVector(const NeighborTable& table, const std::vector<int>& row_atoms, const Position& vector,
    int norm_order = 2);

/*! \brief Symmetric 0/1 adjacency of all pairs with a finite neighbor entry closer than cutoff_radius
 *
 * The diagonal is always set. With expand_cartesian each atom entry becomes a
 * 3x3 block, giving the 3N x 3N sparsity pattern of a Hessian.
 */
Eigen::SparseMatrix<int> AdjacencyMask(const NeighborTable& table, const std::vector<int>& row_atoms, int atom_count,
    double cutoff_radius = std::numeric_limits<double>::infinity(), bool expand_cartesian = false);

} // namespace GraphAnalysis
} // namespace halo
