/*
 * <Coordination shells from neighbor distances>
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

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <Eigen/Sparse>

#include "src/core/global.h"

namespace halo {

/*! \brief Result of clustering the finite slots of a neighbor table
 *
 * centers holds one row per cluster (3 columns for vectors, 1 for distances),
 * labels has the shape of the table with -1 on sentinel slots.
 */
struct ClusterModel {
    Matrix centers;
    IndexMatrix labels;

    /*! \brief Distance represented by every slot, +inf for sentinel slots
     *
     * For vector clusters this is the Lp norm of the center, for distance
     * clusters the center itself.
     */
    Matrix EffectiveDistances(int norm_order) const;
};

namespace ShellClassifier {

/*! \brief Round to decimals places, half to even */
double Round(double value, int decimals);

/*! \brief Shell ids consistent within each row
 *
 * Finite distances of a row are rounded to tolerance decimals; the rank of the
 * rounded value among the distinct values of the row plus one is the shell id.
 * Sentinel slots get SentinelShell.
 */
IndexMatrix LocalShells(const Matrix& distances, int tolerance);

/*! \brief Shell ids consistent over the whole table
 *
 * The distinct rounded finite distances of all rows form the shell list; every
 * finite slot receives the id of the closest list entry.
 */
IndexMatrix GlobalShells(const Matrix& distances, int tolerance);

/*! \brief Rounded distinct finite distances, ascending (the global shell radii) */
std::vector<double> ShellDistances(const Matrix& distances, int tolerance);

/*! \brief One atom x atom matrix per global shell
 *
 * M(j, i) counts how often atom j appears in the row of atom i (row_atoms[r]
 * is the atom of row r) within the shell. With
 * chemical_pair only entries whose (row, neighbor) elements form that
 * unordered pair are counted.
 */
std::vector<Eigen::SparseMatrix<int>> ShellMatrices(const IndexMatrix& indices, const IndexMatrix& global_shells,
    const std::vector<int>& row_atoms, int atom_count, const StringList& symbols,
    const std::optional<std::pair<std::string, std::string>>& chemical_pair = std::nullopt);

} // namespace ShellClassifier
} // namespace halo
