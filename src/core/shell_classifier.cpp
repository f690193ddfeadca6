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

#include "shell_classifier.h"

#include "src/core/neighbor_errors.h"

#include <fmt/core.h>

#include <algorithm>
#include <cmath>

namespace halo {

Matrix ClusterModel::EffectiveDistances(int norm_order) const
{
    Matrix distances = Matrix::Constant(labels.rows(), labels.cols(), SentinelDistance);
    for (int row = 0; row < labels.rows(); ++row)
        for (int slot = 0; slot < labels.cols(); ++slot) {
            const int label = labels(row, slot);
            if (label < 0)
                continue;
            if (centers.cols() == 1)
                distances(row, slot) = centers(label, 0);
            else
                distances(row, slot) = LpNorm(centers.row(label).transpose(), norm_order);
        }
    return distances;
}

namespace ShellClassifier {

double Round(double value, int decimals)
{
    const double scale = std::pow(10.0, decimals);
    return std::nearbyint(value * scale) / scale;
}

IndexMatrix LocalShells(const Matrix& distances, int tolerance)
{
    IndexMatrix shells = IndexMatrix::Constant(distances.rows(), distances.cols(), SentinelShell);
    std::vector<double> rounded;
    for (int row = 0; row < distances.rows(); ++row) {
        rounded.clear();
        for (int slot = 0; slot < distances.cols(); ++slot)
            if (!IsSentinel(distances(row, slot)))
                rounded.push_back(Round(distances(row, slot), tolerance));
        std::vector<double> unique = rounded;
        std::sort(unique.begin(), unique.end());
        unique.erase(std::unique(unique.begin(), unique.end()), unique.end());

        for (int slot = 0; slot < distances.cols(); ++slot) {
            if (IsSentinel(distances(row, slot)))
                continue;
            const double value = Round(distances(row, slot), tolerance);
            shells(row, slot) = static_cast<int>(std::lower_bound(unique.begin(), unique.end(), value) - unique.begin()) + 1;
        }
    }
    return shells;
}

std::vector<double> ShellDistances(const Matrix& distances, int tolerance)
{
    std::vector<double> unique;
    for (int row = 0; row < distances.rows(); ++row)
        for (int slot = 0; slot < distances.cols(); ++slot)
            if (!IsSentinel(distances(row, slot)))
                unique.push_back(Round(distances(row, slot), tolerance));
    std::sort(unique.begin(), unique.end());
    unique.erase(std::unique(unique.begin(), unique.end()), unique.end());
    return unique;
}

IndexMatrix GlobalShells(const Matrix& distances, int tolerance)
{
    const std::vector<double> shell_list = ShellDistances(distances, tolerance);
    IndexMatrix shells = IndexMatrix::Constant(distances.rows(), distances.cols(), SentinelShell);
    for (int row = 0; row < distances.rows(); ++row)
        for (int slot = 0; slot < distances.cols(); ++slot) {
            const double d = distances(row, slot);
            if (IsSentinel(d))
                continue;
            // nearest entry of the sorted list, the lower one on ties
            auto upper = std::lower_bound(shell_list.begin(), shell_list.end(), d);
            int shell = static_cast<int>(upper - shell_list.begin());
            if (upper == shell_list.end() || (upper != shell_list.begin() && std::abs(d - *(upper - 1)) <= std::abs(*upper - d)))
                shell -= 1;
            shells(row, slot) = shell + 1;
        }
    return shells;
}

std::vector<Eigen::SparseMatrix<int>> ShellMatrices(const IndexMatrix& indices, const IndexMatrix& global_shells,
    const std::vector<int>& row_atoms, int atom_count, const StringList& symbols,
    const std::optional<std::pair<std::string, std::string>>& chemical_pair)
{
    if (static_cast<Eigen::Index>(row_atoms.size()) != indices.rows())
        throw ConfigurationError(fmt::format("{} row atom ids given for a table of {} rows", row_atoms.size(), indices.rows()));
    for (int atom : row_atoms)
        if (atom < 0 || atom >= atom_count)
            throw ConfigurationError(fmt::format("Row atom id {} out of range [0, {})", atom, atom_count));

    typedef Eigen::Triplet<int> T;
    const int shell_count = global_shells.size() > 0 ? std::max(0, global_shells.maxCoeff()) : 0;
    std::vector<std::vector<T>> triplets(shell_count);

    std::pair<std::string, std::string> pair;
    if (chemical_pair) {
        pair = *chemical_pair;
        if (pair.second < pair.first)
            std::swap(pair.first, pair.second);
    }

    for (int row = 0; row < indices.rows(); ++row)
        for (int slot = 0; slot < indices.cols(); ++slot) {
            const int atom = row_atoms[row];
            const int shell = global_shells(row, slot);
            const int neighbor = indices(row, slot);
            if (shell < 1 || neighbor >= atom_count)
                continue;
            if (chemical_pair) {
                std::pair<std::string, std::string> elements(symbols[neighbor], symbols[atom]);
                if (elements.second < elements.first)
                    std::swap(elements.first, elements.second);
                if (elements != pair)
                    continue;
            }
            triplets[shell - 1].emplace_back(neighbor, atom, 1);
        }

    std::vector<Eigen::SparseMatrix<int>> matrices;
    matrices.reserve(shell_count);
    for (int shell = 0; shell < shell_count; ++shell) {
        Eigen::SparseMatrix<int> matrix(atom_count, atom_count);
        matrix.setFromTriplets(triplets[shell].begin(), triplets[shell].end());
        matrices.push_back(matrix);
    }
    return matrices;
}

} // namespace ShellClassifier
} // namespace halo
