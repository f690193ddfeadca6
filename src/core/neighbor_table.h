/*
 * <Canonical neighbor table and its filled / ragged / flattened views>
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

#include <memory>
#include <vector>

#include "src/core/global.h"
#include "src/core/neighbor_settings.h"
#include "src/core/periodic_halo.h"

namespace halo {

/*! \brief One presentation of a per-slot quantity
 *
 * values holds the entries row after row. Row i occupies
 * values[offsets[i] .. offsets[i+1]) and atom_numbers[j] is the row owning
 * values[j]. For Mode::Filled every row has the full slot count and sentinel
 * entries are included; Ragged and Flattened keep only the finite prefix of
 * each row.
 */
template <typename T>
struct NeighborView {
    Mode mode = Mode::Filled;
    std::vector<T> values;
    std::vector<int> offsets;
    std::vector<int> atom_numbers;

    inline int Rows() const { return offsets.empty() ? 0 : static_cast<int>(offsets.size()) - 1; }
    inline int Size() const { return static_cast<int>(values.size()); }
    inline int RowSize(int row) const { return offsets[row + 1] - offsets[row]; }
    inline const T& at(int row, int slot) const { return values[offsets[row] + slot]; }

    /*! \brief Copy of one row */
    std::vector<T> Row(int row) const
    {
        return std::vector<T>(values.begin() + offsets[row], values.begin() + offsets[row + 1]);
    }
};

/*! \brief Single reshape used for every quantity and every mode
 *
 * \param distances canonical P x K distances, defines which slots are finite
 * \param get functor (row, slot) -> T reading the canonical storage
 */
template <typename T, typename Getter>
NeighborView<T> Reshape(Mode mode, const Matrix& distances, Getter&& get)
{
    NeighborView<T> view;
    view.mode = mode;
    const int rows = static_cast<int>(distances.rows());
    const int cols = static_cast<int>(distances.cols());
    view.offsets.reserve(rows + 1);
    view.offsets.push_back(0);
    for (int row = 0; row < rows; ++row) {
        int length = cols;
        if (mode != Mode::Filled) {
            // rows are ascending, finite entries form a prefix
            length = 0;
            while (length < cols && !IsSentinel(distances(row, length)))
                ++length;
        }
        for (int slot = 0; slot < length; ++slot) {
            view.values.push_back(get(row, slot));
            view.atom_numbers.push_back(row);
        }
        view.offsets.push_back(static_cast<int>(view.values.size()));
    }
    return view;
}

/*! \brief Reshape of an integer matrix sharing the layout of distances (indices, shells) */
NeighborView<int> Reshape(Mode mode, const Matrix& distances, const IndexMatrix& values);

/*! \brief Canonical filled storage of one query
 *
 * P query rows with K slots each, rows ascending by distance. Empty slots carry
 * SentinelDistance and SentinelIndex together. Vectors are rebuilt on first
 * access from the extended positions and cached until the table is replaced.
 */
class NeighborTable {
public:
    NeighborTable() = default;

    /*! \param positions wrapped query positions (P x 3) the vectors are measured from */
    NeighborTable(Matrix distances, IndexMatrix indices, IndexMatrix extended_indices, Geometry positions,
        std::shared_ptr<const PeriodicHalo> halo);

    /*! \brief False until a query has filled the table */
    inline bool isPopulated() const { return m_populated; }
    inline int Rows() const { return static_cast<int>(m_distances.rows()); }
    inline int Columns() const { return static_cast<int>(m_distances.cols()); }

    inline const Matrix& distances() const { return m_distances; }
    inline const IndexMatrix& indices() const { return m_indices; }
    inline const IndexMatrix& extendedIndices() const { return m_extended_indices; }
    inline const Geometry& positions() const { return m_positions; }

    /*! \brief (P*K) x 3 vectors, row r * K + s belongs to slot s of query r */
    const Geometry& vectors() const;
    inline Position Vector(int row, int slot) const { return vectors().row(row * Columns() + slot).transpose(); }
    inline bool hasVectors() const { return m_vectors_ready; }

    NeighborView<double> Distances(Mode mode) const;
    NeighborView<int> Indices(Mode mode) const;
    NeighborView<Position> Vectors(Mode mode) const;
    NeighborView<int> AtomNumbers(Mode mode) const;

    /*! \brief Number of finite entries per row */
    std::vector<int> NumbersOfNeighbors() const;

    /*! \brief Largest number of finite entries of any row */
    int MaxFiniteColumns() const;

    /*! \brief Keep the slots [first, last) of every row */
    void TrimColumns(int first, int last);

    /*! \brief True if a neighbor vector reaches further along the periodic axes than the halo
     *
     * The Lp norm of the periodic components of every finite vector is compared
     * to width. A hit means the halo may have been too thin to hold all
     * neighbors.
     */
    bool CheckWidth(double width, const Periodicity& pbc, int norm_order) const;

private:
    Matrix m_distances;
    IndexMatrix m_indices;
    IndexMatrix m_extended_indices;
    Geometry m_positions;
    std::shared_ptr<const PeriodicHalo> m_halo;
    bool m_populated = false;

    mutable Geometry m_vectors;
    mutable bool m_vectors_ready = false;
};

} // namespace halo
