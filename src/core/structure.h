/*
 * <Reference structure: positions, lattice cell, periodicity and element labels>
 * Copyright (C) 2019 - 2025 Conrad Hübler <Conrad.Huebler@gmx.net>
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

#include <string>
#include <vector>

#include <Eigen/Dense>

#include "src/core/global.h"

namespace halo {

/*! \brief Immutable atomic structure snapshot
 *
 * Holds N Cartesian positions (rows), the 3x3 cell with the lattice vectors as
 * rows, a periodicity flag per lattice direction and one chemical symbol per
 * atom. Neighbor engines take a copy at construction time, so later changes to
 * the caller's structure never reach an existing spatial index.
 *
 * \note Non-periodic structures may carry a zero cell. Density based estimates
 * (VolumePerAtom) are then undefined and the engine requires an explicit
 * neighbor count.
 */
class Structure {
public:
    /*! \brief Periodic or partially periodic structure
     * \throws ConfigurationError on shape mismatch or a singular cell along a periodic axis
     */
    Structure(const Geometry& positions, const Cell& cell, const Periodicity& pbc, const StringList& symbols);

    /*! \brief Isolated cluster without cell and periodicity */
    Structure(const Geometry& positions, const StringList& symbols);

    Structure() = default;

    /*! \brief Cubic crystal built from the conventional cell
     * \param symbol element symbol used for every atom
     * \param a lattice constant (Angstroms)
     * \param lattice "sc", "bcc" or "fcc"
     * \param repeat number of conventional cells along each axis
     */
    static Structure Cubic(const std::string& symbol, double a, const std::string& lattice = "bcc", int repeat = 1);

    inline int AtomCount() const { return static_cast<int>(m_positions.rows()); }

    inline const Geometry& Positions() const { return m_positions; }
    inline Position Atom(int i) const { return m_positions.row(i).transpose(); }
    inline const Cell& getCell() const { return m_cell; }
    inline const Periodicity& PBC() const { return m_pbc; }
    inline const StringList& Symbols() const { return m_symbols; }
    inline const std::string& Symbol(int i) const { return m_symbols[i]; }

    /*! \brief Number of periodic lattice directions */
    int PeriodicAxes() const;
    inline bool isPeriodic() const { return PeriodicAxes() > 0; }

    double Volume() const;
    double VolumePerAtom() const;

    /*! \brief Positions folded into the primary cell along periodic axes */
    Geometry WrappedPositions(double epsilon = 1.0e-12) const;

    Eigen::Vector3d VerticalLengths(int p = 2) const;
    Eigen::Vector3d CellLengths(int p = 2) const;

private:
    void Validate() const;

    Geometry m_positions;
    Cell m_cell = Cell::Zero();
    Periodicity m_pbc = { false, false, false };
    StringList m_symbols;
};

} // namespace halo
