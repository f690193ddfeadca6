/*
 * <Periodic Boundary Conditions Utilities>
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
 * Convention: the rows of a cell matrix are the lattice vectors a, b, c.
 * Cartesian positions are rows as well, so  x = f * cell  and  f = x * cell^-1.
 */

#pragma once

#include <Eigen/Dense>
#include <cmath>

#include "src/core/global.h"

namespace PBCUtils {

/*! \brief Convert Cartesian rows to fractional coordinates
 * \param positions N x 3 Cartesian coordinates (Angstroms)
 * \param cell 3x3 lattice vector matrix (rows)
 * \return N x 3 fractional coordinates
 */
inline Geometry toFractional(const Geometry& positions, const Cell& cell)
{
    return positions * cell.inverse();
}

/*! \brief Fold positions into the primary cell along periodic axes
 * \param positions N x 3 Cartesian coordinates
 * \param cell 3x3 lattice vector matrix (rows)
 * \param pbc periodicity per lattice direction
 * \param epsilon buffer added in fractional units before flooring
 * \return folded positions; non-periodic axes are left untouched
 *
 * The buffer keeps points sitting on a cell face (up to rounding) on the
 * lower face, so repeated folding does not flip them between both faces.
 */
inline Geometry wrapPositions(const Geometry& positions, const Cell& cell, const Periodicity& pbc, double epsilon = 1.0e-12)
{
    if (!pbc[0] && !pbc[1] && !pbc[2])
        return positions;

    const Cell inverse = cell.inverse();
    Geometry wrapped = positions;
    for (int i = 0; i < positions.rows(); ++i) {
        Eigen::RowVector3d frac = positions.row(i) * inverse;
        Eigen::RowVector3d shift_frac = Eigen::RowVector3d::Zero();
        for (int axis = 0; axis < 3; ++axis)
            shift_frac(axis) = std::floor(frac(axis) + epsilon);
        Eigen::RowVector3d shift = shift_frac * cell;
        for (int axis = 0; axis < 3; ++axis)
            if (pbc[axis])
                wrapped(i, axis) -= shift(axis);
    }
    return wrapped;
}

/*! \brief Perpendicular height of the cell along each lattice direction
 *
 *  h_i = |det(cell)| / || a_{i+1} x a_{i-1} ||_p
 *
 * For p = 2 this is the distance between the two faces spanned by the other
 * two lattice vectors.
 */
inline Eigen::Vector3d verticalLengths(const Cell& cell, int p = 2)
{
    const double volume = std::abs(cell.determinant());
    Eigen::Vector3d heights;
    for (int i = 0; i < 3; ++i) {
        const Position next = cell.row((i + 1) % 3).transpose();
        const Position previous = cell.row((i + 2) % 3).transpose();
        heights(i) = volume / halo::LpNorm(next.cross(previous), p);
    }
    return heights;
}

/*! \brief Lp norm of each lattice vector */
inline Eigen::Vector3d cellLengths(const Cell& cell, int p = 2)
{
    Eigen::Vector3d lengths;
    for (int i = 0; i < 3; ++i)
        lengths(i) = halo::LpNorm(cell.row(i).transpose(), p);
    return lengths;
}

/*! \brief Check if a unit cell is valid
 * \return true if all lattice vectors are non-zero and the volume is finite
 *
 * Only the absolute volume is tested, left-handed cells are accepted.
 */
inline bool isValidUnitCell(const Cell& cell)
{
    if (cell.row(0).norm() < 1e-6 || cell.row(1).norm() < 1e-6 || cell.row(2).norm() < 1e-6) {
        return false;
    }
    return std::abs(cell.determinant()) > 1e-6;
}

} // namespace PBCUtils
