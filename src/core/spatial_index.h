/*
 * <k-d tree over the extended positions of a periodic structure>
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

#include "src/core/global.h"
#include "src/core/periodic_halo.h"

namespace halo {

/*! \brief Static k-d tree answering k-nearest queries under an Lp metric
 *
 * Built once over PeriodicHalo::Positions() and never modified afterwards.
 * Several engines may share one index (GetNeighborhood, Copy), queries are
 * const and touch no state of the index.
 */
class SpatialIndex {
public:
    SpatialIndex(std::shared_ptr<const PeriodicHalo> halo, int norm_order = 2);
    ~SpatialIndex();

    SpatialIndex(const SpatialIndex&) = delete;
    SpatialIndex& operator=(const SpatialIndex&) = delete;

    /*! \brief k nearest extended points of every row of points
     *
     * \param points P x 3 Cartesian query positions
     * \param k number of slots per row
     * \param radius entries not strictly closer than radius become +inf / SentinelIndex
     * \param distances P x k, ascending per row
     * \param extended_indices P x k row indices into the extended positions
     */
    void Query(const Geometry& points, int k, double radius, Matrix& distances, IndexMatrix& extended_indices) const;

    inline int Size() const { return m_halo->Size(); }
    inline int NormOrder() const { return m_norm_order; }
    inline const PeriodicHalo& Halo() const { return *m_halo; }

private:
    struct Impl;

    std::shared_ptr<const PeriodicHalo> m_halo;
    int m_norm_order = 2;
    std::unique_ptr<Impl> m_impl;
};

} // namespace halo
