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

#include "spatial_index.h"

#include "src/core/neighbor_errors.h"

#include <nanoflann.hpp>

#include <fmt/core.h>

#include <cmath>
#include <vector>

namespace halo {

namespace {

/* nanoflann dataset adaptor over the row-major extended positions */
struct ExtendedCloud {
    const Geometry& positions;

    inline size_t kdtree_get_point_count() const { return static_cast<size_t>(positions.rows()); }
    inline double kdtree_get_pt(const size_t idx, const size_t dim) const { return positions(idx, dim); }

    template <class BBOX>
    bool kdtree_get_bbox(BBOX& /* bb */) const { return false; }
};

/* Separable Lp metric, accumulates sum |a_i - b_i|^p; the root is taken after the search */
template <class T, class DataSource, typename Accumulator = T>
struct LpAdaptor {
    typedef T ElementType;
    typedef Accumulator DistanceType;

    const DataSource& data_source;
    int p;

    LpAdaptor(const DataSource& _data_source)
        : data_source(_data_source)
        , p(2)
    {
    }

    inline DistanceType power(DistanceType diff) const
    {
        diff = std::abs(diff);
        switch (p) {
        case 1:
            return diff;
        case 2:
            return diff * diff;
        default:
            return std::pow(diff, p);
        }
    }

    inline DistanceType evalMetric(const T* a, const size_t b_idx, size_t size, DistanceType worst_dist = -1) const
    {
        DistanceType result = DistanceType();
        for (size_t i = 0; i < size; ++i) {
            result += power(a[i] - data_source.kdtree_get_pt(b_idx, i));
            if (worst_dist > 0 && result > worst_dist)
                return result;
        }
        return result;
    }

    template <typename U, typename V>
    inline DistanceType accum_dist(const U a, const V b, const size_t) const
    {
        return power(a - b);
    }
};

typedef LpAdaptor<double, ExtendedCloud> Metric;
typedef nanoflann::KDTreeSingleIndexAdaptor<Metric, ExtendedCloud, 3, size_t> KDTree;

} // namespace

struct SpatialIndex::Impl {
    ExtendedCloud cloud;
    std::unique_ptr<KDTree> tree;

    Impl(const Geometry& positions, int norm_order)
        : cloud{ positions }
    {
        if (positions.rows() == 0)
            return;
        tree = std::make_unique<KDTree>(3, cloud, nanoflann::KDTreeSingleIndexAdaptorParams(10));
        tree->distance.p = norm_order;
        tree->buildIndex();
    }
};

SpatialIndex::SpatialIndex(std::shared_ptr<const PeriodicHalo> halo, int norm_order)
    : m_halo(std::move(halo))
    , m_norm_order(norm_order)
{
    if (norm_order < 1)
        throw ConfigurationError(fmt::format("norm_order must be at least 1, got {}", norm_order));
    m_impl = std::make_unique<Impl>(m_halo->Positions(), norm_order);
}

SpatialIndex::~SpatialIndex() = default;

void SpatialIndex::Query(const Geometry& points, int k, double radius, Matrix& distances, IndexMatrix& extended_indices) const
{
    const Eigen::Index rows = points.rows();
    distances = Matrix::Constant(rows, k, SentinelDistance);
    extended_indices = IndexMatrix::Constant(rows, k, SentinelIndex);
    if (!m_impl->tree || k <= 0)
        return;

    const double p = m_norm_order;
    const double bound = std::isinf(radius) ? radius : std::pow(radius, p);

    std::vector<size_t> indices(k);
    std::vector<double> powered(k);
    for (Eigen::Index row = 0; row < rows; ++row) {
        const double query[3] = { points(row, 0), points(row, 1), points(row, 2) };
        const size_t found = m_impl->tree->knnSearch(query, static_cast<size_t>(k), indices.data(), powered.data());
        for (size_t slot = 0; slot < found; ++slot) {
            if (!(powered[slot] < bound))
                break;
            distances(row, slot) = m_norm_order == 2 ? std::sqrt(powered[slot]) : std::pow(powered[slot], 1.0 / p);
            extended_indices(row, slot) = static_cast<int>(indices[slot]);
        }
    }
}

} // namespace halo
