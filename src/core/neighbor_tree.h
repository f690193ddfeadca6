/*
 * <Neighbor search engine reusing one spatial index>
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
#include <memory>
#include <optional>
#include <random>
#include <string>

#include "src/core/global.h"
#include "src/core/neighbor_estimator.h"
#include "src/core/neighbor_settings.h"
#include "src/core/neighbor_table.h"
#include "src/core/periodic_halo.h"
#include "src/core/spatial_index.h"
#include "src/core/structure.h"

namespace halo {

/*! \brief Neighbor information of arbitrary positions
 *
 * Owns a copy of the reference structure, the periodic halo and the k-d tree
 * built over it, and the neighbor table of the last query. Copies share the
 * halo and the tree, so neighborhoods of new positions are cheap as long as
 * the reference structure did not change.
 *
 * Views (Distances, Indices, Vectors, AtomNumbers) present the table in the
 * configured Mode unless another one is passed.
 *
 * \code
 * halo::NeighborTree tree = halo::GetTree(structure, settings);
 * auto neighborhood = tree.GetNeighborhood(positions, 6);
 * auto distances = neighborhood.Distances(halo::Mode::Ragged);
 * \endcode
 */
class NeighborTree {
public:
    explicit NeighborTree(const Structure& structure, const NeighborSettings& settings = NeighborSettings());
    virtual ~NeighborTree() = default;

    /*! \brief Build halo and k-d tree sized for the given search
     *
     * \throws ConfigurationError if neither num_neighbors nor a finite cutoff_radius is given
     */
    void BuildIndex(std::optional<int> num_neighbors, double cutoff_radius, double width_buffer);
    inline bool hasIndex() const { return static_cast<bool>(m_index); }

    /*! \brief Search the shared index, no state other than the frozen search size is touched
     *
     * \throws InfeasibleSearchError if the index holds fewer points than requested for an unbounded search
     */
    NeighborTable Query(const Geometry& positions, std::optional<int> num_neighbors,
        double cutoff_radius = std::numeric_limits<double>::infinity(), double width_buffer = 1.2);

    /*! \brief Replace the table by the neighbors of positions
     *
     * With exclude_self one extra slot is searched and the first column (the
     * query atom itself) is dropped. Columns beyond the longest finite row are
     * removed.
     */
    void Populate(const Geometry& positions, std::optional<int> num_neighbors, double cutoff_radius,
        double width_buffer, bool exclude_self);

    /*! \brief New engine sharing the index, holding the neighbors of positions */
    NeighborTree GetNeighborhood(const Geometry& positions, std::optional<int> num_neighbors = 12,
        double cutoff_radius = std::numeric_limits<double>::infinity(), double width_buffer = 1.2) const;

    NeighborTree Copy() const { return *this; }

    NeighborView<double> Distances() const { return m_table.Distances(m_settings.mode); }
    NeighborView<double> Distances(Mode mode) const { return m_table.Distances(mode); }
    NeighborView<int> Indices() const { return m_table.Indices(m_settings.mode); }
    NeighborView<int> Indices(Mode mode) const { return m_table.Indices(mode); }
    NeighborView<Position> Vectors() const { return m_table.Vectors(m_settings.mode); }
    NeighborView<Position> Vectors(Mode mode) const { return m_table.Vectors(mode); }
    NeighborView<int> AtomNumbers() const { return m_table.AtomNumbers(m_settings.mode); }
    NeighborView<int> AtomNumbers(Mode mode) const { return m_table.AtomNumbers(mode); }

    /*! \brief Neighbor quantities of new positions from the shared index, the stored table is left alone */
    NeighborView<double> GetDistances(const Geometry& positions, std::optional<Mode> mode = std::nullopt,
        std::optional<int> num_neighbors = std::nullopt, double cutoff_radius = std::numeric_limits<double>::infinity(),
        double width_buffer = 1.2);
    NeighborView<int> GetIndices(const Geometry& positions, std::optional<Mode> mode = std::nullopt,
        std::optional<int> num_neighbors = std::nullopt, double cutoff_radius = std::numeric_limits<double>::infinity(),
        double width_buffer = 1.2);
    NeighborView<Position> GetVectors(const Geometry& positions, std::optional<Mode> mode = std::nullopt,
        std::optional<int> num_neighbors = std::nullopt, double cutoff_radius = std::numeric_limits<double>::infinity(),
        double width_buffer = 1.2);

    std::vector<int> NumbersOfNeighbors() const { return m_table.NumbersOfNeighbors(); }

    inline Mode getMode() const { return m_settings.mode; }
    inline void setMode(Mode mode) { m_settings.mode = mode; }
    inline void setMode(const std::string& mode) { m_settings.mode = ParseMode(mode); }

    inline int NormOrder() const { return m_settings.norm_order; }
    /*! \brief Always throws, the norm order is fixed by the index */
    [[noreturn]] void setNormOrder(int norm_order);

    inline bool WrapPositions() const { return m_settings.wrap_positions; }
    inline void setWrapPositions(bool wrap) { m_settings.wrap_positions = wrap; }

    inline std::optional<int> NumNeighbors() const { return m_estimator.NumNeighbors(); }
    inline double CutoffRadius() const { return m_estimator.CutoffRadius(); }
    inline double Width() const { return m_halo ? m_halo->Width() : 0.0; }

    inline const Structure& getStructure() const { return m_structure; }
    inline const NeighborSettings& Settings() const { return m_settings; }
    inline const NeighborTable& Table() const { return m_table; }
    /*! \throws ConfigurationError before BuildIndex */
    const PeriodicHalo& Halo() const;

    /*! \brief True if neighbor vectors reach beyond the halo width along periodic axes */
    bool CheckWidth(double width) const;

    /*! \brief Per row average of Y_l^m over the neighbors closer than cutoff_radius
     *
     * \throws DegenerateGeometryError if a row has no such neighbor
     */
    ComplexVector SphericalHarmonics(int l, int m, double cutoff_radius = std::numeric_limits<double>::infinity(),
        const std::optional<Eigen::Matrix3d>& rotation = std::nullopt) const;

    /*! \brief Steinhardt parameter Q_l per row under one fresh random rotation */
    Vector SteinhardtParameter(int l, double cutoff_radius = std::numeric_limits<double>::infinity());

    std::string Summary() const;

protected:
    /*! \brief Called whenever the table was replaced */
    virtual void TableChanged() {}

    Structure m_structure;
    NeighborSettings m_settings;
    NeighborEstimator m_estimator;
    NeighborTable m_table;

    std::shared_ptr<const PeriodicHalo> m_halo;
    std::shared_ptr<const SpatialIndex> m_index;

    std::mt19937 m_generator;
};

} // namespace halo
