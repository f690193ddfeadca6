/*
 * <Atom level neighbor analysis: shells, clusters and graphs>
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

#include "neighbors.h"

#include "src/core/agglomerative_clustering.h"
#include "src/core/halo_logger.h"
#include "src/core/neighbor_errors.h"

#include <fmt/core.h>

#include <algorithm>
#include <numeric>

namespace halo {

Neighbors::Neighbors(const Structure& structure, const NeighborSettings& settings)
    : NeighborTree(structure, settings)
{
}

void Neighbors::TableChanged()
{
    m_shells.reset();
    m_vector_clusters.reset();
    m_distance_clusters.reset();

    m_row_atoms.reset();
    if (m_table.Rows() == m_structure.AtomCount()) {
        m_row_atoms = std::vector<int>(m_table.Rows());
        std::iota(m_row_atoms->begin(), m_row_atoms->end(), 0);
    }
}

const std::vector<int>& Neighbors::RowAtoms() const
{
    if (!m_row_atoms)
        throw ConfigurationError(fmt::format("The {} rows of the neighbor table are not assigned to atoms of the structure",
            m_table.Rows()));
    return *m_row_atoms;
}

void Neighbors::setRowAtoms(const std::vector<int>& row_atoms)
{
    if (static_cast<int>(row_atoms.size()) != m_table.Rows())
        throw ConfigurationError(fmt::format("{} row atom ids given for a table of {} rows", row_atoms.size(), m_table.Rows()));
    for (int atom : row_atoms)
        if (atom < 0 || atom >= m_structure.AtomCount())
            throw ConfigurationError(fmt::format("Atom id {} out of range [0, {})", atom, m_structure.AtomCount()));
    m_row_atoms = row_atoms;
}

NeighborView<std::string> Neighbors::ChemicalSymbols(std::optional<Mode> mode) const
{
    const IndexMatrix& indices = m_table.indices();
    const int atoms = m_structure.AtomCount();
    return Reshape<std::string>(mode.value_or(m_settings.mode), m_table.distances(), [&](int row, int slot) {
        const int index = indices(row, slot);
        return index < atoms ? m_structure.Symbol(index) : std::string("v");
    });
}

NeighborView<int> Neighbors::Shells(std::optional<Mode> mode)
{
    if (!m_shells)
        m_shells = ShellClassifier::LocalShells(m_table.distances(), m_settings.tolerance);
    return Reshape(mode.value_or(m_settings.mode), m_table.distances(), *m_shells);
}

double Neighbors::SmallestDistance() const
{
    double smallest = SentinelDistance;
    const Matrix& distances = m_table.distances();
    for (int row = 0; row < distances.rows(); ++row)
        for (int slot = 0; slot < distances.cols(); ++slot)
            smallest = std::min(smallest, distances(row, slot));
    return smallest;
}

IndexMatrix Neighbors::ExpandLabels(const std::vector<int>& labels) const
{
    const Matrix& distances = m_table.distances();
    IndexMatrix expanded = IndexMatrix::Constant(distances.rows(), distances.cols(), -1);
    size_t next = 0;
    for (int row = 0; row < distances.rows(); ++row)
        for (int slot = 0; slot < distances.cols(); ++slot)
            if (!IsSentinel(distances(row, slot)))
                expanded(row, slot) = labels[next++];
    return expanded;
}

void Neighbors::ClusterByVectors(std::optional<double> distance_threshold, std::optional<int> n_clusters,
    std::optional<std::string> linkage, std::optional<std::string> affinity)
{
    if (!m_table.isPopulated())
        throw ConfigurationError("neighbors not set");
    if (!distance_threshold && !n_clusters)
        distance_threshold = SmallestDistance();

    const Matrix& distances = m_table.distances();
    std::vector<int> finite_rows;
    for (int row = 0; row < distances.rows(); ++row)
        for (int slot = 0; slot < distances.cols(); ++slot)
            if (!IsSentinel(distances(row, slot)))
                finite_rows.push_back(row * m_table.Columns() + slot);

    const Geometry& vectors = m_table.vectors();
    Matrix samples(static_cast<Eigen::Index>(finite_rows.size()), 3);
    for (size_t i = 0; i < finite_rows.size(); ++i)
        samples.row(i) = vectors.row(finite_rows[i]);

    AgglomerativeClustering clustering(distance_threshold, n_clusters,
        ParseLinkage(linkage.value_or(m_settings.linkage)), ParseAffinity(affinity.value_or(m_settings.affinity)));
    clustering.Fit(samples);

    ClusterModel model;
    model.centers = clustering.Centers();
    model.labels = ExpandLabels(clustering.Labels());
    m_vector_clusters = std::move(model);
}

void Neighbors::ClusterByDistances(std::optional<double> distance_threshold, std::optional<int> n_clusters,
    std::optional<std::string> linkage, std::optional<std::string> affinity, bool use_vecs)
{
    if (!m_table.isPopulated())
        throw ConfigurationError("neighbors not set");
    if (!distance_threshold && !n_clusters)
        distance_threshold = 0.1 * SmallestDistance();

    std::vector<double> values;
    if (use_vecs) {
        if (!m_vector_clusters)
            ClusterByVectors();
        const Matrix clustered = m_vector_clusters->EffectiveDistances(m_settings.norm_order);
        for (int row = 0; row < clustered.rows(); ++row)
            for (int slot = 0; slot < clustered.cols(); ++slot)
                if (m_vector_clusters->labels(row, slot) >= 0)
                    values.push_back(clustered(row, slot));
    } else {
        const Matrix& distances = m_table.distances();
        for (int row = 0; row < distances.rows(); ++row)
            for (int slot = 0; slot < distances.cols(); ++slot)
                if (!IsSentinel(distances(row, slot)))
                    values.push_back(distances(row, slot));
    }

    Matrix samples(static_cast<Eigen::Index>(values.size()), 1);
    for (size_t i = 0; i < values.size(); ++i)
        samples(i, 0) = values[i];

    AgglomerativeClustering clustering(distance_threshold, n_clusters,
        ParseLinkage(linkage.value_or(m_settings.linkage)), ParseAffinity(affinity.value_or(m_settings.affinity)));
    clustering.Fit(samples);

    ClusterModel model;
    model.centers = clustering.Centers();
    model.labels = ExpandLabels(clustering.Labels());
    m_distance_clusters = std::move(model);
}

void Neighbors::ResetClusters(bool vecs, bool distances)
{
    if (vecs)
        m_vector_clusters.reset();
    if (distances)
        m_distance_clusters.reset();
}

Matrix Neighbors::ShellInput(bool cluster_by_distances, bool cluster_by_vecs)
{
    if (cluster_by_distances) {
        if (!m_distance_clusters)
            ClusterByDistances(std::nullopt, std::nullopt, std::nullopt, std::nullopt, cluster_by_vecs);
        return m_distance_clusters->EffectiveDistances(m_settings.norm_order);
    }
    if (cluster_by_vecs) {
        if (!m_vector_clusters)
            ClusterByVectors();
        return m_vector_clusters->EffectiveDistances(m_settings.norm_order);
    }
    return m_table.distances();
}

NeighborView<int> Neighbors::LocalShells(std::optional<Mode> mode, std::optional<int> tolerance,
    bool cluster_by_distances, bool cluster_by_vecs)
{
    const Matrix distances = ShellInput(cluster_by_distances, cluster_by_vecs);
    const IndexMatrix shells = ShellClassifier::LocalShells(distances, tolerance.value_or(m_settings.tolerance));
    return Reshape(mode.value_or(m_settings.mode), m_table.distances(), shells);
}

NeighborView<int> Neighbors::GlobalShells(std::optional<Mode> mode, std::optional<int> tolerance,
    bool cluster_by_distances, bool cluster_by_vecs)
{
    if (!m_table.isPopulated())
        throw ConfigurationError("neighbors not set");
    const Matrix distances = ShellInput(cluster_by_distances, cluster_by_vecs);
    const IndexMatrix shells = ShellClassifier::GlobalShells(distances, tolerance.value_or(m_settings.tolerance));
    return Reshape(mode.value_or(m_settings.mode), m_table.distances(), shells);
}

std::vector<Eigen::SparseMatrix<int>> Neighbors::ShellMatrix(
    const std::optional<std::pair<std::string, std::string>>& chemical_pair, bool cluster_by_distances, bool cluster_by_vecs)
{
    if (!m_table.isPopulated())
        throw ConfigurationError("neighbors not set");
    const Matrix distances = ShellInput(cluster_by_distances, cluster_by_vecs);
    const IndexMatrix shells = ShellClassifier::GlobalShells(distances, m_settings.tolerance);
    return ShellClassifier::ShellMatrices(m_table.indices(), shells, RowAtoms(), m_structure.AtomCount(), m_structure.Symbols(), chemical_pair);
}

GraphAnalysis::VectorMatch Neighbors::FindNeighborsByVector(const Position& vector) const
{
    return GraphAnalysis::FindNeighborsByVector(m_table, RowAtoms(), vector, m_settings.norm_order);
}

GraphAnalysis::ClusterResult Neighbors::ClusterAnalysis(const std::vector<int>& id_list) const
{
    return GraphAnalysis::ClusterAnalysis(m_table.indices(), RowAtoms(), m_structure.AtomCount(), id_list);
}

GraphAnalysis::BondList Neighbors::Bonds(double radius, std::optional<int> max_shells, double prec) const
{
    return GraphAnalysis::Bonds(m_table.distances(), m_table.indices(), m_structure.Symbols(), radius, max_shells, prec);
}

Eigen::SparseMatrix<int> Neighbors::AdjacencyMask(double cutoff_radius, bool expand_cartesian) const
{
    return GraphAnalysis::AdjacencyMask(m_table, RowAtoms(), m_structure.AtomCount(), cutoff_radius, expand_cartesian);
}

Neighbors GetNeighbors(const Structure& structure, const NeighborSettings& settings, const std::optional<std::vector<int>>& id_list)
{
    settings.Validate();

    Neighbors neighbors(structure, settings);
    neighbors.BuildIndex(settings.num_neighbors, settings.cutoff_radius, settings.width_buffer);

    Geometry positions = structure.WrappedPositions();
    if (id_list) {
        Geometry selected(static_cast<Eigen::Index>(id_list->size()), 3);
        for (size_t i = 0; i < id_list->size(); ++i) {
            const int id = (*id_list)[i];
            if (id < 0 || id >= structure.AtomCount())
                throw ConfigurationError(fmt::format("Atom id {} out of range [0, {})", id, structure.AtomCount()));
            selected.row(i) = positions.row(id);
        }
        positions = selected;
    }

    neighbors.Populate(positions, settings.num_neighbors, settings.cutoff_radius, settings.width_buffer, true);
    if (id_list)
        neighbors.setRowAtoms(*id_list);

    if (neighbors.CheckWidth(neighbors.Width()))
        HaloLogger::warn("width_buffer may have been too small - most likely not all neighbors properly assigned");

    if (HaloLogger::get_verbosity() >= 2) {
        HaloLogger::param_table(neighbors.Settings().toJson(), "Neighbor search");
        HaloLogger::info_fmt("Neighbors of {} atoms: {} slots, halo width {:.4f}, {} extended points",
            neighbors.Table().Rows(), neighbors.Table().Columns(), neighbors.Width(), neighbors.Halo().Size());
    }
    return neighbors;
}

NeighborTree GetTree(const Structure& structure, const NeighborSettings& settings)
{
    settings.Validate();
    NeighborTree tree(structure, settings);
    tree.BuildIndex(settings.num_neighbors, settings.cutoff_radius, settings.width_buffer);
    return tree;
}

NeighborTree GetNeighborhood(const Structure& structure, const Geometry& positions, const NeighborSettings& settings)
{
    NeighborTree tree = GetTree(structure, settings);
    tree.Populate(positions, settings.num_neighbors, settings.cutoff_radius, settings.width_buffer, false);
    return tree;
}

} // namespace halo
