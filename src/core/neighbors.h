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

#pragma once

#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <Eigen/Sparse>

#include "src/core/graph_analysis.h"
#include "src/core/neighbor_tree.h"
#include "src/core/shell_classifier.h"

namespace halo {

/*! \brief Neighbors of the atoms of the reference structure
 *
 * Rows are atoms, the atom itself is not listed among its neighbors. On top of
 * NeighborTree this adds coordination shells (local and global, optionally
 * refined by agglomerative clustering), shell matrices and graph analysis.
 *
 * Shells and cluster models are computed on first use and kept until
 * ResetClusters() or until the table is replaced by a new query.
 *
 * \code
 * auto structure = halo::Structure::Cubic("Fe", 2.83, "bcc", 2);
 * halo::NeighborSettings settings;
 * settings.num_neighbors = 8;
 * auto neigh = halo::GetNeighbors(structure, settings);
 * auto J = neigh.ShellMatrix();   // J[0]: first shell, 8 entries per column
 * \endcode
 */
class Neighbors : public NeighborTree {
public:
    explicit Neighbors(const Structure& structure, const NeighborSettings& settings = NeighborSettings());

    inline int Tolerance() const { return m_settings.tolerance; }
    inline void setTolerance(int tolerance) { m_settings.tolerance = tolerance; }

    /*! \brief Element of every neighbor, "v" (vacancy) for sentinel slots */
    NeighborView<std::string> ChemicalSymbols(std::optional<Mode> mode = std::nullopt) const;

    /*! \brief Cached local shells of the raw distances */
    NeighborView<int> Shells(std::optional<Mode> mode = std::nullopt);

    NeighborView<int> LocalShells(std::optional<Mode> mode = std::nullopt, std::optional<int> tolerance = std::nullopt,
        bool cluster_by_distances = false, bool cluster_by_vecs = false);

    /*! \throws ConfigurationError before the first query */
    NeighborView<int> GlobalShells(std::optional<Mode> mode = std::nullopt, std::optional<int> tolerance = std::nullopt,
        bool cluster_by_distances = false, bool cluster_by_vecs = false);

    /*! \brief One sparse atom x atom matrix per global shell
     *
     * The matrices are symmetric; a bilinear form built from them counts every
     * pair twice and has to be halved.
     */
    std::vector<Eigen::SparseMatrix<int>> ShellMatrix(
        const std::optional<std::pair<std::string, std::string>>& chemical_pair = std::nullopt,
        bool cluster_by_distances = false, bool cluster_by_vecs = false);

    /*! \brief Cluster the finite neighbor vectors
     *
     * Without threshold and cluster count the threshold defaults to the
     * smallest neighbor distance. Linkage and affinity default to the settings.
     */
    void ClusterByVectors(std::optional<double> distance_threshold = std::nullopt, std::optional<int> n_clusters = std::nullopt,
        std::optional<std::string> linkage = std::nullopt, std::optional<std::string> affinity = std::nullopt);

    /*! \brief Cluster the finite neighbor distances
     *
     * Without threshold and cluster count the threshold defaults to 10% of the
     * smallest neighbor distance. With use_vecs the lengths of the vector
     * cluster centers are clustered instead of the raw distances.
     */
    void ClusterByDistances(std::optional<double> distance_threshold = std::nullopt, std::optional<int> n_clusters = std::nullopt,
        std::optional<std::string> linkage = std::nullopt, std::optional<std::string> affinity = std::nullopt,
        bool use_vecs = false);

    void ResetClusters(bool vecs = true, bool distances = true);

    /*! \brief Atom whose neighbors are listed in each row
     *
     * Identity after a query of all atoms, id_list for GetNeighbors with an
     * id_list. Shell matrices and graph analyses need this mapping.
     *
     * \throws ConfigurationError if the rows do not belong to atoms of the structure
     */
    const std::vector<int>& RowAtoms() const;
    void setRowAtoms(const std::vector<int>& row_atoms);

    inline const std::optional<ClusterModel>& VectorClusters() const { return m_vector_clusters; }
    inline const std::optional<ClusterModel>& DistanceClusters() const { return m_distance_clusters; }

    GraphAnalysis::VectorMatch FindNeighborsByVector(const Position& vector) const;

    GraphAnalysis::ClusterResult ClusterAnalysis(const std::vector<int>& id_list) const;

    GraphAnalysis::BondList Bonds(double radius = std::numeric_limits<double>::infinity(),
        std::optional<int> max_shells = std::nullopt, double prec = 0.1) const;

    /*! \brief Pairs of atoms closer than cutoff_radius, see GraphAnalysis::AdjacencyMask */
    Eigen::SparseMatrix<int> AdjacencyMask(double cutoff_radius = std::numeric_limits<double>::infinity(),
        bool expand_cartesian = false) const;

protected:
    void TableChanged() override;

private:
    /*! \brief Distances feeding the shell rounding: raw or cluster representatives */
    Matrix ShellInput(bool cluster_by_distances, bool cluster_by_vecs);
    double SmallestDistance() const;
    IndexMatrix ExpandLabels(const std::vector<int>& labels) const;

    std::optional<IndexMatrix> m_shells;
    std::optional<std::vector<int>> m_row_atoms;
    std::optional<ClusterModel> m_vector_clusters;
    std::optional<ClusterModel> m_distance_clusters;
};

/*! \brief Neighbors of every atom of structure (or of the atoms in id_list)
 *
 * Builds halo and index for the search, queries the folded atom positions with
 * one extra slot and drops the atom itself. A warning is logged when the halo
 * turns out thinner than the neighbor vectors.
 *
 * \throws ConfigurationError for non-positive num_neighbors or negative width_buffer
 */
Neighbors GetNeighbors(const Structure& structure, const NeighborSettings& settings = NeighborSettings(),
    const std::optional<std::vector<int>>& id_list = std::nullopt);

/*! \brief Engine with halo and index built, but without a query */
NeighborTree GetTree(const Structure& structure, const NeighborSettings& settings = NeighborSettings());

/*! \brief Neighbors of arbitrary positions in the structure */
NeighborTree GetNeighborhood(const Structure& structure, const Geometry& positions,
    const NeighborSettings& settings = NeighborSettings());

} // namespace halo
