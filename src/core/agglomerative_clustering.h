/*
 * <Hierarchical agglomerative clustering of neighbor distances and vectors>
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
#include <vector>

#include "src/core/global.h"

namespace halo {

enum class Linkage {
    Single,
    Complete,
    Average,
    Ward
};

enum class Affinity {
    Euclidean,
    Manhattan,
    Cosine
};

/*! \brief single, complete, average or ward */
Linkage ParseLinkage(const std::string& name);
/*! \brief euclidean (l2), manhattan (l1) or cosine */
Affinity ParseAffinity(const std::string& name);

/*! \brief Bottom-up clustering with a distance threshold or a target cluster count
 *
 * Exactly one stopping criterion is used: clusters are merged while the linkage
 * distance stays below distance_threshold, or until n_clusters remain.
 *
 * The merge tree is built with the nearest-neighbor chain algorithm and
 * Lance-Williams updates on a condensed distance matrix, O(n^2) in time and
 * memory. Identical samples are collapsed into one weighted sample before, so
 * crystals with many equal distances stay cheap.
 *
 * Labels are numbered 0..k-1 in order of first appearance, Centers() holds the
 * mean of the samples of each cluster.
 */
class AgglomerativeClustering {
public:
    /*! \brief Unique sample count above which a resource warning is logged */
    static constexpr int LargeSampleCount = 10000;

    /*! \throws ConfigurationError if both or none of the criteria are given, or ward is combined with a non-euclidean affinity */
    AgglomerativeClustering(std::optional<double> distance_threshold, std::optional<int> n_clusters,
        Linkage linkage = Linkage::Complete, Affinity affinity = Affinity::Euclidean);

    /*! \brief Cluster the rows of samples (n x d) */
    AgglomerativeClustering& Fit(const Matrix& samples);

    inline const std::vector<int>& Labels() const { return m_labels; }
    inline const Matrix& Centers() const { return m_centers; }
    inline int ClusterCount() const { return static_cast<int>(m_centers.rows()); }

private:
    struct Merge {
        int first;
        int second;
        double height;
    };

    double SampleDistance(const Matrix& samples, int a, int b) const;
    std::vector<Merge> BuildTree(const Matrix& unique, const std::vector<double>& weights) const;

    std::optional<double> m_distance_threshold;
    std::optional<int> m_n_clusters;
    Linkage m_linkage;
    Affinity m_affinity;

    std::vector<int> m_labels;
    Matrix m_centers;
};

} // namespace halo
