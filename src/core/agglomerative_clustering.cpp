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

#include "agglomerative_clustering.h"

#include "src/core/halo_logger.h"
#include "src/core/neighbor_errors.h"

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <numeric>

namespace halo {

namespace {

std::string lower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), ::tolower);
    return value;
}

/* position of pair (i, j), i < j, in the condensed upper triangle of an n x n matrix */
inline size_t condensed(size_t n, size_t i, size_t j)
{
    if (i > j)
        std::swap(i, j);
    return n * i - i * (i + 1) / 2 + (j - i - 1);
}

int find(std::vector<int>& parent, int i)
{
    while (parent[i] != i) {
        parent[i] = parent[parent[i]];
        i = parent[i];
    }
    return i;
}

} // namespace

Linkage ParseLinkage(const std::string& name)
{
    const std::string key = lower(name);
    if (key == "single")
        return Linkage::Single;
    if (key == "complete")
        return Linkage::Complete;
    if (key == "average")
        return Linkage::Average;
    if (key == "ward")
        return Linkage::Ward;
    throw ConfigurationError(fmt::format("Unknown linkage '{}'. Available: single, complete, average, ward", name));
}

Affinity ParseAffinity(const std::string& name)
{
    const std::string key = lower(name);
    if (key == "euclidean" || key == "l2")
        return Affinity::Euclidean;
    if (key == "manhattan" || key == "l1" || key == "cityblock")
        return Affinity::Manhattan;
    if (key == "cosine")
        return Affinity::Cosine;
    throw ConfigurationError(fmt::format("Unknown affinity '{}'. Available: euclidean, l1, l2, manhattan, cosine", name));
}

AgglomerativeClustering::AgglomerativeClustering(std::optional<double> distance_threshold, std::optional<int> n_clusters,
    Linkage linkage, Affinity affinity)
    : m_distance_threshold(distance_threshold)
    , m_n_clusters(n_clusters)
    , m_linkage(linkage)
    , m_affinity(affinity)
{
    if (m_distance_threshold.has_value() == m_n_clusters.has_value())
        throw ConfigurationError("Exactly one of n_clusters and distance_threshold has to be set");
    if (m_n_clusters && *m_n_clusters < 1)
        throw ConfigurationError(fmt::format("n_clusters must be positive, got {}", *m_n_clusters));
    if (m_linkage == Linkage::Ward && m_affinity != Affinity::Euclidean)
        throw ConfigurationError("Ward linkage requires the euclidean affinity");
}

double AgglomerativeClustering::SampleDistance(const Matrix& samples, int a, int b) const
{
    switch (m_affinity) {
    case Affinity::Manhattan:
        return (samples.row(a) - samples.row(b)).cwiseAbs().sum();
    case Affinity::Cosine: {
        const double norms = samples.row(a).norm() * samples.row(b).norm();
        if (norms == 0)
            return 1.0;
        return 1.0 - samples.row(a).dot(samples.row(b)) / norms;
    }
    case Affinity::Euclidean:
    default:
        return (samples.row(a) - samples.row(b)).norm();
    }
}

std::vector<AgglomerativeClustering::Merge> AgglomerativeClustering::BuildTree(const Matrix& unique,
    const std::vector<double>& weights) const
{
    const size_t n = static_cast<size_t>(unique.rows());
    std::vector<Merge> merges;
    if (n < 2)
        return merges;
    merges.reserve(n - 1);

    std::vector<double> distance(n * (n - 1) / 2);
    for (size_t i = 0; i < n; ++i)
        for (size_t j = i + 1; j < n; ++j)
            distance[condensed(n, i, j)] = SampleDistance(unique, static_cast<int>(i), static_cast<int>(j));

    // collapsed duplicates enter ward as clusters of their multiplicity
    if (m_linkage == Linkage::Ward)
        for (size_t i = 0; i < n; ++i)
            for (size_t j = i + 1; j < n; ++j)
                distance[condensed(n, i, j)] *= std::sqrt(2.0 * weights[i] * weights[j] / (weights[i] + weights[j]));

    std::vector<double> size = weights;
    std::vector<bool> active(n, true);
    std::vector<int> chain;
    chain.reserve(n);

    for (size_t remaining = n; remaining > 1; --remaining) {
        if (chain.empty()) {
            for (size_t i = 0; i < n; ++i)
                if (active[i]) {
                    chain.push_back(static_cast<int>(i));
                    break;
                }
        }

        int a = 0, b = 0;
        double height = 0;
        while (true) {
            a = chain.back();
            // prefer the previous chain element on ties, otherwise the chain may cycle
            int best = -1;
            double best_distance = std::numeric_limits<double>::infinity();
            if (chain.size() > 1) {
                best = chain[chain.size() - 2];
                best_distance = distance[condensed(n, a, best)];
            }
            for (size_t k = 0; k < n; ++k) {
                if (!active[k] || static_cast<int>(k) == a)
                    continue;
                const double d = distance[condensed(n, a, k)];
                if (d < best_distance) {
                    best_distance = d;
                    best = static_cast<int>(k);
                }
            }
            if (chain.size() > 1 && best == chain[chain.size() - 2]) {
                b = best;
                height = best_distance;
                break;
            }
            chain.push_back(best);
        }
        chain.pop_back();
        chain.pop_back();

        // b survives and represents the union
        const double size_a = size[a];
        const double size_b = size[b];
        const double d_ab = height;
        for (size_t k = 0; k < n; ++k) {
            if (!active[k] || static_cast<int>(k) == a || static_cast<int>(k) == b)
                continue;
            const double d_ak = distance[condensed(n, a, k)];
            const double d_bk = distance[condensed(n, b, k)];
            double updated = 0;
            switch (m_linkage) {
            case Linkage::Single:
                updated = std::min(d_ak, d_bk);
                break;
            case Linkage::Complete:
                updated = std::max(d_ak, d_bk);
                break;
            case Linkage::Average:
                updated = (size_a * d_ak + size_b * d_bk) / (size_a + size_b);
                break;
            case Linkage::Ward: {
                const double size_k = size[k];
                const double total = size_a + size_b + size_k;
                updated = std::sqrt(std::max(0.0,
                    ((size_a + size_k) * d_ak * d_ak + (size_b + size_k) * d_bk * d_bk - size_k * d_ab * d_ab) / total));
                break;
            }
            }
            distance[condensed(n, b, k)] = updated;
        }
        active[a] = false;
        size[b] = size_a + size_b;
        merges.push_back({ a, b, height });
    }

    std::stable_sort(merges.begin(), merges.end(), [](const Merge& x, const Merge& y) { return x.height < y.height; });
    return merges;
}

AgglomerativeClustering& AgglomerativeClustering::Fit(const Matrix& samples)
{
    const int count = static_cast<int>(samples.rows());
    const int dim = static_cast<int>(samples.cols());
    m_labels.assign(count, -1);
    m_centers.resize(0, dim);
    if (count == 0)
        return *this;

    // collapse identical samples; merging them happens at height 0 for every linkage
    const bool collapse = !m_distance_threshold || *m_distance_threshold > 0;
    std::vector<int> order(count);
    std::iota(order.begin(), order.end(), 0);
    std::vector<int> sample_to_unique(count);
    std::vector<int> representatives;
    std::vector<double> weights;
    if (collapse) {
        std::sort(order.begin(), order.end(), [&samples, dim](int a, int b) {
            for (int c = 0; c < dim; ++c) {
                if (samples(a, c) < samples(b, c))
                    return true;
                if (samples(a, c) > samples(b, c))
                    return false;
            }
            return a < b;
        });
        for (int i = 0; i < count; ++i) {
            const int sample = order[i];
            if (i == 0 || samples.row(sample) != samples.row(order[i - 1])) {
                representatives.push_back(sample);
                weights.push_back(0.0);
            }
            sample_to_unique[sample] = static_cast<int>(representatives.size()) - 1;
            weights.back() += 1.0;
        }
    } else {
        representatives = order;
        weights.assign(count, 1.0);
        sample_to_unique = order;
    }

    const int unique_count = static_cast<int>(representatives.size());
    if (unique_count > LargeSampleCount)
        HaloLogger::warn_fmt("Agglomerative clustering of {} distinct samples needs O(n^2) time and {:.1f} MB of memory",
            unique_count, 0.5 * unique_count * (unique_count - 1.0) * sizeof(double) / 1048576.0);

    Matrix unique(unique_count, dim);
    for (int i = 0; i < unique_count; ++i)
        unique.row(i) = samples.row(representatives[i]);

    const std::vector<Merge> merges = BuildTree(unique, weights);

    size_t applied = 0;
    if (m_n_clusters) {
        int target = *m_n_clusters;
        if (target > unique_count) {
            HaloLogger::warn_fmt("n_clusters {} exceeds the number of distinct samples {}, using {}", target, unique_count, unique_count);
            target = unique_count;
        }
        applied = static_cast<size_t>(unique_count - target);
    } else {
        while (applied < merges.size() && merges[applied].height < *m_distance_threshold)
            ++applied;
    }

    std::vector<int> parent(unique_count);
    std::iota(parent.begin(), parent.end(), 0);
    for (size_t i = 0; i < applied; ++i) {
        const int root_first = find(parent, merges[i].first);
        const int root_second = find(parent, merges[i].second);
        if (root_first != root_second)
            parent[root_first] = root_second;
    }

    std::vector<int> root_label(unique_count, -1);
    int clusters = 0;
    for (int sample = 0; sample < count; ++sample) {
        const int root = find(parent, sample_to_unique[sample]);
        if (root_label[root] < 0)
            root_label[root] = clusters++;
        m_labels[sample] = root_label[root];
    }

    m_centers = Matrix::Zero(clusters, dim);
    std::vector<int> members(clusters, 0);
    for (int sample = 0; sample < count; ++sample) {
        m_centers.row(m_labels[sample]) += samples.row(sample);
        ++members[m_labels[sample]];
    }
    for (int c = 0; c < clusters; ++c)
        m_centers.row(c) /= members[c];

    return *this;
}

} // namespace halo
