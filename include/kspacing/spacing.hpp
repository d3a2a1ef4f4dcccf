#pragma once

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <utility>
#include <vector>

#include "kspacing/disjoint_set.hpp"
#include "kspacing/edge_list.hpp"

namespace kspacing {

// Max-spacing k-clustering over an explicit distance graph.
//
// Semantics:
//  - Edges are undirected distances (smaller = closer), kept sorted ascending
//    with a stable sort so input order decides ties.
//  - Kruskal-style greedy merge: union endpoints in ascending order until k
//    clusters remain; the next edge that still joins two different clusters
//    is the minimum inter-cluster distance, i.e. the spacing.
//  - Every query builds its own DisjointSets, so one instance answers any
//    number of k values.
class ExplicitSpacingClusterer {
public:
    struct Config {
        bool verbose = false;          // log every consumed edge
        std::ostream* log = &std::cerr;
    };

    // Edge endpoints must be < n; throws std::invalid_argument otherwise.
    ExplicitSpacingClusterer(uint32_t n, std::vector<WeightedEdge> edges);

    void set_config(const Config& cfg) { cfg_ = cfg; }
    const Config& config() const { return cfg_; }

    // Maximum spacing of a k-clustering.
    // Throws InvalidClusterTarget unless 2 <= k < n, and SpacingUndefined when
    // the edges never connect two of the k clusters.
    int64_t spacing_for_clusters(uint32_t k) const;

    // (k, spacing) for every requested k, in the given order.
    std::vector<std::pair<uint32_t, int64_t>> spacing_sweep(const std::vector<uint32_t>& ks) const;

    uint32_t element_count() const { return n_; }
    const std::vector<WeightedEdge>& sorted_edges() const { return edges_; }

private:
    uint32_t n_ = 0;
    std::vector<WeightedEdge> edges_{};
    Config cfg_{};
};

} // namespace kspacing
