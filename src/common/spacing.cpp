// ----------------------------------------------------------------------------
// spacing.cpp
//
// Max-spacing k-clustering on an explicit graph.
//
//  - Edges are sorted once, ascending by distance (stable).
//  - A query for k walks the sorted edges, uniting endpoints, until the
//    union-find reports k components. It then continues past intra-cluster
//    edges to the first edge whose endpoints lie in different clusters; that
//    distance is the spacing. Because edges are ascending, no later edge can
//    connect two clusters more cheaply.
//  - Complexity: O(E log E) once, then O(E alpha(n)) per query.
// ----------------------------------------------------------------------------

#include "kspacing/spacing.hpp"
#include "kspacing/errors.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace kspacing
{

    static inline bool edge_asc(const WeightedEdge &a, const WeightedEdge &b) { return a.distance < b.distance; }

    ExplicitSpacingClusterer::ExplicitSpacingClusterer(uint32_t n, std::vector<WeightedEdge> edges)
        : n_(n), edges_(std::move(edges))
    {
        for (const auto &e : edges_)
        {
            if (e.u >= n_ || e.v >= n_)
            {
                throw std::invalid_argument("edge endpoint out of range for " + std::to_string(n_) + " elements");
            }
        }
        std::stable_sort(edges_.begin(), edges_.end(), edge_asc);
    }

    int64_t ExplicitSpacingClusterer::spacing_for_clusters(uint32_t k) const
    {
        if (k < 2 || k >= n_)
        {
            throw InvalidClusterTarget("k must satisfy 2 <= k < " + std::to_string(n_) + ", got " + std::to_string(k));
        }

        DisjointSets dsu(n_);
        std::size_t idx = 0;
        while (dsu.components() > k)
        {
            if (idx == edges_.size())
            {
                throw SpacingUndefined("edges exhausted with " + std::to_string(dsu.components()) +
                                       " clusters remaining (target " + std::to_string(k) + ")");
            }
            const WeightedEdge &e = edges_[idx++];
            const bool m = dsu.merged(e.u, e.v);
            if (cfg_.verbose)
            {
                *cfg_.log << "edge " << e.u << "-" << e.v << " d=" << e.distance
                          << (m ? " merged" : " internal") << " clusters=" << dsu.components() << "\n";
            }
        }

        // First edge crossing two of the k clusters
        for (; idx < edges_.size(); ++idx)
        {
            const WeightedEdge &e = edges_[idx];
            if (dsu.find(e.u) != dsu.find(e.v))
            {
                if (cfg_.verbose)
                {
                    *cfg_.log << "spacing edge " << e.u << "-" << e.v << " d=" << e.distance
                              << " clusters=" << dsu.components() << "\n";
                }
                return e.distance;
            }
        }
        throw SpacingUndefined("no edge connects two of the " + std::to_string(k) + " clusters");
    }

    std::vector<std::pair<uint32_t, int64_t>> ExplicitSpacingClusterer::spacing_sweep(const std::vector<uint32_t> &ks) const
    {
        std::vector<std::pair<uint32_t, int64_t>> out;
        out.reserve(ks.size());
        for (uint32_t k : ks)
            out.emplace_back(k, spacing_for_clusters(k));
        return out;
    }

} // namespace kspacing
