// ----------------------------------------------------------------------------
// hamming.cpp
//
// Spacing-threshold clustering over bit-vectors.
//
//  - build(): points are ingested in label order into a hash index keyed by
//    bit contents. A repeated value unites the new label with the first owner
//    immediately, so the index holds distinct values only.
//  - For each distance i in 1..T-1 every stored value is expanded into its
//    C(L, i) flipped variants; variants present in the index are united with
//    the origin. Afterwards every pair closer than T shares a cluster and no
//    pair at distance >= T was merged directly, so components() is the
//    answer.
// ----------------------------------------------------------------------------

#include "kspacing/hamming.hpp"

#include <algorithm>
#include <stdexcept>

namespace kspacing {

uint64_t HammingNeighborEnumerator::merge_at_distance(unsigned d, DisjointSets& dsu, std::ostream* trace) const {
    uint64_t merges = 0;
    for_each_neighbor(d, [&](uint32_t a, uint32_t b) {
        const bool m = dsu.merged(a, b);
        if (m) ++merges;
        if (trace) {
            *trace << "distance " << d << ": " << a << " ~ " << b << (m ? " merged" : "") << "\n";
        }
    });
    return merges;
}

HammingClusterer::HammingClusterer(std::size_t bit_length) : bits_(bit_length) {}

HammingClusterer::HammingClusterer(std::size_t bit_length, std::vector<BitVector> points)
    : bits_(bit_length) {
    for (const auto& p : points) {
        if (p.size() != bits_) {
            throw std::invalid_argument("point has " + std::to_string(p.size()) + " bits, expected " +
                                        std::to_string(bits_));
        }
    }
    points_ = std::move(points);
}

uint32_t HammingClusterer::add(BitVector v) {
    if (v.size() != bits_) {
        throw std::invalid_argument("point has " + std::to_string(v.size()) + " bits, expected " +
                                    std::to_string(bits_));
    }
    points_.push_back(std::move(v));
    return static_cast<uint32_t>(points_.size() - 1);
}

uint32_t HammingClusterer::build() {
    dsu_.reset(points_.size());
    index_.clear();
    index_.reserve(points_.size());
    for (uint32_t id = 0; id < points_.size(); ++id) {
        const uint32_t owner = index_.insert(points_[id], id);
        if (cfg_.verbose) {
            *cfg_.log << "point " << id << ": " << points_[id].to_string();
        }
        if (owner != id) {
            dsu_.unite(id, owner);
            if (cfg_.verbose) *cfg_.log << " duplicate of " << owner;
        }
        if (cfg_.verbose) *cfg_.log << "\n";
    }
    if (cfg_.verbose) {
        *cfg_.log << "distinct=" << index_.size() << " clusters=" << dsu_.components() << "\n";
    }
    return dsu_.components();
}

uint32_t HammingClusterer::max_clusters_with_spacing(unsigned T) {
    if (T < 1) throw InvalidDistanceParameter("spacing threshold must be >= 1, got " + std::to_string(T));

    build();
    HammingNeighborEnumerator enumerator(index_, bits_);
    const std::size_t max_d = std::min<std::size_t>(T - 1, bits_);
    for (std::size_t i = 1; i <= max_d; ++i) {
        const unsigned d = static_cast<unsigned>(i);
        const uint64_t merges = enumerator.merge_at_distance(d, dsu_, cfg_.verbose ? cfg_.log : nullptr);
        if (cfg_.verbose) {
            *cfg_.log << "distance " << d << " done: merges=" << merges
                      << " clusters=" << dsu_.components() << "\n";
        }
    }
    return dsu_.components();
}

} // namespace kspacing
