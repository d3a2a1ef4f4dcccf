#pragma once

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

#include "kspacing/bit_vector.hpp"
#include "kspacing/disjoint_set.hpp"
#include "kspacing/errors.hpp"

namespace kspacing {

// Distinct bit-vector values mapped to the first element id that carried them.
class BitIndex {
public:
    using Map = std::unordered_map<BitVector, uint32_t, BitVectorHash>;
    using const_iterator = Map::const_iterator;

    // Store v for element id unless the value is already present.
    // Returns the owning id (id itself when v is new).
    uint32_t insert(const BitVector& v, uint32_t id) { return map_.emplace(v, id).first->second; }

    const_iterator find(const BitVector& v) const { return map_.find(v); }
    const_iterator begin() const { return map_.begin(); }
    const_iterator end() const { return map_.end(); }
    std::size_t size() const { return map_.size(); }
    void clear() { map_.clear(); }
    void reserve(std::size_t n) { map_.reserve(n); }

private:
    Map map_{};
};

// Finds, for every stored vector, the stored vectors at exactly Hamming
// distance d by flipping every combination of d bit positions (C(L, d)
// candidates per origin) instead of comparing all pairs.
class HammingNeighborEnumerator {
public:
    HammingNeighborEnumerator(const BitIndex& index, std::size_t bit_length)
        : index_(index), bits_(bit_length) {}

    // Calls visit(origin_id, neighbor_id) for each ordered pair at distance d.
    // Every unordered pair is reported once from each side.
    // Throws InvalidDistanceParameter if d < 1.
    template <class Visit>
    void for_each_neighbor(unsigned d, Visit&& visit) const {
        if (d < 1) throw InvalidDistanceParameter("Hamming distance must be >= 1, got " + std::to_string(d));
        if (d > bits_) return;
        for (const auto& [value, id] : index_) {
            BitVector work = value;
            descend(d, 0, 0, id, work, visit);
        }
    }

    // Unite every pair at distance d. Returns the number of successful merges.
    // When trace is non-null each discovered pair is written to it.
    uint64_t merge_at_distance(unsigned d, DisjointSets& dsu, std::ostream* trace = nullptr) const;

private:
    // Flip positions >= cursor in increasing order; restore on the way back.
    template <class Visit>
    void descend(unsigned d, unsigned level, std::size_t cursor, uint32_t origin,
                 BitVector& work, Visit& visit) const {
        if (level == d) {
            auto it = index_.find(work);
            if (it != index_.end()) visit(origin, it->second);
            return;
        }
        // leave room for the remaining d-level-1 flips
        const std::size_t last = bits_ - (d - level - 1);
        for (std::size_t i = cursor; i < last; ++i) {
            work.flip(i);
            descend(d, level + 1, i + 1, origin, work, visit);
            work.flip(i);
        }
    }

    const BitIndex& index_;
    std::size_t bits_;
};

// Largest k such that a k-clustering of the points has spacing >= T under
// Hamming distance. Labels are assigned in ingestion order starting at 0.
class HammingClusterer {
public:
    struct Config {
        bool verbose = false;          // trace ingestion and every merge
        std::ostream* log = &std::cerr;
    };

    explicit HammingClusterer(std::size_t bit_length);
    // Throws std::invalid_argument if any point has a different length.
    HammingClusterer(std::size_t bit_length, std::vector<BitVector> points);

    void set_config(const Config& cfg) { cfg_ = cfg; }
    const Config& config() const { return cfg_; }

    // Append a point; returns its element id.
    uint32_t add(BitVector v);

    // One singleton per point, then unite duplicates (distance 0).
    // Returns the resulting cluster count.
    uint32_t build();

    // build(), then unite every pair at distance 1..T-1.
    // Throws InvalidDistanceParameter if T < 1, before touching any state.
    uint32_t max_clusters_with_spacing(unsigned T);

    std::size_t bit_length() const { return bits_; }
    uint32_t point_count() const { return static_cast<uint32_t>(points_.size()); }
    std::size_t distinct_count() const { return index_.size(); }
    uint32_t components() const { return dsu_.components(); }
    const DisjointSets& disjoint_sets() const { return dsu_; }
    const BitIndex& index() const { return index_; }

private:
    std::size_t bits_;
    std::vector<BitVector> points_{};
    BitIndex index_{};
    DisjointSets dsu_{};
    Config cfg_{};
};

} // namespace kspacing
