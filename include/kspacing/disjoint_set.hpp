#pragma once

#include <vector>
#include <cstddef>
#include <cstdint>

namespace kspacing {

// Disjoint-set (Union-Find) with union by size and path compression.
// Tracks the number of clusters in O(1). Indices are 0..n-1; any operation
// on an index outside that range throws IndexOutOfRange.
class DisjointSets {
public:
    // Construct with n singleton sets.
    explicit DisjointSets(std::size_t n = 0);

    // Reset to n singleton sets, discarding previous state.
    void reset(std::size_t n);

    // Number of elements managed.
    std::size_t size() const { return parent_.size(); }

    // Find set representative with path compression.
    uint32_t find(uint32_t x);

    // Find set representative without path compression (read-only traversal).
    uint32_t find_no_compress(uint32_t x) const;

    // Union two sets, returning the resulting representative. The smaller tree
    // goes under the larger one; on equal sizes b's root goes under a's root.
    // If already in the same set, returns the existing representative.
    uint32_t unite(uint32_t a, uint32_t b);

    // Like unite(), but reports whether two distinct sets were merged.
    bool merged(uint32_t a, uint32_t b);

    bool same(uint32_t a, uint32_t b) const { return find_no_compress(a) == find_no_compress(b); }

    // Current number of disjoint clusters.
    uint32_t components() const { return comp_count_; }

    // Number of elements in the set containing x.
    uint32_t set_size(uint32_t x) const { return size_[find_no_compress(x)]; }

    // Roots of the current forest, ascending.
    std::vector<uint32_t> roots() const;

private:
    void check_index(uint32_t x) const;

    std::vector<uint32_t> parent_;
    std::vector<uint32_t> size_; // valid only at roots
    uint32_t comp_count_ = 0;
};

} // namespace kspacing
