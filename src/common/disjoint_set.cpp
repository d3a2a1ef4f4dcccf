#include "kspacing/disjoint_set.hpp"
#include "kspacing/errors.hpp"

#include <string>

namespace kspacing {

DisjointSets::DisjointSets(std::size_t n) {
    reset(n);
}

void DisjointSets::reset(std::size_t n) {
    parent_.resize(n);
    size_.assign(n, 1);
    comp_count_ = static_cast<uint32_t>(n);
    for (uint32_t i = 0; i < n; ++i) parent_[i] = i;
}

void DisjointSets::check_index(uint32_t x) const {
    if (x >= parent_.size()) {
        throw IndexOutOfRange("disjoint-set index " + std::to_string(x) +
                              " out of range [0, " + std::to_string(parent_.size()) + ")");
    }
}

uint32_t DisjointSets::find(uint32_t x) {
    check_index(x);
    uint32_t root = x;
    while (parent_[root] != root) {
        root = parent_[root];
    }
    // Re-point every node on the path straight at the root
    while (parent_[x] != root) {
        uint32_t p = parent_[x];
        parent_[x] = root;
        x = p;
    }
    return root;
}

uint32_t DisjointSets::find_no_compress(uint32_t x) const {
    check_index(x);
    uint32_t root = x;
    while (parent_[root] != root) {
        root = parent_[root];
    }
    return root;
}

uint32_t DisjointSets::unite(uint32_t a, uint32_t b) {
    uint32_t ra = find(a);
    uint32_t rb = find(b);
    if (ra == rb) return ra;
    // union by size
    if (size_[ra] < size_[rb]) {
        parent_[ra] = rb;
        size_[rb] += size_[ra];
        --comp_count_;
        return rb;
    }
    parent_[rb] = ra;
    size_[ra] += size_[rb];
    --comp_count_;
    return ra;
}

bool DisjointSets::merged(uint32_t a, uint32_t b) {
    const uint32_t before = comp_count_;
    unite(a, b);
    return comp_count_ != before;
}

std::vector<uint32_t> DisjointSets::roots() const {
    std::vector<uint32_t> out;
    out.reserve(comp_count_);
    for (uint32_t i = 0; i < parent_.size(); ++i) {
        if (parent_[i] == i) out.push_back(i);
    }
    return out;
}

} // namespace kspacing
