#include "kspacing/bit_vector.hpp"

#include <bit>
#include <stdexcept>

namespace kspacing {

BitVector::BitVector(std::size_t bits) : bits_(bits), words_((bits + 63) / 64, 0) {}

BitVector BitVector::from_string(std::string_view s) {
    BitVector v(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '1') v.set(i);
        else if (s[i] != '0') throw std::invalid_argument("invalid bit character '" + std::string(1, s[i]) + "'");
    }
    return v;
}

std::size_t BitVector::count() const {
    std::size_t c = 0;
    for (uint64_t w : words_) c += static_cast<std::size_t>(std::popcount(w));
    return c;
}

std::size_t BitVector::hash() const {
    // splitmix64 finalizer folded over the words
    uint64_t h = 0x9e3779b97f4a7c15ull ^ static_cast<uint64_t>(bits_);
    for (uint64_t w : words_) {
        uint64_t z = h ^ w;
        z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ull;
        z = (z ^ (z >> 27)) * 0x94d049bb133111ebull;
        h = z ^ (z >> 31);
    }
    return static_cast<std::size_t>(h);
}

std::string BitVector::to_string() const {
    std::string out(bits_, '0');
    for (std::size_t i = 0; i < bits_; ++i) {
        if (test(i)) out[i] = '1';
    }
    return out;
}

std::size_t hamming_distance(const BitVector& a, const BitVector& b) {
    if (a.size() != b.size()) {
        throw std::invalid_argument("hamming_distance: length mismatch (" + std::to_string(a.size()) +
                                    " vs " + std::to_string(b.size()) + ")");
    }
    std::size_t d = 0;
    const auto& wa = a.words();
    const auto& wb = b.words();
    for (std::size_t i = 0; i < wa.size(); ++i) {
        d += static_cast<std::size_t>(std::popcount(wa[i] ^ wb[i]));
    }
    return d;
}

} // namespace kspacing
