#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace kspacing {

// Fixed-length bit-vector packed into 64-bit words. Equality and hashing are
// structural over the bits; unused high bits of the last word stay zero.
class BitVector {
public:
    BitVector() = default;
    explicit BitVector(std::size_t bits);

    // Parse a string of '0'/'1' characters (bit 0 first).
    // Throws std::invalid_argument on any other character.
    static BitVector from_string(std::string_view s);

    std::size_t size() const { return bits_; }

    // Bit accessors. Precondition: i < size().
    bool test(std::size_t i) const { return (words_[i >> 6] >> (i & 63)) & 1u; }
    void set(std::size_t i, bool value = true) {
        const uint64_t mask = uint64_t{1} << (i & 63);
        if (value) words_[i >> 6] |= mask; else words_[i >> 6] &= ~mask;
    }
    void flip(std::size_t i) { words_[i >> 6] ^= uint64_t{1} << (i & 63); }

    // Number of set bits.
    std::size_t count() const;

    std::size_t hash() const;

    // '0'/'1' rendering, bit 0 first.
    std::string to_string() const;

    const std::vector<uint64_t>& words() const { return words_; }

    friend bool operator==(const BitVector& a, const BitVector& b) {
        return a.bits_ == b.bits_ && a.words_ == b.words_;
    }
    friend bool operator!=(const BitVector& a, const BitVector& b) { return !(a == b); }

private:
    std::size_t bits_ = 0;
    std::vector<uint64_t> words_{};
};

struct BitVectorHash {
    std::size_t operator()(const BitVector& v) const noexcept { return v.hash(); }
};

// Number of positions at which a and b differ.
// Throws std::invalid_argument when lengths differ.
std::size_t hamming_distance(const BitVector& a, const BitVector& b);

} // namespace kspacing
