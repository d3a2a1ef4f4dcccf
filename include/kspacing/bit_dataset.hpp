#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>
#include <vector>

#include "kspacing/bit_vector.hpp"

namespace kspacing {

// Reads an implicit (Hamming) dataset:
//
//   <M> <L>
//   <bit 1> ... <bit L>      (M rows, element ids 0..M-1 in row order)
//
// Bits may be whitespace separated or contiguous. Malformed input is reported
// on std::cerr and leaves the dataset invalid.
class BitDataset {
public:
  explicit BitDataset(std::istream& in);
  explicit BitDataset(const std::string& file_path);

  bool is_valid() const { return valid; }
  uint32_t get_point_count() const { return static_cast<uint32_t>(points.size()); }
  std::size_t get_bit_length() const { return bit_length; }
  const std::vector<BitVector>& get_points() const { return points; }

private:
  bool parse_stream(std::istream& in);

  bool valid = false;
  std::size_t bit_length = 0;
  std::vector<BitVector> points;
};

} // namespace kspacing
