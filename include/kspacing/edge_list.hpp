#pragma once

#include <cstdint>
#include <istream>
#include <string>
#include <vector>

namespace kspacing {

struct WeightedEdge
{
  uint32_t u;        // 0-based element id
  uint32_t v;        // 0-based element id
  int64_t distance;  // non-negative
};

// Reads an explicit distance graph:
//
//   <N>
//   <a> <b> <distance>
//   ...
//
// Labels are shifted by label_base so that ids land in [0, N). Lines that are
// blank or start with 'c' / '#' are skipped. Malformed input is reported on
// std::cerr and leaves the list invalid.
class EdgeList {
public:
  EdgeList(std::istream& in, uint32_t label_base = 1);
  EdgeList(const std::string& file_path, uint32_t label_base = 1);

  bool is_valid() const { return valid; }
  uint32_t get_element_count() const { return element_count; }
  const std::vector<WeightedEdge>& get_edges() const { return edges; }
  std::vector<WeightedEdge>& get_edges() { return edges; }

private:
  bool parse_stream(std::istream& in, uint32_t label_base);

  bool valid = false;
  uint32_t element_count = 0;
  std::vector<WeightedEdge> edges;
};

} // namespace kspacing
