#include "kspacing/edge_list.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

namespace kspacing {

namespace {

bool skippable(const std::string& line) {
  std::size_t i = line.find_first_not_of(" \t\r");
  if (i == std::string::npos) return true;
  return line[i] == 'c' || line[i] == '#';
}

} // namespace

EdgeList::EdgeList(std::istream& in, uint32_t label_base) {
  parse_stream(in, label_base);
}

EdgeList::EdgeList(const std::string& file_path, uint32_t label_base) {
  std::ifstream file(file_path);
  if (!file.is_open()) {
    std::cerr << "Error: Could not open edge list file: " << file_path << std::endl;
    return;
  }
  parse_stream(file, label_base);
}

bool EdgeList::parse_stream(std::istream& in, uint32_t label_base) {
  valid = false;
  element_count = 0;
  edges.clear();

  std::string line;
  while (std::getline(in, line)) {
    if (!skippable(line)) break;
  }

  // Header: element count
  {
    std::istringstream hs(line);
    long long n = -1;
    if (!(hs >> n) || n < 0 || n > static_cast<long long>(UINT32_MAX)) {
      std::cerr << "Error: Missing or invalid element count header." << std::endl;
      return false;
    }
    element_count = static_cast<uint32_t>(n);
  }

  const long long lo = label_base;
  const long long hi = static_cast<long long>(label_base) + element_count; // exclusive
  std::size_t line_no = 1;
  while (std::getline(in, line)) {
    ++line_no;
    if (skippable(line)) continue;
    std::istringstream ls(line);
    long long a = 0, b = 0, d = 0;
    if (!(ls >> a >> b >> d)) {
      std::cerr << "Error: line " << line_no << ": expected '<a> <b> <distance>'." << std::endl;
      return false;
    }
    if (a < lo || a >= hi || b < lo || b >= hi) {
      std::cerr << "Error: line " << line_no << ": label out of range [" << lo << ", " << hi << ")." << std::endl;
      return false;
    }
    if (d < 0) {
      std::cerr << "Error: line " << line_no << ": negative distance " << d << "." << std::endl;
      return false;
    }
    edges.push_back(WeightedEdge{static_cast<uint32_t>(a - lo), static_cast<uint32_t>(b - lo), d});
  }

  valid = true;
  return valid;
}

} // namespace kspacing
