#include "kspacing/bit_dataset.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <utility>

namespace kspacing {

BitDataset::BitDataset(std::istream& in) {
  parse_stream(in);
}

BitDataset::BitDataset(const std::string& file_path) {
  std::ifstream file(file_path);
  if (!file.is_open()) {
    std::cerr << "Error: Could not open bit dataset file: " << file_path << std::endl;
    return;
  }
  parse_stream(file);
}

bool BitDataset::parse_stream(std::istream& in) {
  valid = false;
  bit_length = 0;
  points.clear();

  std::string line;
  while (std::getline(in, line)) {
    if (line.find_first_not_of(" \t\r") != std::string::npos) break;
  }

  long long m = -1, l = -1;
  {
    std::istringstream hs(line);
    if (!(hs >> m >> l) || m < 0 || l < 1) {
      std::cerr << "Error: Missing or invalid '<count> <bits>' header." << std::endl;
      return false;
    }
  }
  bit_length = static_cast<std::size_t>(l);

  std::size_t line_no = 1;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.find_first_not_of(" \t\r") == std::string::npos) continue;

    // Validate the row before allocating, so the header alone never sizes memory
    std::size_t found = 0;
    for (char c : line) {
      if (c == ' ' || c == '\t' || c == '\r') continue;
      if (c != '0' && c != '1') {
        std::cerr << "Error: line " << line_no << ": non-binary symbol '" << c << "'." << std::endl;
        return false;
      }
      ++found;
    }
    if (found != bit_length) {
      std::cerr << "Error: line " << line_no << ": expected " << bit_length << " bits, found " << found << "." << std::endl;
      return false;
    }
    if (points.size() == static_cast<std::size_t>(m)) {
      std::cerr << "Error: more than the " << m << " declared points." << std::endl;
      return false;
    }

    BitVector v(bit_length);
    std::size_t pos = 0;
    for (char c : line) {
      if (c == '0') ++pos;
      else if (c == '1') v.set(pos++);
    }
    points.push_back(std::move(v));
  }

  if (points.size() != static_cast<std::size_t>(m)) {
    std::cerr << "Error: header declares " << m << " points, found " << points.size() << "." << std::endl;
    return false;
  }
  valid = true;
  return valid;
}

} // namespace kspacing
