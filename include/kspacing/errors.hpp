#pragma once

#include <stdexcept>
#include <string>

namespace kspacing {

// Requested cluster count k is outside [2, number of elements).
class InvalidClusterTarget : public std::domain_error {
public:
    explicit InvalidClusterTarget(const std::string& what) : std::domain_error(what) {}
};

// Spacing threshold / Hamming distance below 1.
class InvalidDistanceParameter : public std::domain_error {
public:
    explicit InvalidDistanceParameter(const std::string& what) : std::domain_error(what) {}
};

// Disjoint-set operation on an identifier outside [0, n).
class IndexOutOfRange : public std::out_of_range {
public:
    explicit IndexOutOfRange(const std::string& what) : std::out_of_range(what) {}
};

// The edge set ran out before two distinct clusters were ever connected,
// so no spacing is observable (input graph is disconnected).
class SpacingUndefined : public std::runtime_error {
public:
    explicit SpacingUndefined(const std::string& what) : std::runtime_error(what) {}
};

} // namespace kspacing
