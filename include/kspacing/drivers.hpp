#pragma once

#include <ostream>

namespace kspacing {

// Command-line entry points behind algorithms/*/main.cpp. Summary lines go to
// out, diagnostics and verbose traces to err. Return value is the exit code:
//   0 success, 1 usage/argument error, 2 input parse error,
//   3 output error, 4 clustering precondition/runtime error.
int run_explicit_spacing(int argc, char** argv, std::ostream& out, std::ostream& err);
int run_hamming_clusters(int argc, char** argv, std::ostream& out, std::ostream& err);

} // namespace kspacing
