#pragma once
#include <chrono>

namespace kspacing {

// Wall-clock stopwatch for the phase timings in the summary lines.
class Timer {
public:
    using clock = std::chrono::steady_clock;

    Timer() { reset(); }

    void reset() { start_ = clock::now(); }

    double sec() const {
        return std::chrono::duration<double>(clock::now() - start_).count();
    }

private:
    clock::time_point start_{};
};

} // namespace kspacing
