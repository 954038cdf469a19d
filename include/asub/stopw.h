#pragma once

#include <chrono>

namespace asub {
/// Wall-clock stopwatch started at construction.
class StopW {
    std::chrono::steady_clock::time_point time_begin;

  public:
    StopW() { time_begin = std::chrono::steady_clock::now(); }

    double getElapsedTimeMili() const {
        std::chrono::steady_clock::time_point time_end = std::chrono::steady_clock::now();
        return std::chrono::duration<double, std::milli>(time_end - time_begin).count();
    }

    double getElapsedTimeSec() const { return getElapsedTimeMili() / 1000.0; }
};
} // namespace asub
