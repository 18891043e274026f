#pragma once
#include <chrono>

using steady_tp = std::chrono::steady_clock::time_point;

static inline steady_tp now_tp() {
    return std::chrono::steady_clock::now();
}

static inline double ms_since(steady_tp t0) {
    return std::chrono::duration<double, std::milli>(now_tp() - t0).count();
}

// Pairs (or any unit) per second over `ms` milliseconds; 0 for an empty interval.
static inline double rate_per_second(double count, double ms) {
    return (ms > 0.0) ? count * 1000.0 / ms : 0.0;
}
