#pragma once
#include "types.hpp"
#include "search_options.hpp"

enum class StepVerdict {
    ReachedOne,     // r' == 1
    Decreased,      // 0 < r' < r
    ZeroRemainder,  // r' == 0, dead end
    NonDecreasing   // r' >= r, dead end
};

struct ReductionStep {
    u64 multiplier;
    u64 remainder;
    StepVerdict verdict;
};

// Multiplier chosen by the baseline rule for 0 < r < y.
u64 baseline_multiplier(u64 r, u64 modulus, BaselineRule rule);

// r' = (r * k) mod y and its verdict relative to r.
ReductionStep reduce_with(u64 r, u64 k, u64 modulus);

ReductionStep propose_step(u64 r, u64 modulus, BaselineRule rule);

inline bool is_accepted(StepVerdict v) {
    return v == StepVerdict::ReachedOne || v == StepVerdict::Decreased;
}

const char* verdict_name(StepVerdict v);
