#include "reduction_engine.hpp"
#include "modular_arithmetic.hpp"
#include <stdexcept>

u64 baseline_multiplier(u64 r, u64 modulus, BaselineRule rule) {
    if (r == 0 || r >= modulus) {
        throw std::invalid_argument("baseline_multiplier(): remainder out of range");
    }
    // Naive rule lands exactly on 0 whenever r divides y.
    if (rule == BaselineRule::Naive && modulus % r == 0) {
        return modulus / r;
    }
    return modulus / r + 1;
}

ReductionStep reduce_with(u64 r, u64 k, u64 modulus) {
    ReductionStep s;
    s.multiplier = k;
    s.remainder = multiply_mod(r, k, modulus);
    if (s.remainder == 1) {
        s.verdict = StepVerdict::ReachedOne;
    } else if (s.remainder == 0) {
        s.verdict = StepVerdict::ZeroRemainder;
    } else if (s.remainder >= r) {
        s.verdict = StepVerdict::NonDecreasing;
    } else {
        s.verdict = StepVerdict::Decreased;
    }
    return s;
}

ReductionStep propose_step(u64 r, u64 modulus, BaselineRule rule) {
    return reduce_with(r, baseline_multiplier(r, modulus, rule), modulus);
}

const char* verdict_name(StepVerdict v) {
    switch (v) {
        case StepVerdict::ReachedOne:    return "reached 1";
        case StepVerdict::Decreased:     return "decreased";
        case StepVerdict::ZeroRemainder: return "zero remainder";
        case StepVerdict::NonDecreasing: return "remainder not decreasing";
    }
    return "unknown";
}
