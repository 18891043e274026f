#pragma once
#include "types.hpp"
#include "search_options.hpp"
#include "backtracking_controller.hpp"
#include <string>
#include <vector>

enum class InverseMode {
    HeuristicOnly,  // may report SearchExhausted
    Guaranteed      // Extended Euclid fallback, total on coprime input
};

enum class InverseMethod { None, Heuristic, ExtendedEuclid };

enum class FailureReason {
    None,
    InvalidInput,
    NotCoprime,
    SearchExhausted,
    InternalInconsistency
};

struct InverseOutcome {
    bool success = false;
    u64 base = 0;
    u64 modulus = 0;
    u64 inverse = 0;
    InverseMethod method = InverseMethod::None;
    FailureReason reason = FailureReason::None;
    u64 gcd = 0;                  // set for NotCoprime
    std::string message;          // set for InvalidInput and diagnostics

    // Heuristic trace. For an Extended Euclid answer the accepted sequence is
    // empty and remainders holds only the seed; the failed attempt survives
    // in `events` and `exhaustion`.
    std::vector<u64> multipliers;
    std::vector<u64> remainders;
    int explored_nodes = 0;
    int backtracks = 0;
    ExhaustionCause exhaustion = ExhaustionCause::None;
    bool inconsistency_detected = false;
    std::vector<SearchEvent> events;
};

InverseOutcome compute_inverse(u64 base, u64 modulus, InverseMode mode,
                               const SearchOptions &opts = SearchOptions());

// Decimal-string entry point for CLI and route callers.
InverseOutcome compute_inverse(const std::string &base, const std::string &modulus,
                               InverseMode mode,
                               const SearchOptions &opts = SearchOptions());

u64 max_supported_modulus();

const char* method_name(InverseMethod m);
const char* reason_name(FailureReason r);
