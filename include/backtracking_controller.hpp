#pragma once
#include "types.hpp"
#include "search_options.hpp"
#include "reduction_engine.hpp"
#include <cstddef>
#include <vector>

enum class TrapKind {
    None,
    Parity,        // even remainder under an even modulus
    SharedFactor   // remainder shares an odd factor with the modulus
};

enum class SearchEventKind {
    Step,            // baseline multiplier accepted
    DeadEnd,         // baseline multiplier rejected
    OffsetRetry,     // k + w replaced the rejected multiplier
    Backtrack,       // earliest odd multiplier bumped by 2, suffix discarded
    BudgetExceeded,
    IterationCap
};

struct SearchEvent {
    SearchEventKind kind;
    size_t step;          // 1-based index of the step concerned
    u64 remainder_in;
    u64 multiplier;
    u64 remainder_out;
    u64 replaced;         // previous multiplier (OffsetRetry, Backtrack)
    StepVerdict verdict;
    TrapKind trap;
};

enum class SearchStatus { Found, Exhausted };

enum class ExhaustionCause {
    None,
    DeadEnd,           // no recovery strategy applied
    NoOddMultiplier,
    BacktrackLimit,
    NodeBudget,
    IterationCap
};

struct SearchResult {
    SearchStatus status = SearchStatus::Exhausted;
    ExhaustionCause cause = ExhaustionCause::None;
    // On exhaustion the trace ends with the step that failed.
    std::vector<u64> multipliers;
    std::vector<u64> remainders;
    int explored_nodes = 0;
    int backtracks = 0;
    unsigned generation = 0;
    std::vector<SearchEvent> events;
};

TrapKind classify_trap(u64 r, u64 modulus);

// Drive the reduction engine from seed (0 < seed < modulus, modulus >= 2)
// towards remainder 1. Never throws for in-range input; running out of
// options is reported as SearchStatus::Exhausted.
SearchResult run_search(u64 seed, u64 modulus, const SearchOptions &opts);

const char* trap_name(TrapKind t);
const char* exhaustion_cause_name(ExhaustionCause c);
