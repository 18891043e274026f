#include "backtracking_controller.hpp"
#include "modular_arithmetic.hpp"
#include "search_state.hpp"
#include <stdexcept>
#include <utility>

namespace {

SearchEvent make_event(SearchEventKind kind, size_t step, u64 r_in,
                       const ReductionStep &s, u64 replaced = 0,
                       TrapKind trap = TrapKind::None) {
    SearchEvent e;
    e.kind = kind;
    e.step = step;
    e.remainder_in = r_in;
    e.multiplier = s.multiplier;
    e.remainder_out = s.remainder;
    e.replaced = replaced;
    e.verdict = s.verdict;
    e.trap = trap;
    return e;
}

SearchResult finish(SearchState &st, SearchStatus status, ExhaustionCause cause,
                    std::vector<SearchEvent> &events) {
    SearchResult res;
    res.status = status;
    res.cause = cause;
    res.multipliers = st.multipliers();
    res.remainders = st.remainders();
    res.explored_nodes = st.budget.nodes;
    res.backtracks = st.budget.backtracks;
    res.generation = st.generation();
    res.events = std::move(events);
    return res;
}

// Record the failing step in the trace unless a backtrack already left a
// zero remainder at the tail.
SearchResult exhausted_at(SearchState &st, const ReductionStep &failed,
                          ExhaustionCause cause, std::vector<SearchEvent> &events) {
    if (st.last_remainder() != 0) {
        st.push_step(failed.multiplier, failed.remainder);
    }
    return finish(st, SearchStatus::Exhausted, cause, events);
}

bool backtrack_enabled(TrapKind trap, const SearchOptions &opts) {
    if (!opts.enable_parity_backtrack) return false;
    if (trap == TrapKind::Parity) return true;
    return trap == TrapKind::SharedFactor && opts.extend_backtrack_to_shared_factors;
}

// Bump the earliest odd multiplier by 2 and recompute that step. A bump that
// lands on remainder 0 is bumped again while the budget allows.
ExhaustionCause backtrack_earliest_odd(SearchState &st, TrapKind trap,
                                       std::vector<SearchEvent> &events) {
    for (;;) {
        if (!st.budget.can_backtrack()) {
            return st.budget.nodes_exhausted() ? ExhaustionCause::NodeBudget
                                               : ExhaustionCause::BacktrackLimit;
        }
        long idx = st.earliest_odd_multiplier();
        if (idx < 0) return ExhaustionCause::NoOddMultiplier;

        st.budget.note_backtrack();
        st.budget.visit();

        const u64 old_k = st.multipliers()[idx];
        const u64 r_in = st.remainders()[idx];
        st.truncate((size_t)idx);
        ReductionStep s = reduce_with(r_in, old_k + 2, st.modulus());
        st.push_step(s.multiplier, s.remainder);
        events.push_back(make_event(SearchEventKind::Backtrack, st.steps(), r_in, s, old_k, trap));

        if (s.verdict != StepVerdict::ZeroRemainder) return ExhaustionCause::None;
    }
}

} // namespace

TrapKind classify_trap(u64 r, u64 modulus) {
    if (r % 2 == 0 && modulus % 2 == 0) return TrapKind::Parity;
    if (gcd_u64(r, modulus) > 1) return TrapKind::SharedFactor;
    return TrapKind::None;
}

SearchResult run_search(u64 seed, u64 modulus, const SearchOptions &opts) {
    if (modulus < 2 || seed == 0 || seed >= modulus) {
        throw std::invalid_argument("run_search(): seed must lie in (0, modulus)");
    }

    SearchState st(seed, modulus, opts);
    std::vector<SearchEvent> events;

    for (;;) {
        if (st.steps() > 0 && st.last_remainder() == 1) {
            return finish(st, SearchStatus::Found, ExhaustionCause::None, events);
        }

        const u64 r = st.last_remainder();
        if ((int)st.steps() >= opts.max_iterations) {
            ReductionStep none{0, r, StepVerdict::NonDecreasing};
            events.push_back(make_event(SearchEventKind::IterationCap, st.steps(), r, none));
            return finish(st, SearchStatus::Exhausted, ExhaustionCause::IterationCap, events);
        }
        if (!st.budget.visit()) {
            ReductionStep none{0, r, StepVerdict::NonDecreasing};
            events.push_back(make_event(SearchEventKind::BudgetExceeded, st.steps(), r, none));
            return finish(st, SearchStatus::Exhausted, ExhaustionCause::NodeBudget, events);
        }

        const ReductionStep s = propose_step(r, modulus, opts.baseline);
        if (is_accepted(s.verdict)) {
            st.push_step(s.multiplier, s.remainder);
            events.push_back(make_event(SearchEventKind::Step, st.steps(), r, s));
            continue;
        }

        const TrapKind trap = classify_trap(r, modulus);
        events.push_back(make_event(SearchEventKind::DeadEnd, st.steps() + 1, r, s, 0, trap));

        if (opts.enable_local_offset_retry) {
            bool replaced = false;
            for (int w = 1; w <= opts.offset_window; ++w) {
                if (!st.budget.visit()) {
                    events.push_back(make_event(SearchEventKind::BudgetExceeded, st.steps() + 1, r, s));
                    return exhausted_at(st, s, ExhaustionCause::NodeBudget, events);
                }
                ReductionStep c = reduce_with(r, s.multiplier + (u64)w, modulus);
                if (is_accepted(c.verdict)) {
                    st.push_step(c.multiplier, c.remainder);
                    events.push_back(make_event(SearchEventKind::OffsetRetry, st.steps(), r, c, s.multiplier));
                    replaced = true;
                    break;
                }
            }
            if (replaced) continue;
        }

        if (!backtrack_enabled(trap, opts)) {
            return exhausted_at(st, s, ExhaustionCause::DeadEnd, events);
        }
        ExhaustionCause cause = backtrack_earliest_odd(st, trap, events);
        if (cause != ExhaustionCause::None) {
            return exhausted_at(st, s, cause, events);
        }
    }
}

const char* trap_name(TrapKind t) {
    switch (t) {
        case TrapKind::None:         return "none";
        case TrapKind::Parity:       return "parity trap";
        case TrapKind::SharedFactor: return "shared-factor trap";
    }
    return "unknown";
}

const char* exhaustion_cause_name(ExhaustionCause c) {
    switch (c) {
        case ExhaustionCause::None:            return "none";
        case ExhaustionCause::DeadEnd:         return "dead end";
        case ExhaustionCause::NoOddMultiplier: return "no odd multiplier to backtrack to";
        case ExhaustionCause::BacktrackLimit:  return "backtrack limit reached";
        case ExhaustionCause::NodeBudget:      return "node budget exhausted";
        case ExhaustionCause::IterationCap:    return "iteration cap reached";
    }
    return "unknown";
}
