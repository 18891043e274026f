#pragma once
#include "invmod_config.hpp"

enum class BaselineRule {
    Naive,      // k = y/r when r | y, else floor(y/r) + 1
    Corrected   // k = floor(y/r) + 1
};

struct SearchOptions {
    BaselineRule baseline = INVMOD_CORRECTED_BASELINE ? BaselineRule::Corrected
                                                      : BaselineRule::Naive;
    bool enable_local_offset_retry = true;
    bool enable_parity_backtrack = true;
    // Also backtrack on dead ends whose remainder shares an odd factor with y
    bool extend_backtrack_to_shared_factors = true;

    int offset_window  = INVMOD_OFFSET_WINDOW;
    int max_iterations = INVMOD_MAX_ITERATIONS;
    int max_backtracks = INVMOD_MAX_BACKTRACKS;
    int max_nodes      = INVMOD_MAX_NODES;

    // Plain forward walk: no offset retry, no backtracking.
    static SearchOptions forward_only(BaselineRule rule) {
        SearchOptions o;
        o.baseline = rule;
        o.enable_local_offset_retry = false;
        o.enable_parity_backtrack = false;
        o.extend_backtrack_to_shared_factors = false;
        return o;
    }
};
