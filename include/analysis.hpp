#pragma once
#include "types.hpp"
#include <string>
#include <vector>

struct AnalysisRow {
    u64 x;
    u64 y;
    bool naive_success;       // naive rule, no recovery
    bool corrected_success;   // corrected rule, no recovery
    bool backtrack_success;   // corrected rule, offset retry + backtracking
    int corrected_steps;      // -1 when that variant failed
    int backtrack_steps;
    int explored_nodes;
    bool fallback;            // guaranteed mode needed Extended Euclid
    bool reference_match;     // guaranteed answer agrees with mpz_invert
};

struct ModulusSummary {
    u64 y;
    int samples;
    double naive_rate;
    double corrected_rate;
    double backtrack_rate;
    double avg_corrected_steps;   // over successful runs, 0 when none
    double avg_backtrack_steps;
    int fallbacks;
};

// mpz_invert of x mod y; false when no inverse exists.
bool reference_inverse(u64 x, u64 y, u64 &inv);

AnalysisRow analyze_pair(u64 x, u64 y);

// y = 2..max_y; every coprime x < y, or the first sample_per_y of them.
std::vector<AnalysisRow> analyze_range(u64 max_y, int sample_per_y);

std::vector<ModulusSummary> summarize(const std::vector<AnalysisRow> &rows);

void write_csv(const std::vector<AnalysisRow> &rows, const std::string &path);
