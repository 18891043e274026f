#include "analysis.hpp"
#include "invmod.hpp"
#include "modular_arithmetic.hpp"
#include <gmpxx.h>
#include <fstream>
#include <map>
#include <stdexcept>
#include <string>

bool reference_inverse(u64 x, u64 y, u64 &inv) {
    mpz_class a(std::to_string(x)), m(std::to_string(y)), r;
    if (mpz_invert(r.get_mpz_t(), a.get_mpz_t(), m.get_mpz_t()) == 0) {
        return false;
    }
    inv = std::stoull(r.get_str());
    return true;
}

AnalysisRow analyze_pair(u64 x, u64 y) {
    AnalysisRow row{};
    row.x = x;
    row.y = y;

    InverseOutcome naive = compute_inverse(x, y, InverseMode::HeuristicOnly,
                                           SearchOptions::forward_only(BaselineRule::Naive));
    InverseOutcome corrected = compute_inverse(x, y, InverseMode::HeuristicOnly,
                                               SearchOptions::forward_only(BaselineRule::Corrected));
    InverseOutcome full = compute_inverse(x, y, InverseMode::Guaranteed);

    row.naive_success = naive.success;
    row.corrected_success = corrected.success;
    row.corrected_steps = corrected.success ? (int)corrected.multipliers.size() : -1;
    row.backtrack_success = full.method == InverseMethod::Heuristic;
    row.backtrack_steps = row.backtrack_success ? (int)full.multipliers.size() : -1;
    row.explored_nodes = full.explored_nodes;
    row.fallback = full.method == InverseMethod::ExtendedEuclid;

    u64 ref = 0;
    bool has_ref = reference_inverse(x, y, ref);
    row.reference_match = full.success ? (has_ref && ref == full.inverse) : !has_ref;
    return row;
}

std::vector<AnalysisRow> analyze_range(u64 max_y, int sample_per_y) {
    std::vector<AnalysisRow> rows;
    for (u64 y = 2; y <= max_y; ++y) {
        int taken = 0;
        for (u64 x = 1; x < y; ++x) {
            if (sample_per_y > 0 && taken >= sample_per_y) break;
            if (gcd_u64(x, y) != 1) continue;
            rows.push_back(analyze_pair(x, y));
            ++taken;
        }
    }
    return rows;
}

std::vector<ModulusSummary> summarize(const std::vector<AnalysisRow> &rows) {
    std::map<u64, std::vector<const AnalysisRow*>> by_y;
    for (const AnalysisRow &r : rows) by_y[r.y].push_back(&r);

    std::vector<ModulusSummary> out;
    out.reserve(by_y.size());
    for (const auto &kv : by_y) {
        const auto &group = kv.second;
        ModulusSummary s{};
        s.y = kv.first;
        s.samples = (int)group.size();
        int naive = 0, corrected = 0, backtrack = 0;
        long corrected_steps = 0, backtrack_steps = 0;
        for (const AnalysisRow *r : group) {
            naive += r->naive_success;
            if (r->corrected_success) { ++corrected; corrected_steps += r->corrected_steps; }
            if (r->backtrack_success) { ++backtrack; backtrack_steps += r->backtrack_steps; }
            s.fallbacks += r->fallback;
        }
        s.naive_rate = (double)naive / s.samples;
        s.corrected_rate = (double)corrected / s.samples;
        s.backtrack_rate = (double)backtrack / s.samples;
        s.avg_corrected_steps = corrected ? (double)corrected_steps / corrected : 0.0;
        s.avg_backtrack_steps = backtrack ? (double)backtrack_steps / backtrack : 0.0;
        out.push_back(s);
    }
    return out;
}

void write_csv(const std::vector<AnalysisRow> &rows, const std::string &path) {
    std::ofstream f(path);
    if (!f) throw std::runtime_error("Cannot open file: " + path);

    f << "x,y,naive_success,corrected_success,backtrack_success,"
         "corrected_steps,backtrack_steps,explored_nodes,fallback\n";
    for (const AnalysisRow &r : rows) {
        f << r.x << "," << r.y << ","
          << (r.naive_success ? 1 : 0) << ","
          << (r.corrected_success ? 1 : 0) << ","
          << (r.backtrack_success ? 1 : 0) << ",";
        if (r.corrected_steps >= 0) f << r.corrected_steps;
        f << ",";
        if (r.backtrack_steps >= 0) f << r.backtrack_steps;
        f << "," << r.explored_nodes << "," << (r.fallback ? 1 : 0) << "\n";
    }
    if (!f) throw std::runtime_error("Write failed: " + path);
}
