#include "analysis.hpp"
#include "timing.hpp"
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    long max_y = 200;
    long sample = 0;
    std::string csv_path = "complexity.csv";

    if (argc > 1) {
        char* endptr = nullptr;
        max_y = std::strtol(argv[1], &endptr, 10);
        if (*endptr != '\0' || max_y < 2) {
            fprintf(stderr, "Error: MAX_Y must be an integer >= 2 (got '%s').\n", argv[1]);
            return 1;
        }
    }
    if (argc > 2) {
        char* endptr = nullptr;
        sample = std::strtol(argv[2], &endptr, 10);
        if (*endptr != '\0' || sample < 0) {
            fprintf(stderr, "Error: SAMPLE_PER_Y must be a non-negative integer (got '%s').\n", argv[2]);
            return 1;
        }
    }
    if (argc > 3) csv_path = argv[3];
    if (argc > 4) {
        fprintf(stderr, "Usage: %s [MAX_Y] [SAMPLE_PER_Y] [CSV_PATH]\n", argv[0]);
        return 1;
    }

    printf("=== Multiplier/remainder inverse: analysis up to y=%ld, samplePerY=%ld ===\n",
           max_y, sample);

    auto t_start = now_tp();
    std::vector<AnalysisRow> rows = analyze_range((u64)max_y, (int)sample);
    double analyze_ms = ms_since(t_start);

    try {
        write_csv(rows, csv_path);
    } catch (const std::exception& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }
    printf("[analysis] CSV written: %s (%zu rows)\n", csv_path.c_str(), rows.size());

    int mismatches = 0;
    for (const AnalysisRow& r : rows) {
        if (r.reference_match) continue;
        if (mismatches < 5)
            fprintf(stderr, "Mismatch against mpz_invert at x=%llu y=%llu\n", r.x, r.y);
        ++mismatches;
    }

    printf("\ny, samples, naive, corrected, backtrack, avgCorrectedSteps, avgBacktrackSteps, fallbacks, log2y\n");
    int total = 0, naive = 0, corrected = 0, backtrack = 0, fallbacks = 0;
    for (const ModulusSummary& s : summarize(rows)) {
        printf("%llu, %d, %.1f%%, %.1f%%, %.1f%%, %.2f, %.2f, %d, %.3f\n",
               s.y, s.samples, s.naive_rate * 100.0, s.corrected_rate * 100.0,
               s.backtrack_rate * 100.0, s.avg_corrected_steps, s.avg_backtrack_steps,
               s.fallbacks, std::log2((double)s.y));
        total += s.samples;
        naive += (int)std::lround(s.naive_rate * s.samples);
        corrected += (int)std::lround(s.corrected_rate * s.samples);
        backtrack += (int)std::lround(s.backtrack_rate * s.samples);
        fallbacks += s.fallbacks;
    }

    printf("\n=== Totals ===\n");
    printf("pairs=%d | naive %d | corrected %d | backtrack %d | fallbacks %d | mismatches=%d\n",
           total, naive, corrected, backtrack, fallbacks, mismatches);
    printf("[timing] %.2f ms (%.2f pairs/s)\n", analyze_ms, rate_per_second(total, analyze_ms));

    return mismatches == 0 ? 0 : 1;
}
