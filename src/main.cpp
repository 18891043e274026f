#include "../include/invmod_config.hpp"
#include "../include/invmod.hpp"
#include "../include/narration.hpp"
#include "../include/route_facade.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

static void usage(const char* prog) {
    fprintf(stderr, "Usage:\n");
    fprintf(stderr, "  %s X Y [--steps|--result|--explain] [--guaranteed|--heuristic-only]\n", prog);
    fprintf(stderr, "         [--naive] [--no-offset] [--no-backtrack] [--no-shared-factor]\n");
    fprintf(stderr, "         [-w W] [-b B] [-n NODES] [-i ITER]\n");
    fprintf(stderr, "  %s --route TARGET          (e.g. \"/inverse-mod-z?x=3&y=7\")\n", prog);
    fprintf(stderr, "  %s --explain\n", prog);
    fprintf(stderr, "\nX and Y are positive integers or files whose first line holds one.\n");
    fprintf(stderr, "Defaults: W=%d B=%d NODES=%d ITER=%d (compile with -DINVMOD_...=X)\n",
            INVMOD_OFFSET_WINDOW, INVMOD_MAX_BACKTRACKS, INVMOD_MAX_NODES, INVMOD_MAX_ITERATIONS);
}

// Operand literal, or the first line of the file it names.
static std::string read_operand(const char* arg) {
    std::string s;
    std::ifstream fin(arg);
    if (fin) { std::getline(fin, s); fin.close(); }
    else     { s = arg; }
    while (!s.empty() && (s.back() == '\r' || s.back() == ' ')) s.pop_back();
    return s;
}

static bool parse_count(const char* flag, const char* text, int& out) {
    char* endptr = nullptr;
    long v = std::strtol(text, &endptr, 10);
    if (*endptr != '\0' || v <= 0 || v > 1000000) {
        fprintf(stderr, "Error: invalid value for %s (got '%s').\n", flag, text);
        return false;
    }
    out = (int)v;
    return true;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    const std::string first = argv[1];
    if (first == "--explain" && argc == 2) {
        printf("%s", algorithm_explanation().c_str());
        return 0;
    }
    if (first == "--route") {
        if (argc != 3) {
            fprintf(stderr, "Error: --route takes exactly one TARGET.\n");
            return 1;
        }
        RouteResponse resp = handle_route("GET", argv[2]);
        printf("HTTP %d\n\n%s", resp.status, resp.body.c_str());
        return resp.status == 200 ? 0 : 1;
    }
    if (argc < 3) {
        usage(argv[0]);
        return 1;
    }

    enum class Output { Steps, Result, Explain } output = Output::Steps;
    InverseMode mode = InverseMode::Guaranteed;
    SearchOptions opts;

    for (int i = 3; i < argc; ++i) {
        const std::string a = argv[i];
        const bool has_value = i + 1 < argc;
        if      (a == "--steps")            output = Output::Steps;
        else if (a == "--result")           output = Output::Result;
        else if (a == "--explain")          output = Output::Explain;
        else if (a == "--guaranteed")       mode = InverseMode::Guaranteed;
        else if (a == "--heuristic-only")   mode = InverseMode::HeuristicOnly;
        else if (a == "--naive")            opts.baseline = BaselineRule::Naive;
        else if (a == "--no-offset")        opts.enable_local_offset_retry = false;
        else if (a == "--no-backtrack")     opts.enable_parity_backtrack = false;
        else if (a == "--no-shared-factor") opts.extend_backtrack_to_shared_factors = false;
        else if (a == "-w" && has_value) { if (!parse_count("-w", argv[++i], opts.offset_window))  return 1; }
        else if (a == "-b" && has_value) { if (!parse_count("-b", argv[++i], opts.max_backtracks)) return 1; }
        else if (a == "-n" && has_value) { if (!parse_count("-n", argv[++i], opts.max_nodes))      return 1; }
        else if (a == "-i" && has_value) { if (!parse_count("-i", argv[++i], opts.max_iterations)) return 1; }
        else {
            fprintf(stderr, "Error: unknown or incomplete option '%s'.\n", a.c_str());
            usage(argv[0]);
            return 1;
        }
    }

    const std::string xs = read_operand(argv[1]);
    const std::string ys = read_operand(argv[2]);
    InverseOutcome out = compute_inverse(xs, ys, mode, opts);

    if (out.reason == FailureReason::InvalidInput) {
        fprintf(stderr, "Error: %s (got x='%s', y='%s').\n",
                out.message.c_str(), xs.c_str(), ys.c_str());
        return 1;
    }
    if (out.inconsistency_detected) {
        fprintf(stderr, "[search] internal inconsistency: %s\n", out.message.c_str());
    }

    switch (output) {
        case Output::Steps:
            printf("%s", format_steps(out).c_str());
            break;
        case Output::Result:
            printf("%s\n", format_result(out).c_str());
            break;
        case Output::Explain:
            printf("%s\n%s", algorithm_explanation().c_str(), format_steps(out).c_str());
            break;
    }
    return out.success ? 0 : 2;
}
