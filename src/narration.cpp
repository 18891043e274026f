#include "narration.hpp"
#include <sstream>

namespace {

void join(std::ostringstream &os, const std::vector<u64> &v) {
    os << "[";
    for (size_t i = 0; i < v.size(); ++i) {
        if (i) os << ", ";
        os << v[i];
    }
    os << "]";
}

void narrate_event(std::ostringstream &os, const SearchEvent &e, u64 y) {
    switch (e.kind) {
        case SearchEventKind::Step:
            os << "Step " << e.step << ": ((" << e.remainder_in << " * " << e.multiplier
               << ") % " << y << ") = " << e.remainder_out << "\n";
            break;
        case SearchEventKind::DeadEnd:
            os << "Dead end at step " << e.step << ": ((" << e.remainder_in << " * "
               << e.multiplier << ") % " << y << ") = " << e.remainder_out << ", "
               << verdict_name(e.verdict);
            if (e.trap != TrapKind::None) os << " (" << trap_name(e.trap) << ")";
            os << "\n";
            break;
        case SearchEventKind::OffsetRetry:
            os << "Step " << e.step << ": adjusted k from " << e.replaced << " to "
               << e.multiplier << ", ((" << e.remainder_in << " * " << e.multiplier
               << ") % " << y << ") = " << e.remainder_out << "\n";
            break;
        case SearchEventKind::Backtrack:
            os << "Backtrack: k[" << e.step << "] " << e.replaced << " -> " << e.multiplier
               << ", ((" << e.remainder_in << " * " << e.multiplier << ") % " << y
               << ") = " << e.remainder_out << "\n";
            break;
        case SearchEventKind::BudgetExceeded:
            os << "Node budget exhausted at remainder " << e.remainder_in << "\n";
            break;
        case SearchEventKind::IterationCap:
            os << "Iteration cap reached at remainder " << e.remainder_in << "\n";
            break;
    }
}

} // namespace

std::string format_steps(const InverseOutcome &out) {
    std::ostringstream os;
    if (out.reason == FailureReason::InvalidInput) {
        os << "Error: " << out.message << "\n";
        return os.str();
    }

    os << "Calculating the inverse of " << out.base << " mod " << out.modulus << "...\n";
    if (out.reason == FailureReason::NotCoprime) {
        os << out.message << "\n";
        return os.str();
    }

    for (const SearchEvent &e : out.events) {
        narrate_event(os, e, out.modulus);
    }

    if (out.method == InverseMethod::Heuristic) {
        os << "(k[1] * k[2] * ... * k[n]) mod y = " << out.inverse << "\n";
    } else if (out.method == InverseMethod::ExtendedEuclid) {
        os << "\nHeuristic search did not reach remainder 1 ("
           << exhaustion_cause_name(out.exhaustion) << ")\n";
        if (out.inconsistency_detected) {
            os << "Internal inconsistency: " << out.message << "\n";
        }
        os << "Extended Euclidean fallback gives z = " << out.inverse << "\n";
    } else {
        os << "\nAlgorithm failed to find inverse: ";
        if (!out.remainders.empty()) os << "final remainder = " << out.remainders.back() << ", ";
        os << out.message << "\n";
    }

    os << "\nFinal Values:\n";
    os << "x = " << out.base << "\n";
    os << "y = " << out.modulus << "\n";
    os << "k[] = ";
    join(os, out.multipliers);
    os << "\nr[] = ";
    join(os, out.remainders);
    os << "\nz = " << (out.success ? out.inverse : 0) << "\n";
    os << "explored nodes = " << out.explored_nodes << ", backtracks = " << out.backtracks << "\n";

    if (out.success) {
        os << "\nValidation step:\n";
        u64 check = (u64)(((u128)out.inverse * (u128)(out.base % out.modulus)) % (u128)out.modulus);
        os << "((" << out.inverse << " * " << out.base << ") mod " << out.modulus
           << ") == 1 is " << (check == 1 ? "true" : "false") << "\n";
    }
    return os.str();
}

std::string format_result(const InverseOutcome &out) {
    std::ostringstream os;
    if (out.success) {
        os << "Inverse of " << out.base << " mod " << out.modulus << " = " << out.inverse;
        if (out.method == InverseMethod::ExtendedEuclid) os << " (extended Euclid fallback)";
    } else if (out.reason == FailureReason::InvalidInput) {
        os << "Error: " << out.message;
    } else {
        os << "No inverse of " << out.base << " mod " << out.modulus << ": " << out.message;
    }
    return os.str();
}

std::string algorithm_explanation() {
    return
        "Inverse by multiplier/remainder reduction\n"
        "\n"
        "Given positive integers x and y, find z with (z * x) mod y == 1.\n"
        "\n"
        "Start from r[0] = x mod y and pick one multiplier per step:\n"
        "  k[i] = floor(y / r[i-1]) + 1, so y < r[i-1] * k[i] <= y + r[i-1]\n"
        "  r[i] = (r[i-1] * k[i]) mod y, expected to satisfy r[i] < r[i-1]\n"
        "Stop when r[n] == 1; then z = (k[1] * k[2] * ... * k[n]) mod y.\n"
        "\n"
        "A step whose remainder is 0 or does not decrease is a dead end. The\n"
        "search then tries k+1 .. k+W at that step, and if the remainder is stuck\n"
        "sharing a factor with y, bumps the earliest odd multiplier by 2,\n"
        "drops the steps after it and continues. Backtracks, explored candidates\n"
        "and steps are all capped, so the search can give up.\n"
        "\n"
        "This is a heuristic and does not always reach 1. Guaranteed mode falls\n"
        "back to the extended Euclidean algorithm when it does not.\n"
        "\n"
        "Validation step:\n"
        "  (z * x) mod y == 1\n";
}

std::string explain(u64 base, u64 modulus, InverseMode mode) {
    return format_steps(compute_inverse(base, modulus, mode));
}
