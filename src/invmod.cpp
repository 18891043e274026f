#include "invmod.hpp"
#include "bigint_utils.hpp"
#include "inverse_assembler.hpp"
#include "invmod_config.hpp"
#include "modular_arithmetic.hpp"
#include <string>
#include <utility>

namespace {

InverseOutcome rejected(u64 base, u64 modulus, const std::string &why) {
    InverseOutcome out;
    out.base = base;
    out.modulus = modulus;
    out.reason = FailureReason::InvalidInput;
    out.message = why;
    return out;
}

void apply_fallback(InverseOutcome &out, u64 seed) {
    out.success = true;
    out.method = InverseMethod::ExtendedEuclid;
    out.reason = FailureReason::None;
    out.inverse = modinv_u64(seed, out.modulus);
    out.multipliers.clear();
    out.remainders.assign(1, seed);
}

} // namespace

u64 max_supported_modulus() {
    return 1ull << INVMOD_MAX_MODULUS_BITS;
}

InverseOutcome compute_inverse(u64 base, u64 modulus, InverseMode mode,
                               const SearchOptions &opts) {
    if (base == 0 || modulus == 0) {
        return rejected(base, modulus, "x and y must be positive integers");
    }
    if (modulus > max_supported_modulus()) {
        return rejected(base, modulus, "y must not exceed 2^" +
                        std::to_string(INVMOD_MAX_MODULUS_BITS));
    }

    InverseOutcome out;
    out.base = base;
    out.modulus = modulus;

    const u64 seed = base % modulus;
    if (seed == 0) {
        out.reason = FailureReason::NotCoprime;
        out.gcd = modulus;
        out.message = std::to_string(base) + " is a multiple of " +
                      std::to_string(modulus) + ", no inverse exists";
        return out;
    }
    const u64 g = gcd_u64(seed, modulus);
    if (g != 1) {
        out.reason = FailureReason::NotCoprime;
        out.gcd = g;
        out.message = std::to_string(base) + " and " + std::to_string(modulus) +
                      " are not coprime (GCD = " + std::to_string(g) + "), no inverse exists";
        return out;
    }

    SearchResult search = run_search(seed, modulus, opts);
    out.multipliers = std::move(search.multipliers);
    out.remainders = std::move(search.remainders);
    out.explored_nodes = search.explored_nodes;
    out.backtracks = search.backtracks;
    out.exhaustion = search.cause;
    out.events = std::move(search.events);

    if (search.status == SearchStatus::Found) {
        AssembledInverse z = assemble_inverse(out.multipliers, out.remainders, base, modulus);
        if (z.valid) {
            out.success = true;
            out.method = InverseMethod::Heuristic;
            out.inverse = z.inverse;
            return out;
        }
        out.inconsistency_detected = true;
        out.reason = FailureReason::InternalInconsistency;
        out.message = "accepted multiplier sequence gives " + std::to_string(z.inverse) +
                      ", which fails (z * x) mod y == 1";
    } else {
        out.reason = FailureReason::SearchExhausted;
        out.message = std::string("heuristic search exhausted: ") +
                      exhaustion_cause_name(search.cause);
    }

    if (mode == InverseMode::Guaranteed) {
        apply_fallback(out, seed);
    }
    return out;
}

InverseOutcome compute_inverse(const std::string &base, const std::string &modulus,
                               InverseMode mode, const SearchOptions &opts) {
    cpp_int x, y;
    if (!parse_positive_decimal(base, x) || !parse_positive_decimal(modulus, y)) {
        return rejected(0, 0, "x and y must be positive integers");
    }
    if (!fits_u64(x) || !fits_u64(y)) {
        return rejected(0, 0, "x and y must fit in 64 bits");
    }
    return compute_inverse(x.convert_to<u64>(), y.convert_to<u64>(), mode, opts);
}

const char* method_name(InverseMethod m) {
    switch (m) {
        case InverseMethod::None:           return "none";
        case InverseMethod::Heuristic:      return "heuristic";
        case InverseMethod::ExtendedEuclid: return "extendedEuclid";
    }
    return "unknown";
}

const char* reason_name(FailureReason r) {
    switch (r) {
        case FailureReason::None:                  return "none";
        case FailureReason::InvalidInput:          return "invalidInput";
        case FailureReason::NotCoprime:            return "notCoprime";
        case FailureReason::SearchExhausted:       return "searchExhausted";
        case FailureReason::InternalInconsistency: return "internalInconsistency";
    }
    return "unknown";
}
