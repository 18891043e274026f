#pragma once
#include "invmod.hpp"
#include <string>

// Plain-text renderings of an InverseOutcome. They read only the outcome,
// never re-run the search.
std::string format_steps(const InverseOutcome &out);
std::string format_result(const InverseOutcome &out);
std::string algorithm_explanation();

// format_steps(compute_inverse(base, modulus, mode))
std::string explain(u64 base, u64 modulus, InverseMode mode = InverseMode::Guaranteed);
