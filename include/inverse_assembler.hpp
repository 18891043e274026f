#pragma once
#include "types.hpp"
#include "bigint_utils.hpp"
#include <vector>

struct AssembledInverse {
    bool valid;        // (inverse * base) mod y == 1 and the trace ends at 1
    u64 inverse;
    cpp_int product;   // k[1] * ... * k[n], unreduced
};

// inverse = (k[1] * ... * k[n]) mod y, checked against base.
AssembledInverse assemble_inverse(const std::vector<u64> &multipliers,
                                  const std::vector<u64> &remainders,
                                  u64 base, u64 modulus);
