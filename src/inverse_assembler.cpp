#include "inverse_assembler.hpp"
#include <stdexcept>

AssembledInverse assemble_inverse(const std::vector<u64> &multipliers,
                                  const std::vector<u64> &remainders,
                                  u64 base, u64 modulus) {
    if (modulus == 0) {
        throw std::invalid_argument("assemble_inverse(): zero modulus");
    }

    AssembledInverse out;
    out.product = 1;
    for (u64 k : multipliers) {
        out.product *= k;
    }
    const cpp_int m(modulus);
    cpp_int z = out.product % m;
    out.inverse = z.convert_to<u64>();

    bool ends_at_one = remainders.size() == multipliers.size() + 1 &&
                       remainders.back() == 1;
    out.valid = ends_at_one && (z * cpp_int(base)) % m == 1;
    return out;
}
