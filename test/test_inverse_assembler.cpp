#include "inverse_assembler.hpp"
#include "gtest/gtest.h"
#include <stdexcept>

namespace {


TEST(InverseAssembler, product_reduced_and_validated) {
    AssembledInverse z = assemble_inverse({3, 4}, {3, 2, 1}, 3, 7);
    EXPECT_TRUE(z.valid);
    EXPECT_EQ(5ull, z.inverse);
    EXPECT_EQ(cpp_int(12), z.product);

    z = assemble_inverse({2, 2, 3, 19}, {31, 25, 13, 2, 1}, 31, 37);
    EXPECT_TRUE(z.valid);
    EXPECT_EQ(6ull, z.inverse);
}

TEST(InverseAssembler, unreduced_base_is_accepted) {
    AssembledInverse z = assemble_inverse({2}, {3, 1}, 8, 5);
    EXPECT_TRUE(z.valid);
    EXPECT_EQ(2ull, z.inverse);
}

TEST(InverseAssembler, product_beyond_64_bits) {
    // (2^63 + 1)^3 overflows u64; the result must still be exact
    const u64 y = 9223372036854775808ull;
    AssembledInverse z = assemble_inverse({y + 1, y + 1, y + 1}, {1, 1, 1, 1}, 1, y);
    EXPECT_TRUE(z.valid);
    EXPECT_EQ(1ull, z.inverse);
    EXPECT_GT(z.product, cpp_int(~0ull));
}

TEST(InverseAssembler, inconsistent_sequences_are_flagged) {
    // wrong multiplier
    AssembledInverse z = assemble_inverse({3, 5}, {3, 2, 1}, 3, 7);
    EXPECT_FALSE(z.valid);
    // trace that does not end at 1
    z = assemble_inverse({3, 5}, {5, 3, 3}, 5, 12);
    EXPECT_FALSE(z.valid);
    // mismatched lengths
    z = assemble_inverse({3, 4}, {3, 1}, 3, 7);
    EXPECT_FALSE(z.valid);
}

TEST(InverseAssembler, zero_modulus_throws) {
    EXPECT_THROW(assemble_inverse({1}, {1, 1}, 1, 0), std::invalid_argument);
}


}  // end unnamed namespace
