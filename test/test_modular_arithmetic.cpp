#include "modular_arithmetic.hpp"
#include "gtest/gtest.h"
#include <stdexcept>

namespace {


TEST(ModularArithmetic, gcd_basic) {
    EXPECT_EQ(0ull, gcd_u64(0, 0));
    EXPECT_EQ(7ull, gcd_u64(7, 0));
    EXPECT_EQ(7ull, gcd_u64(0, 7));
    EXPECT_EQ(2ull, gcd_u64(4, 6));
    EXPECT_EQ(1ull, gcd_u64(31, 37));
    EXPECT_EQ(5ull, gcd_u64(10, 5));
    EXPECT_EQ(1ull, gcd_u64(9223372036854775807ull, 9223372036854775808ull));
}

TEST(ModularArithmetic, egcd_bezout_identity) {
    const long long pairs[][2] = {{3, 7}, {240, 46}, {17, 3120}, {4, 6}, {1, 1}, {0, 5}};
    for (const auto& p : pairs) {
        cpp_int a(p[0]), b(p[1]), x, y;
        cpp_int g = egcd(a, b, x, y);
        EXPECT_EQ(cpp_int(gcd_u64((u64)p[0], (u64)p[1])), g);
        EXPECT_EQ(g, cpp_int(x * a + y * b));
    }
}

TEST(ModularArithmetic, modinv_known_values) {
    EXPECT_EQ(5ull, modinv_u64(3, 7));
    EXPECT_EQ(2ull, modinv_u64(3, 5));
    EXPECT_EQ(6ull, modinv_u64(31, 37));
    EXPECT_EQ(5ull, modinv_u64(5, 12));
    EXPECT_EQ(2753ull, modinv_u64(17, 3120));
    EXPECT_EQ(18633540ull, modinv_u64(123456789, 1000000007));
    // -1 is its own inverse
    EXPECT_EQ(9223372036854775807ull,
              modinv_u64(9223372036854775807ull, 9223372036854775808ull));
}

TEST(ModularArithmetic, modinv_exhaustive_small) {
    for (u64 m = 2; m < 120; ++m) {
        for (u64 a = 1; a < m; ++a) {
            if (gcd_u64(a, m) != 1) {
                EXPECT_THROW(modinv_u64(a, m), std::runtime_error);
                continue;
            }
            u64 inv = modinv_u64(a, m);
            EXPECT_LT(inv, m);
            EXPECT_EQ(1ull, multiply_mod(a, inv, m));
        }
    }
}

TEST(ModularArithmetic, contract_violations_throw) {
    EXPECT_THROW(modinv_u64(3, 0), std::runtime_error);
    EXPECT_THROW(multiply_mod(3, 4, 0), std::invalid_argument);
}

TEST(ModularArithmetic, multiply_mod_no_overflow) {
    const u64 m = 9223372036854775808ull;
    EXPECT_EQ(1ull, multiply_mod(m - 1, m - 1, m));
    EXPECT_EQ(0ull, multiply_mod(2, m / 2, m));
}

TEST(BigintUtils, parse_positive_decimal) {
    cpp_int v;
    EXPECT_TRUE(parse_positive_decimal("1", v));
    EXPECT_EQ(cpp_int(1), v);
    EXPECT_TRUE(parse_positive_decimal("18446744073709551616", v));
    EXPECT_FALSE(fits_u64(v));
    EXPECT_TRUE(parse_positive_decimal("18446744073709551615", v));
    EXPECT_TRUE(fits_u64(v));

    EXPECT_FALSE(parse_positive_decimal("", v));
    EXPECT_FALSE(parse_positive_decimal("0", v));
    EXPECT_FALSE(parse_positive_decimal("007", v));
    EXPECT_FALSE(parse_positive_decimal("-3", v));
    EXPECT_FALSE(parse_positive_decimal("3.5", v));
    EXPECT_FALSE(parse_positive_decimal("12a", v));
    EXPECT_FALSE(parse_positive_decimal(" 12", v));
}

TEST(BigintUtils, bitlen) {
    EXPECT_EQ(1u, bitlen_cppint(cpp_int(0)));
    EXPECT_EQ(1u, bitlen_cppint(cpp_int(1)));
    EXPECT_EQ(64u, bitlen_cppint(cpp_int(~0ull)));
}


}  // end unnamed namespace
