#pragma once
#include "types.hpp"
#include "bigint_utils.hpp"
#include <stdexcept>

u64 gcd_u64(u64 a, u64 b);
cpp_int egcd(const cpp_int &a, const cpp_int &b, cpp_int &x, cpp_int &y);
u64 modinv_u64(u64 a, u64 m);
u64 multiply_mod(u64 a, u64 b, u64 m);
