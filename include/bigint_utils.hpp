#pragma once
#include "types.hpp"
#include <boost/multiprecision/cpp_int.hpp>
#include <string>

using boost::multiprecision::cpp_int;

// Strict decimal parse: digits only, no sign, no leading zero.
static inline bool parse_positive_decimal(const std::string &s, cpp_int &out) {
    if (s.empty() || s[0] == '0') return false;
    cpp_int N = 0;
    for (char ch : s) {
        if (ch < '0' || ch > '9') return false;
        N = N * 10 + (ch - '0');
    }
    out = N;
    return true;
}

static inline size_t bitlen_cppint(const cpp_int &x) {
    cpp_int t = x;
    size_t bits = 0;
    while (t > 0) {
        t >>= 1;
        ++bits;
    }
    return bits ? bits : 1;
}

static inline bool fits_u64(const cpp_int &x) {
    return x >= 0 && x <= cpp_int(~0ull);
}
