#include "modular_arithmetic.hpp"

u64 gcd_u64(u64 a, u64 b) {
    while (b != 0) {
        u64 t = a % b;
        a = b;
        b = t;
    }
    return a;
}

cpp_int egcd(const cpp_int &a, const cpp_int &b, cpp_int &x, cpp_int &y) {
    if (b == 0) {
        x = 1;
        y = 0;
        return a;
    }
    cpp_int x1, y1;
    cpp_int g = egcd(b, a % b, x1, y1);
    x = y1;
    y = x1 - (a / b) * y1;
    return g;
}

u64 modinv_u64(u64 a, u64 m) {
    if (m == 0) {
        throw std::runtime_error("modinv_u64(): divide by zero");
    }
    cpp_int x, y;
    cpp_int g = egcd(cpp_int(a), cpp_int(m), x, y);
    if (g != 1) {
        throw std::runtime_error("modinv_u64(): inverse does not exist");
    }
    cpp_int inv = x % cpp_int(m);
    if (inv < 0) inv += m;
    return inv.convert_to<u64>();
}

u64 multiply_mod(u64 a, u64 b, u64 m) {
    if (m == 0) {
        throw std::invalid_argument("multiply_mod(): zero modulus");
    }
    return (u64)(((u128)a * (u128)b) % (u128)m);
}
