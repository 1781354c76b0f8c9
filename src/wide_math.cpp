// =============================================================================
// wide_math.cpp - 256-bit intermediate arithmetic for swap pricing
// =============================================================================

#include "pairamm/wide_math.hpp"

namespace pairamm {
namespace wide {

namespace {

constexpr U128 MASK64 = (U128(1) << 64) - 1;

inline bool bit_at(const U256& v, int i) {
    return i >= 128 ? ((v.hi >> (i - 128)) & 1) != 0 : ((v.lo >> i) & 1) != 0;
}

inline void set_bit(U256& v, int i) {
    if (i >= 128) {
        v.hi |= U128(1) << (i - 128);
    } else {
        v.lo |= U128(1) << i;
    }
}

inline U256 shl1(const U256& v) {
    return U256(v.lo << 1, (v.hi << 1) | (v.lo >> 127));
}

} // namespace

U256 add(const U256& a, const U256& b) {
    U256 r;
    r.lo = a.lo + b.lo;
    U128 carry = r.lo < a.lo ? 1 : 0;
    r.hi = a.hi + b.hi + carry;
    return r;
}

U256 sub(const U256& a, const U256& b) {
    U256 r;
    r.lo = a.lo - b.lo;  // Wraps
    U128 borrow = a.lo < b.lo ? 1 : 0;
    r.hi = a.hi - b.hi - borrow;
    return r;
}

U256 mul_u128(U128 a, U128 b) {
    // Split into 64-bit halves to avoid overflow
    U128 a_lo = a & MASK64;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK64;
    U128 b_hi = b >> 64;

    // Cross products
    U128 p0 = a_lo * b_lo;
    U128 p1 = a_lo * b_hi;
    U128 p2 = a_hi * b_lo;
    U128 p3 = a_hi * b_hi;

    // Accumulate with carry
    U128 mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);

    U256 result;
    result.lo = (p0 & MASK64) | (mid << 64);
    result.hi = p3 + (p1 >> 64) + (p2 >> 64) + (mid >> 64);
    return result;
}

std::optional<DivResult> divmod(const U256& num, const U256& denom) {
    if (denom.is_zero()) return std::nullopt;
    if (num.fits_u128() && denom.fits_u128()) {
        return DivResult{U256(num.lo / denom.lo), U256(num.lo % denom.lo)};
    }
    if (num < denom) {
        return DivResult{U256(), num};
    }

    // Restoring binary long division, most significant bit first
    DivResult out;
    for (int i = 255; i >= 0; --i) {
        // A set top bit means the shifted remainder exceeds any 256-bit divisor
        bool carry = (out.remainder.hi >> 127) != 0;
        out.remainder = shl1(out.remainder);
        if (bit_at(num, i)) out.remainder.lo |= 1;

        if (carry || out.remainder >= denom) {
            out.remainder = sub(out.remainder, denom);
            set_bit(out.quotient, i);
        }
    }
    return out;
}

std::optional<U128> narrow(const U256& value) {
    if (!value.fits_u128()) return std::nullopt;
    return value.lo;
}

std::optional<U128> mul_div(U128 a, U128 b, const U256& denom) {
    auto result = divmod(mul_u128(a, b), denom);
    if (!result) return std::nullopt;
    return narrow(result->quotient);
}

} // namespace wide
} // namespace pairamm
