#ifndef PAIRAMM_WIDE_MATH_HPP
#define PAIRAMM_WIDE_MATH_HPP

#include <optional>

#include "types.hpp"

namespace pairamm {

// =============================================================================
// 256-bit Unsigned Integer (two U128 limbs)
// =============================================================================

struct U256 {
    U128 lo;  // Low 128 bits
    U128 hi;  // High 128 bits

    U256() : lo(0), hi(0) {}
    U256(U128 l) : lo(l), hi(0) {}
    U256(U128 l, U128 h) : lo(l), hi(h) {}

    bool operator==(const U256& other) const {
        return lo == other.lo && hi == other.hi;
    }
    bool operator!=(const U256& other) const { return !(*this == other); }
    bool operator<(const U256& other) const {
        return hi < other.hi || (hi == other.hi && lo < other.lo);
    }
    bool operator>(const U256& other) const { return other < *this; }
    bool operator<=(const U256& other) const { return !(other < *this); }
    bool operator>=(const U256& other) const { return !(*this < other); }

    bool is_zero() const { return lo == 0 && hi == 0; }
    bool fits_u128() const { return hi == 0; }
};

namespace wide {

// Sum modulo 2^256
U256 add(const U256& a, const U256& b);

// Difference modulo 2^256
U256 sub(const U256& a, const U256& b);

// Full 256-bit product of two U128 values (never overflows)
U256 mul_u128(U128 a, U128 b);

struct DivResult {
    U256 quotient;
    U256 remainder;
};

// Long division; nullopt on a zero divisor
std::optional<DivResult> divmod(const U256& num, const U256& denom);

// Narrow back to 128 bits; nullopt when the high limb is set
std::optional<U128> narrow(const U256& value);

// floor(a * b / denom) with a 256-bit intermediate.
// nullopt on a zero divisor or a quotient wider than 128 bits.
std::optional<U128> mul_div(U128 a, U128 b, const U256& denom);

} // namespace wide

} // namespace pairamm

#endif // PAIRAMM_WIDE_MATH_HPP
