// =============================================================================
// pricing.cpp - Swap quote and pool ratio
// =============================================================================

#include "pairamm/pricing.hpp"
#include "pairamm/wide_math.hpp"

namespace pairamm {
namespace pricing {

namespace {

// Whole display units; balances below 10^39 normalize to zero
inline Balance normalize(Balance balance, uint8_t decimals) {
    auto scale = pow10(decimals);
    if (!scale) return 0;
    return balance / *scale;
}

} // namespace

Balance quote(Balance balance_in, Balance balance_out, Balance amount_in) {
    U256 denom = wide::add(U256(balance_in), U256(amount_in));
    if (denom.is_zero()) return 0;

    // amount_in / denom <= 1, so the quotient is bounded by balance_out
    auto out = wide::mul_div(balance_out, amount_in, denom);
    if (!out || *out > balance_out) {
        throw AMMError(errors::ARITHMETIC_OVERFLOW, "quote narrowing out of range");
    }
    return *out;
}

std::optional<U128> pow10(uint8_t exponent) {
    U128 result = 1;
    for (uint8_t i = 0; i < exponent; ++i) {
        if (result > U128_MAX / 10) return std::nullopt;
        result *= 10;
    }
    return result;
}

std::optional<Balance> ratio(Balance balance_0, Balance balance_1,
                             uint8_t decimals_0, uint8_t decimals_1) {
    Balance a = normalize(balance_0, decimals_0);
    Balance b = normalize(balance_1, decimals_1);
    return wide::narrow(wide::mul_u128(a, b));
}

} // namespace pricing
} // namespace pairamm
