#ifndef PAIRAMM_PRICING_HPP
#define PAIRAMM_PRICING_HPP

#include <optional>

#include "types.hpp"

namespace pairamm {
namespace pricing {

// Fee-less constant product output:
//   floor(balance_out * amount_in / (balance_in + amount_in))
// Evaluated with 256-bit intermediates, so it is defined for every U128 input
// and never exceeds balance_out. Returns 0 when both balance_in and amount_in
// are 0. Bounds (0 < out <= balance_out) are the caller's to enforce.
Balance quote(Balance balance_in, Balance balance_out, Balance amount_in);

// 10^exponent, or nullopt once it no longer fits in 128 bits (exponent >= 39)
std::optional<U128> pow10(uint8_t exponent);

// Decimals-normalized constant product:
//   (balance_0 / 10^decimals_0) * (balance_1 / 10^decimals_1)
// nullopt when the product overflows U128.
std::optional<Balance> ratio(Balance balance_0, Balance balance_1,
                             uint8_t decimals_0, uint8_t decimals_1);

} // namespace pricing
} // namespace pairamm

#endif // PAIRAMM_PRICING_HPP
