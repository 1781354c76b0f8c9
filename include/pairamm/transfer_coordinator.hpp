#ifndef PAIRAMM_TRANSFER_COORDINATOR_HPP
#define PAIRAMM_TRANSFER_COORDINATOR_HPP

#include <memory>

#include <spdlog/logger.h>

#include "types.hpp"
#include "config.hpp"
#include "promise.hpp"
#include "token_pair.hpp"

namespace pairamm {

// =============================================================================
// Swap Quote (phase 1 result, nothing committed)
// =============================================================================

struct SwapQuote {
    size_t input_index;
    size_t output_index;
    Balance amount_in;
    Balance amount_out;
    Balance new_balance_in;
    Balance new_balance_out;
};

// Phase 2 result
struct SwapSettlement {
    bool committed;
    Balance refund;   // Returned to the inbound ledger for the sender
};

// =============================================================================
// TransferCoordinator - two-phase swap: quote + ft_transfer, then commit
//
// Phase 1 prices the swap against the reserves as they are now and issues the
// outbound transfer. The reserves are not touched and not reserved, so other
// swaps or deposits may commit in between. Phase 2 runs in swap_callback and
// either writes both precomputed balances or leaves the pair untouched.
// =============================================================================

class TransferCoordinator {
public:
    explicit TransferCoordinator(const PoolConfig& config);

    // Throws ARITHMETIC_OVERFLOW, INSUFFICIENT_LIQUIDITY or ZERO_OUTPUT
    SwapQuote prepare(const TokenPair& pair, size_t input_index, Balance amount) const;

    // ft_transfer of the quoted output to `initiator`, continued by
    // self.swap_callback{input_index, balance_in, balance_out, amount}
    Promise initiate_swap(const TokenPair& pair, const AccountId& initiator,
                          size_t input_index, Balance amount, const AccountId& self) const;

    SwapSettlement on_transfer_result(TokenPair& pair, size_t input_index,
                                      Balance new_balance_in, Balance new_balance_out,
                                      Balance amount, const PromiseResult& result) const;

private:
    PoolConfig config_;
    std::shared_ptr<spdlog::logger> log_;
};

} // namespace pairamm

#endif // PAIRAMM_TRANSFER_COORDINATOR_HPP
