// =============================================================================
// transfer_coordinator.cpp - Swap transfer and callback commit
// =============================================================================

#include "pairamm/transfer_coordinator.hpp"
#include "pairamm/pricing.hpp"
#include "pairamm/log.hpp"

namespace pairamm {

TransferCoordinator::TransferCoordinator(const PoolConfig& config)
    : config_(config)
    , log_(log::get("pool")) {}

// =============================================================================
// Phase 1
// =============================================================================

SwapQuote TransferCoordinator::prepare(const TokenPair& pair, size_t input_index,
                                       Balance amount) const {
    size_t output_index = TokenPair::other(input_index);
    Balance reserve_in = pair.slot(input_index).balance;
    Balance reserve_out = pair.slot(output_index).balance;

    if (reserve_in > U128_MAX - amount) {
        throw AMMError(errors::ARITHMETIC_OVERFLOW, "input reserve exceeds U128 range");
    }

    Balance amount_out = pricing::quote(reserve_in, reserve_out, amount);
    if (amount_out > reserve_out) {
        throw AMMError(errors::INSUFFICIENT_LIQUIDITY);
    }
    if (amount_out == 0) {
        throw AMMError(errors::ZERO_OUTPUT);
    }

    return SwapQuote{input_index, output_index, amount, amount_out,
                     reserve_in + amount, reserve_out - amount_out};
}

Promise TransferCoordinator::initiate_swap(const TokenPair& pair, const AccountId& initiator,
                                           size_t input_index, Balance amount,
                                           const AccountId& self) const {
    SwapQuote quote = prepare(pair, input_index, amount);
    const AccountId& token_out = pair.slot(quote.output_index).address;

    log_->info("swap {} {} -> {} {} for {}", to_string(amount),
               pair.slot(input_index).address, to_string(quote.amount_out), token_out, initiator);

    Promise promise = Promise::call(
        token_out, methods::FT_TRANSFER,
        json{{"receiver_id", initiator}, {"amount", u128_to_json(quote.amount_out)}, {"memo", nullptr}},
        config_.transfer_deposit, config_.transfer_gas);

    promise.then(FunctionCall{
        self, methods::SWAP_CALLBACK,
        json{{"input_index", input_index},
             {"balance_in", u128_to_json(quote.new_balance_in)},
             {"balance_out", u128_to_json(quote.new_balance_out)},
             {"amount", u128_to_json(amount)}},
        0, config_.callback_gas});
    return promise;
}

// =============================================================================
// Phase 2
// =============================================================================

SwapSettlement TransferCoordinator::on_transfer_result(TokenPair& pair, size_t input_index,
                                                       Balance new_balance_in,
                                                       Balance new_balance_out,
                                                       Balance amount,
                                                       const PromiseResult& result) const {
    if (!result.successful) {
        log_->warn("transfer out of slot {} failed, refunding {}",
                   TokenPair::other(input_index), to_string(amount));
        return SwapSettlement{false, amount};
    }

    pair.commit_swap(input_index, new_balance_in, new_balance_out);
    log_->info("swap committed: slot {} = {}, slot {} = {}", input_index,
               to_string(new_balance_in), TokenPair::other(input_index), to_string(new_balance_out));
    return SwapSettlement{true, 0};
}

} // namespace pairamm
