// =============================================================================
// promise.cpp - Outbound call chains and per-call context
// =============================================================================

#include "pairamm/promise.hpp"
#include "pairamm/contract.hpp"

namespace pairamm {

// =============================================================================
// Promise
// =============================================================================

Promise::Promise(FunctionCall first) {
    calls_.push_back(std::move(first));
}

Promise Promise::call(AccountId receiver_id, std::string method, json args,
                      Balance deposit, Gas gas) {
    return Promise(FunctionCall{std::move(receiver_id), std::move(method),
                                std::move(args), deposit, gas});
}

Promise& Promise::then(FunctionCall callback) {
    calls_.push_back(std::move(callback));
    return *this;
}

Gas Promise::total_gas() const {
    Gas total = 0;
    for (const auto& c : calls_) total += c.gas;
    return total;
}

// =============================================================================
// CallContext
// =============================================================================

void CallContext::charge(Gas gas) {
    if (gas > remaining_gas()) {
        throw AMMError(errors::GAS_EXCEEDED,
                       "need " + std::to_string(gas) + ", have " + std::to_string(remaining_gas()));
    }
    used_gas += gas;
}

void CallContext::schedule(Promise promise) {
    charge(promise.total_gas());
    scheduled_.push_back(std::move(promise));
}

void CallContext::log(std::string message) {
    logs_.push_back(std::move(message));
}

} // namespace pairamm
