#ifndef PAIRAMM_PROMISE_HPP
#define PAIRAMM_PROMISE_HPP

#include <string>
#include <variant>
#include <vector>

#include "types.hpp"

namespace pairamm {

// =============================================================================
// Outbound Function Call
// =============================================================================

struct FunctionCall {
    AccountId receiver_id;
    std::string method;
    json args;
    Balance deposit = 0;   // Attached collateral
    Gas gas = 0;           // Static gas budget for this call
};

// =============================================================================
// Promise - a chain of calls, each run after the previous one resolves
//
// The first call executes as soon as the issuing call commits. Every later
// call is a continuation and receives the previous call's PromiseResult.
// =============================================================================

class Promise {
public:
    static Promise call(AccountId receiver_id, std::string method, json args,
                        Balance deposit, Gas gas);

    // Append a continuation
    Promise& then(FunctionCall callback);

    const std::vector<FunctionCall>& calls() const { return calls_; }
    Gas total_gas() const;

private:
    explicit Promise(FunctionCall first);

    std::vector<FunctionCall> calls_;
};

// =============================================================================
// Promise Result (what a continuation observes)
// =============================================================================

struct PromiseResult {
    bool successful = false;
    json value;  // Return value when successful

    static PromiseResult success(json value) { return {true, std::move(value)}; }
    static PromiseResult failure() { return {false, nullptr}; }
};

// =============================================================================
// PromiseOrValue - return type of every contract method
// =============================================================================

class PromiseOrValue {
public:
    PromiseOrValue(json value) : inner_(std::in_place_index<0>, std::move(value)) {}
    PromiseOrValue(Promise promise) : inner_(std::in_place_index<1>, std::move(promise)) {}

    bool is_promise() const { return inner_.index() == 1; }

    const json& value() const { return std::get<0>(inner_); }
    const Promise& promise() const { return std::get<1>(inner_); }

private:
    std::variant<json, Promise> inner_;
};

} // namespace pairamm

#endif // PAIRAMM_PROMISE_HPP
