#ifndef PAIRAMM_CONTRACT_HPP
#define PAIRAMM_CONTRACT_HPP

#include <string>
#include <vector>

#include "types.hpp"
#include "promise.hpp"

namespace pairamm {

// =============================================================================
// Call Context (per executed receipt)
// =============================================================================

struct CallContext {
    AccountId current_account_id;      // Contract being executed
    AccountId predecessor_account_id;  // Immediate caller
    AccountId signer_account_id;       // Transaction origin
    Balance attached_deposit = 0;
    Gas prepaid_gas = 0;
    Gas used_gas = 0;                  // Execution cost plus gas handed to promises

    // Results of the call this one continues (empty for first calls)
    std::vector<PromiseResult> promise_results;

    Gas remaining_gas() const { return prepaid_gas - used_gas; }

    // Reserve gas for an outbound call; throws GAS_EXCEEDED
    void charge(Gas gas);

    // Issue a detached promise that is not this call's return value
    void schedule(Promise promise);
    const std::vector<Promise>& scheduled() const { return scheduled_; }

    void log(std::string message);
    const std::vector<std::string>& logs() const { return logs_; }

private:
    std::vector<Promise> scheduled_;
    std::vector<std::string> logs_;
};

// =============================================================================
// Contract Interface
// =============================================================================

class IContract {
public:
    virtual ~IContract() = default;

    // State-changing entry point. Throwing aborts the call; the runtime
    // discards everything it scheduled.
    virtual PromiseOrValue call(CallContext& ctx, const std::string& method,
                                const json& args) = 0;

    // Read-only entry point
    virtual json view(const std::string& method, const json& args) const = 0;
};

} // namespace pairamm

#endif // PAIRAMM_CONTRACT_HPP
