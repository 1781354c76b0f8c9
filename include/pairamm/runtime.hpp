#ifndef PAIRAMM_RUNTIME_HPP
#define PAIRAMM_RUNTIME_HPP

#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <spdlog/logger.h>

#include "types.hpp"
#include "config.hpp"
#include "contract.hpp"

namespace pairamm {

// =============================================================================
// Execution Outcome (one receipt)
// =============================================================================

struct ExecutionOutcome {
    uint64_t receipt_id = 0;
    bool success = false;
    json value;                     // Return value, or the forwarded promise's value
    int32_t error_code = errors::OK;
    std::string error;
    std::vector<std::string> logs;  // Logs emitted by this receipt only
};

// =============================================================================
// Runtime - serialized receipt executor hosting contracts
//
// Receipts run one at a time in FIFO order. A call that returns a Promise
// takes the outcome of the chain's last call. A continuation runs once the
// call it depends on has resolved, successfully or not.
//
// Outcomes of internal receipts are dropped once their continuation or the
// forwarding call has consumed them. Transaction outcomes are kept until
// call() returns them, or for the runtime's lifetime when queued by submit().
// =============================================================================

class Runtime {
public:
    explicit Runtime(RuntimeConfig config = {});
    ~Runtime() = default;

    // Non-copyable
    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    // =========================================================================
    // Accounts
    // =========================================================================

    void deploy(const AccountId& account, std::shared_ptr<IContract> contract);
    bool has_account(const AccountId& account) const;

    // =========================================================================
    // Transactions
    // =========================================================================

    // Submit and drain the queue; returns the transaction's final outcome.
    // gas == 0 attaches max_gas.
    ExecutionOutcome call(const AccountId& signer, const AccountId& receiver,
                          const std::string& method, const json& args = json::object(),
                          Balance deposit = 0, Gas gas = 0);

    // Queue a transaction without executing it; throws GAS_EXCEEDED above max_gas
    uint64_t submit(const AccountId& signer, const AccountId& receiver,
                    const std::string& method, const json& args = json::object(),
                    Balance deposit = 0, Gas gas = 0);

    // Execute the next ready receipt; false when nothing is ready
    bool step();

    // Execute until no receipt is ready
    void run();

    size_t pending() const { return ready_.size(); }

    // Outcome of a transaction queued with submit()
    std::optional<ExecutionOutcome> outcome(uint64_t receipt_id) const;

    size_t retained_outcomes() const { return outcomes_.size(); }

    // Read-only call; contract errors propagate as exceptions
    json view(const AccountId& receiver, const std::string& method,
              const json& args = json::object()) const;

    // Every contract log line, in execution order
    const std::vector<std::string>& logs() const { return journal_; }

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t total_receipts;
        uint64_t failed_receipts;
    };
    Stats get_stats() const;

private:
    struct Receipt {
        uint64_t id;
        AccountId signer;
        AccountId predecessor;
        AccountId receiver;
        std::string method;
        json args;
        Balance deposit;
        Gas gas;
        std::optional<uint64_t> depends_on;
    };

    RuntimeConfig config_;
    std::unordered_map<AccountId, std::shared_ptr<IContract>> contracts_;

    uint64_t next_id_{1};
    std::unordered_map<uint64_t, Receipt> receipts_;        // Not yet executed
    std::deque<uint64_t> ready_;
    std::unordered_map<uint64_t, std::vector<uint64_t>> dependents_;  // id -> continuations
    std::unordered_map<uint64_t, std::vector<uint64_t>> forwards_;    // id -> receipts taking its outcome
    std::unordered_map<uint64_t, ExecutionOutcome> deferred_;         // Returned a promise, awaiting it
    std::unordered_map<uint64_t, ExecutionOutcome> outcomes_;         // Resolved, still needed
    std::unordered_set<uint64_t> transactions_;                       // Submitted by a signer

    std::vector<std::string> journal_;
    uint64_t total_receipts_{0};
    uint64_t failed_receipts_{0};

    std::shared_ptr<spdlog::logger> log_;

    uint64_t enqueue(Receipt receipt);
    void execute(const Receipt& receipt);

    // Create receipts for a promise chain; returns the last call's receipt id
    uint64_t spawn(const Promise& promise, const Receipt& origin);

    void fail(const Receipt& receipt, int32_t code, const std::string& error,
              std::vector<std::string> logs = {});
    void resolve(uint64_t id, ExecutionOutcome outcome);
};

} // namespace pairamm

#endif // PAIRAMM_RUNTIME_HPP
