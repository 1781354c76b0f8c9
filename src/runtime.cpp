// =============================================================================
// runtime.cpp - Serialized receipt executor
// =============================================================================

#include "pairamm/runtime.hpp"
#include "pairamm/log.hpp"

namespace pairamm {

// =============================================================================
// Constructor
// =============================================================================

Runtime::Runtime(RuntimeConfig config)
    : config_(config)
    , log_(log::get("runtime")) {}

// =============================================================================
// Accounts
// =============================================================================

void Runtime::deploy(const AccountId& account, std::shared_ptr<IContract> contract) {
    if (!is_valid_account_id(account)) {
        throw AMMError(errors::INVALID_ARGUMENT, "invalid account id: " + account);
    }
    if (!contract) {
        throw AMMError(errors::INVALID_ARGUMENT, "no contract to deploy at " + account);
    }
    contracts_[account] = std::move(contract);
    log_->info("deployed contract at {}", account);
}

bool Runtime::has_account(const AccountId& account) const {
    return contracts_.find(account) != contracts_.end();
}

// =============================================================================
// Transactions
// =============================================================================

ExecutionOutcome Runtime::call(const AccountId& signer, const AccountId& receiver,
                               const std::string& method, const json& args,
                               Balance deposit, Gas gas) {
    uint64_t id = submit(signer, receiver, method, args, deposit, gas);
    run();

    auto node = outcomes_.extract(id);
    if (node.empty()) {
        ExecutionOutcome stuck;
        stuck.receipt_id = id;
        stuck.error = "transaction did not complete";
        return stuck;
    }
    transactions_.erase(id);
    return std::move(node.mapped());
}

uint64_t Runtime::submit(const AccountId& signer, const AccountId& receiver,
                         const std::string& method, const json& args,
                         Balance deposit, Gas gas) {
    Gas attached = gas == 0 ? config_.max_gas : gas;
    if (attached > config_.max_gas) {
        throw AMMError(errors::GAS_EXCEEDED, "transaction gas above max_gas");
    }

    uint64_t id = enqueue(Receipt{0, signer, signer, receiver, method, args, deposit, attached, std::nullopt});
    transactions_.insert(id);
    return id;
}

bool Runtime::step() {
    if (ready_.empty()) return false;

    uint64_t id = ready_.front();
    ready_.pop_front();

    auto node = receipts_.extract(id);
    if (node.empty()) return true;
    execute(node.mapped());
    return true;
}

void Runtime::run() {
    while (step()) {}
}

std::optional<ExecutionOutcome> Runtime::outcome(uint64_t receipt_id) const {
    auto it = outcomes_.find(receipt_id);
    if (it == outcomes_.end()) return std::nullopt;
    return it->second;
}

json Runtime::view(const AccountId& receiver, const std::string& method, const json& args) const {
    auto it = contracts_.find(receiver);
    if (it == contracts_.end()) {
        throw AMMError(errors::ACCOUNT_NOT_FOUND, receiver);
    }
    return it->second->view(method, args);
}

Runtime::Stats Runtime::get_stats() const {
    return Stats{total_receipts_, failed_receipts_};
}

// =============================================================================
// Receipt Execution
// =============================================================================

uint64_t Runtime::enqueue(Receipt receipt) {
    receipt.id = next_id_++;
    uint64_t id = receipt.id;

    if (receipt.depends_on) {
        dependents_[*receipt.depends_on].push_back(id);
    } else {
        ready_.push_back(id);
    }
    receipts_.emplace(id, std::move(receipt));
    return id;
}

void Runtime::execute(const Receipt& receipt) {
    ++total_receipts_;

    // Consumed before any check so a failing continuation still releases it
    std::vector<PromiseResult> results;
    if (receipt.depends_on) {
        auto dep = outcomes_.find(*receipt.depends_on);
        if (dep == outcomes_.end()) {
            fail(receipt, errors::INVALID_ARGUMENT, "dependency outcome missing");
            return;
        }
        results.push_back(dep->second.success ? PromiseResult::success(dep->second.value)
                                              : PromiseResult::failure());
        // A chain has one continuation per call; nothing else reads this outcome
        if (transactions_.count(dep->first) == 0) outcomes_.erase(dep);
    }

    auto it = contracts_.find(receipt.receiver);
    if (it == contracts_.end()) {
        fail(receipt, errors::ACCOUNT_NOT_FOUND, receipt.receiver);
        return;
    }
    if (receipt.gas < config_.call_cost) {
        fail(receipt, errors::GAS_EXCEEDED, "attached gas does not cover execution");
        return;
    }

    CallContext ctx;
    ctx.current_account_id = receipt.receiver;
    ctx.predecessor_account_id = receipt.predecessor;
    ctx.signer_account_id = receipt.signer;
    ctx.attached_deposit = receipt.deposit;
    ctx.prepaid_gas = receipt.gas;
    ctx.used_gas = config_.call_cost;

    ctx.promise_results = std::move(results);

    log_->debug("receipt {}: {} -> {}.{}", receipt.id, receipt.predecessor,
                receipt.receiver, receipt.method);

    try {
        PromiseOrValue ret = it->second->call(ctx, receipt.method, receipt.args);
        if (ret.is_promise()) {
            ctx.charge(ret.promise().total_gas());
        }

        journal_.insert(journal_.end(), ctx.logs().begin(), ctx.logs().end());

        for (const auto& promise : ctx.scheduled()) {
            spawn(promise, receipt);
        }

        if (ret.is_promise()) {
            uint64_t last = spawn(ret.promise(), receipt);
            ExecutionOutcome waiting;
            waiting.receipt_id = receipt.id;
            waiting.logs = ctx.logs();
            deferred_.emplace(receipt.id, std::move(waiting));
            forwards_[last].push_back(receipt.id);
        } else {
            ExecutionOutcome done;
            done.success = true;
            done.value = ret.value();
            done.logs = ctx.logs();
            resolve(receipt.id, std::move(done));
        }
    } catch (const AMMError& e) {
        fail(receipt, e.code(), e.what(), ctx.logs());
    } catch (const std::exception& e) {
        fail(receipt, errors::INVALID_ARGUMENT, e.what(), ctx.logs());
    }
}

uint64_t Runtime::spawn(const Promise& promise, const Receipt& origin) {
    std::optional<uint64_t> previous;
    for (const auto& c : promise.calls()) {
        previous = enqueue(Receipt{0, origin.signer, origin.receiver, c.receiver_id,
                                   c.method, c.args, c.deposit, c.gas, previous});
    }
    return *previous;
}

void Runtime::fail(const Receipt& receipt, int32_t code, const std::string& error,
                   std::vector<std::string> logs) {
    ++failed_receipts_;
    log_->warn("receipt {} ({}.{}) failed: {}", receipt.id, receipt.receiver,
               receipt.method, error);

    journal_.insert(journal_.end(), logs.begin(), logs.end());

    ExecutionOutcome out;
    out.success = false;
    out.error_code = code;
    out.error = error;
    out.logs = std::move(logs);
    resolve(receipt.id, std::move(out));
}

void Runtime::resolve(uint64_t id, ExecutionOutcome outcome) {
    outcome.receipt_id = id;

    auto waiting = deferred_.find(id);
    if (waiting != deferred_.end()) {
        outcome.logs = std::move(waiting->second.logs);
        deferred_.erase(waiting);
    }

    bool has_dependents = false;
    auto deps = dependents_.find(id);
    if (deps != dependents_.end()) {
        has_dependents = true;
        for (uint64_t dep : deps->second) ready_.push_back(dep);
        dependents_.erase(deps);
    }

    std::vector<uint64_t> forwarded;
    auto fwd = forwards_.find(id);
    if (fwd != forwards_.end()) {
        forwarded = std::move(fwd->second);
        forwards_.erase(fwd);
    }

    ExecutionOutcome result;
    result.success = outcome.success;
    result.value = outcome.value;
    result.error_code = outcome.error_code;
    result.error = outcome.error;

    if (has_dependents || transactions_.count(id) > 0) {
        outcomes_[id] = std::move(outcome);
    }

    for (uint64_t target : forwarded) {
        resolve(target, result);
    }
}

} // namespace pairamm
