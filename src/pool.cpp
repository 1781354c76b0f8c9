// =============================================================================
// pool.cpp - Two-token pool contract: dispatch, deposits and swap callbacks
// =============================================================================

#include "pairamm/pool.hpp"
#include "pairamm/pricing.hpp"
#include "pairamm/log.hpp"

namespace pairamm {

namespace {

const json& field(const json& args, const char* key) {
    if (!args.is_object()) {
        throw AMMError(errors::INVALID_ARGUMENT, "arguments must be an object");
    }
    auto it = args.find(key);
    if (it == args.end()) {
        throw AMMError(errors::INVALID_ARGUMENT, std::string("missing field ") + key);
    }
    return *it;
}

AccountId account_field(const json& args, const char* key) {
    const json& value = field(args, key);
    if (!value.is_string() || !is_valid_account_id(value.get_ref<const std::string&>())) {
        throw AMMError(errors::INVALID_ARGUMENT, std::string(key) + " is not a valid account id");
    }
    return value.get<std::string>();
}

size_t index_field(const json& args, const char* key) {
    const json& value = field(args, key);
    if (!value.is_number_unsigned() || value.get<uint64_t>() >= TokenPair::SLOTS) {
        throw AMMError(errors::INVALID_ARGUMENT, std::string(key) + " is not a slot index");
    }
    return value.get<size_t>();
}

Balance amount_field(const json& args, const char* key) {
    return u128_from_json(field(args, key));
}

void require_private(const CallContext& ctx) {
    if (ctx.predecessor_account_id != ctx.current_account_id) {
        throw AMMError(errors::UNAUTHORIZED, ctx.predecessor_account_id);
    }
}

const PromiseResult& single_result(const CallContext& ctx) {
    if (ctx.promise_results.size() != 1) {
        throw AMMError(errors::INVALID_ARGUMENT, "expected exactly one promise result");
    }
    return ctx.promise_results.front();
}

} // namespace

// =============================================================================
// Constructor
// =============================================================================

PairPool::PairPool(PoolConfig config)
    : config_(config)
    , resolver_(config)
    , coordinator_(config)
    , log_(log::get("pool")) {
    register_call_handlers();
    register_view_handlers();
}

// =============================================================================
// Dispatch
// =============================================================================

PromiseOrValue PairPool::call(CallContext& ctx, const std::string& method, const json& args) {
    auto it = call_handlers_.find(method);
    if (it == call_handlers_.end()) {
        throw AMMError(errors::METHOD_NOT_FOUND, method);
    }
    return it->second(ctx, args);
}

json PairPool::view(const std::string& method, const json& args) const {
    auto it = view_handlers_.find(method);
    if (it == view_handlers_.end()) {
        throw AMMError(errors::METHOD_NOT_FOUND, method);
    }
    return it->second(args);
}

void PairPool::register_call_handlers() {
    call_handlers_["new"] = [this](CallContext& ctx, const json& args) {
        return init(ctx, args);
    };
    call_handlers_["update_metadata"] = [this](CallContext& ctx, const json& args) {
        return update_metadata(ctx, args);
    };
    call_handlers_[methods::METADATA_CALLBACK] = [this](CallContext& ctx, const json& args) {
        return metadata_callback(ctx, args);
    };
    call_handlers_[methods::FT_ON_TRANSFER] = [this](CallContext& ctx, const json& args) {
        return ft_on_transfer(ctx, args);
    };
    call_handlers_[methods::SWAP_CALLBACK] = [this](CallContext& ctx, const json& args) {
        return swap_callback(ctx, args);
    };
}

void PairPool::register_view_handlers() {
    view_handlers_["get_metadata"] = [this](const json& args) -> json {
        return metadata(account_field(args, "token"));
    };
    view_handlers_["get_balance"] = [this](const json& args) -> json {
        return u128_to_json(balance(account_field(args, "token")));
    };
    view_handlers_["get_ratio"] = [this](const json&) -> json {
        return u128_to_json(ratio());
    };
    view_handlers_["get_owner"] = [this](const json&) -> json {
        return owner();
    };
}

// =============================================================================
// Initialization and metadata
// =============================================================================

PromiseOrValue PairPool::init(CallContext& ctx, const json& args) {
    if (pair_) {
        throw AMMError(errors::ALREADY_INITIALIZED);
    }

    TokenPair pair(account_field(args, "owner"),
                   account_field(args, "token_a"),
                   account_field(args, "token_b"));

    // Both queries are issued before any state is written; a gas failure
    // leaves the contract uninitialized.
    for (size_t i = 0; i < TokenPair::SLOTS; ++i) {
        ctx.schedule(resolver_.request(pair, pair.slot(i).address, ctx.current_account_id));
    }

    log_->info("pool {} initialized: owner {}, tokens {} / {}", ctx.current_account_id,
               pair.owner(), pair.slot(0).address, pair.slot(1).address);
    pair_.emplace(std::move(pair));
    return json(nullptr);
}

PromiseOrValue PairPool::update_metadata(CallContext& ctx, const json& args) {
    const TokenPair& pair = state();
    AccountId token = account_field(args, "token");
    log_->debug("metadata refresh requested for {}", token);
    return resolver_.request(pair, token, ctx.current_account_id);
}

PromiseOrValue PairPool::metadata_callback(CallContext& ctx, const json& args) {
    require_private(ctx);
    TokenPair& pair = state();
    size_t index = index_field(args, "index");
    resolver_.on_result(pair, index, single_result(ctx));
    return json(nullptr);
}

// =============================================================================
// Deposit / swap entry point
// =============================================================================

PromiseOrValue PairPool::ft_on_transfer(CallContext& ctx, const json& args) {
    TokenPair& pair = state();

    auto index = pair.index_of(ctx.predecessor_account_id);
    if (!index) {
        throw AMMError(errors::UNSUPPORTED_TOKEN, ctx.predecessor_account_id);
    }

    AccountId sender = account_field(args, "sender_id");
    Balance amount = amount_field(args, "amount");
    if (amount == 0) {
        throw AMMError(errors::ZERO_AMOUNT);
    }

    if (sender == pair.owner()) {
        pair.credit(*index, amount);
        ++deposits_;
        log_->info("deposit of {} {} by owner, reserve now {}", to_string(amount),
                   ctx.predecessor_account_id, to_string(pair.slot(*index).balance));
        return u128_to_json(0);
    }

    Promise promise = coordinator_.initiate_swap(pair, sender, *index, amount,
                                                 ctx.current_account_id);
    // The runtime charges the returned chain; fail here so nothing is counted
    if (promise.total_gas() > ctx.remaining_gas()) {
        throw AMMError(errors::GAS_EXCEEDED, "swap needs " + std::to_string(promise.total_gas()));
    }
    ++swaps_initiated_;
    return promise;
}

PromiseOrValue PairPool::swap_callback(CallContext& ctx, const json& args) {
    require_private(ctx);
    TokenPair& pair = state();

    size_t input_index = index_field(args, "input_index");
    Balance balance_in = amount_field(args, "balance_in");
    Balance balance_out = amount_field(args, "balance_out");
    Balance amount = amount_field(args, "amount");

    SwapSettlement settlement = coordinator_.on_transfer_result(
        pair, input_index, balance_in, balance_out, amount, single_result(ctx));

    if (settlement.committed) {
        ++swaps_committed_;
    } else {
        ++swaps_rolled_back_;
        ctx.log("Transferring the swapped tokens failed.");
    }
    return u128_to_json(settlement.refund);
}

// =============================================================================
// Queries
// =============================================================================

const AccountId& PairPool::owner() const {
    return state().owner();
}

Balance PairPool::balance(const AccountId& token) const {
    return state().balance(token);
}

const TokenMetadata& PairPool::metadata(const AccountId& token) const {
    return state().metadata(token);
}

Balance PairPool::ratio() const {
    const TokenPair& pair = state();
    const TokenMetadata& m0 = pair.metadata(pair.slot(0).address);
    const TokenMetadata& m1 = pair.metadata(pair.slot(1).address);

    auto value = pricing::ratio(pair.slot(0).balance, pair.slot(1).balance,
                                m0.decimals, m1.decimals);
    if (!value) {
        throw AMMError(errors::ARITHMETIC_OVERFLOW, "ratio exceeds U128 range");
    }
    return *value;
}

PairPool::Stats PairPool::get_stats() const {
    return Stats{deposits_, swaps_initiated_, swaps_committed_, swaps_rolled_back_};
}

TokenPair& PairPool::state() {
    if (!pair_) throw AMMError(errors::NOT_INITIALIZED);
    return *pair_;
}

const TokenPair& PairPool::state() const {
    if (!pair_) throw AMMError(errors::NOT_INITIALIZED);
    return *pair_;
}

} // namespace pairamm
