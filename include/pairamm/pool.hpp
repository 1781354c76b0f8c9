#ifndef PAIRAMM_POOL_HPP
#define PAIRAMM_POOL_HPP

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

#include <spdlog/logger.h>

#include "types.hpp"
#include "config.hpp"
#include "contract.hpp"
#include "token_pair.hpp"
#include "metadata_resolver.hpp"
#include "transfer_coordinator.hpp"

namespace pairamm {

// =============================================================================
// PairPool - two-token constant-product pool contract
//
// Call methods:  new, update_metadata, ft_on_transfer,
//                metadata_callback (private), swap_callback (private)
// View methods:  get_metadata, get_balance, get_ratio, get_owner
//
// Balances change in exactly two places: an owner deposit in ft_on_transfer
// and a successful swap_callback.
// =============================================================================

class PairPool : public IContract {
public:
    explicit PairPool(PoolConfig config = {});
    ~PairPool() override = default;

    // Non-copyable
    PairPool(const PairPool&) = delete;
    PairPool& operator=(const PairPool&) = delete;

    PromiseOrValue call(CallContext& ctx, const std::string& method, const json& args) override;
    json view(const std::string& method, const json& args) const override;

    // =========================================================================
    // Typed queries (mirror the view methods; throw the same errors)
    // =========================================================================

    bool initialized() const { return pair_.has_value(); }
    const AccountId& owner() const;
    Balance balance(const AccountId& token) const;
    const TokenMetadata& metadata(const AccountId& token) const;
    Balance ratio() const;

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t deposits;
        uint64_t swaps_initiated;
        uint64_t swaps_committed;
        uint64_t swaps_rolled_back;
    };
    Stats get_stats() const;

private:
    using CallHandler = std::function<PromiseOrValue(CallContext&, const json&)>;
    using ViewHandler = std::function<json(const json&)>;

    PoolConfig config_;
    std::optional<TokenPair> pair_;
    MetadataResolver resolver_;
    TransferCoordinator coordinator_;
    std::shared_ptr<spdlog::logger> log_;

    std::unordered_map<std::string, CallHandler> call_handlers_;
    std::unordered_map<std::string, ViewHandler> view_handlers_;

    uint64_t deposits_{0};
    uint64_t swaps_initiated_{0};
    uint64_t swaps_committed_{0};
    uint64_t swaps_rolled_back_{0};

    void register_call_handlers();
    void register_view_handlers();

    // Handlers
    PromiseOrValue init(CallContext& ctx, const json& args);
    PromiseOrValue update_metadata(CallContext& ctx, const json& args);
    PromiseOrValue metadata_callback(CallContext& ctx, const json& args);
    PromiseOrValue ft_on_transfer(CallContext& ctx, const json& args);
    PromiseOrValue swap_callback(CallContext& ctx, const json& args);

    TokenPair& state();
    const TokenPair& state() const;
};

} // namespace pairamm

#endif // PAIRAMM_POOL_HPP
