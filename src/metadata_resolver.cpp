// =============================================================================
// metadata_resolver.cpp - Token metadata query and callback
// =============================================================================

#include "pairamm/metadata_resolver.hpp"
#include "pairamm/log.hpp"

namespace pairamm {

MetadataResolver::MetadataResolver(const PoolConfig& config)
    : config_(config)
    , log_(log::get("pool")) {}

Promise MetadataResolver::request(const TokenPair& pair, const AccountId& token,
                                  const AccountId& self) const {
    size_t index = pair.require_index(token);

    Promise promise = Promise::call(token, methods::FT_METADATA, json::object(),
                                    0, config_.metadata_gas);
    promise.then(FunctionCall{self, methods::METADATA_CALLBACK, json{{"index", index}},
                              0, config_.callback_gas});
    return promise;
}

bool MetadataResolver::on_result(TokenPair& pair, size_t index, const PromiseResult& result) const {
    const AccountId& token = pair.slot(index).address;

    if (!result.successful) {
        log_->warn("metadata query to {} failed, slot {} stays unresolved", token, index);
        return false;
    }

    FungibleTokenMetadata ft;
    try {
        ft = result.value.get<FungibleTokenMetadata>();
    } catch (const json::exception& e) {
        log_->warn("metadata from {} is malformed: {}", token, e.what());
        return false;
    } catch (const AMMError& e) {
        log_->warn("metadata from {} is malformed: {}", token, e.what());
        return false;
    }

    log_->info("slot {} metadata: {} ({}), {} decimals", index, ft.name, ft.symbol,
               static_cast<int>(ft.decimals));
    pair.set_metadata(index, TokenMetadata{ft.name, ft.symbol, ft.decimals});
    return true;
}

} // namespace pairamm
