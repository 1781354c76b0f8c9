#ifndef PAIRAMM_METADATA_RESOLVER_HPP
#define PAIRAMM_METADATA_RESOLVER_HPP

#include <memory>

#include <spdlog/logger.h>

#include "types.hpp"
#include "config.hpp"
#include "promise.hpp"
#include "token_pair.hpp"

namespace pairamm {

// =============================================================================
// MetadataResolver - ft_metadata round trip into a token slot
// =============================================================================

class MetadataResolver {
public:
    explicit MetadataResolver(const PoolConfig& config);

    // ft_metadata on `token`, continued by self.metadata_callback{index}.
    // Throws UNKNOWN_TOKEN when `token` is not one of the pair's slots.
    Promise request(const TokenPair& pair, const AccountId& token, const AccountId& self) const;

    // Continuation body. A failed or undecodable response leaves the slot
    // unresolved and returns false.
    bool on_result(TokenPair& pair, size_t index, const PromiseResult& result) const;

private:
    PoolConfig config_;
    std::shared_ptr<spdlog::logger> log_;
};

} // namespace pairamm

#endif // PAIRAMM_METADATA_RESOLVER_HPP
