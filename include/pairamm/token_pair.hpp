#ifndef PAIRAMM_TOKEN_PAIR_HPP
#define PAIRAMM_TOKEN_PAIR_HPP

#include <array>
#include <cstddef>
#include <optional>

#include "types.hpp"

namespace pairamm {

// =============================================================================
// Token Slot
// =============================================================================

struct Token {
    AccountId address;                       // Token ledger account, immutable
    Balance balance = 0;                     // Accounted reserve
    std::optional<TokenMetadata> metadata;   // Unset until resolved

    explicit Token(AccountId addr) : address(std::move(addr)) {}
};

// =============================================================================
// TokenPair - the pool's system of record
//
// Two slots indexed 0 and 1 plus the liquidity owner. Reads go through the
// address-keyed accessors. The mutators are reserved for the owner-deposit
// path and the two callbacks (metadata, swap); nothing else writes here.
// =============================================================================

class TokenPair {
public:
    static constexpr size_t SLOTS = 2;

    // Throws INVALID_ARGUMENT when both addresses are the same
    TokenPair(AccountId owner, AccountId token_a, AccountId token_b);

    const AccountId& owner() const { return owner_; }
    const Token& slot(size_t index) const { return tokens_.at(index); }

    // Slot index for a token address, nullopt for foreign addresses
    std::optional<size_t> index_of(const AccountId& address) const;

    // Same as index_of but throws UNKNOWN_TOKEN
    size_t require_index(const AccountId& address) const;

    bool contains(const AccountId& address) const { return index_of(address).has_value(); }

    static size_t other(size_t index) { return 1 - index; }

    // -------------------------------------------------------------------------
    // Queries
    // -------------------------------------------------------------------------

    Balance balance(const AccountId& address) const;

    // Throws UNKNOWN_TOKEN, or METADATA_UNAVAILABLE when not yet resolved
    const TokenMetadata& metadata(const AccountId& address) const;

    bool metadata_resolved() const;

    // -------------------------------------------------------------------------
    // Mutators
    // -------------------------------------------------------------------------

    // Owner deposit; throws ARITHMETIC_OVERFLOW instead of wrapping
    void credit(size_t index, Balance amount);

    // Swap commit: both reserves are replaced together
    void commit_swap(size_t input_index, Balance new_balance_in, Balance new_balance_out);

    void set_metadata(size_t index, TokenMetadata metadata);

private:
    AccountId owner_;
    std::array<Token, SLOTS> tokens_;
};

} // namespace pairamm

#endif // PAIRAMM_TOKEN_PAIR_HPP
