// =============================================================================
// token_pair.cpp - Two-slot reserve store
// =============================================================================

#include "pairamm/token_pair.hpp"

namespace pairamm {

TokenPair::TokenPair(AccountId owner, AccountId token_a, AccountId token_b)
    : owner_(std::move(owner))
    , tokens_{Token(std::move(token_a)), Token(std::move(token_b))} {
    if (tokens_[0].address == tokens_[1].address) {
        throw AMMError(errors::INVALID_ARGUMENT, "token addresses must differ");
    }
}

std::optional<size_t> TokenPair::index_of(const AccountId& address) const {
    if (address == tokens_[0].address) return 0;
    if (address == tokens_[1].address) return 1;
    return std::nullopt;
}

size_t TokenPair::require_index(const AccountId& address) const {
    auto index = index_of(address);
    if (!index) throw AMMError(errors::UNKNOWN_TOKEN, address);
    return *index;
}

// =============================================================================
// Queries
// =============================================================================

Balance TokenPair::balance(const AccountId& address) const {
    return tokens_[require_index(address)].balance;
}

const TokenMetadata& TokenPair::metadata(const AccountId& address) const {
    const Token& token = tokens_[require_index(address)];
    if (!token.metadata) throw AMMError(errors::METADATA_UNAVAILABLE, address);
    return *token.metadata;
}

bool TokenPair::metadata_resolved() const {
    return tokens_[0].metadata.has_value() && tokens_[1].metadata.has_value();
}

// =============================================================================
// Mutators
// =============================================================================

void TokenPair::credit(size_t index, Balance amount) {
    Token& token = tokens_.at(index);
    if (token.balance > U128_MAX - amount) {
        throw AMMError(errors::ARITHMETIC_OVERFLOW, "deposit exceeds U128 range");
    }
    token.balance += amount;
}

void TokenPair::commit_swap(size_t input_index, Balance new_balance_in, Balance new_balance_out) {
    tokens_.at(input_index).balance = new_balance_in;
    tokens_.at(other(input_index)).balance = new_balance_out;
}

void TokenPair::set_metadata(size_t index, TokenMetadata metadata) {
    tokens_.at(index).metadata = std::move(metadata);
}

} // namespace pairamm
