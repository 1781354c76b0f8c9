// =============================================================================
// types.cpp - Ledger primitives, metadata serialization and error codes
// =============================================================================

#include "pairamm/types.hpp"
#include <algorithm>

namespace pairamm {

// =============================================================================
// Account Ids
// =============================================================================

namespace {

inline bool is_separator(char c) {
    return c == '-' || c == '_' || c == '.';
}

inline bool is_id_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

} // namespace

bool is_valid_account_id(std::string_view id) {
    if (id.size() < 2 || id.size() > 64) return false;

    bool last_was_separator = true;  // Disallows a leading separator
    for (char c : id) {
        if (is_separator(c)) {
            if (last_was_separator) return false;
            last_was_separator = true;
        } else if (is_id_char(c)) {
            last_was_separator = false;
        } else {
            return false;
        }
    }
    return !last_was_separator;
}

// =============================================================================
// U128 Conversions
// =============================================================================

std::string to_string(U128 value) {
    if (value == 0) return "0";

    std::string out;
    while (value != 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
        value /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::optional<U128> parse_u128(std::string_view text) {
    if (text.empty()) return std::nullopt;

    U128 result = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return std::nullopt;
        U128 digit = static_cast<U128>(c - '0');
        if (result > (U128_MAX - digit) / 10) return std::nullopt;
        result = result * 10 + digit;
    }
    return result;
}

U128 u128_from_json(const json& value) {
    if (!value.is_string()) {
        throw AMMError(errors::INVALID_ARGUMENT, "expected a U128 decimal string");
    }
    auto parsed = parse_u128(value.get_ref<const std::string&>());
    if (!parsed) {
        throw AMMError(errors::INVALID_ARGUMENT,
                       "not a U128 value: " + value.get<std::string>());
    }
    return *parsed;
}

// =============================================================================
// Metadata Serialization
// =============================================================================

namespace {

uint8_t decimals_from_json(const json& j) {
    const json& d = j.at("decimals");
    if (!d.is_number_unsigned() || d.get<uint64_t>() > 255) {
        throw AMMError(errors::INVALID_ARGUMENT, "decimals must fit in u8");
    }
    return static_cast<uint8_t>(d.get<uint64_t>());
}

void optional_string(const json& j, const char* key, std::optional<std::string>& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        out.reset();
    } else {
        out = it->get<std::string>();
    }
}

} // namespace

void to_json(json& j, const FungibleTokenMetadata& m) {
    j = json{
        {"spec", m.spec},
        {"name", m.name},
        {"symbol", m.symbol},
        {"icon", m.icon ? json(*m.icon) : json(nullptr)},
        {"reference", m.reference ? json(*m.reference) : json(nullptr)},
        {"reference_hash", m.reference_hash ? json(*m.reference_hash) : json(nullptr)},
        {"decimals", m.decimals}
    };
}

void from_json(const json& j, FungibleTokenMetadata& m) {
    m.spec = j.value("spec", std::string{});
    j.at("name").get_to(m.name);
    j.at("symbol").get_to(m.symbol);
    optional_string(j, "icon", m.icon);
    optional_string(j, "reference", m.reference);
    optional_string(j, "reference_hash", m.reference_hash);
    m.decimals = decimals_from_json(j);
}

void to_json(json& j, const TokenMetadata& m) {
    j = json{{"name", m.name}, {"symbol", m.symbol}, {"decimals", m.decimals}};
}

void from_json(const json& j, TokenMetadata& m) {
    j.at("name").get_to(m.name);
    j.at("symbol").get_to(m.symbol);
    m.decimals = decimals_from_json(j);
}

// =============================================================================
// Errors
// =============================================================================

namespace errors {

const char* message(int32_t code) {
    switch (code) {
        case OK:                     return "OK";
        case UNKNOWN_TOKEN:          return "Wrong token provided.";
        case UNSUPPORTED_TOKEN:      return "Token not supported.";
        case ZERO_AMOUNT:            return "Amount must be positive.";
        case ZERO_OUTPUT:            return "Cannot swap for 0 tokens.";
        case INSUFFICIENT_LIQUIDITY: return "Not enough funds to complete the trade.";
        case METADATA_UNAVAILABLE:   return "Metadata is not initialized!";
        case ARITHMETIC_OVERFLOW:    return "Arithmetic overflow.";
        case NOT_INITIALIZED:        return "The contract is not initialized.";
        case ALREADY_INITIALIZED:    return "The contract has already been initialized.";
        case INVALID_ARGUMENT:       return "Invalid argument.";
        case UNAUTHORIZED:           return "Method is private.";
        case METHOD_NOT_FOUND:       return "Method not found.";
        case ACCOUNT_NOT_FOUND:      return "Account does not exist.";
        case GAS_EXCEEDED:           return "Exceeded the prepaid gas.";
        case INVALID_CONFIG:         return "Invalid configuration.";
        default:                     return "Unknown error.";
    }
}

} // namespace errors

AMMError::AMMError(int32_t code)
    : std::runtime_error(errors::message(code)), code_(code) {}

AMMError::AMMError(int32_t code, const std::string& detail)
    : std::runtime_error(std::string(errors::message(code)) + " " + detail), code_(code) {}

} // namespace pairamm
