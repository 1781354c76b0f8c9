#ifndef PAIRAMM_TYPES_HPP
#define PAIRAMM_TYPES_HPP

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace pairamm {

using json = nlohmann::json;

// =============================================================================
// Ledger Primitives
// =============================================================================

using AccountId = std::string;
using U128 = unsigned __int128;
using Balance = U128;
using Gas = uint64_t;

constexpr Gas TGAS = 1000000000000ULL;       // 1e12 gas units
constexpr Balance ONE_YOCTO = 1;              // Minimal attached collateral
constexpr U128 U128_MAX = ~U128(0);

// Cross-contract method names
namespace methods {
constexpr const char* FT_METADATA = "ft_metadata";
constexpr const char* FT_TRANSFER = "ft_transfer";
constexpr const char* FT_ON_TRANSFER = "ft_on_transfer";
constexpr const char* METADATA_CALLBACK = "metadata_callback";
constexpr const char* SWAP_CALLBACK = "swap_callback";
}

// Account ids: 2..64 chars of [a-z0-9], separated by single '-', '_' or '.'
bool is_valid_account_id(std::string_view id);

// =============================================================================
// U128 <-> decimal string (ledger JSON convention for balances)
// =============================================================================

std::string to_string(U128 value);
std::optional<U128> parse_u128(std::string_view text);

// Throws AMMError(INVALID_ARGUMENT) when the value is not a decimal U128 string
U128 u128_from_json(const json& value);
inline json u128_to_json(U128 value) { return to_string(value); }

// =============================================================================
// Token Metadata
// =============================================================================

// Full record returned by a fungible-token ledger's ft_metadata
struct FungibleTokenMetadata {
    std::string spec;
    std::string name;
    std::string symbol;
    std::optional<std::string> icon;
    std::optional<std::string> reference;
    std::optional<std::string> reference_hash;
    uint8_t decimals = 0;
};

// Subset of the ledger record the pool keeps per slot
struct TokenMetadata {
    std::string name;
    std::string symbol;
    uint8_t decimals = 0;

    bool operator==(const TokenMetadata& other) const {
        return name == other.name && symbol == other.symbol && decimals == other.decimals;
    }
    bool operator!=(const TokenMetadata& other) const { return !(*this == other); }
};

void to_json(json& j, const FungibleTokenMetadata& m);
void from_json(const json& j, FungibleTokenMetadata& m);
void to_json(json& j, const TokenMetadata& m);
void from_json(const json& j, TokenMetadata& m);

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;
constexpr int32_t UNKNOWN_TOKEN = -1;
constexpr int32_t UNSUPPORTED_TOKEN = -2;
constexpr int32_t ZERO_AMOUNT = -3;
constexpr int32_t ZERO_OUTPUT = -4;
constexpr int32_t INSUFFICIENT_LIQUIDITY = -5;
constexpr int32_t METADATA_UNAVAILABLE = -6;
constexpr int32_t ARITHMETIC_OVERFLOW = -7;
constexpr int32_t NOT_INITIALIZED = -10;
constexpr int32_t ALREADY_INITIALIZED = -11;
constexpr int32_t INVALID_ARGUMENT = -12;
constexpr int32_t UNAUTHORIZED = -20;
constexpr int32_t METHOD_NOT_FOUND = -30;
constexpr int32_t ACCOUNT_NOT_FOUND = -31;
constexpr int32_t GAS_EXCEEDED = -32;
constexpr int32_t INVALID_CONFIG = -40;

const char* message(int32_t code);
}

// Raised by every operation that must abort the whole call
class AMMError : public std::runtime_error {
public:
    explicit AMMError(int32_t code);
    AMMError(int32_t code, const std::string& detail);

    int32_t code() const noexcept { return code_; }

private:
    int32_t code_;
};

} // namespace pairamm

#endif // PAIRAMM_TYPES_HPP
