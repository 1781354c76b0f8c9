// pairamm - Ledger primitive tests

#include <catch2/catch_test_macros.hpp>
#include <pairamm/types.hpp>

#include "support/error_code.hpp"

using namespace pairamm;
using pairamm::testing::error_code_of;

TEST_CASE("Account id validation", "[types]") {
    REQUIRE(is_valid_account_id("pool"));
    REQUIRE(is_valid_account_id("token-a"));
    REQUIRE(is_valid_account_id("amm.testnet"));
    REQUIRE(is_valid_account_id("a_b-c.d0"));

    REQUIRE_FALSE(is_valid_account_id(""));
    REQUIRE_FALSE(is_valid_account_id("a"));
    REQUIRE_FALSE(is_valid_account_id("Pool"));
    REQUIRE_FALSE(is_valid_account_id("-pool"));
    REQUIRE_FALSE(is_valid_account_id("pool."));
    REQUIRE_FALSE(is_valid_account_id("po..ol"));
    REQUIRE_FALSE(is_valid_account_id("po ol"));
    REQUIRE_FALSE(is_valid_account_id(std::string(65, 'a')));
    REQUIRE(is_valid_account_id(std::string(64, 'a')));
}

TEST_CASE("U128 decimal strings", "[types]") {
    REQUIRE(to_string(U128(0)) == "0");
    REQUIRE(to_string(U128_MAX) == "340282366920938463463374607431768211455");

    REQUIRE(parse_u128("0") == U128(0));
    REQUIRE(parse_u128("340282366920938463463374607431768211455") == U128_MAX);
    REQUIRE_FALSE(parse_u128("340282366920938463463374607431768211456").has_value());
    REQUIRE_FALSE(parse_u128("").has_value());
    REQUIRE_FALSE(parse_u128("-1").has_value());
    REQUIRE_FALSE(parse_u128("12a").has_value());

    SECTION("JSON values") {
        REQUIRE(u128_to_json(42) == "42");
        REQUIRE(u128_from_json(json("1000000000000000000000")) == U128(1000000000000) * 1000000000);
        REQUIRE(error_code_of([] { u128_from_json(json(5)); }) == errors::INVALID_ARGUMENT);
        REQUIRE(error_code_of([] { u128_from_json(json("five")); }) == errors::INVALID_ARGUMENT);
    }
}

TEST_CASE("Token metadata JSON", "[types]") {
    json j = {{"spec", "ft-1.0.0"}, {"name", "Wrapped"}, {"symbol", "WRP"},
              {"icon", "data:image/svg+xml,"}, {"reference", nullptr}, {"decimals", 24}};

    FungibleTokenMetadata ft = j.get<FungibleTokenMetadata>();
    REQUIRE(ft.name == "Wrapped");
    REQUIRE(ft.icon == std::string("data:image/svg+xml,"));
    REQUIRE_FALSE(ft.reference.has_value());
    REQUIRE_FALSE(ft.reference_hash.has_value());
    REQUIRE(ft.decimals == 24);

    json out = ft;
    REQUIRE(out["reference_hash"].is_null());
    REQUIRE(out["decimals"] == 24);

    SECTION("Decimals must fit in a byte") {
        j["decimals"] = 256;
        REQUIRE(error_code_of([&] { j.get<FungibleTokenMetadata>(); }) == errors::INVALID_ARGUMENT);
    }

    SECTION("Pool subset") {
        TokenMetadata md = json{{"name", "Wrapped"}, {"symbol", "WRP"}, {"decimals", 24}};
        REQUIRE(md == TokenMetadata{"Wrapped", "WRP", 24});
        REQUIRE(json(md)["symbol"] == "WRP");
    }
}

TEST_CASE("Error messages", "[types]") {
    AMMError plain(errors::ZERO_OUTPUT);
    REQUIRE(plain.code() == errors::ZERO_OUTPUT);
    REQUIRE(std::string(plain.what()) == "Cannot swap for 0 tokens.");

    AMMError detailed(errors::UNKNOWN_TOKEN, "token-c");
    REQUIRE(std::string(detailed.what()) == "Wrong token provided. token-c");

    REQUIRE(std::string(errors::message(errors::INSUFFICIENT_LIQUIDITY))
            == "Not enough funds to complete the trade.");
    REQUIRE(std::string(errors::message(errors::METADATA_UNAVAILABLE))
            == "Metadata is not initialized!");
}
