// pairamm - Pool integration tests (pool + two token ledgers on the runtime)

#include <algorithm>

#include <catch2/catch_test_macros.hpp>
#include <pairamm/pool.hpp>
#include <pairamm/runtime.hpp>
#include <pairamm/wide_math.hpp>

#include "support/error_code.hpp"
#include "support/test_token.hpp"

using namespace pairamm;
using pairamm::testing::TestToken;
using pairamm::testing::error_code_of;

namespace {

const Balance E9 = 1000000000;
const Balance E18 = E9 * E9;

struct PoolFixture {
    Runtime runtime;
    std::shared_ptr<TestToken> token_a = std::make_shared<TestToken>();
    std::shared_ptr<TestToken> token_b = std::make_shared<TestToken>();
    std::shared_ptr<PairPool> pool = std::make_shared<PairPool>();

    explicit PoolFixture(uint8_t decimals_a = 8, uint8_t decimals_b = 16, bool initialize = true) {
        runtime.deploy("token-a", token_a);
        runtime.deploy("token-b", token_b);
        runtime.deploy("pool", pool);
        create_token("token-a", "token_a", decimals_a);
        create_token("token-b", "token_b", decimals_b);

        for (const char* account : {"pool", "owner", "alice", "carol"}) {
            register_account("token-a", account);
            register_account("token-b", account);
        }

        if (initialize) {
            ExecutionOutcome out = runtime.call("owner", "pool", "new",
                json{{"owner", "owner"}, {"token_a", "token-a"}, {"token_b", "token-b"}});
            REQUIRE(out.success);
        }
    }

    void create_token(const AccountId& account, const std::string& name, uint8_t decimals) {
        REQUIRE(runtime.call(account, account, "new",
                             json{{"name", name}, {"decimals", decimals}}).success);
    }

    void register_account(const AccountId& token, const AccountId& account) {
        REQUIRE(runtime.call(account, token, "storage_deposit",
                             json{{"account_id", account}}).success);
    }

    void mint(const AccountId& token, const AccountId& account, Balance amount) {
        REQUIRE(runtime.call(token, token, "mint",
                             json{{"account_id", account}, {"amount", to_string(amount)}}).success);
    }

    // ft_transfer_call into the pool; the outcome value is the amount the pool kept
    ExecutionOutcome send(const AccountId& from, const AccountId& token, Balance amount) {
        return runtime.call(from, token, "ft_transfer_call",
                            json{{"receiver_id", "pool"}, {"amount", to_string(amount)}, {"msg", ""}},
                            ONE_YOCTO);
    }

    uint64_t submit_send(const AccountId& from, const AccountId& token, Balance amount) {
        return runtime.submit(from, token, "ft_transfer_call",
                              json{{"receiver_id", "pool"}, {"amount", to_string(amount)}, {"msg", ""}},
                              ONE_YOCTO);
    }

    void deposit(const AccountId& token, Balance amount) {
        mint(token, "owner", amount);
        REQUIRE(send("owner", token, amount).value == to_string(amount));
    }

    bool logged(const std::string& line) const {
        const auto& logs = runtime.logs();
        return std::find(logs.begin(), logs.end(), line) != logs.end();
    }
};

} // namespace

TEST_CASE("Pool initialization", "[pool]") {
    PoolFixture f;

    REQUIRE(f.pool->initialized());
    REQUIRE(f.pool->owner() == "owner");
    REQUIRE(f.runtime.view("pool", "get_owner") == "owner");

    SECTION("Metadata of both tokens resolves") {
        REQUIRE(f.pool->metadata("token-a") == TokenMetadata{"token_a", "token_a_SYMBOL", 8});
        REQUIRE(f.pool->metadata("token-b") == TokenMetadata{"token_b", "token_b_SYMBOL", 16});

        json md = f.runtime.view("pool", "get_metadata", json{{"token", "token-b"}});
        REQUIRE(md["symbol"] == "token_b_SYMBOL");
        REQUIRE(md["decimals"] == 16);
    }

    SECTION("Empty pool ratio is zero") {
        REQUIRE(f.pool->ratio() == 0);
        REQUIRE(f.runtime.view("pool", "get_ratio") == "0");
    }

    SECTION("Second initialization is rejected") {
        ExecutionOutcome out = f.runtime.call("owner", "pool", "new",
            json{{"owner", "alice"}, {"token_a", "token-a"}, {"token_b", "token-b"}});
        REQUIRE_FALSE(out.success);
        REQUIRE(out.error_code == errors::ALREADY_INITIALIZED);
        REQUIRE(f.pool->owner() == "owner");
    }

    SECTION("Unknown method") {
        REQUIRE(f.runtime.call("alice", "pool", "drain").error_code == errors::METHOD_NOT_FOUND);
        REQUIRE(error_code_of([&] { f.runtime.view("pool", "get_everything"); })
                == errors::METHOD_NOT_FOUND);
    }
}

TEST_CASE("Pool before initialization", "[pool]") {
    PoolFixture f(8, 16, false);

    REQUIRE_FALSE(f.pool->initialized());
    REQUIRE(error_code_of([&] { f.runtime.view("pool", "get_owner"); }) == errors::NOT_INITIALIZED);
    REQUIRE(error_code_of([&] { f.pool->ratio(); }) == errors::NOT_INITIALIZED);

    ExecutionOutcome out = f.runtime.call("token-a", "pool", "ft_on_transfer",
        json{{"sender_id", "alice"}, {"amount", "10"}, {"msg", ""}});
    REQUIRE(out.error_code == errors::NOT_INITIALIZED);

    SECTION("Identical token addresses") {
        ExecutionOutcome bad = f.runtime.call("owner", "pool", "new",
            json{{"owner", "owner"}, {"token_a", "token-a"}, {"token_b", "token-a"}});
        REQUIRE(bad.error_code == errors::INVALID_ARGUMENT);
        REQUIRE_FALSE(f.pool->initialized());
    }

    SECTION("Malformed account id") {
        ExecutionOutcome bad = f.runtime.call("owner", "pool", "new",
            json{{"owner", "Owner!"}, {"token_a", "token-a"}, {"token_b", "token-b"}});
        REQUIRE(bad.error_code == errors::INVALID_ARGUMENT);
    }

    SECTION("Not enough gas for the metadata queries") {
        ExecutionOutcome bad = f.runtime.call("owner", "pool", "new",
            json{{"owner", "owner"}, {"token_a", "token-a"}, {"token_b", "token-b"}},
            0, 3 * TGAS);
        REQUIRE(bad.error_code == errors::GAS_EXCEEDED);
        REQUIRE_FALSE(f.pool->initialized());
        REQUIRE(f.runtime.pending() == 0);
    }

    SECTION("Ratio before metadata resolves") {
        f.runtime.submit("owner", "pool", "new",
            json{{"owner", "owner"}, {"token_a", "token-a"}, {"token_b", "token-b"}});
        REQUIRE(f.runtime.step());

        REQUIRE(f.pool->initialized());
        REQUIRE(error_code_of([&] { f.pool->ratio(); }) == errors::METADATA_UNAVAILABLE);
        REQUIRE(error_code_of([&] { f.runtime.view("pool", "get_ratio"); })
                == errors::METADATA_UNAVAILABLE);

        f.runtime.run();
        REQUIRE(f.pool->ratio() == 0);
    }
}

TEST_CASE("Owner deposits", "[pool]") {
    PoolFixture f;

    SECTION("Deposit credits exactly one slot") {
        f.deposit("token-a", E9);
        REQUIRE(f.pool->balance("token-a") == E9);
        REQUIRE(f.pool->balance("token-b") == 0);
        REQUIRE(f.token_a->balance_of("pool") == E9);
        REQUIRE(f.token_a->balance_of("owner") == 0);
        REQUIRE(f.runtime.view("pool", "get_balance", json{{"token", "token-a"}}) == "1000000000");
        REQUIRE(f.pool->get_stats().deposits == 1);
    }

    SECTION("Reference ratio") {
        f.deposit("token-a", E9);
        f.deposit("token-b", E18);
        REQUIRE(f.pool->ratio() == 1000);
    }

    SECTION("Plain transfer is not accounted") {
        f.mint("token-a", "owner", 500);
        ExecutionOutcome out = f.runtime.call("owner", "token-a", "ft_transfer",
            json{{"receiver_id", "pool"}, {"amount", "500"}, {"memo", nullptr}}, ONE_YOCTO);
        REQUIRE(out.success);
        REQUIRE(f.token_a->balance_of("pool") == 500);
        REQUIRE(f.pool->balance("token-a") == 0);
    }

    SECTION("Foreign address on the balance view") {
        REQUIRE(error_code_of([&] { f.pool->balance("token-c"); }) == errors::UNKNOWN_TOKEN);
    }
}

TEST_CASE("Swaps", "[pool][swap]") {
    PoolFixture f;
    f.deposit("token-a", 2 * E9);
    f.deposit("token-b", E18);

    SECTION("Token A for token B") {
        f.mint("token-a", "alice", E9);
        ExecutionOutcome out = f.send("alice", "token-a", E9);
        REQUIRE(out.success);
        REQUIRE(out.value == "1000000000");

        REQUIRE(f.pool->balance("token-a") == 3 * E9);
        REQUIRE(to_string(f.pool->balance("token-b")) == "666666666666666667");
        REQUIRE(to_string(f.token_b->balance_of("alice")) == "333333333333333333");
        REQUIRE(f.token_a->balance_of("alice") == 0);

        // Accounted reserves match the ledgers
        REQUIRE(f.token_a->balance_of("pool") == f.pool->balance("token-a"));
        REQUIRE(f.token_b->balance_of("pool") == f.pool->balance("token-b"));

        auto stats = f.pool->get_stats();
        REQUIRE(stats.swaps_initiated == 1);
        REQUIRE(stats.swaps_committed == 1);
        REQUIRE(stats.swaps_rolled_back == 0);
    }

    SECTION("Token B for token A") {
        Balance amount = E18 / 10;
        Balance reserve_a = f.pool->balance("token-a");
        Balance reserve_b = f.pool->balance("token-b");
        Balance expected = reserve_a * amount / (reserve_b + amount);

        f.mint("token-b", "alice", amount);
        REQUIRE(f.send("alice", "token-b", amount).value == to_string(amount));

        REQUIRE(f.token_a->balance_of("alice") == expected);
        REQUIRE(f.pool->balance("token-a") == reserve_a - expected);
        REQUIRE(f.pool->balance("token-b") == reserve_b + amount);

        // The constant product never shrinks
        REQUIRE(wide::mul_u128(f.pool->balance("token-a"), f.pool->balance("token-b"))
                >= wide::mul_u128(reserve_a, reserve_b));
    }

    SECTION("Output that rounds to zero is refunded") {
        PoolFixture thin;
        thin.deposit("token-a", E9);
        thin.deposit("token-b", 10);
        thin.mint("token-a", "alice", 1);

        ExecutionOutcome out = thin.send("alice", "token-a", 1);
        REQUIRE(out.value == "0");
        REQUIRE(thin.token_a->balance_of("alice") == 1);
        REQUIRE(thin.pool->balance("token-a") == E9);
        REQUIRE(thin.pool->balance("token-b") == 10);
    }

    SECTION("Zero amount is rejected") {
        ExecutionOutcome out = f.runtime.call("token-a", "pool", "ft_on_transfer",
            json{{"sender_id", "alice"}, {"amount", "0"}, {"msg", ""}});
        REQUIRE(out.error_code == errors::ZERO_AMOUNT);
    }
}

TEST_CASE("Failed swap transfer rolls back", "[pool][swap]") {
    PoolFixture f;
    f.deposit("token-a", 2 * E9);
    f.deposit("token-b", E18);

    // Registered on token A only, so the payout in token B fails
    f.register_account("token-a", "bob");
    f.mint("token-a", "bob", E9);

    ExecutionOutcome out = f.send("bob", "token-a", E9);
    REQUIRE(out.success);
    REQUIRE(out.value == "0");

    REQUIRE(f.token_a->balance_of("bob") == E9);
    REQUIRE(f.pool->balance("token-a") == 2 * E9);
    REQUIRE(f.pool->balance("token-b") == E18);
    REQUIRE(f.token_b->balance_of("pool") == E18);
    REQUIRE(f.logged("Transferring the swapped tokens failed."));
    REQUIRE(f.pool->get_stats().swaps_rolled_back == 1);
}

TEST_CASE("Foreign token is refunded", "[pool]") {
    PoolFixture f;
    f.deposit("token-a", E9);

    auto token_c = std::make_shared<TestToken>();
    f.runtime.deploy("token-c", token_c);
    f.create_token("token-c", "token_c", 6);
    f.register_account("token-c", "pool");
    f.register_account("token-c", "alice");
    f.mint("token-c", "alice", 1000);

    ExecutionOutcome out = f.send("alice", "token-c", 1000);
    REQUIRE(out.value == "0");
    REQUIRE(token_c->balance_of("alice") == 1000);
    REQUIRE(token_c->balance_of("pool") == 0);
    REQUIRE(f.pool->balance("token-a") == E9);
    REQUIRE(f.pool->balance("token-b") == 0);

    // The pool's receipt itself failed with the rejection
    ExecutionOutcome direct = f.runtime.call("token-c", "pool", "ft_on_transfer",
        json{{"sender_id", "alice"}, {"amount", "5"}, {"msg", ""}});
    REQUIRE(direct.error_code == errors::UNSUPPORTED_TOKEN);
}

TEST_CASE("Large reserves", "[pool]") {
    PoolFixture f(20, 18);
    const Balance half = U128_MAX / 2;

    f.deposit("token-a", half);
    f.deposit("token-b", half);
    REQUIRE(to_string(f.pool->ratio()) == "289480223093290488503844922296628310727");

    f.mint("token-a", "alice", half);
    REQUIRE(f.send("alice", "token-a", half).value == to_string(half));

    REQUIRE(f.token_b->balance_of("alice") == half / 2);
    REQUIRE(f.pool->balance("token-a") == half + half);
    REQUIRE(f.pool->balance("token-b") == half - half / 2);

    SECTION("Ratio overflow surfaces as an error") {
        PoolFixture g(0, 0);
        g.deposit("token-a", half);
        g.deposit("token-b", half);
        REQUIRE(error_code_of([&] { g.pool->ratio(); }) == errors::ARITHMETIC_OVERFLOW);
    }
}

TEST_CASE("Private callbacks", "[pool]") {
    PoolFixture f;
    f.deposit("token-a", 2 * E9);
    f.deposit("token-b", E18);

    ExecutionOutcome swap = f.runtime.call("alice", "pool", "swap_callback",
        json{{"input_index", 0}, {"balance_in", "1"}, {"balance_out", "1"}, {"amount", "1"}});
    REQUIRE_FALSE(swap.success);
    REQUIRE(swap.error_code == errors::UNAUTHORIZED);

    ExecutionOutcome md = f.runtime.call("alice", "pool", "metadata_callback", json{{"index", 0}});
    REQUIRE(md.error_code == errors::UNAUTHORIZED);

    REQUIRE(f.pool->balance("token-a") == 2 * E9);
    REQUIRE(f.pool->balance("token-b") == E18);
}

TEST_CASE("Metadata query failure and refresh", "[pool][metadata]") {
    PoolFixture f(8, 16, false);

    // token-late is not deployed yet, so its ft_metadata call fails
    ExecutionOutcome init = f.runtime.call("owner", "pool", "new",
        json{{"owner", "owner"}, {"token_a", "token-a"}, {"token_b", "token-late"}});
    REQUIRE(init.success);

    REQUIRE(f.pool->metadata("token-a").decimals == 8);
    REQUIRE(error_code_of([&] { f.pool->metadata("token-late"); })
            == errors::METADATA_UNAVAILABLE);
    REQUIRE(error_code_of([&] { f.pool->ratio(); }) == errors::METADATA_UNAVAILABLE);

    SECTION("Refresh after the token appears") {
        auto late = std::make_shared<TestToken>();
        f.runtime.deploy("token-late", late);
        f.create_token("token-late", "late", 12);

        ExecutionOutcome out = f.runtime.call("owner", "pool", "update_metadata",
                                              json{{"token", "token-late"}});
        REQUIRE(out.success);
        REQUIRE(f.pool->metadata("token-late") == TokenMetadata{"late", "late_SYMBOL", 12});
        REQUIRE(f.pool->ratio() == 0);
    }

    SECTION("Refresh of a foreign token") {
        ExecutionOutcome out = f.runtime.call("owner", "pool", "update_metadata",
                                              json{{"token", "token-b"}});
        REQUIRE(out.error_code == errors::UNKNOWN_TOKEN);
    }
}

TEST_CASE("In-flight swaps price against the same reserves", "[pool][race]") {
    PoolFixture f;
    f.deposit("token-a", 2 * E9);
    f.deposit("token-b", E18);
    f.mint("token-a", "alice", E9);
    f.mint("token-a", "carol", E9);

    SECTION("Two swaps quoted before either commits") {
        uint64_t first = f.submit_send("alice", "token-a", E9);
        uint64_t second = f.submit_send("carol", "token-a", E9);
        f.runtime.run();

        REQUIRE(f.runtime.outcome(first)->value == "1000000000");
        REQUIRE(f.runtime.outcome(second)->value == "1000000000");

        // Both were priced against (2e9, 1e18)
        REQUIRE(to_string(f.token_b->balance_of("alice")) == "333333333333333333");
        REQUIRE(to_string(f.token_b->balance_of("carol")) == "333333333333333333");

        // Each callback wrote its own precomputed balances
        REQUIRE(f.pool->balance("token-a") == 3 * E9);
        REQUIRE(to_string(f.pool->balance("token-b")) == "666666666666666667");
        REQUIRE(f.token_a->balance_of("pool") == 4 * E9);
        REQUIRE(f.pool->get_stats().swaps_committed == 2);
    }

    SECTION("Deposit landing inside the swap window") {
        f.mint("token-b", "owner", E9);
        f.submit_send("alice", "token-a", E9);
        f.submit_send("owner", "token-b", E9);
        f.runtime.run();

        // The swap callback commits the output balance it computed before the deposit
        REQUIRE(to_string(f.pool->balance("token-b")) == "666666666666666667");
        REQUIRE(f.pool->get_stats().deposits == 3);
        REQUIRE(f.token_b->balance_of("pool") == E18 - 333333333333333333ULL + E9);
    }
}

TEST_CASE("Reserves and ratio across a pending swap", "[pool][swap]") {
    PoolFixture f;
    f.deposit("token-a", E9);
    f.deposit("token-b", E18);
    REQUIRE(f.pool->ratio() == 1000);

    f.mint("token-b", "alice", E18 / 10);
    uint64_t tx = f.submit_send("alice", "token-b", E18 / 10);
    REQUIRE(f.runtime.step());  // token-b.ft_transfer_call
    REQUIRE(f.runtime.step());  // pool.ft_on_transfer, payout in flight

    REQUIRE(f.pool->get_stats().swaps_initiated == 1);
    REQUIRE(f.pool->get_stats().swaps_committed == 0);
    REQUIRE(f.token_b->balance_of("pool") == E18 + E18 / 10);
    REQUIRE(f.pool->balance("token-a") == E9);
    REQUIRE(f.pool->balance("token-b") == E18);
    REQUIRE(f.pool->ratio() == 1000);
    REQUIRE(f.runtime.view("pool", "get_ratio") == "1000");

    f.runtime.run();
    REQUIRE(f.runtime.outcome(tx)->value == "100000000000000000");

    // floor(1e9 * 1e17 / (1e18 + 1e17))
    REQUIRE(f.token_a->balance_of("alice") == 90909090);
    REQUIRE(f.pool->balance("token-a") == 909090910);
    REQUIRE(f.pool->balance("token-b") == E18 + E18 / 10);

    // Whole-unit normalization truncates 9.09 to 9, so the ratio only holds up to rounding
    REQUIRE(f.pool->ratio() == 9 * 110);

    f.deposit("token-a", 1090909090);
    REQUIRE(f.pool->balance("token-a") == 2 * E9);
    REQUIRE(f.pool->ratio() == 20 * 110);
}

TEST_CASE("Swap without gas for the payout", "[pool][swap]") {
    PoolFixture f;
    f.deposit("token-a", 2 * E9);
    f.deposit("token-b", E18);

    // 1 TGas left after execution, the payout chain needs 2
    ExecutionOutcome out = f.runtime.call("token-a", "pool", "ft_on_transfer",
        json{{"sender_id", "alice"}, {"amount", "1000000000"}, {"msg", ""}}, 0, 2 * TGAS);
    REQUIRE(out.error_code == errors::GAS_EXCEEDED);
    REQUIRE(f.pool->get_stats().swaps_initiated == 0);
    REQUIRE(f.pool->balance("token-a") == 2 * E9);
    REQUIRE(f.pool->balance("token-b") == E18);
    REQUIRE(f.runtime.pending() == 0);
}

TEST_CASE("Transfer call without gas for the notification", "[pool][token]") {
    PoolFixture f;
    f.mint("token-a", "alice", 500);

    ExecutionOutcome out = f.runtime.call("alice", "token-a", "ft_transfer_call",
        json{{"receiver_id", "pool"}, {"amount", "500"}, {"msg", ""}},
        ONE_YOCTO, TestToken::RESOLVE_TRANSFER_GAS + TGAS);
    REQUIRE(out.error_code == errors::GAS_EXCEEDED);
    REQUIRE(f.token_a->balance_of("alice") == 500);
    REQUIRE(f.token_a->balance_of("pool") == 0);
    REQUIRE(f.pool->balance("token-a") == 0);
}
