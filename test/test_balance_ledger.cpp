#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "test_helpers.hpp"

using namespace multitoken;
using namespace multitoken::ledger;

// Seeds a token directly in the state, bypassing the registry
static void seedToken(LedgerState &state, const TokenId &token_id, const AccountId &owner_id) {
    state.setOwner(token_id, owner_id);
    state.setSupply(token_id, 0);
    state.setBalance(token_id, owner_id, 0);
}

TEST_SUITE("Balance arithmetic") {
    TEST_CASE("Decimal rendering and parsing") {
        CHECK(balance::toString(0) == "0");
        CHECK(balance::toString(1000) == "1000");
        CHECK(balance::toString(BALANCE_MAX) == "340282366920938463463374607431768211455");

        auto parsed = balance::parse("340282366920938463463374607431768211455");
        REQUIRE(parsed.is_ok());
        CHECK(parsed.value() == BALANCE_MAX);

        CHECK(balance::parse("").is_err());
        CHECK(balance::parse("12a").is_err());
        CHECK(balance::parse("-1").is_err());
        auto too_big = balance::parse("340282366920938463463374607431768211456");
        REQUIRE(too_big.is_err());
        CHECK(too_big.error().code == ERR_OVERFLOW);
    }

    TEST_CASE("Checked add and sub") {
        Balance out = 0;
        CHECK(balance::checkedAdd(BALANCE_MAX - 1, 1, out));
        CHECK(out == BALANCE_MAX);
        CHECK_FALSE(balance::checkedAdd(BALANCE_MAX, 1, out));
        CHECK(balance::checkedSub(5, 5, out));
        CHECK(out == 0);
        CHECK_FALSE(balance::checkedSub(4, 5, out));
    }

    TEST_CASE("High and low halves") {
        Balance value = balance::fromParts(7, 9);
        CHECK(balance::high(value) == 7);
        CHECK(balance::low(value) == 9);
        CHECK(balance::fromParts(balance::high(BALANCE_MAX), balance::low(BALANCE_MAX)) == BALANCE_MAX);
    }
}

TEST_SUITE("BalanceLedger") {
    TEST_CASE("Deposit and withdraw move balance and supply together") {
        LedgerState state;
        BalanceLedger ledger(state);
        seedToken(state, "1", "alice");

        REQUIRE(ledger.deposit("1", "alice", 100).is_ok());
        REQUIRE(ledger.withdraw("1", "alice", 40).is_ok());

        CHECK(ledger.balanceOf("1", "alice").value() == 60);
        CHECK(ledger.supplyOf("1").value() == 60);
        CHECK(ledger.sumOfBalances("1").value() == 60);
    }

    TEST_CASE("Unknown tokens and unregistered accounts") {
        LedgerState state;
        BalanceLedger ledger(state);
        seedToken(state, "1", "alice");

        auto missing_token = ledger.balanceOf("2", "alice");
        REQUIRE(missing_token.is_err());
        CHECK(missing_token.error().code == ERR_NOT_FOUND);

        auto unregistered = ledger.balanceOf("1", "bob");
        REQUIRE(unregistered.is_err());
        CHECK(unregistered.error().code == ERR_NOT_REGISTERED);

        auto deposit = ledger.deposit("1", "bob", 5);
        REQUIRE(deposit.is_err());
        CHECK(deposit.error().code == ERR_NOT_REGISTERED);
        CHECK_FALSE(ledger.isRegistered("1", "bob"));
    }

    TEST_CASE("Registering an account") {
        LedgerState state;
        BalanceLedger ledger(state);
        seedToken(state, "1", "alice");

        REQUIRE(ledger.registerAccount("1", "bob").is_ok());
        CHECK(ledger.balanceOf("1", "bob").value() == 0);

        auto again = ledger.registerAccount("1", "bob");
        REQUIRE(again.is_err());
        CHECK(again.error().code == ERR_ALREADY_REGISTERED);

        auto unknown = ledger.registerAccount("9", "bob");
        REQUIRE(unknown.is_err());
        CHECK(unknown.error().code == ERR_NOT_FOUND);
    }

    TEST_CASE("Withdrawing more than the balance fails without side effects") {
        LedgerState state;
        BalanceLedger ledger(state);
        seedToken(state, "1", "alice");
        REQUIRE(ledger.deposit("1", "alice", 10).is_ok());

        auto result = ledger.withdraw("1", "alice", 11);
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_INSUFFICIENT_BALANCE);
        CHECK(ledger.balanceOf("1", "alice").value() == 10);
        CHECK(ledger.supplyOf("1").value() == 10);
    }

    TEST_CASE("Balances and supply may reach the 128-bit maximum but not pass it") {
        LedgerState state;
        BalanceLedger ledger(state);
        seedToken(state, "1", "alice");
        REQUIRE(ledger.registerAccount("1", "bob").is_ok());

        REQUIRE(ledger.deposit("1", "alice", BALANCE_MAX).is_ok());
        CHECK(ledger.balanceOf("1", "alice").value() == BALANCE_MAX);

        SUBCASE("Balance overflow") {
            auto result = ledger.deposit("1", "alice", 1);
            REQUIRE(result.is_err());
            CHECK(result.error().code == ERR_OVERFLOW);
        }

        SUBCASE("Supply overflow through another account") {
            auto result = ledger.deposit("1", "bob", 1);
            REQUIRE(result.is_err());
            CHECK(result.error().code == ERR_OVERFLOW);
            CHECK(ledger.balanceOf("1", "bob").value() == 0);
        }

        SUBCASE("Withdraw back to zero") {
            REQUIRE(ledger.withdraw("1", "alice", BALANCE_MAX).is_ok());
            CHECK(ledger.balanceOf("1", "alice").value() == 0);
            CHECK(ledger.supplyOf("1").value() == 0);
        }

        CHECK(ledger.supplyOf("1").value() == ledger.sumOfBalances("1").value());
    }

    TEST_CASE("State guard rolls back uncommitted mutations") {
        LedgerState state;
        BalanceLedger ledger(state);
        seedToken(state, "1", "alice");
        state.clearJournal();
        REQUIRE(ledger.deposit("1", "alice", 50).is_ok());

        {
            StateGuard guard(state);
            REQUIRE(ledger.registerAccount("1", "bob").is_ok());
            REQUIRE(ledger.withdraw("1", "alice", 20).is_ok());
            REQUIRE(ledger.deposit("1", "bob", 20).is_ok());
        }

        CHECK(ledger.balanceOf("1", "alice").value() == 50);
        CHECK_FALSE(ledger.isRegistered("1", "bob"));
        CHECK(ledger.supplyOf("1").value() == 50);

        {
            StateGuard outer(state);
            REQUIRE(ledger.withdraw("1", "alice", 5).is_ok());
            {
                StateGuard inner(state);
                REQUIRE(ledger.withdraw("1", "alice", 5).is_ok());
            }
            outer.commit();
        }
        CHECK(ledger.balanceOf("1", "alice").value() == 45);
    }
}
