#include "test_helpers.hpp"

#include <limits>

using namespace multitoken;
using fixtures::Harness;
using fixtures::titled;

TEST_SUITE("TokenRegistry") {
    TEST_CASE("Mint, register and transfer") {
        Harness h;
        auto t1 = h.mint("alice", 1000, "gold");
        CHECK(t1 == "1");
        CHECK(h.balance("alice", t1) == 1000);

        h.registerAccount(t1, "bob");
        REQUIRE(h.mt.transfer(h.as("alice"), "bob", t1, 4).is_ok());

        CHECK(h.balance("alice", t1) == 996);
        CHECK(h.balance("bob", t1) == 4);
        h.checkSupplyInvariant(t1);
    }

    TEST_CASE("Token ids are allocated in increasing order") {
        Harness h;
        CHECK(h.mint("alice", 1) == "1");
        CHECK(h.mint("bob", 2) == "2");
        CHECK(h.mint("alice", 3) == "3");
        CHECK(h.mt.state().lastTokenId() == 3);
    }

    TEST_CASE("Minted token view") {
        Harness h;
        auto t1 = h.mint("alice", 250, "silver");

        auto token = h.mt.token(t1);
        REQUIRE(token.has_value());
        CHECK(token->owner_id == "alice");
        CHECK(token->supply == 250);
        REQUIRE(token->metadata.has_value());
        CHECK(token->metadata->title == std::optional<std::string>("silver"));
        REQUIRE(token->approvals.has_value());
        CHECK(token->approvals->empty());
        CHECK(token->next_approval_id == std::optional<dp::u64>(0));

        CHECK_FALSE(h.mt.token("42").has_value());
        CHECK(h.mt.supply(t1) == std::optional<Balance>(250));
        CHECK_FALSE(h.mt.supply("42").has_value());
    }

    TEST_CASE("Mint without an amount starts at zero") {
        Harness h;
        auto token = h.mt.mint(h.owner(), "alice", std::nullopt, titled("empty"));
        REQUIRE(token.is_ok());
        CHECK(token.value().supply == 0);
        CHECK(h.balance("alice", token.value().token_id) == 0);
    }

    TEST_CASE("Mint emits one event on commit") {
        Harness h;
        std::vector<ledger::LedgerEvent> seen;
        h.mt.events().subscribe([&](const ledger::LedgerEvent &event) { seen.push_back(event); });

        auto t1 = h.mint("alice", 77);
        REQUIRE(seen.size() == 1);
        CHECK(seen[0].kind == ledger::EventKind::Mint);
        CHECK(seen[0].new_owner_id == "alice");
        CHECK(seen[0].token_id == t1);
        CHECK(seen[0].amount == 77);
        CHECK(seen[0].toJson().find("\"event\":\"mt_mint\"") != std::string::npos);
        CHECK(h.mt.events().pending().empty());
    }

    TEST_CASE("Only the contract owner may mint") {
        Harness h;
        auto result = h.mt.mint(h.as("mallory"), "mallory", 10, titled("fake"));
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_UNAUTHORIZED);
        CHECK(h.mt.state().lastTokenId() == 0);
    }

    TEST_CASE("Metadata is required and validated") {
        Harness h;

        SUBCASE("Missing") {
            auto result = h.mt.mint(h.owner(), "alice", 10, std::nullopt);
            REQUIRE(result.is_err());
            CHECK(result.error().code == ERR_INVALID_METADATA);
        }

        SUBCASE("Empty title") {
            auto result = h.mt.mint(h.owner(), "alice", 10, titled(""));
            REQUIRE(result.is_err());
            CHECK(result.error().code == ERR_INVALID_METADATA);
        }

        SUBCASE("Hash without its subject") {
            TokenMetadata md = titled("art");
            md.media_hash = "abc";
            auto result = h.mt.mint(h.owner(), "alice", 10, md);
            REQUIRE(result.is_err());
            CHECK(result.error().code == ERR_INVALID_METADATA);

            md.media = "https://example.com/a.png";
            md.reference_hash = "def";
            result = h.mt.mint(h.owner(), "alice", 10, md);
            REQUIRE(result.is_err());
            CHECK(result.error().code == ERR_INVALID_METADATA);
        }

        CHECK(h.mt.state().lastTokenId() == 0);
        CHECK(h.mt.events().published().empty());
    }

    TEST_CASE("Extensions can be disabled") {
        MultiTokenConfig config;
        config.extensions.metadata = false;
        config.extensions.approvals = false;
        Harness h(config);

        auto token = h.mt.mint(h.owner(), "alice", 5, std::nullopt);
        REQUIRE(token.is_ok());
        CHECK_FALSE(token.value().metadata.has_value());
        CHECK_FALSE(token.value().approvals.has_value());
        CHECK_FALSE(token.value().next_approval_id.has_value());

        auto grant = h.mt.approve(h.as("alice"), token.value().token_id, "bob", 1);
        REQUIRE(grant.is_err());
        CHECK(grant.error().code == ERR_INVALID_ARGUMENT);
    }

    TEST_CASE("Storage deposit refund") {
        Harness h;
        auto before = h.mt.state().storageUsage();

        auto token = h.mt.mint(host::Invocation(h.config.owner_id, 1000000), "alice", 10, titled("paid"),
                               AccountId("alice"));
        REQUIRE(token.is_ok());
        auto used = h.mt.state().storageUsage() - before;

        REQUIRE(h.payments.refunds().size() == 1);
        CHECK(h.payments.refunds()[0].recipient == "alice");
        CHECK(h.payments.refunds()[0].amount == Balance(1000000) - Balance(used));
    }

    TEST_CASE("Insufficient storage deposit aborts the mint") {
        Harness h;
        auto result = h.mt.mint(host::Invocation(h.config.owner_id, 1), "alice", 10, titled("cheap"),
                                AccountId("alice"));
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_PRECHECK_FAILED);
        CHECK(h.mt.state().lastTokenId() == 0);
        CHECK_FALSE(h.mt.token("1").has_value());
        CHECK(h.payments.refunds().empty());
        CHECK(h.mt.events().published().empty());
    }

    TEST_CASE("Token ids stop at the top of the id space") {
        Harness h;
        const auto last = std::numeric_limits<dp::u64>::max();
        {
            ledger::StateGuard guard(h.mt.state());
            h.mt.state().setLastTokenId(last);
            guard.commit();
        }

        auto result = h.mt.mint(h.owner(), "alice", 10, titled("overflow"));
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_ID_SPACE_EXHAUSTED);
        CHECK(h.mt.state().lastTokenId() == last);
        CHECK(h.mt.state().tokenIds().empty());
        CHECK(h.mt.events().published().empty());
    }

    TEST_CASE("Storage refund is paid only after the mint persists") {
        storage::FileKvStore unopened; // every write fails
        Harness h(MultiTokenConfig{}, &unopened);

        auto result = h.mt.mint(host::Invocation(h.config.owner_id, 1000000), "alice", 10, titled("paid"),
                                AccountId("alice"));
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_STORAGE);
        CHECK(h.payments.refunds().empty());
        CHECK(h.mt.state().lastTokenId() == 0);
        CHECK_FALSE(h.mt.token("1").has_value());
        CHECK(h.mt.events().published().empty());
    }
}
