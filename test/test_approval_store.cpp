#include "test_helpers.hpp"

using namespace multitoken;
using fixtures::Harness;

TEST_SUITE("ApprovalStore") {
    TEST_CASE("Approval ids increase per token") {
        Harness h;
        auto t1 = h.mint("alice", 100);
        auto t2 = h.mint("alice", 100);

        auto first = h.mt.approve(h.as("alice"), t1, "bob", 10);
        auto second = h.mt.approve(h.as("alice"), t1, "carol", 20);
        auto other = h.mt.approve(h.as("alice"), t2, "bob", 30);
        REQUIRE(first.is_ok());
        REQUIRE(second.is_ok());
        REQUIRE(other.is_ok());

        CHECK(first.value().approval_id == 0);
        CHECK(second.value().approval_id == 1);
        CHECK(other.value().approval_id == 0);

        auto token = h.mt.token(t1);
        REQUIRE(token.has_value());
        CHECK(token->next_approval_id == std::optional<dp::u64>(2));
        CHECK(token->approvals->size() == 2);
        CHECK(token->approvals->at("carol").amount == 20);
    }

    TEST_CASE("Re-approving replaces the approval with a fresh id") {
        Harness h;
        auto t1 = h.mint("alice", 100);
        REQUIRE(h.mt.approve(h.as("alice"), t1, "bob", 10).is_ok());
        auto again = h.mt.approve(h.as("alice"), t1, "bob", 15);
        REQUIRE(again.is_ok());
        CHECK(again.value().approval_id == 1);

        CHECK(h.mt.isApproved(t1, "bob"));
        CHECK(h.mt.isApproved(t1, "bob", dp::u64(1)));
        CHECK_FALSE(h.mt.isApproved(t1, "bob", dp::u64(0)));
    }

    TEST_CASE("Only the owner of record grants and revokes") {
        Harness h;
        auto t1 = h.mint("alice", 100);

        auto grant = h.mt.approve(h.as("bob"), t1, "carol", 10);
        REQUIRE(grant.is_err());
        CHECK(grant.error().code == ERR_UNAUTHORIZED);

        REQUIRE(h.mt.approve(h.as("alice"), t1, "carol", 10).is_ok());
        auto revoke = h.mt.revoke(h.as("bob"), t1, "carol");
        REQUIRE(revoke.is_err());
        CHECK(revoke.error().code == ERR_UNAUTHORIZED);
        CHECK(h.mt.isApproved(t1, "carol"));

        auto unknown = h.mt.approve(h.as("alice"), "99", "carol", 10);
        REQUIRE(unknown.is_err());
        CHECK(unknown.error().code == ERR_NOT_FOUND);
    }

    TEST_CASE("Approval calls require the attached deposit") {
        Harness h;
        auto t1 = h.mint("alice", 100);
        auto result = h.mt.approve(host::Invocation("alice", 0), t1, "bob", 10);
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_PRECHECK_FAILED);
        CHECK_FALSE(h.mt.isApproved(t1, "bob"));
    }

    TEST_CASE("Revoke and revoke all") {
        Harness h;
        auto t1 = h.mint("alice", 100);
        REQUIRE(h.mt.approve(h.as("alice"), t1, "bob", 10).is_ok());
        REQUIRE(h.mt.approve(h.as("alice"), t1, "carol", 10).is_ok());

        REQUIRE(h.mt.revoke(h.as("alice"), t1, "bob").is_ok());
        CHECK_FALSE(h.mt.isApproved(t1, "bob"));
        CHECK(h.mt.isApproved(t1, "carol"));

        auto missing = h.mt.revoke(h.as("alice"), t1, "bob");
        REQUIRE(missing.is_err());
        CHECK(missing.error().code == ERR_NOT_FOUND);

        REQUIRE(h.mt.revokeAll(h.as("alice"), t1).is_ok());
        CHECK_FALSE(h.mt.isApproved(t1, "carol"));
        CHECK(h.mt.token(t1)->approvals->empty());
    }

    TEST_CASE("Disabled store reports nothing") {
        ledger::LedgerState state;
        ledger::ApprovalStore store(state, false);
        state.setOwner("1", "alice");

        store.initializeToken("1");
        CHECK_FALSE(state.approvalsOf("1").has_value());
        CHECK(store.grant("1", "bob", 5).is_err());
        CHECK_FALSE(store.isApproved("1", "bob"));
        CHECK_FALSE(store.takeAll("1").has_value());
    }
}
