#include "test_helpers.hpp"

#include <filesystem>
#include <fstream>

using namespace multitoken;
using namespace multitoken::storage;
using fixtures::Harness;
using fixtures::replying;

// Test helper: cleanup storage directory
struct TestStore {
    std::string path;
    FileKvStore store;

    explicit TestStore(const std::string &name) : path(name + "_store") { cleanup(); }

    ~TestStore() {
        store.close();
        cleanup();
    }

    void cleanup() {
        if (std::filesystem::exists(path)) {
            std::filesystem::remove_all(path);
        }
    }
};

static dp::ByteBuf bytes(const std::string &text) { return dp::ByteBuf(text.begin(), text.end()); }

// ===========================================
// Keys
// ===========================================

TEST_CASE("Storage keys") {
    SUBCASE("Deterministic per record") {
        auto a = keyFor(ledger::StateKey{ledger::RecordKind::Balance, "1", "alice"});
        auto b = keyFor(ledger::StateKey{ledger::RecordKind::Balance, "1", "alice"});
        auto c = keyFor(ledger::StateKey{ledger::RecordKind::Balance, "1", "bob"});
        REQUIRE(a.is_ok());
        REQUIRE(b.is_ok());
        REQUIRE(c.is_ok());
        CHECK(a.value() == b.value());
        CHECK(a.value() != c.value());
        CHECK(a.value().size() == 1 + 32 + 32);
        CHECK(a.value()[0] == static_cast<char>(ledger::RecordKind::Balance));
    }

    SUBCASE("Token records hash only the token id") {
        auto owner = keyFor(ledger::StateKey{ledger::RecordKind::Owner, "7", ""});
        auto supply = keyFor(ledger::StateKey{ledger::RecordKind::Supply, "7", ""});
        REQUIRE(owner.is_ok());
        REQUIRE(supply.is_ok());
        CHECK(owner.value().size() == 33);
        CHECK(owner.value().substr(1) == supply.value().substr(1));
        CHECK(owner.value()[0] != supply.value()[0]);
    }

    SUBCASE("Saga keys sort by id") {
        auto two = keyFor(ledger::StateKey{ledger::RecordKind::Saga, "2", ""});
        auto ten = keyFor(ledger::StateKey{ledger::RecordKind::Saga, "10", ""});
        REQUIRE(two.is_ok());
        REQUIRE(ten.is_ok());
        CHECK(two.value().size() == 9);
        CHECK(two.value() < ten.value());
        CHECK(keyFor(ledger::StateKey{ledger::RecordKind::Saga, "x", ""}).is_err());
    }

    SUBCASE("SHA-256 digest") {
        auto empty = digest("");
        REQUIRE(empty.is_ok());
        CHECK(empty.value().size() == 32);
        CHECK(static_cast<unsigned char>(empty.value()[0]) == 0xe3);
        CHECK(static_cast<unsigned char>(empty.value()[1]) == 0xb0);
    }
}

// ===========================================
// Backends
// ===========================================

TEST_CASE("MemoryKvStore") {
    MemoryKvStore kv;
    REQUIRE(kv.apply({WriteOp{"a1", bytes("x")}, WriteOp{"a2", bytes("y")}, WriteOp{"b1", bytes("z")}}).is_ok());
    CHECK(kv.size() == 3);

    auto scanned = kv.scanPrefix("a");
    REQUIRE(scanned.is_ok());
    REQUIRE(scanned.value().size() == 2);
    CHECK(scanned.value()[0].first == "a1");
    CHECK(scanned.value()[1].first == "a2");

    REQUIRE(kv.apply({WriteOp{"a1", std::nullopt}}).is_ok());
    CHECK_FALSE(kv.get("a1").value().has_value());
    CHECK(kv.get("b1").value().has_value());
}

TEST_CASE("FileKvStore") {
    TestStore ts("multitoken_kv");

    SUBCASE("Operations require an open store") {
        CHECK(ts.store.get("a").is_err());
        CHECK(ts.store.apply({WriteOp{"a", bytes("1")}}).is_err());
    }

    SUBCASE("Batches survive reopening") {
        REQUIRE(ts.store.open(dp::String(ts.path.c_str())).is_ok());
        REQUIRE(ts.store.apply({WriteOp{"k1", bytes("one")}, WriteOp{"k2", bytes("two")}}).is_ok());
        REQUIRE(ts.store.apply({WriteOp{"k1", std::nullopt}, WriteOp{"k3", bytes("three")}}).is_ok());
        ts.store.close();

        FileKvStore reopened;
        REQUIRE(reopened.open(dp::String(ts.path.c_str())).is_ok());
        CHECK(reopened.size() == 2);
        CHECK(reopened.sequence() == 2);
        CHECK_FALSE(reopened.get("k1").value().has_value());
        auto k3 = reopened.get("k3");
        REQUIRE(k3.is_ok());
        REQUIRE(k3.value().has_value());
        CHECK(std::string(k3.value()->begin(), k3.value()->end()) == "three");
        reopened.close();
    }

    SUBCASE("A torn trailing batch is cut off on open") {
        REQUIRE(ts.store.open(dp::String(ts.path.c_str())).is_ok());
        REQUIRE(ts.store.apply({WriteOp{"k1", bytes("one")}}).is_ok());
        auto log = ts.store.logPath();
        ts.store.close();
        auto intact_size = std::filesystem::file_size(log);

        {
            std::ofstream out(log, std::ios::binary | std::ios::app);
            dp::u32 len = 4096;
            out.write(reinterpret_cast<const char *>(&len), sizeof(len));
            out.write("partial", 7);
        }

        {
            FileKvStore reopened;
            REQUIRE(reopened.open(dp::String(ts.path.c_str())).is_ok());
            CHECK(reopened.size() == 1);
            CHECK(reopened.get("k1").value().has_value());
            CHECK(std::filesystem::file_size(log) == intact_size);

            // Written after recovery, so it must not land behind the torn bytes
            REQUIRE(reopened.apply({WriteOp{"k2", bytes("two")}}).is_ok());
            reopened.close();
        }

        FileKvStore again;
        REQUIRE(again.open(dp::String(ts.path.c_str())).is_ok());
        CHECK(again.size() == 2);
        CHECK(again.sequence() == 2);
        auto k2 = again.get("k2");
        REQUIRE(k2.is_ok());
        REQUIRE(k2.value().has_value());
        CHECK(std::string(k2.value()->begin(), k2.value()->end()) == "two");
        again.close();
    }

    SUBCASE("A length prefix cut short is dropped") {
        REQUIRE(ts.store.open(dp::String(ts.path.c_str())).is_ok());
        REQUIRE(ts.store.apply({WriteOp{"k1", bytes("one")}}).is_ok());
        auto log = ts.store.logPath();
        ts.store.close();
        auto intact_size = std::filesystem::file_size(log);

        {
            std::ofstream out(log, std::ios::binary | std::ios::app);
            out.write("\x01\x02", 2);
        }

        REQUIRE(ts.store.open(dp::String(ts.path.c_str())).is_ok());
        CHECK(std::filesystem::file_size(log) == intact_size);
        REQUIRE(ts.store.apply({WriteOp{"k2", bytes("two")}}).is_ok());
        ts.store.close();

        REQUIRE(ts.store.open(dp::String(ts.path.c_str())).is_ok());
        CHECK(ts.store.size() == 2);
    }

    SUBCASE("Missing directory without create") {
        OpenOptions opts;
        opts.create_if_missing = false;
        CHECK(ts.store.open(dp::String(ts.path.c_str()), opts).is_err());
    }

    SUBCASE("Explicit transaction rollback") {
        REQUIRE(ts.store.open(dp::String(ts.path.c_str())).is_ok());
        {
            auto tx = ts.store.beginTransaction();
            tx->stage(WriteOp{"k1", bytes("one")});
            tx->rollback();
        }
        CHECK(ts.store.size() == 0);
        {
            auto tx = ts.store.beginTransaction();
            tx->stage(WriteOp{"k1", bytes("one")});
        }
        CHECK(ts.store.size() == 0);
    }
}

// ===========================================
// Ledger persistence
// ===========================================

TEST_SUITE("StateStore") {
    TEST_CASE("Ledger state round-trips through the store") {
        MemoryKvStore kv;
        TokenId t1;
        {
            Harness h(MultiTokenConfig{}, &kv);
            TokenMetadata md = fixtures::titled("gold");
            md.media = "ipfs://gold";
            md.media_hash = "aa";
            auto token = h.mt.mint(h.owner(), "alice", BALANCE_MAX - 5, md);
            REQUIRE(token.is_ok());
            t1 = token.value().token_id;
            h.registerAccount(t1, "bob");
            REQUIRE(h.mt.transfer(h.as("alice"), "bob", t1, 25).is_ok());
            REQUIRE(h.mt.approve(h.as("alice"), t1, "carol", 9).is_ok());
        }
        CHECK(kv.size() > 0);

        Harness h(MultiTokenConfig{}, &kv);
        REQUIRE(h.mt.restore().is_ok());

        CHECK(h.balance("alice", t1) == BALANCE_MAX - 30);
        CHECK(h.balance("bob", t1) == 25);
        CHECK(h.mt.supply(t1) == std::optional<Balance>(BALANCE_MAX - 5));
        CHECK(h.mt.state().lastTokenId() == 1);

        auto token = h.mt.token(t1);
        REQUIRE(token.has_value());
        CHECK(token->owner_id == "alice");
        REQUIRE(token->metadata.has_value());
        CHECK(token->metadata->media == std::optional<std::string>("ipfs://gold"));
        CHECK_FALSE(token->metadata->reference.has_value());
        CHECK(h.mt.isApproved(t1, "carol", dp::u64(0)));
        CHECK(token->next_approval_id == std::optional<dp::u64>(1));

        // Counters continue where they left off
        CHECK(h.mint("alice", 1) == "2");
    }

    TEST_CASE("Failed invocations write nothing") {
        MemoryKvStore kv;
        Harness h(MultiTokenConfig{}, &kv);
        auto t1 = h.mint("alice", 100);
        auto stored = kv.size();

        CHECK(h.mt.transfer(h.as("alice"), "nobody", t1, 10).is_err());
        CHECK(kv.size() == stored);

        Harness reloaded(MultiTokenConfig{}, &kv);
        REQUIRE(reloaded.mt.restore().is_ok());
        CHECK(reloaded.balance("alice", t1) == 100);
    }

    TEST_CASE("Restore without a store") {
        Harness h;
        auto result = h.mt.restore();
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_STORAGE);
    }

    TEST_CASE("Sagas started before a restart are notified again") {
        TestStore ts("multitoken_saga");
        REQUIRE(ts.store.open(dp::String(ts.path.c_str())).is_ok());
        TokenId t1;
        dp::u64 saga_id = 0;
        {
            Harness h(MultiTokenConfig{}, &ts.store);
            t1 = h.mint("alice", 1000);
            h.registerAccount(t1, "bob");
            auto started = h.mt.transferCall(h.withGas("alice"), "bob", t1, 100, std::nullopt, std::nullopt, "m");
            REQUIRE(started.is_ok());
            saga_id = started.value();
            // Process stops before the scheduler runs
        }
        ts.store.close();
        REQUIRE(ts.store.open(dp::String(ts.path.c_str())).is_ok());

        Harness h(MultiTokenConfig{}, &ts.store);
        REQUIRE(h.mt.restore().is_ok());
        h.scheduler.registerReceiver("bob", replying("[\"60\"]"));

        auto saga = h.mt.saga(saga_id);
        REQUIRE(saga.is_ok());
        REQUIRE(saga.value().has_value());
        CHECK(saga.value()->state == settlement::SagaState::Started);
        CHECK(saga.value()->message == "m");

        auto resumed = h.mt.resumeSettlements();
        REQUIRE(resumed.is_ok());
        CHECK(resumed.value() == 1);
        CHECK(h.scheduler.runPending() == 1);

        CHECK(h.balance("alice", t1) == 960);
        CHECK(h.balance("bob", t1) == 40);

        // The settled record is only on disk now
        CHECK(h.mt.state().sagaCount() == 0);
        auto settled = h.mt.saga(saga_id);
        REQUIRE(settled.is_ok());
        REQUIRE(settled.value().has_value());
        CHECK(settled.value()->state == settlement::SagaState::Resolved);
        CHECK(settled.value()->settled == std::vector<Balance>{40});
    }

    TEST_CASE("Sagas whose outcome was lost settle as fully used") {
        MemoryKvStore kv;
        TokenId t1;
        {
            Harness h(MultiTokenConfig{}, &kv);
            t1 = h.mint("alice", 1000);
            h.registerAccount(t1, "bob");
            h.scheduler.registerReceiver("bob", replying("[\"100\"]"));
            REQUIRE(h.mt.transferCall(h.withGas("alice"), "bob", t1, 100, std::nullopt, std::nullopt, "").is_ok());
            CHECK(h.scheduler.deliverPending() == 1);
            // Process stops before the resolution runs
        }

        Harness h(MultiTokenConfig{}, &kv);
        REQUIRE(h.mt.restore().is_ok());
        CHECK(h.mt.state().pendingSagas().size() == 1);

        auto resumed = h.mt.resumeSettlements();
        REQUIRE(resumed.is_ok());
        CHECK(resumed.value() == 1);
        CHECK(h.scheduler.queued() == 0);
        CHECK(h.mt.state().pendingSagas().empty());
        CHECK(h.balance("alice", t1) == 900);
        CHECK(h.balance("bob", t1) == 100);
    }

    TEST_CASE("Resuming twice after a restart notifies the receiver once") {
        MemoryKvStore kv;
        TokenId t1;
        dp::u64 saga_id = 0;
        {
            Harness h(MultiTokenConfig{}, &kv);
            t1 = h.mint("alice", 1000);
            h.registerAccount(t1, "bob");
            auto started = h.mt.transferCall(h.withGas("alice"), "bob", t1, 100, std::nullopt, std::nullopt, "");
            REQUIRE(started.is_ok());
            saga_id = started.value();
        }

        Harness h(MultiTokenConfig{}, &kv);
        REQUIRE(h.mt.restore().is_ok());
        auto receiver = replying("[\"0\"]");
        h.scheduler.registerReceiver("bob", receiver);

        REQUIRE(h.mt.resumeSettlements().is_ok());
        REQUIRE(h.mt.resumeSettlements().is_ok());
        CHECK(h.scheduler.queued() == 2);

        CHECK(h.scheduler.runPending() == 1);
        CHECK(receiver->notifications.size() == 1);
        CHECK(h.scheduler.failures().size() == 1);
        CHECK(h.balance("bob", t1) == 100);

        auto saga = h.mt.saga(saga_id);
        REQUIRE(saga.is_ok());
        REQUIRE(saga.value().has_value());
        CHECK(saga.value()->state == settlement::SagaState::Resolved);
    }

    TEST_CASE("Settled sagas are not reloaded into memory") {
        MemoryKvStore kv;
        {
            Harness h(MultiTokenConfig{}, &kv);
            auto t1 = h.mint("alice", 1000);
            h.registerAccount(t1, "bob");
            h.scheduler.registerReceiver("bob", replying("[\"0\"]"));
            REQUIRE(h.mt.transferCall(h.withGas("alice"), "bob", t1, 10, std::nullopt, std::nullopt, "").is_ok());
            REQUIRE(h.mt.transferCall(h.withGas("alice"), "bob", t1, 20, std::nullopt, std::nullopt, "").is_ok());
            CHECK(h.scheduler.runPending() == 2);
            REQUIRE(h.mt.transferCall(h.withGas("alice"), "bob", t1, 30, std::nullopt, std::nullopt, "").is_ok());
            CHECK(h.mt.state().sagaCount() == 1);
        }

        Harness h(MultiTokenConfig{}, &kv);
        REQUIRE(h.mt.restore().is_ok());
        CHECK(h.mt.state().sagaCount() == 1);
        CHECK(h.mt.state().lastSagaId() == 3);
        CHECK(h.mt.saga(1).value()->state == settlement::SagaState::Resolved);
        CHECK(h.mt.saga(3).value()->state == settlement::SagaState::Started);
    }

    TEST_CASE("Text with embedded NUL bytes survives persistence") {
        MemoryKvStore kv;
        const std::string message("pool\0memo", 9);
        TokenMetadata md = fixtures::titled(std::string("a\0b", 3));
        TokenId t1;
        dp::u64 saga_id = 0;
        {
            Harness h(MultiTokenConfig{}, &kv);
            auto token = h.mt.mint(h.owner(), "alice", 100, md);
            REQUIRE(token.is_ok());
            t1 = token.value().token_id;
            h.registerAccount(t1, "bob");
            auto started = h.mt.transferCall(h.withGas("alice"), "bob", t1, 5, std::nullopt, std::nullopt, message);
            REQUIRE(started.is_ok());
            saga_id = started.value();
        }

        Harness h(MultiTokenConfig{}, &kv);
        REQUIRE(h.mt.restore().is_ok());
        auto saga = h.mt.saga(saga_id);
        REQUIRE(saga.is_ok());
        REQUIRE(saga.value().has_value());
        CHECK(saga.value()->message == message);
        CHECK(saga.value()->message.size() == 9);

        auto token = h.mt.token(t1);
        REQUIRE(token.has_value());
        REQUIRE(token->metadata.has_value());
        CHECK(token->metadata->title == std::optional<std::string>(std::string("a\0b", 3)));
    }
}
