/**
 * Example: a ledger persisted to an append-only file store
 *
 * This demo shows how to:
 * 1. Attach a FileKvStore so every committed call is written to disk
 * 2. Stop in the middle of a transfer-and-notify saga
 * 3. Reopen the store and finish the saga with resumeSettlements()
 */

#include "multitoken.hpp"
#include <filesystem>
#include <iostream>

using namespace multitoken;
using namespace multitoken::storage;

class EchoReceiver : public settlement::TokenReceiver {
  public:
    std::string onTransfer(const settlement::TransferNotification &notification) override {
        // Return everything
        return settlement::formatUnusedAmounts(notification.amounts);
    }
};

int main() {
    const std::string path = "multitoken_demo_store";
    std::filesystem::remove_all(path);

    MultiTokenConfig config;
    TokenId token_id;

    // ===========================================
    // First run: mint, then start a saga and stop
    // ===========================================
    {
        FileKvStore store;
        auto opened = store.open(dp::String(path.c_str()));
        if (!opened.is_ok()) {
            std::cerr << "Failed to open store: " << opened.error().message.c_str() << std::endl;
            return 1;
        }

        host::LocalScheduler scheduler;
        MultiToken mt(config, &scheduler, nullptr, &store);
        scheduler.attach(mt);

        TokenMetadata md;
        md.title = "Silver";
        auto minted = mt.mint(host::Invocation(config.owner_id, 1), "alice", 500, md);
        if (!minted.is_ok()) {
            std::cerr << "Mint failed: " << minted.error().message.c_str() << std::endl;
            return 1;
        }
        token_id = minted.value().token_id;

        if (!mt.registerAccount(host::Invocation("vault"), token_id, "vault").is_ok()) {
            std::cerr << "Registration failed" << std::endl;
            return 1;
        }
        auto saga = mt.transferCall(host::Invocation("alice", 1, 100 * TGAS), "vault", token_id, 200, std::nullopt,
                                    std::nullopt, "deposit");
        if (!saga.is_ok()) {
            std::cerr << "Transfer call failed: " << saga.error().message.c_str() << std::endl;
            return 1;
        }
        std::cout << "Saga " << saga.value() << " started, stopping before notification" << std::endl;
        std::cout << "Records on disk: " << store.size() << std::endl;
    }

    // ===========================================
    // Second run: restore and settle
    // ===========================================
    {
        FileKvStore store;
        auto opened = store.open(dp::String(path.c_str()));
        if (!opened.is_ok()) {
            std::cerr << "Failed to reopen store: " << opened.error().message.c_str() << std::endl;
            return 1;
        }

        host::LocalScheduler scheduler;
        MultiToken mt(config, &scheduler, nullptr, &store);
        scheduler.attach(mt);
        scheduler.registerReceiver("vault", std::make_shared<EchoReceiver>());

        auto restored = mt.restore();
        if (!restored.is_ok()) {
            std::cerr << "Restore failed: " << restored.error().message.c_str() << std::endl;
            return 1;
        }

        auto resumed = mt.resumeSettlements();
        if (!resumed.is_ok()) {
            std::cerr << "Resume failed: " << resumed.error().message.c_str() << std::endl;
            return 1;
        }
        scheduler.runPending();

        std::cout << "alice: " << balance::toString(mt.balanceOf("alice", token_id).value()) << std::endl;
        std::cout << "vault: " << balance::toString(mt.balanceOf("vault", token_id).value()) << std::endl;
    }

    std::filesystem::remove_all(path);
    return 0;
}
