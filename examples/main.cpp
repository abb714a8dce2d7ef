#include "multitoken.hpp"
#include <iostream>
#include <memory>

using namespace multitoken;

// Staking pool that keeps 70% of whatever it receives and hands the rest back
class StakingPool : public settlement::TokenReceiver {
  public:
    std::string onTransfer(const settlement::TransferNotification &notification) override {
        std::cout << "Pool notified by " << notification.sender << " (msg: \"" << notification.message << "\")"
                  << std::endl;
        std::vector<Balance> unused;
        for (auto amount : notification.amounts)
            unused.push_back(amount * 3 / 10);
        return settlement::formatUnusedAmounts(unused);
    }
};

void printSeparator(const std::string &title) {
    std::cout << "\n" << std::string(60, '=') << std::endl;
    std::cout << "  " << title << std::endl;
    std::cout << std::string(60, '=') << std::endl;
}

void printBalance(const MultiToken &mt, const AccountId &account, const TokenId &token_id) {
    auto held = mt.balanceOf(account, token_id);
    if (held.is_ok()) {
        std::cout << "  " << account << " holds " << balance::toString(held.value()) << " of token " << token_id
                  << std::endl;
    } else {
        std::cout << "  " << account << ": " << held.error().message.c_str() << std::endl;
    }
}

int main() {
    MultiTokenConfig config;
    host::LocalScheduler scheduler;
    host::LocalPaymentGateway payments(1);
    MultiToken mt(config, &scheduler, &payments);
    scheduler.attach(mt);
    scheduler.registerReceiver("pool", std::make_shared<StakingPool>());

    mt.events().subscribe([](const ledger::LedgerEvent &event) { std::cout << "EVENT " << event.toJson() << std::endl; });

    host::Invocation owner(config.owner_id, 1);
    host::Invocation alice("alice", 1, 100 * TGAS);

    printSeparator("MINTING");
    TokenMetadata gold;
    gold.title = "Gold";
    gold.description = "Fungible gold points";
    auto minted = mt.mint(owner, "alice", 1000, gold);
    if (!minted.is_ok()) {
        std::cerr << "Mint failed: " << minted.error().message.c_str() << std::endl;
        return 1;
    }
    TokenId t1 = minted.value().token_id;
    printBalance(mt, "alice", t1);

    printSeparator("DIRECT TRANSFER");
    if (!mt.registerAccount(host::Invocation("bob"), t1, "bob").is_ok()) {
        std::cerr << "Registration failed" << std::endl;
        return 1;
    }
    auto sent = mt.transfer(alice, "bob", t1, 4, std::nullopt, std::string("first payment"));
    if (!sent.is_ok()) {
        std::cerr << "Transfer failed: " << sent.error().message.c_str() << std::endl;
        return 1;
    }
    printBalance(mt, "alice", t1);
    printBalance(mt, "bob", t1);

    printSeparator("DELEGATED TRANSFER");
    auto approval = mt.approve(alice, t1, "carol", 50);
    if (approval.is_ok()) {
        std::cout << "carol approved with id " << approval.value().approval_id << std::endl;
        auto delegated = mt.transfer(host::Invocation("carol", 1), "bob", t1, 20, approval.value().approval_id);
        std::cout << "carol moves 20 for alice: " << (delegated.is_ok() ? "ok" : delegated.error().message.c_str())
                  << std::endl;
    }
    printBalance(mt, "alice", t1);
    printBalance(mt, "bob", t1);

    printSeparator("TRANSFER AND NOTIFY");
    if (!mt.registerAccount(host::Invocation("pool"), t1, "pool").is_ok()) {
        std::cerr << "Registration failed" << std::endl;
        return 1;
    }
    auto saga_id = mt.transferCall(alice, "pool", t1, 100, std::nullopt, std::nullopt, "stake");
    if (!saga_id.is_ok()) {
        std::cerr << "Transfer call failed: " << saga_id.error().message.c_str() << std::endl;
        return 1;
    }
    std::cout << "Saga " << saga_id.value() << " started; optimistic balances:" << std::endl;
    printBalance(mt, "alice", t1);
    printBalance(mt, "pool", t1);

    scheduler.runPending();
    for (const auto &report : scheduler.reports()) {
        std::cout << "Saga " << report.saga_id << " " << settlement::sagaStateToString(report.state)
                  << ": kept " << balance::toString(report.settled[0]) << ", refunded "
                  << balance::toString(report.refunded) << std::endl;
    }
    printBalance(mt, "alice", t1);
    printBalance(mt, "pool", t1);

    auto supply = mt.supply(t1);
    std::cout << "\nTotal supply of token " << t1 << ": " << balance::toString(supply.value_or(0)) << std::endl;
    return 0;
}
