#include <multitoken/multitoken.hpp>

#include <iostream>

namespace multitoken {

    MultiToken::MultiToken(MultiTokenConfig config, host::CallScheduler *scheduler, host::PaymentGateway *payments,
                           storage::KvStore *store)
        : config_(std::move(config)), scheduler_(scheduler), payments_(payments),
          store_(store != nullptr ? std::make_unique<storage::StateStore>(*store) : nullptr), ledger_(state_),
          approvals_(state_, config_.extensions.approvals),
          registry_(state_, ledger_, approvals_, events_, config_, payments_), engine_(state_, ledger_, approvals_, events_),
          protocol_(state_, ledger_, engine_, events_, config_) {}

    dp::Result<void, dp::Error> MultiToken::restore() {
        if (!store_) {
            return dp::Result<void, dp::Error>::err(storage_error("No store attached"));
        }
        auto loaded = store_->load(state_);
        if (!loaded.is_ok())
            return loaded;
        events_.clear();
        return dp::Result<void, dp::Error>::ok();
    }

    // ===========================================
    // Preconditions
    // ===========================================

    dp::Result<void, dp::Error> MultiToken::requireDeposit(const host::Invocation &invocation) const {
        if (invocation.attached_deposit < config_.required_deposit) {
            std::string msg = "Requires attached deposit of at least " + balance::toString(config_.required_deposit);
            return dp::Result<void, dp::Error>::err(precheck_failed(dp::String(msg.c_str())));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<AccountId, dp::Error> MultiToken::requireTokenOwner(const host::Invocation &invocation,
                                                                   const TokenId &token_id) const {
        auto owner = state_.ownerOf(token_id);
        if (!owner.has_value()) {
            return dp::Result<AccountId, dp::Error>::err(not_found());
        }
        if (*owner != invocation.predecessor) {
            return dp::Result<AccountId, dp::Error>::err(unauthorized("Predecessor must be the token owner"));
        }
        return dp::Result<AccountId, dp::Error>::ok(*owner);
    }

    dp::Result<void, dp::Error> MultiToken::persist() {
        if (!store_)
            return dp::Result<void, dp::Error>::ok();
        return store_->flush(state_);
    }

    // ===========================================
    // Minting and registration
    // ===========================================

    dp::Result<Token, dp::Error> MultiToken::mint(const host::Invocation &invocation, const AccountId &owner_id,
                                                  std::optional<Balance> amount, std::optional<TokenMetadata> metadata,
                                                  std::optional<AccountId> refund_id) {
        if (invocation.predecessor != config_.owner_id) {
            return dp::Result<Token, dp::Error>::err(unauthorized("Unauthorized"));
        }

        ledger::MintRequest request;
        request.owner_id = owner_id;
        request.amount = amount;
        request.metadata = std::move(metadata);
        request.refund_id = std::move(refund_id);
        request.attached_deposit = invocation.attached_deposit;

        std::optional<host::Refund> refund;
        auto minted = invoke<Token>([&]() -> dp::Result<Token, dp::Error> {
            auto receipt = registry_.mint(request);
            if (!receipt.is_ok())
                return dp::Result<Token, dp::Error>::err(receipt.error());
            refund = receipt.value().refund;
            return dp::Result<Token, dp::Error>::ok(receipt.value().token);
        });
        if (!minted.is_ok())
            return minted;

        // Native funds leave only once the mint has committed
        if (refund.has_value()) {
            auto paid = payments_->payout(*refund);
            if (!paid.is_ok()) {
                std::cout << "Storage refund to " << refund->recipient
                          << " failed: " << paid.error().message.c_str() << std::endl;
            }
        }
        return minted;
    }

    dp::Result<void, dp::Error> MultiToken::registerAccount(const host::Invocation &, const TokenId &token_id,
                                                            const AccountId &account_id) {
        return invoke<void>([&]() { return ledger_.registerAccount(token_id, account_id); });
    }

    // ===========================================
    // Transfers
    // ===========================================

    dp::Result<void, dp::Error> MultiToken::transfer(const host::Invocation &invocation, const AccountId &receiver_id,
                                                     const TokenId &token_id, Balance amount,
                                                     std::optional<dp::u64> approval_id,
                                                     std::optional<std::string> memo) {
        auto deposit = requireDeposit(invocation);
        if (!deposit.is_ok())
            return deposit;

        return invoke<void>([&]() -> dp::Result<void, dp::Error> {
            auto receipt = engine_.transferOne(invocation.predecessor, receiver_id, token_id, amount, approval_id, memo);
            if (!receipt.is_ok())
                return dp::Result<void, dp::Error>::err(receipt.error());
            return dp::Result<void, dp::Error>::ok();
        });
    }

    dp::Result<void, dp::Error> MultiToken::batchTransfer(const host::Invocation &invocation,
                                                          const AccountId &receiver_id,
                                                          const std::vector<TokenId> &token_ids,
                                                          const std::vector<Balance> &amounts,
                                                          std::optional<std::vector<std::optional<dp::u64>>> approval_ids,
                                                          std::optional<std::string> memo) {
        auto deposit = requireDeposit(invocation);
        if (!deposit.is_ok())
            return deposit;

        return invoke<void>([&]() -> dp::Result<void, dp::Error> {
            auto receipts =
                engine_.transferBatch(invocation.predecessor, receiver_id, token_ids, amounts, approval_ids, memo);
            if (!receipts.is_ok())
                return dp::Result<void, dp::Error>::err(receipts.error());
            return dp::Result<void, dp::Error>::ok();
        });
    }

    dp::Result<dp::u64, dp::Error> MultiToken::transferCall(const host::Invocation &invocation,
                                                            const AccountId &receiver_id, const TokenId &token_id,
                                                            Balance amount, std::optional<dp::u64> approval_id,
                                                            std::optional<std::string> memo,
                                                            const std::string &message) {
        std::optional<std::vector<std::optional<dp::u64>>> approval_ids;
        if (approval_id.has_value())
            approval_ids = std::vector<std::optional<dp::u64>>{approval_id};
        return batchTransferCall(invocation, receiver_id, {token_id}, {amount}, std::move(approval_ids),
                                 std::move(memo), message);
    }

    dp::Result<dp::u64, dp::Error>
    MultiToken::batchTransferCall(const host::Invocation &invocation, const AccountId &receiver_id,
                                  const std::vector<TokenId> &token_ids, const std::vector<Balance> &amounts,
                                  std::optional<std::vector<std::optional<dp::u64>>> approval_ids,
                                  std::optional<std::string> memo, const std::string &message) {
        if (scheduler_ == nullptr) {
            return dp::Result<dp::u64, dp::Error>::err(precheck_failed("No call scheduler configured"));
        }

        std::optional<host::SettlementChain> chain;
        auto saga_id = invoke<dp::u64>([&]() -> dp::Result<dp::u64, dp::Error> {
            auto scheduled =
                protocol_.batchTransferCall(invocation, receiver_id, token_ids, amounts, approval_ids, memo, message);
            if (!scheduled.is_ok())
                return dp::Result<dp::u64, dp::Error>::err(scheduled.error());
            chain = scheduled.value();
            return dp::Result<dp::u64, dp::Error>::ok(chain->saga_id);
        });
        if (!saga_id.is_ok())
            return saga_id;

        // Chains reach the scheduler only once the optimistic transfer has committed
        scheduler_->schedule(std::move(*chain));
        return saga_id;
    }

    dp::Result<void, dp::Error> MultiToken::notificationDispatched(dp::u64 saga_id) {
        return invoke<void>([&]() { return protocol_.markNotified(saga_id); });
    }

    dp::Result<settlement::SettlementReport, dp::Error>
    MultiToken::resolveTransfer(const host::Invocation &invocation, dp::u64 saga_id,
                                const settlement::PromiseResult &outcome) {
        return invoke<settlement::SettlementReport>(
            [&]() { return protocol_.resolveTransfer(invocation, saga_id, outcome); });
    }

    dp::Result<size_t, dp::Error> MultiToken::resumeSettlements() {
        size_t handled = 0;
        for (const auto &saga : state_.pendingSagas()) {
            std::cout << "Resuming saga " << saga.id << " (" << settlement::sagaStateToString(saga.state) << ")"
                      << std::endl;

            if (saga.state == settlement::SagaState::Started) {
                if (scheduler_ == nullptr) {
                    return dp::Result<size_t, dp::Error>::err(precheck_failed("No call scheduler configured"));
                }
                scheduler_->schedule(protocol_.chainFor(saga, 0));
            } else {
                // The notification went out but its outcome was lost with the process
                host::Invocation invocation(config_.account_id, 0, config_.gas_for_resolve_transfer);
                auto report = resolveTransfer(invocation, saga.id, settlement::PromiseResult::successful(""));
                if (!report.is_ok())
                    return dp::Result<size_t, dp::Error>::err(report.error());
            }
            ++handled;
        }
        return dp::Result<size_t, dp::Error>::ok(handled);
    }

    // ===========================================
    // Approvals
    // ===========================================

    dp::Result<Approval, dp::Error> MultiToken::approve(const host::Invocation &invocation, const TokenId &token_id,
                                                        const AccountId &spender_id, Balance amount) {
        auto deposit = requireDeposit(invocation);
        if (!deposit.is_ok())
            return dp::Result<Approval, dp::Error>::err(deposit.error());
        auto owner = requireTokenOwner(invocation, token_id);
        if (!owner.is_ok())
            return dp::Result<Approval, dp::Error>::err(owner.error());
        if (spender_id == owner.value()) {
            return dp::Result<Approval, dp::Error>::err(invalid_argument("Owner cannot approve itself"));
        }

        return invoke<Approval>([&]() { return approvals_.grant(token_id, spender_id, amount); });
    }

    dp::Result<void, dp::Error> MultiToken::revoke(const host::Invocation &invocation, const TokenId &token_id,
                                                   const AccountId &spender_id) {
        auto deposit = requireDeposit(invocation);
        if (!deposit.is_ok())
            return deposit;
        auto owner = requireTokenOwner(invocation, token_id);
        if (!owner.is_ok())
            return dp::Result<void, dp::Error>::err(owner.error());

        return invoke<void>([&]() { return approvals_.revoke(token_id, spender_id); });
    }

    dp::Result<void, dp::Error> MultiToken::revokeAll(const host::Invocation &invocation, const TokenId &token_id) {
        auto deposit = requireDeposit(invocation);
        if (!deposit.is_ok())
            return deposit;
        auto owner = requireTokenOwner(invocation, token_id);
        if (!owner.is_ok())
            return dp::Result<void, dp::Error>::err(owner.error());

        return invoke<void>([&]() { return approvals_.revokeAll(token_id); });
    }

    bool MultiToken::isApproved(const TokenId &token_id, const AccountId &spender_id,
                                std::optional<dp::u64> approval_id) const {
        return approvals_.isApproved(token_id, spender_id, approval_id);
    }

    // ===========================================
    // Views
    // ===========================================

    dp::Result<Balance, dp::Error> MultiToken::balanceOf(const AccountId &account_id, const TokenId &token_id) const {
        return ledger_.balanceOf(token_id, account_id);
    }

    dp::Result<std::vector<Balance>, dp::Error> MultiToken::batchBalanceOf(const AccountId &account_id,
                                                                           const std::vector<TokenId> &token_ids) const {
        std::vector<Balance> balances;
        balances.reserve(token_ids.size());
        for (const auto &token_id : token_ids) {
            auto amount = ledger_.balanceOf(token_id, account_id);
            if (!amount.is_ok())
                return dp::Result<std::vector<Balance>, dp::Error>::err(amount.error());
            balances.push_back(amount.value());
        }
        return dp::Result<std::vector<Balance>, dp::Error>::ok(std::move(balances));
    }

    dp::Result<std::optional<settlement::SagaRecord>, dp::Error> MultiToken::saga(dp::u64 saga_id) const {
        auto held = state_.sagaOf(saga_id);
        if (held.has_value() || !store_)
            return dp::Result<std::optional<settlement::SagaRecord>, dp::Error>::ok(held);
        return store_->loadSaga(saga_id);
    }

    std::optional<Balance> MultiToken::supply(const TokenId &token_id) const { return state_.supplyOf(token_id); }

    std::vector<std::optional<Balance>> MultiToken::batchSupply(const std::vector<TokenId> &token_ids) const {
        std::vector<std::optional<Balance>> supplies;
        supplies.reserve(token_ids.size());
        for (const auto &token_id : token_ids)
            supplies.push_back(state_.supplyOf(token_id));
        return supplies;
    }

} // namespace multitoken
