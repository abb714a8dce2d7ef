#pragma once

#include <memory>

#include <multitoken/common/config.hpp>
#include <multitoken/host/invocation.hpp>
#include <multitoken/host/payment.hpp>
#include <multitoken/host/scheduler.hpp>
#include <multitoken/ledger/ledger.hpp>
#include <multitoken/settlement/transfer_protocol.hpp>
#include <multitoken/storage/state_store.hpp>

namespace multitoken {

    // ===========================================
    // MultiToken - the ledger surface
    // ===========================================

    /// One multi-token ledger instance.
    ///
    /// Each mutating call is one invocation: it either commits completely
    /// (state, events, persisted records) or leaves nothing behind.
    class MultiToken : public host::SettlementSink {
      public:
        explicit MultiToken(MultiTokenConfig config = MultiTokenConfig{}, host::CallScheduler *scheduler = nullptr,
                            host::PaymentGateway *payments = nullptr, storage::KvStore *store = nullptr);

        MultiToken(const MultiToken &) = delete;
        MultiToken &operator=(const MultiToken &) = delete;

        /// Reloads state from the attached store
        dp::Result<void, dp::Error> restore();

        // ===========================================
        // Minting and registration
        // ===========================================

        /// Only the configured contract owner may mint
        dp::Result<Token, dp::Error> mint(const host::Invocation &invocation, const AccountId &owner_id,
                                          std::optional<Balance> amount = std::nullopt,
                                          std::optional<TokenMetadata> metadata = std::nullopt,
                                          std::optional<AccountId> refund_id = std::nullopt);

        dp::Result<void, dp::Error> registerAccount(const host::Invocation &invocation, const TokenId &token_id,
                                                    const AccountId &account_id);

        // ===========================================
        // Transfers
        // ===========================================

        dp::Result<void, dp::Error> transfer(const host::Invocation &invocation, const AccountId &receiver_id,
                                             const TokenId &token_id, Balance amount,
                                             std::optional<dp::u64> approval_id = std::nullopt,
                                             std::optional<std::string> memo = std::nullopt);

        dp::Result<void, dp::Error>
        batchTransfer(const host::Invocation &invocation, const AccountId &receiver_id,
                      const std::vector<TokenId> &token_ids, const std::vector<Balance> &amounts,
                      std::optional<std::vector<std::optional<dp::u64>>> approval_ids = std::nullopt,
                      std::optional<std::string> memo = std::nullopt);

        /// Moves the funds, then schedules the receiver notification and the settlement. Returns the saga id.
        dp::Result<dp::u64, dp::Error> transferCall(const host::Invocation &invocation, const AccountId &receiver_id,
                                                   const TokenId &token_id, Balance amount,
                                                   std::optional<dp::u64> approval_id,
                                                   std::optional<std::string> memo, const std::string &message);

        dp::Result<dp::u64, dp::Error>
        batchTransferCall(const host::Invocation &invocation, const AccountId &receiver_id,
                          const std::vector<TokenId> &token_ids, const std::vector<Balance> &amounts,
                          std::optional<std::vector<std::optional<dp::u64>>> approval_ids,
                          std::optional<std::string> memo, const std::string &message);

        // SettlementSink
        const AccountId &ledgerId() const override { return config_.account_id; }
        dp::Result<void, dp::Error> notificationDispatched(dp::u64 saga_id) override;
        dp::Result<settlement::SettlementReport, dp::Error>
        resolveTransfer(const host::Invocation &invocation, dp::u64 saga_id,
                        const settlement::PromiseResult &outcome) override;

        /// Re-drives sagas interrupted by a restart. STARTED sagas are notified again,
        /// NOTIFIED ones are settled as if the receiver used everything. Returns the number handled.
        dp::Result<size_t, dp::Error> resumeSettlements();

        // ===========================================
        // Approvals
        // ===========================================

        dp::Result<Approval, dp::Error> approve(const host::Invocation &invocation, const TokenId &token_id,
                                                const AccountId &spender_id, Balance amount);

        dp::Result<void, dp::Error> revoke(const host::Invocation &invocation, const TokenId &token_id,
                                           const AccountId &spender_id);

        dp::Result<void, dp::Error> revokeAll(const host::Invocation &invocation, const TokenId &token_id);

        bool isApproved(const TokenId &token_id, const AccountId &spender_id,
                        std::optional<dp::u64> approval_id = std::nullopt) const;

        // ===========================================
        // Views
        // ===========================================

        dp::Result<Balance, dp::Error> balanceOf(const AccountId &account_id, const TokenId &token_id) const;

        dp::Result<std::vector<Balance>, dp::Error> batchBalanceOf(const AccountId &account_id,
                                                                   const std::vector<TokenId> &token_ids) const;

        std::optional<Balance> supply(const TokenId &token_id) const;

        std::vector<std::optional<Balance>> batchSupply(const std::vector<TokenId> &token_ids) const;

        std::optional<Token> token(const TokenId &token_id) const { return registry_.token(token_id); }

        /// Pending sagas are held in memory; settled ones are read back from the store, if any
        dp::Result<std::optional<settlement::SagaRecord>, dp::Error> saga(dp::u64 saga_id) const;

        // Components
        const MultiTokenConfig &config() const { return config_; }
        ledger::LedgerState &state() { return state_; }
        ledger::EventLog &events() { return events_; }
        ledger::BalanceLedger &balances() { return ledger_; }

      private:
        dp::Result<void, dp::Error> requireDeposit(const host::Invocation &invocation) const;
        dp::Result<AccountId, dp::Error> requireTokenOwner(const host::Invocation &invocation,
                                                           const TokenId &token_id) const;
        dp::Result<void, dp::Error> persist();

        /// Runs `body` as one invocation: rolled back on error, committed and persisted otherwise
        template <typename T, typename Fn> dp::Result<T, dp::Error> invoke(Fn &&body) {
            ledger::StateGuard guard(state_);
            size_t event_mark = events_.pendingMark();

            dp::Result<T, dp::Error> result = body();
            if (!result.is_ok()) {
                events_.discardFrom(event_mark);
                return result;
            }

            auto persisted = persist();
            if (!persisted.is_ok()) {
                events_.discardFrom(event_mark);
                return dp::Result<T, dp::Error>::err(persisted.error());
            }

            guard.commit();
            state_.clearDirty();
            state_.evictSettled();
            events_.publish();
            return result;
        }

        MultiTokenConfig config_;
        host::CallScheduler *scheduler_;
        host::PaymentGateway *payments_;
        std::unique_ptr<storage::StateStore> store_;

        ledger::LedgerState state_;
        ledger::EventLog events_;
        ledger::BalanceLedger ledger_;
        ledger::ApprovalStore approvals_;
        ledger::TokenRegistry registry_;
        ledger::TransferEngine engine_;
        settlement::AsyncTransferProtocol protocol_;
    };

} // namespace multitoken
