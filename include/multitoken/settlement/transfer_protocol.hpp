#pragma once

#include <multitoken/common/config.hpp>
#include <multitoken/host/invocation.hpp>
#include <multitoken/host/scheduler.hpp>
#include <multitoken/ledger/transfer_engine.hpp>
#include <multitoken/settlement/notification.hpp>
#include <multitoken/settlement/saga.hpp>

namespace multitoken::settlement {

    /// Optimistic transfer, then notify the receiver, then settle.
    ///
    /// transferCall moves the funds at once and records a saga holding
    /// everything the later compensation needs. The returned chain is handed
    /// to a scheduler once the invocation commits. resolveTransfer refunds
    /// whatever the receiver reports unused, bounded by what it still holds.
    class AsyncTransferProtocol {
      public:
        AsyncTransferProtocol(ledger::LedgerState &state, ledger::BalanceLedger &ledger,
                              ledger::TransferEngine &engine, ledger::EventLog &events, const MultiTokenConfig &config)
            : state_(state), ledger_(ledger), engine_(engine), events_(events), config_(config) {}

        /// Deposit and gas preconditions of a transfer call; never mutates
        dp::Result<void, dp::Error> precheck(const host::Invocation &invocation) const;

        dp::Result<host::SettlementChain, dp::Error> transferCall(const host::Invocation &invocation,
                                                                  const AccountId &receiver_id,
                                                                  const TokenId &token_id, Balance amount,
                                                                  std::optional<dp::u64> approval_id,
                                                                  const std::optional<std::string> &memo,
                                                                  const std::string &message);

        dp::Result<host::SettlementChain, dp::Error>
        batchTransferCall(const host::Invocation &invocation, const AccountId &receiver_id,
                          const std::vector<TokenId> &token_ids, const std::vector<Balance> &amounts,
                          const std::optional<std::vector<std::optional<dp::u64>>> &approval_ids,
                          const std::optional<std::string> &memo, const std::string &message);

        /// STARTED -> NOTIFIED
        dp::Result<void, dp::Error> markNotified(dp::u64 saga_id);

        /// Settles a saga from the notification outcome. Only the ledger's own identity may call this.
        dp::Result<SettlementReport, dp::Error> resolveTransfer(const host::Invocation &invocation, dp::u64 saga_id,
                                                               const PromiseResult &outcome);

        /// Rebuilds the chain of a recorded saga, for re-sending its notification
        host::SettlementChain chainFor(const SagaRecord &saga, dp::u64 notify_gas) const;

      private:
        /// True for an allocated id that is no longer held in memory
        bool wasSettled(dp::u64 saga_id) const;

        ledger::LedgerState &state_;
        ledger::BalanceLedger &ledger_;
        ledger::TransferEngine &engine_;
        ledger::EventLog &events_;
        const MultiTokenConfig &config_;
    };

} // namespace multitoken::settlement
