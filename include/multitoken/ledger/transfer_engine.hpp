#pragma once

#include <multitoken/common/error.hpp>
#include <multitoken/ledger/approval_store.hpp>
#include <multitoken/ledger/balance_ledger.hpp>
#include <multitoken/ledger/events.hpp>

namespace multitoken::ledger {

    /// Result of one transfer leg
    struct TransferReceipt {
        AccountId owner_id;                         // owner-of-record the funds were taken from
        std::optional<ApprovalMap> removed_approvals; // approval set cleared by this transfer
    };

    /// Validates and executes transfers against a BalanceLedger.
    ///
    /// Every transfer attempt clears the whole approval set of its token, not
    /// only the approval that authorized it.
    class TransferEngine {
      public:
        TransferEngine(LedgerState &state, BalanceLedger &ledger, ApprovalStore &approvals, EventLog &events)
            : state_(state), ledger_(ledger), approvals_(approvals), events_(events) {}

        dp::Result<TransferReceipt, dp::Error> transferOne(const AccountId &sender_id, const AccountId &receiver_id,
                                                           const TokenId &token_id, Balance amount,
                                                           std::optional<dp::u64> approval_id = std::nullopt,
                                                           const std::optional<std::string> &memo = std::nullopt);

        /// All-or-nothing: a failing leg leaves no trace of the earlier ones
        dp::Result<std::vector<TransferReceipt>, dp::Error>
        transferBatch(const AccountId &sender_id, const AccountId &receiver_id, const std::vector<TokenId> &token_ids,
                      const std::vector<Balance> &amounts,
                      const std::optional<std::vector<std::optional<dp::u64>>> &approval_ids = std::nullopt,
                      const std::optional<std::string> &memo = std::nullopt);

      private:
        LedgerState &state_;
        BalanceLedger &ledger_;
        ApprovalStore &approvals_;
        EventLog &events_;
    };

} // namespace multitoken::ledger
