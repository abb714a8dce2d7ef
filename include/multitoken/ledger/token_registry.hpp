#pragma once

#include <multitoken/common/config.hpp>
#include <multitoken/common/error.hpp>
#include <multitoken/host/payment.hpp>
#include <multitoken/ledger/approval_store.hpp>
#include <multitoken/ledger/balance_ledger.hpp>
#include <multitoken/ledger/events.hpp>

namespace multitoken::ledger {

    /// Parameters of one mint
    struct MintRequest {
        AccountId owner_id;
        std::optional<Balance> amount;           // initial balance of the owner, 0 if absent
        std::optional<TokenMetadata> metadata;   // required with the metadata extension
        std::optional<AccountId> refund_id;      // receives the deposit left after storage costs
        Balance attached_deposit{0};
    };

    /// A minted token and the storage refund owed once the mint commits
    struct MintReceipt {
        Token token;
        std::optional<host::Refund> refund;
    };

    /// Allocates token ids and records owner-of-record, metadata and approval counters
    class TokenRegistry {
      public:
        TokenRegistry(LedgerState &state, BalanceLedger &ledger, ApprovalStore &approvals, EventLog &events,
                      const MultiTokenConfig &config, host::PaymentGateway *payments = nullptr)
            : state_(state), ledger_(ledger), approvals_(approvals), events_(events), config_(config),
              payments_(payments) {}

        /// Mints a new token and credits the owner with the initial amount.
        /// The refund in the receipt is not paid here; the caller pays it after committing.
        dp::Result<MintReceipt, dp::Error> mint(const MintRequest &request);

        /// Token view, nullopt if the id was never minted
        std::optional<Token> token(const TokenId &token_id) const;

        bool exists(const TokenId &token_id) const { return state_.hasToken(token_id); }

        std::optional<AccountId> ownerOf(const TokenId &token_id) const { return state_.ownerOf(token_id); }

        static dp::Result<void, dp::Error> validateMetadata(const TokenMetadata &metadata);

      private:
        LedgerState &state_;
        BalanceLedger &ledger_;
        ApprovalStore &approvals_;
        EventLog &events_;
        const MultiTokenConfig &config_;
        host::PaymentGateway *payments_;
    };

} // namespace multitoken::ledger
