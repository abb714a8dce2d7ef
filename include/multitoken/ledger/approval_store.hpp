#pragma once

#include <multitoken/common/error.hpp>
#include <multitoken/ledger/ledger_state.hpp>

namespace multitoken::ledger {

    /// Approvals granted by a token's owner-of-record.
    ///
    /// Disabled instances hold no approval sets at all: every query reports
    /// nothing and grants fail.
    class ApprovalStore {
      public:
        ApprovalStore(LedgerState &state, bool enabled) : state_(state), enabled_(enabled) {}

        bool enabled() const { return enabled_; }

        /// Creates the empty approval set and counter for a freshly minted token
        void initializeToken(const TokenId &token_id);

        /// Grants (or replaces) `spender_id`'s approval, allocating the next approval id of the token
        dp::Result<Approval, dp::Error> grant(const TokenId &token_id, const AccountId &spender_id, Balance amount);

        dp::Result<void, dp::Error> revoke(const TokenId &token_id, const AccountId &spender_id);

        dp::Result<void, dp::Error> revokeAll(const TokenId &token_id);

        std::optional<Approval> approvalOf(const TokenId &token_id, const AccountId &spender_id) const;

        /// True if `spender_id` holds an approval (with the given id, when supplied)
        bool isApproved(const TokenId &token_id, const AccountId &spender_id,
                        std::optional<dp::u64> approval_id = std::nullopt) const;

        /// Removes every approval recorded for the token and returns them
        std::optional<ApprovalMap> takeAll(const TokenId &token_id);

      private:
        LedgerState &state_;
        bool enabled_;
    };

} // namespace multitoken::ledger
