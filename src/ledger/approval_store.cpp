#include <multitoken/ledger/approval_store.hpp>

namespace multitoken::ledger {

    void ApprovalStore::initializeToken(const TokenId &token_id) {
        if (!enabled_)
            return;
        state_.setApprovals(token_id, ApprovalMap{});
        state_.setNextApprovalId(token_id, 0);
    }

    dp::Result<Approval, dp::Error> ApprovalStore::grant(const TokenId &token_id, const AccountId &spender_id,
                                                         Balance amount) {
        if (!enabled_) {
            return dp::Result<Approval, dp::Error>::err(invalid_argument("Approval extension is disabled"));
        }
        if (!state_.hasToken(token_id)) {
            return dp::Result<Approval, dp::Error>::err(not_found());
        }

        dp::u64 next_id = state_.nextApprovalIdOf(token_id).value_or(0);
        if (next_id == std::numeric_limits<dp::u64>::max()) {
            return dp::Result<Approval, dp::Error>::err(id_space_exhausted("Approval ids exhausted for token"));
        }

        Approval approval{next_id, amount};
        auto approvals = state_.approvalsOf(token_id).value_or(ApprovalMap{});
        approvals[spender_id] = approval;
        state_.setApprovals(token_id, approvals);
        state_.setNextApprovalId(token_id, next_id + 1);
        return dp::Result<Approval, dp::Error>::ok(approval);
    }

    dp::Result<void, dp::Error> ApprovalStore::revoke(const TokenId &token_id, const AccountId &spender_id) {
        if (!state_.hasToken(token_id)) {
            return dp::Result<void, dp::Error>::err(not_found());
        }
        auto approvals = state_.approvalsOf(token_id);
        if (!approvals.has_value() || approvals->erase(spender_id) == 0) {
            return dp::Result<void, dp::Error>::err(not_found("No approval for this account"));
        }
        state_.setApprovals(token_id, *approvals);
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> ApprovalStore::revokeAll(const TokenId &token_id) {
        if (!state_.hasToken(token_id)) {
            return dp::Result<void, dp::Error>::err(not_found());
        }
        if (enabled_)
            state_.setApprovals(token_id, ApprovalMap{});
        return dp::Result<void, dp::Error>::ok();
    }

    std::optional<Approval> ApprovalStore::approvalOf(const TokenId &token_id, const AccountId &spender_id) const {
        auto approvals = state_.approvalsOf(token_id);
        if (!approvals.has_value())
            return std::nullopt;
        auto it = approvals->find(spender_id);
        if (it == approvals->end())
            return std::nullopt;
        return it->second;
    }

    bool ApprovalStore::isApproved(const TokenId &token_id, const AccountId &spender_id,
                                   std::optional<dp::u64> approval_id) const {
        auto approval = approvalOf(token_id, spender_id);
        if (!approval.has_value())
            return false;
        return !approval_id.has_value() || approval->approval_id == *approval_id;
    }

    std::optional<ApprovalMap> ApprovalStore::takeAll(const TokenId &token_id) {
        if (!enabled_)
            return std::nullopt;
        return state_.takeApprovals(token_id);
    }

} // namespace multitoken::ledger
