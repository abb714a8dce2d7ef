#include <multitoken/ledger/transfer_engine.hpp>

namespace multitoken::ledger {

    dp::Result<TransferReceipt, dp::Error> TransferEngine::transferOne(const AccountId &sender_id,
                                                                       const AccountId &receiver_id,
                                                                       const TokenId &token_id, Balance amount,
                                                                       std::optional<dp::u64> approval_id,
                                                                       const std::optional<std::string> &memo) {
        if (sender_id == receiver_id) {
            return dp::Result<TransferReceipt, dp::Error>::err(invalid_argument("Sender and receiver must differ"));
        }
        if (amount == 0) {
            return dp::Result<TransferReceipt, dp::Error>::err(invalid_argument("Amount must be positive"));
        }

        auto owner = state_.ownerOf(token_id);
        if (!owner.has_value()) {
            return dp::Result<TransferReceipt, dp::Error>::err(not_found("Token not found"));
        }

        StateGuard guard(state_);

        auto removed = approvals_.takeAll(token_id);

        if (sender_id != *owner) {
            if (!removed.has_value()) {
                return dp::Result<TransferReceipt, dp::Error>::err(unauthorized("Unauthorized"));
            }
            auto it = removed->find(sender_id);
            if (it == removed->end()) {
                return dp::Result<TransferReceipt, dp::Error>::err(unauthorized("Sender not approved"));
            }
            if (approval_id.has_value() && it->second.approval_id != *approval_id) {
                return dp::Result<TransferReceipt, dp::Error>::err(approval_mismatch());
            }
            if (amount > it->second.amount) {
                return dp::Result<TransferReceipt, dp::Error>::err(unauthorized("Amount exceeds approved allowance"));
            }
        }

        if (*owner == receiver_id) {
            return dp::Result<TransferReceipt, dp::Error>::err(invalid_argument("Owner and receiver must differ"));
        }

        auto withdrawn = ledger_.withdraw(token_id, *owner, amount);
        if (!withdrawn.is_ok()) {
            return dp::Result<TransferReceipt, dp::Error>::err(withdrawn.error());
        }
        auto deposited = ledger_.deposit(token_id, receiver_id, amount);
        if (!deposited.is_ok()) {
            return dp::Result<TransferReceipt, dp::Error>::err(deposited.error());
        }

        LedgerEvent event;
        event.kind = EventKind::Transfer;
        event.old_owner_id = *owner;
        event.new_owner_id = receiver_id;
        event.token_id = token_id;
        event.amount = amount;
        if (sender_id != *owner)
            event.authorized_id = sender_id;
        event.memo = memo;
        events_.emit(event);

        guard.commit();
        return dp::Result<TransferReceipt, dp::Error>::ok(TransferReceipt{*owner, std::move(removed)});
    }

    dp::Result<std::vector<TransferReceipt>, dp::Error>
    TransferEngine::transferBatch(const AccountId &sender_id, const AccountId &receiver_id,
                                  const std::vector<TokenId> &token_ids, const std::vector<Balance> &amounts,
                                  const std::optional<std::vector<std::optional<dp::u64>>> &approval_ids,
                                  const std::optional<std::string> &memo) {
        if (token_ids.empty() || token_ids.size() != amounts.size()) {
            return dp::Result<std::vector<TransferReceipt>, dp::Error>::err(
                invalid_argument("Token ids and amounts must be non-empty and of equal length"));
        }
        if (approval_ids.has_value() && approval_ids->size() != token_ids.size()) {
            return dp::Result<std::vector<TransferReceipt>, dp::Error>::err(
                invalid_argument("Approval ids must match token ids"));
        }

        StateGuard guard(state_);
        size_t event_mark = events_.pendingMark();

        std::vector<TransferReceipt> receipts;
        receipts.reserve(token_ids.size());
        for (size_t i = 0; i < token_ids.size(); ++i) {
            std::optional<dp::u64> approval_id = approval_ids.has_value() ? (*approval_ids)[i] : std::nullopt;
            auto receipt = transferOne(sender_id, receiver_id, token_ids[i], amounts[i], approval_id, memo);
            if (!receipt.is_ok()) {
                events_.discardFrom(event_mark);
                return dp::Result<std::vector<TransferReceipt>, dp::Error>::err(receipt.error());
            }
            receipts.push_back(receipt.value());
        }

        guard.commit();
        return dp::Result<std::vector<TransferReceipt>, dp::Error>::ok(std::move(receipts));
    }

} // namespace multitoken::ledger
