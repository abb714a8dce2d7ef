#include <multitoken/ledger/ledger_state.hpp>

namespace multitoken::ledger {

    namespace {
        // Fixed per-record overhead, on top of key and value bytes
        constexpr dp::u64 RECORD_OVERHEAD = 40;
        constexpr dp::u64 BALANCE_BYTES = 16;
        constexpr dp::u64 COUNTER_BYTES = 8;

        dp::u64 optionalSize(const std::optional<std::string> &field) { return field ? field->size() + 1 : 1; }

        dp::u64 metadataSize(const TokenMetadata &md) {
            return optionalSize(md.title) + optionalSize(md.description) + optionalSize(md.media) +
                   optionalSize(md.media_hash) + optionalSize(md.issued_at) + optionalSize(md.expires_at) +
                   optionalSize(md.starts_at) + optionalSize(md.updated_at) + optionalSize(md.extra) +
                   optionalSize(md.reference) + optionalSize(md.reference_hash);
        }
    } // namespace

    void LedgerState::setLastTokenId(dp::u64 id) {
        auto previous = last_token_id_;
        undo_.push_back([previous](LedgerState &state) { state.last_token_id_ = previous; });
        last_token_id_ = id;
        markDirty(RecordKind::Counters, "");
    }

    void LedgerState::setLastSagaId(dp::u64 id) {
        auto previous = last_saga_id_;
        undo_.push_back([previous](LedgerState &state) { state.last_saga_id_ = previous; });
        last_saga_id_ = id;
        markDirty(RecordKind::Counters, "");
    }

    std::vector<TokenId> LedgerState::tokenIds() const {
        std::vector<TokenId> ids;
        ids.reserve(owners_.size());
        for (const auto &[token_id, owner] : owners_)
            ids.push_back(token_id);
        return ids;
    }

    std::optional<AccountId> LedgerState::ownerOf(const TokenId &token_id) const {
        auto it = owners_.find(token_id);
        if (it == owners_.end())
            return std::nullopt;
        return it->second;
    }

    void LedgerState::setOwner(const TokenId &token_id, const AccountId &owner_id) {
        journal(&LedgerState::owners_, token_id);
        owners_[token_id] = owner_id;
        markDirty(RecordKind::Owner, token_id);
    }

    std::optional<Balance> LedgerState::supplyOf(const TokenId &token_id) const {
        auto it = supply_.find(token_id);
        if (it == supply_.end())
            return std::nullopt;
        return it->second;
    }

    void LedgerState::setSupply(const TokenId &token_id, Balance supply) {
        journal(&LedgerState::supply_, token_id);
        supply_[token_id] = supply;
        markDirty(RecordKind::Supply, token_id);
    }

    std::optional<TokenMetadata> LedgerState::metadataOf(const TokenId &token_id) const {
        auto it = metadata_.find(token_id);
        if (it == metadata_.end())
            return std::nullopt;
        return it->second;
    }

    void LedgerState::setMetadata(const TokenId &token_id, const TokenMetadata &metadata) {
        journal(&LedgerState::metadata_, token_id);
        metadata_[token_id] = metadata;
        markDirty(RecordKind::Metadata, token_id);
    }

    std::optional<Balance> LedgerState::balanceOf(const TokenId &token_id, const AccountId &account_id) const {
        auto it = balances_.find(BalanceKey{token_id, account_id});
        if (it == balances_.end())
            return std::nullopt;
        return it->second;
    }

    void LedgerState::setBalance(const TokenId &token_id, const AccountId &account_id, Balance amount) {
        BalanceKey key{token_id, account_id};
        journal(&LedgerState::balances_, key);
        balances_[key] = amount;
        markDirty(RecordKind::Balance, token_id, account_id);
    }

    void LedgerState::eraseBalance(const TokenId &token_id, const AccountId &account_id) {
        BalanceKey key{token_id, account_id};
        if (balances_.find(key) == balances_.end())
            return;
        journal(&LedgerState::balances_, key);
        balances_.erase(key);
        markDirty(RecordKind::Balance, token_id, account_id);
    }

    std::vector<std::pair<AccountId, Balance>> LedgerState::balancesOf(const TokenId &token_id) const {
        std::vector<std::pair<AccountId, Balance>> result;
        for (auto it = balances_.lower_bound(BalanceKey{token_id, ""}); it != balances_.end(); ++it) {
            if (it->first.first != token_id)
                break;
            result.emplace_back(it->first.second, it->second);
        }
        return result;
    }

    std::optional<ApprovalMap> LedgerState::approvalsOf(const TokenId &token_id) const {
        auto it = approvals_.find(token_id);
        if (it == approvals_.end())
            return std::nullopt;
        return it->second;
    }

    void LedgerState::setApprovals(const TokenId &token_id, const ApprovalMap &approvals) {
        journal(&LedgerState::approvals_, token_id);
        approvals_[token_id] = approvals;
        markDirty(RecordKind::Approvals, token_id);
    }

    std::optional<ApprovalMap> LedgerState::takeApprovals(const TokenId &token_id) {
        auto it = approvals_.find(token_id);
        if (it == approvals_.end())
            return std::nullopt;
        journal(&LedgerState::approvals_, token_id);
        ApprovalMap taken = std::move(it->second);
        approvals_.erase(it);
        markDirty(RecordKind::Approvals, token_id);
        return taken;
    }

    std::optional<dp::u64> LedgerState::nextApprovalIdOf(const TokenId &token_id) const {
        auto it = next_approval_ids_.find(token_id);
        if (it == next_approval_ids_.end())
            return std::nullopt;
        return it->second;
    }

    void LedgerState::setNextApprovalId(const TokenId &token_id, dp::u64 next_id) {
        journal(&LedgerState::next_approval_ids_, token_id);
        next_approval_ids_[token_id] = next_id;
        markDirty(RecordKind::NextApprovalId, token_id);
    }

    std::optional<settlement::SagaRecord> LedgerState::sagaOf(dp::u64 saga_id) const {
        auto it = sagas_.find(saga_id);
        if (it == sagas_.end())
            return std::nullopt;
        return it->second;
    }

    void LedgerState::putSaga(const settlement::SagaRecord &record) {
        journal(&LedgerState::sagas_, record.id);
        sagas_[record.id] = record;
        markDirty(RecordKind::Saga, std::to_string(record.id));
    }

    std::vector<settlement::SagaRecord> LedgerState::pendingSagas() const {
        std::vector<settlement::SagaRecord> pending;
        for (const auto &[id, record] : sagas_) {
            if (!settlement::isTerminal(record.state))
                pending.push_back(record);
        }
        return pending;
    }

    size_t LedgerState::evictSettled() {
        size_t evicted = 0;
        for (auto it = sagas_.begin(); it != sagas_.end();) {
            bool unflushed = dirty_.count(StateKey{RecordKind::Saga, std::to_string(it->first), ""}) > 0;
            if (settlement::isTerminal(it->second.state) && !unflushed) {
                it = sagas_.erase(it);
                ++evicted;
            } else {
                ++it;
            }
        }
        return evicted;
    }

    void LedgerState::rollbackTo(size_t mark) {
        while (undo_.size() > mark) {
            auto undo = std::move(undo_.back());
            undo_.pop_back();
            undo(*this);
        }
    }

    dp::u64 LedgerState::storageUsage() const {
        dp::u64 usage = RECORD_OVERHEAD + 2 * COUNTER_BYTES;
        for (const auto &[token_id, owner] : owners_)
            usage += RECORD_OVERHEAD + token_id.size() + owner.size();
        for (const auto &[token_id, supply] : supply_)
            usage += RECORD_OVERHEAD + token_id.size() + BALANCE_BYTES;
        for (const auto &[token_id, md] : metadata_)
            usage += RECORD_OVERHEAD + token_id.size() + metadataSize(md);
        for (const auto &[key, amount] : balances_)
            usage += RECORD_OVERHEAD + key.first.size() + key.second.size() + BALANCE_BYTES;
        for (const auto &[token_id, approvals] : approvals_) {
            usage += RECORD_OVERHEAD + token_id.size();
            for (const auto &[spender, approval] : approvals)
                usage += spender.size() + COUNTER_BYTES + BALANCE_BYTES;
        }
        for (const auto &[token_id, next_id] : next_approval_ids_)
            usage += RECORD_OVERHEAD + token_id.size() + COUNTER_BYTES;
        // Saga records are transient bookkeeping and are not charged to minters
        return usage;
    }

} // namespace multitoken::ledger
