#pragma once

#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include <multitoken/common/types.hpp>
#include <multitoken/settlement/saga.hpp>

namespace multitoken::ledger {

    /// Kind of a persisted record, also the first byte of its storage key
    enum class RecordKind : dp::u8 {
        Counters = 0,
        Owner = 1,
        Supply = 2,
        Balance = 3,
        Metadata = 4,
        Approvals = 5,
        NextApprovalId = 6,
        Saga = 7,
    };

    /// Identifies one record touched by an invocation
    struct StateKey {
        RecordKind kind{RecordKind::Counters};
        std::string primary;   // token id, or saga id
        std::string secondary; // account id for balances

        bool operator<(const StateKey &other) const {
            return std::tie(kind, primary, secondary) < std::tie(other.kind, other.primary, other.secondary);
        }
        bool operator==(const StateKey &other) const {
            return kind == other.kind && primary == other.primary && secondary == other.secondary;
        }
    };

    /// All ledger maps of one contract instance.
    ///
    /// Every mutation is journaled so an invocation can be rolled back as a
    /// whole, and marks its record dirty so a StateStore can persist it.
    class LedgerState {
      public:
        LedgerState() = default;

        // ===========================================
        // Counters
        // ===========================================

        dp::u64 lastTokenId() const { return last_token_id_; }
        void setLastTokenId(dp::u64 id);

        dp::u64 lastSagaId() const { return last_saga_id_; }
        void setLastSagaId(dp::u64 id);

        // ===========================================
        // Tokens
        // ===========================================

        bool hasToken(const TokenId &token_id) const { return owners_.count(token_id) > 0; }
        std::vector<TokenId> tokenIds() const;

        std::optional<AccountId> ownerOf(const TokenId &token_id) const;
        void setOwner(const TokenId &token_id, const AccountId &owner_id);

        std::optional<Balance> supplyOf(const TokenId &token_id) const;
        void setSupply(const TokenId &token_id, Balance supply);

        std::optional<TokenMetadata> metadataOf(const TokenId &token_id) const;
        void setMetadata(const TokenId &token_id, const TokenMetadata &metadata);

        // ===========================================
        // Balances
        // ===========================================

        std::optional<Balance> balanceOf(const TokenId &token_id, const AccountId &account_id) const;
        void setBalance(const TokenId &token_id, const AccountId &account_id, Balance amount);
        /// Drops a balance entry without touching supply (rollback and storage management only)
        void eraseBalance(const TokenId &token_id, const AccountId &account_id);
        std::vector<std::pair<AccountId, Balance>> balancesOf(const TokenId &token_id) const;

        // ===========================================
        // Approvals
        // ===========================================

        std::optional<ApprovalMap> approvalsOf(const TokenId &token_id) const;
        void setApprovals(const TokenId &token_id, const ApprovalMap &approvals);
        /// Removes and returns the whole approval set of a token
        std::optional<ApprovalMap> takeApprovals(const TokenId &token_id);

        std::optional<dp::u64> nextApprovalIdOf(const TokenId &token_id) const;
        void setNextApprovalId(const TokenId &token_id, dp::u64 next_id);

        // ===========================================
        // Sagas
        // ===========================================

        std::optional<settlement::SagaRecord> sagaOf(dp::u64 saga_id) const;
        void putSaga(const settlement::SagaRecord &record);
        std::vector<settlement::SagaRecord> pendingSagas() const;
        size_t sagaCount() const { return sagas_.size(); }
        /// Drops settled sagas whose record is already persisted. Not journaled.
        size_t evictSettled();

        // ===========================================
        // Journal
        // ===========================================

        size_t journalMark() const { return undo_.size(); }
        void rollbackTo(size_t mark);
        void clearJournal() { undo_.clear(); }

        const std::set<StateKey> &dirtyKeys() const { return dirty_; }
        void clearDirty() { dirty_.clear(); }

        /// Approximate byte footprint of all records
        dp::u64 storageUsage() const;

      private:
        using BalanceKey = std::pair<TokenId, AccountId>;
        using Undo = std::function<void(LedgerState &)>;

        template <typename Map, typename Key> void journal(Map LedgerState::*member, const Key &key) {
            auto &map = this->*member;
            auto it = map.find(key);
            if (it == map.end()) {
                undo_.push_back([member, key](LedgerState &state) { (state.*member).erase(key); });
            } else {
                undo_.push_back([member, key, previous = it->second](LedgerState &state) {
                    (state.*member)[key] = previous;
                });
            }
        }

        void markDirty(RecordKind kind, const std::string &primary, const std::string &secondary = "") {
            dirty_.insert(StateKey{kind, primary, secondary});
        }

        dp::u64 last_token_id_{0};
        dp::u64 last_saga_id_{0};

        std::map<TokenId, AccountId> owners_;
        std::map<TokenId, Balance> supply_;
        std::map<TokenId, TokenMetadata> metadata_;
        std::map<BalanceKey, Balance> balances_;
        std::map<TokenId, ApprovalMap> approvals_;
        std::map<TokenId, dp::u64> next_approval_ids_;
        std::map<dp::u64, settlement::SagaRecord> sagas_;

        std::vector<Undo> undo_;
        std::set<StateKey> dirty_;
    };

    /// Rolls a LedgerState back to where it stood at construction unless committed.
    /// Guards nest; only the outermost commit discards the journal.
    class StateGuard {
      public:
        inline explicit StateGuard(LedgerState &state) : state_(state), mark_(state.journalMark()) {}

        inline ~StateGuard() {
            if (!committed_)
                state_.rollbackTo(mark_);
        }

        StateGuard(const StateGuard &) = delete;
        StateGuard &operator=(const StateGuard &) = delete;

        inline void commit() {
            if (committed_)
                return;
            if (mark_ == 0)
                state_.clearJournal();
            committed_ = true;
        }

        inline void rollback() {
            if (committed_)
                return;
            state_.rollbackTo(mark_);
            committed_ = true;
        }

      private:
        LedgerState &state_;
        size_t mark_;
        bool committed_ = false;
    };

} // namespace multitoken::ledger
