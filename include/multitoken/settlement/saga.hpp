#pragma once

#include <multitoken/common/types.hpp>
#include <string>
#include <vector>

namespace multitoken::settlement {

    /// Lifecycle of one transfer-and-notify saga
    enum class SagaState : dp::u8 {
        Started = 0,  // funds moved optimistically, notification pending
        Notified = 1, // notification dispatched, resolution pending
        Resolved = 2, // receiver kept some or all of the amount
        Aborted = 3,  // notification failed outright, full reversal attempted
    };

    inline std::string sagaStateToString(SagaState state) {
        switch (state) {
        case SagaState::Started:
            return "started";
        case SagaState::Notified:
            return "notified";
        case SagaState::Resolved:
            return "resolved";
        case SagaState::Aborted:
            return "aborted";
        default:
            return "unknown";
        }
    }

    inline bool isTerminal(SagaState state) { return state == SagaState::Resolved || state == SagaState::Aborted; }

    /// Durable context needed to compensate a transfer-and-notify call
    struct SagaRecord {
        dp::u64 id{0};
        SagaState state{SagaState::Started};
        AccountId sender;                       // caller of transferCall
        AccountId receiver;                     // notified account
        std::vector<AccountId> previous_owners; // refund target per token
        std::vector<TokenId> token_ids;
        std::vector<Balance> amounts;
        // Approval sets cleared by the optimistic transfer; kept for audit, never restored
        std::vector<std::optional<ApprovalMap>> prior_approvals;
        std::string message;
        std::vector<Balance> settled; // filled on resolution
    };

    /// Result of resolving one saga
    struct SettlementReport {
        dp::u64 saga_id{0};
        SagaState state{SagaState::Resolved};
        std::vector<Balance> settled; // kept by the receiver, per token
        Balance refunded{0};          // moved back to previous owners
        Balance burned{0};            // refunds whose previous owner was gone
        Balance shortfall{0};         // unused amounts the receiver no longer held
    };

} // namespace multitoken::settlement
