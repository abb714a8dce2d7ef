#pragma once

#include <datapod/datapod.hpp>

#include <multitoken/common/types.hpp>
#include <multitoken/settlement/saga.hpp>

namespace multitoken::storage {

    // ===========================================
    // Persisted records - POD structs with members()
    // 128-bit amounts are stored as two u64 halves
    // Text is stored as raw bytes so embedded NULs survive
    // ===========================================

    using Text = dp::Vector<dp::u8>;

    struct CountersRecord {
        dp::u64 last_token_id = 0;
        dp::u64 last_saga_id = 0;

        auto members() { return std::tie(last_token_id, last_saga_id); }
        auto members() const { return std::tie(last_token_id, last_saga_id); }
    };

    struct OwnerRecord {
        Text token_id;
        Text owner_id;

        auto members() { return std::tie(token_id, owner_id); }
        auto members() const { return std::tie(token_id, owner_id); }
    };

    /// Supply (empty account) or balance of one account
    struct AmountRecord {
        Text token_id;
        Text account_id;
        dp::u64 amount_high = 0;
        dp::u64 amount_low = 0;

        auto members() { return std::tie(token_id, account_id, amount_high, amount_low); }
        auto members() const { return std::tie(token_id, account_id, amount_high, amount_low); }
    };

    /// Metadata fields in declaration order, `present[i]` set for fields that hold a value
    struct MetadataRecord {
        Text token_id;
        dp::Vector<dp::u8> present;
        dp::Vector<Text> fields;

        auto members() { return std::tie(token_id, present, fields); }
        auto members() const { return std::tie(token_id, present, fields); }
    };

    struct ApprovalEntry {
        Text spender_id;
        dp::u64 approval_id = 0;
        dp::u64 amount_high = 0;
        dp::u64 amount_low = 0;

        auto members() { return std::tie(spender_id, approval_id, amount_high, amount_low); }
        auto members() const { return std::tie(spender_id, approval_id, amount_high, amount_low); }
    };

    struct ApprovalsRecord {
        Text token_id;
        dp::Vector<ApprovalEntry> approvals;

        auto members() { return std::tie(token_id, approvals); }
        auto members() const { return std::tie(token_id, approvals); }
    };

    struct NextApprovalIdRecord {
        Text token_id;
        dp::u64 next_id = 0;

        auto members() { return std::tie(token_id, next_id); }
        auto members() const { return std::tie(token_id, next_id); }
    };

    struct SagaRecordData {
        dp::u64 id = 0;
        dp::u8 state = 0;
        Text sender;
        Text receiver;
        dp::Vector<Text> previous_owners;
        dp::Vector<Text> token_ids;
        dp::Vector<dp::u64> amount_high;
        dp::Vector<dp::u64> amount_low;
        dp::Vector<dp::u8> has_prior_approvals;
        dp::Vector<ApprovalsRecord> prior_approvals;
        Text message;
        dp::Vector<dp::u64> settled_high;
        dp::Vector<dp::u64> settled_low;

        auto members() {
            return std::tie(id, state, sender, receiver, previous_owners, token_ids, amount_high, amount_low,
                            has_prior_approvals, prior_approvals, message, settled_high, settled_low);
        }
        auto members() const {
            return std::tie(id, state, sender, receiver, previous_owners, token_ids, amount_high, amount_low,
                            has_prior_approvals, prior_approvals, message, settled_high, settled_low);
        }
    };

    // ===========================================
    // Conversions
    // ===========================================

    inline Text toDp(const std::string &s) { return Text(s.begin(), s.end()); }
    inline std::string fromDp(const Text &t) { return std::string(t.begin(), t.end()); }

    MetadataRecord toRecord(const TokenId &token_id, const TokenMetadata &metadata);
    TokenMetadata fromRecord(const MetadataRecord &record);

    ApprovalsRecord toRecord(const TokenId &token_id, const ApprovalMap &approvals);
    ApprovalMap fromRecord(const ApprovalsRecord &record);

    SagaRecordData toRecord(const settlement::SagaRecord &saga);
    dp::Result<settlement::SagaRecord, dp::Error> fromRecord(const SagaRecordData &record);

} // namespace multitoken::storage
