#include <multitoken/storage/records.hpp>

namespace multitoken::storage {

    namespace {
        constexpr size_t METADATA_FIELDS = 11;

        std::vector<std::optional<std::string> *> metadataFields(TokenMetadata &md) {
            return {&md.title,      &md.description, &md.media,      &md.media_hash, &md.issued_at,     &md.expires_at,
                    &md.starts_at,  &md.updated_at,  &md.extra,      &md.reference,  &md.reference_hash};
        }
    } // namespace

    MetadataRecord toRecord(const TokenId &token_id, const TokenMetadata &metadata) {
        MetadataRecord record;
        record.token_id = toDp(token_id);
        TokenMetadata copy = metadata;
        for (auto *field : metadataFields(copy)) {
            record.present.push_back(field->has_value() ? 1 : 0);
            record.fields.push_back(toDp(field->value_or("")));
        }
        return record;
    }

    TokenMetadata fromRecord(const MetadataRecord &record) {
        TokenMetadata metadata;
        auto fields = metadataFields(metadata);
        for (size_t i = 0; i < METADATA_FIELDS && i < record.present.size() && i < record.fields.size(); ++i) {
            if (record.present[i])
                *fields[i] = fromDp(record.fields[i]);
        }
        return metadata;
    }

    ApprovalsRecord toRecord(const TokenId &token_id, const ApprovalMap &approvals) {
        ApprovalsRecord record;
        record.token_id = toDp(token_id);
        for (const auto &[spender, approval] : approvals) {
            ApprovalEntry entry;
            entry.spender_id = toDp(spender);
            entry.approval_id = approval.approval_id;
            entry.amount_high = balance::high(approval.amount);
            entry.amount_low = balance::low(approval.amount);
            record.approvals.push_back(entry);
        }
        return record;
    }

    ApprovalMap fromRecord(const ApprovalsRecord &record) {
        ApprovalMap approvals;
        for (const auto &entry : record.approvals) {
            approvals[fromDp(entry.spender_id)] =
                Approval{entry.approval_id, balance::fromParts(entry.amount_high, entry.amount_low)};
        }
        return approvals;
    }

    SagaRecordData toRecord(const settlement::SagaRecord &saga) {
        SagaRecordData record;
        record.id = saga.id;
        record.state = static_cast<dp::u8>(saga.state);
        record.sender = toDp(saga.sender);
        record.receiver = toDp(saga.receiver);
        for (const auto &owner : saga.previous_owners)
            record.previous_owners.push_back(toDp(owner));
        for (const auto &token_id : saga.token_ids)
            record.token_ids.push_back(toDp(token_id));
        for (auto amount : saga.amounts) {
            record.amount_high.push_back(balance::high(amount));
            record.amount_low.push_back(balance::low(amount));
        }
        for (size_t i = 0; i < saga.prior_approvals.size(); ++i) {
            const auto &prior = saga.prior_approvals[i];
            record.has_prior_approvals.push_back(prior.has_value() ? 1 : 0);
            const TokenId &token_id = i < saga.token_ids.size() ? saga.token_ids[i] : TokenId{};
            record.prior_approvals.push_back(toRecord(token_id, prior.value_or(ApprovalMap{})));
        }
        record.message = toDp(saga.message);
        for (auto settled : saga.settled) {
            record.settled_high.push_back(balance::high(settled));
            record.settled_low.push_back(balance::low(settled));
        }
        return record;
    }

    dp::Result<settlement::SagaRecord, dp::Error> fromRecord(const SagaRecordData &record) {
        const size_t count = record.token_ids.size();
        if (record.previous_owners.size() != count || record.amount_high.size() != count ||
            record.amount_low.size() != count || record.has_prior_approvals.size() != record.prior_approvals.size() ||
            record.settled_high.size() != record.settled_low.size()) {
            return dp::Result<settlement::SagaRecord, dp::Error>::err(storage_error("Corrupt saga record"));
        }
        if (record.state > static_cast<dp::u8>(settlement::SagaState::Aborted)) {
            return dp::Result<settlement::SagaRecord, dp::Error>::err(storage_error("Unknown saga state"));
        }

        settlement::SagaRecord saga;
        saga.id = record.id;
        saga.state = static_cast<settlement::SagaState>(record.state);
        saga.sender = fromDp(record.sender);
        saga.receiver = fromDp(record.receiver);
        for (size_t i = 0; i < count; ++i) {
            saga.previous_owners.push_back(fromDp(record.previous_owners[i]));
            saga.token_ids.push_back(fromDp(record.token_ids[i]));
            saga.amounts.push_back(balance::fromParts(record.amount_high[i], record.amount_low[i]));
        }
        for (size_t i = 0; i < record.prior_approvals.size(); ++i) {
            if (record.has_prior_approvals[i])
                saga.prior_approvals.push_back(fromRecord(record.prior_approvals[i]));
            else
                saga.prior_approvals.push_back(std::nullopt);
        }
        saga.message = fromDp(record.message);
        for (size_t i = 0; i < record.settled_high.size(); ++i)
            saga.settled.push_back(balance::fromParts(record.settled_high[i], record.settled_low[i]));
        return dp::Result<settlement::SagaRecord, dp::Error>::ok(std::move(saga));
    }

} // namespace multitoken::storage
