#include <multitoken/storage/state_store.hpp>

#include <keylock/keylock.hpp>

namespace multitoken::storage {

    namespace {
        template <typename T> dp::ByteBuf encode(T record) { return dp::serialize<dp::Mode::WITH_VERSION>(record); }

        template <typename T> dp::Result<T, dp::Error> decode(const dp::ByteBuf &data) {
            try {
                auto result = dp::deserialize<dp::Mode::WITH_VERSION, T>(data);
                return dp::Result<T, dp::Error>::ok(std::move(result));
            } catch (const std::exception &e) {
                return dp::Result<T, dp::Error>::err(storage_error(dp::String(e.what())));
            }
        }

        dp::Result<std::optional<dp::ByteBuf>, dp::Error> present(dp::ByteBuf data) {
            return dp::Result<std::optional<dp::ByteBuf>, dp::Error>::ok(std::optional<dp::ByteBuf>(std::move(data)));
        }

        dp::Result<std::optional<dp::ByteBuf>, dp::Error> absent() {
            return dp::Result<std::optional<dp::ByteBuf>, dp::Error>::ok(std::nullopt);
        }

        dp::Result<dp::u64, dp::Error> parseSagaId(const std::string &text) {
            try {
                size_t consumed = 0;
                auto id = std::stoull(text, &consumed);
                if (consumed != text.size())
                    return dp::Result<dp::u64, dp::Error>::err(storage_error("Malformed saga id"));
                return dp::Result<dp::u64, dp::Error>::ok(static_cast<dp::u64>(id));
            } catch (const std::exception &e) {
                return dp::Result<dp::u64, dp::Error>::err(storage_error(dp::String(e.what())));
            }
        }
    } // namespace

    dp::Result<std::string, dp::Error> digest(const std::string &id) {
        keylock::keylock crypto(keylock::Algorithm::XChaCha20_Poly1305, keylock::HashAlgorithm::SHA256);
        std::vector<uint8_t> input(id.begin(), id.end());
        auto result = crypto.hash(input);
        if (!result.success) {
            return dp::Result<std::string, dp::Error>::err(storage_error("Hash computation failed"));
        }
        return dp::Result<std::string, dp::Error>::ok(std::string(result.data.begin(), result.data.end()));
    }

    Key prefixFor(ledger::RecordKind kind) { return Key(1, static_cast<char>(kind)); }

    dp::Result<Key, dp::Error> keyFor(const ledger::StateKey &state_key) {
        Key key = prefixFor(state_key.kind);

        switch (state_key.kind) {
        case ledger::RecordKind::Counters:
            return dp::Result<Key, dp::Error>::ok(key);
        case ledger::RecordKind::Saga: {
            auto id = parseSagaId(state_key.primary);
            if (!id.is_ok())
                return dp::Result<Key, dp::Error>::err(id.error());
            for (int shift = 56; shift >= 0; shift -= 8)
                key.push_back(static_cast<char>((id.value() >> shift) & 0xff));
            return dp::Result<Key, dp::Error>::ok(key);
        }
        default:
            break;
        }

        auto token_digest = digest(state_key.primary);
        if (!token_digest.is_ok())
            return dp::Result<Key, dp::Error>::err(token_digest.error());
        key += token_digest.value();

        if (state_key.kind == ledger::RecordKind::Balance) {
            auto account_digest = digest(state_key.secondary);
            if (!account_digest.is_ok())
                return dp::Result<Key, dp::Error>::err(account_digest.error());
            key += account_digest.value();
        }
        return dp::Result<Key, dp::Error>::ok(key);
    }

    dp::Result<std::optional<dp::ByteBuf>, dp::Error>
    StateStore::encodeRecord(const ledger::LedgerState &state, const ledger::StateKey &state_key) const {
        const auto &token_id = state_key.primary;

        switch (state_key.kind) {
        case ledger::RecordKind::Counters:
            return present(encode(CountersRecord{state.lastTokenId(), state.lastSagaId()}));
        case ledger::RecordKind::Owner: {
            auto owner = state.ownerOf(token_id);
            if (!owner.has_value())
                return absent();
            return present(encode(OwnerRecord{toDp(token_id), toDp(*owner)}));
        }
        case ledger::RecordKind::Supply: {
            auto supply = state.supplyOf(token_id);
            if (!supply.has_value())
                return absent();
            return present(
                encode(AmountRecord{toDp(token_id), Text{}, balance::high(*supply), balance::low(*supply)}));
        }
        case ledger::RecordKind::Balance: {
            auto amount = state.balanceOf(token_id, state_key.secondary);
            if (!amount.has_value())
                return absent();
            return present(encode(AmountRecord{toDp(token_id), toDp(state_key.secondary), balance::high(*amount),
                                               balance::low(*amount)}));
        }
        case ledger::RecordKind::Metadata: {
            auto metadata = state.metadataOf(token_id);
            if (!metadata.has_value())
                return absent();
            return present(encode(toRecord(token_id, *metadata)));
        }
        case ledger::RecordKind::Approvals: {
            auto approvals = state.approvalsOf(token_id);
            if (!approvals.has_value())
                return absent();
            return present(encode(toRecord(token_id, *approvals)));
        }
        case ledger::RecordKind::NextApprovalId: {
            auto next_id = state.nextApprovalIdOf(token_id);
            if (!next_id.has_value())
                return absent();
            return present(encode(NextApprovalIdRecord{toDp(token_id), *next_id}));
        }
        case ledger::RecordKind::Saga: {
            auto id = parseSagaId(token_id);
            if (!id.is_ok())
                return dp::Result<std::optional<dp::ByteBuf>, dp::Error>::err(id.error());
            auto saga = state.sagaOf(id.value());
            if (!saga.has_value())
                return absent();
            return present(encode(toRecord(*saga)));
        }
        default:
            return dp::Result<std::optional<dp::ByteBuf>, dp::Error>::err(storage_error("Unknown record kind"));
        }
    }

    dp::Result<void, dp::Error> StateStore::flush(const ledger::LedgerState &state) {
        std::vector<WriteOp> batch;
        batch.reserve(state.dirtyKeys().size());

        for (const auto &state_key : state.dirtyKeys()) {
            auto key = keyFor(state_key);
            if (!key.is_ok())
                return dp::Result<void, dp::Error>::err(key.error());
            auto value = encodeRecord(state, state_key);
            if (!value.is_ok())
                return dp::Result<void, dp::Error>::err(value.error());
            batch.push_back(WriteOp{key.value(), value.value()});
        }
        return kv_.apply(batch);
    }

    dp::Result<void, dp::Error> StateStore::load(ledger::LedgerState &state) const {
        ledger::LedgerState loaded;

        // ===========================================
        // Counters
        // ===========================================
        auto counters = kv_.get(prefixFor(ledger::RecordKind::Counters));
        if (!counters.is_ok())
            return dp::Result<void, dp::Error>::err(counters.error());
        if (counters.value().has_value()) {
            auto record = decode<CountersRecord>(*counters.value());
            if (!record.is_ok())
                return dp::Result<void, dp::Error>::err(record.error());
            loaded.setLastTokenId(record.value().last_token_id);
            loaded.setLastSagaId(record.value().last_saga_id);
        }

        // ===========================================
        // Per-kind records
        // ===========================================
        auto scan = [&](ledger::RecordKind kind, auto &&restore) -> dp::Result<void, dp::Error> {
            auto entries = kv_.scanPrefix(prefixFor(kind));
            if (!entries.is_ok())
                return dp::Result<void, dp::Error>::err(entries.error());
            for (const auto &[key, data] : entries.value()) {
                auto restored = restore(data);
                if (!restored.is_ok())
                    return restored;
            }
            return dp::Result<void, dp::Error>::ok();
        };

        auto owners = scan(ledger::RecordKind::Owner, [&](const dp::ByteBuf &data) {
            auto record = decode<OwnerRecord>(data);
            if (!record.is_ok())
                return dp::Result<void, dp::Error>::err(record.error());
            loaded.setOwner(fromDp(record.value().token_id), fromDp(record.value().owner_id));
            return dp::Result<void, dp::Error>::ok();
        });
        if (!owners.is_ok())
            return owners;

        auto supplies = scan(ledger::RecordKind::Supply, [&](const dp::ByteBuf &data) {
            auto record = decode<AmountRecord>(data);
            if (!record.is_ok())
                return dp::Result<void, dp::Error>::err(record.error());
            const auto &r = record.value();
            loaded.setSupply(fromDp(r.token_id), balance::fromParts(r.amount_high, r.amount_low));
            return dp::Result<void, dp::Error>::ok();
        });
        if (!supplies.is_ok())
            return supplies;

        auto balances = scan(ledger::RecordKind::Balance, [&](const dp::ByteBuf &data) {
            auto record = decode<AmountRecord>(data);
            if (!record.is_ok())
                return dp::Result<void, dp::Error>::err(record.error());
            const auto &r = record.value();
            loaded.setBalance(fromDp(r.token_id), fromDp(r.account_id), balance::fromParts(r.amount_high, r.amount_low));
            return dp::Result<void, dp::Error>::ok();
        });
        if (!balances.is_ok())
            return balances;

        auto metadata = scan(ledger::RecordKind::Metadata, [&](const dp::ByteBuf &data) {
            auto record = decode<MetadataRecord>(data);
            if (!record.is_ok())
                return dp::Result<void, dp::Error>::err(record.error());
            loaded.setMetadata(fromDp(record.value().token_id), fromRecord(record.value()));
            return dp::Result<void, dp::Error>::ok();
        });
        if (!metadata.is_ok())
            return metadata;

        auto approvals = scan(ledger::RecordKind::Approvals, [&](const dp::ByteBuf &data) {
            auto record = decode<ApprovalsRecord>(data);
            if (!record.is_ok())
                return dp::Result<void, dp::Error>::err(record.error());
            loaded.setApprovals(fromDp(record.value().token_id), fromRecord(record.value()));
            return dp::Result<void, dp::Error>::ok();
        });
        if (!approvals.is_ok())
            return approvals;

        auto next_ids = scan(ledger::RecordKind::NextApprovalId, [&](const dp::ByteBuf &data) {
            auto record = decode<NextApprovalIdRecord>(data);
            if (!record.is_ok())
                return dp::Result<void, dp::Error>::err(record.error());
            loaded.setNextApprovalId(fromDp(record.value().token_id), record.value().next_id);
            return dp::Result<void, dp::Error>::ok();
        });
        if (!next_ids.is_ok())
            return next_ids;

        auto sagas = scan(ledger::RecordKind::Saga, [&](const dp::ByteBuf &data) {
            auto record = decode<SagaRecordData>(data);
            if (!record.is_ok())
                return dp::Result<void, dp::Error>::err(record.error());
            auto saga = fromRecord(record.value());
            if (!saga.is_ok())
                return dp::Result<void, dp::Error>::err(saga.error());
            if (!settlement::isTerminal(saga.value().state))
                loaded.putSaga(saga.value());
            return dp::Result<void, dp::Error>::ok();
        });
        if (!sagas.is_ok())
            return sagas;

        loaded.clearJournal();
        loaded.clearDirty();
        state = std::move(loaded);
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<std::optional<settlement::SagaRecord>, dp::Error> StateStore::loadSaga(dp::u64 saga_id) const {
        using Loaded = dp::Result<std::optional<settlement::SagaRecord>, dp::Error>;

        auto key = keyFor(ledger::StateKey{ledger::RecordKind::Saga, std::to_string(saga_id), ""});
        if (!key.is_ok())
            return Loaded::err(key.error());
        auto data = kv_.get(key.value());
        if (!data.is_ok())
            return Loaded::err(data.error());
        if (!data.value().has_value())
            return Loaded::ok(std::nullopt);

        auto record = decode<SagaRecordData>(*data.value());
        if (!record.is_ok())
            return Loaded::err(record.error());
        auto saga = fromRecord(record.value());
        if (!saga.is_ok())
            return Loaded::err(saga.error());
        return Loaded::ok(std::optional<settlement::SagaRecord>(saga.value()));
    }

} // namespace multitoken::storage
