#pragma once

#include <multitoken/ledger/ledger_state.hpp>
#include <multitoken/storage/kv_store.hpp>
#include <multitoken/storage/records.hpp>

namespace multitoken::storage {

    /// SHA-256 digest of an identifier, as raw bytes
    dp::Result<std::string, dp::Error> digest(const std::string &id);

    /// One-byte record tag every key of that kind starts with
    Key prefixFor(ledger::RecordKind kind);

    /// Deterministic storage key of a ledger record: tag byte, then the SHA-256
    /// of the token id and of the account id where the record has one. Sagas
    /// use their id in big-endian order.
    dp::Result<Key, dp::Error> keyFor(const ledger::StateKey &state_key);

    /// Persists a LedgerState into a KvStore and loads it back
    class StateStore {
      public:
        explicit StateStore(KvStore &kv) : kv_(kv) {}

        /// Replaces the contents of `state` with what the store holds. Settled sagas stay on disk.
        dp::Result<void, dp::Error> load(ledger::LedgerState &state) const;

        /// Reads one saga record straight from the store
        dp::Result<std::optional<settlement::SagaRecord>, dp::Error> loadSaga(dp::u64 saga_id) const;

        /// Writes every record `state` marks dirty as one atomic batch
        dp::Result<void, dp::Error> flush(const ledger::LedgerState &state);

        KvStore &kv() { return kv_; }

      private:
        dp::Result<std::optional<dp::ByteBuf>, dp::Error> encodeRecord(const ledger::LedgerState &state,
                                                                       const ledger::StateKey &state_key) const;

        KvStore &kv_;
    };

} // namespace multitoken::storage
