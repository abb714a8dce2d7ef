#pragma once

#include <datapod/datapod.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>

#include <multitoken/storage/kv_store.hpp>

namespace multitoken::storage {

    using namespace datapod;

    // ===========================================
    // Log records - POD structs with members()
    // ===========================================

    /// One key write inside a logged batch
    struct LogEntry {
        Vector<u8> key;
        u8 erased = 0;
        Vector<u8> value;

        auto members() { return std::tie(key, erased, value); }
        auto members() const { return std::tie(key, erased, value); }
    };

    /// A committed batch, appended as a single length-prefixed record
    struct BatchRecord {
        u64 sequence = 0;
        Vector<LogEntry> entries;

        auto members() { return std::tie(sequence, entries); }
        auto members() const { return std::tie(sequence, entries); }
    };

    /// Storage configuration options
    struct OpenOptions {
        enum class Synchronous { OFF = 0, NORMAL = 1, FULL = 2 };
        Synchronous sync_mode = Synchronous::NORMAL;
        bool create_if_missing = true;

        auto members() { return std::tie(sync_mode, create_if_missing); }
        auto members() const { return std::tie(sync_mode, create_if_missing); }
    };

    // ===========================================
    // FileKvStore - append-only file-backed store
    // ===========================================

    /// Every committed batch is appended to `<dir>/ledger.dat`; the key index is
    /// rebuilt by replaying the log on open. A torn trailing batch is cut off the
    /// file on open, and a failed append is cut back before the error is returned.
    class FileKvStore : public KvStore {
      public:
        inline FileKvStore() : is_open_(false), sync_mode_(OpenOptions::Synchronous::NORMAL) {}

        inline ~FileKvStore() override { close(); }

        // Non-copyable, movable
        FileKvStore(const FileKvStore &) = delete;
        FileKvStore &operator=(const FileKvStore &) = delete;

        inline FileKvStore(FileKvStore &&other) noexcept
            : base_path_(std::move(other.base_path_)), is_open_(other.is_open_), sync_mode_(other.sync_mode_),
              sequence_(other.sequence_), index_(std::move(other.index_)) {
            other.is_open_ = false;
        }

        inline FileKvStore &operator=(FileKvStore &&other) noexcept {
            if (this != &other) {
                close();
                base_path_ = std::move(other.base_path_);
                is_open_ = other.is_open_;
                sync_mode_ = other.sync_mode_;
                sequence_ = other.sequence_;
                index_ = std::move(other.index_);
                other.is_open_ = false;
            }
            return *this;
        }

        /// Open or create storage at given path (directory)
        inline Result<void, Error> open(const String &path, const OpenOptions &opts = OpenOptions{}) {
            try {
                base_path_ = std::string(path.c_str());
                sync_mode_ = opts.sync_mode;

                if (!std::filesystem::exists(base_path_)) {
                    if (!opts.create_if_missing)
                        return Result<void, Error>::err(storage_error("Store directory does not exist"));
                    std::filesystem::create_directories(base_path_);
                }
                loadIndex();

                is_open_ = true;
                return Result<void, Error>::ok();
            } catch (const std::exception &e) {
                is_open_ = false;
                return Result<void, Error>::err(storage_error(String(e.what())));
            }
        }

        /// Close storage
        inline void close() {
            if (is_open_) {
                pending_.clear();
                is_open_ = false;
            }
        }

        /// Check if storage is open
        inline bool isOpen() const { return is_open_; }

        inline std::filesystem::path logPath() const { return base_path_ / "ledger.dat"; }

        // ===========================================
        // Transaction management (RAII)
        // ===========================================

        class TxGuard {
          public:
            inline explicit TxGuard(FileKvStore &store) : store_(store), committed_(false) { store_.pending_.clear(); }

            inline ~TxGuard() {
                if (!committed_) {
                    store_.pending_.clear();
                }
            }

            TxGuard(const TxGuard &) = delete;
            TxGuard &operator=(const TxGuard &) = delete;

            inline void stage(const WriteOp &op) { store_.pending_.push_back(op); }

            inline Result<void, Error> commit() {
                if (committed_)
                    return Result<void, Error>::ok();
                committed_ = true;
                try {
                    store_.flushPending();
                    return Result<void, Error>::ok();
                } catch (const std::exception &e) {
                    store_.pending_.clear();
                    return Result<void, Error>::err(storage_error(String(e.what())));
                }
            }

            inline void rollback() {
                if (!committed_) {
                    store_.pending_.clear();
                    committed_ = true;
                }
            }

          private:
            FileKvStore &store_;
            bool committed_;
        };

        inline std::unique_ptr<TxGuard> beginTransaction() { return std::make_unique<TxGuard>(*this); }

        // ===========================================
        // KvStore
        // ===========================================

        inline Result<std::optional<ByteBuf>, Error> get(const Key &key) const override {
            if (!is_open_)
                return Result<std::optional<ByteBuf>, Error>::err(storage_error("Store not open"));
            auto it = index_.find(key);
            if (it == index_.end())
                return Result<std::optional<ByteBuf>, Error>::ok(std::nullopt);
            return Result<std::optional<ByteBuf>, Error>::ok(it->second);
        }

        inline Result<std::vector<std::pair<Key, ByteBuf>>, Error> scanPrefix(const Key &prefix) const override {
            if (!is_open_)
                return Result<std::vector<std::pair<Key, ByteBuf>>, Error>::err(storage_error("Store not open"));
            std::vector<std::pair<Key, ByteBuf>> found;
            for (auto it = index_.lower_bound(prefix); it != index_.end(); ++it) {
                if (it->first.compare(0, prefix.size(), prefix) != 0)
                    break;
                found.emplace_back(it->first, it->second);
            }
            return Result<std::vector<std::pair<Key, ByteBuf>>, Error>::ok(std::move(found));
        }

        inline Result<void, Error> apply(const std::vector<WriteOp> &batch) override {
            if (!is_open_)
                return Result<void, Error>::err(storage_error("Store not open"));
            if (batch.empty())
                return Result<void, Error>::ok();

            auto tx = beginTransaction();
            for (const auto &op : batch)
                tx->stage(op);
            return tx->commit();
        }

        inline size_t size() const override { return index_.size(); }

        /// Number of batches replayed or written since open
        inline u64 sequence() const { return sequence_; }

      private:
        // ===========================================
        // File I/O with datapod serialization
        // ===========================================

        inline void appendRecord(const BatchRecord &record) {
            const auto path = logPath();
            const std::uintmax_t previous_size = std::filesystem::exists(path) ? std::filesystem::file_size(path) : 0;

            // Serialize using datapod (need mutable copy)
            BatchRecord mutable_record = record;
            auto buffer = datapod::serialize(mutable_record);
            u32 len = static_cast<u32>(buffer.size());

            bool written = false;
            {
                std::ofstream out(path, std::ios::binary | std::ios::app);
                if (out) {
                    out.write(reinterpret_cast<const char *>(&len), sizeof(len));
                    out.write(reinterpret_cast<const char *>(buffer.data()), buffer.size());
                    if (sync_mode_ == OpenOptions::Synchronous::FULL)
                        out.flush();
                    out.close();
                    written = !out.fail();
                }
            }

            if (!written) {
                // Later appends must start right after the last whole batch
                truncateLog(previous_size);
                throw std::runtime_error("Failed to append batch");
            }
        }

        inline void truncateLog(std::uintmax_t size) {
            std::error_code ec;
            if (std::filesystem::exists(logPath(), ec))
                std::filesystem::resize_file(logPath(), size, ec);
            if (ec)
                std::cout << "Failed to truncate " << logPath().string() << ": " << ec.message() << std::endl;
        }

        inline void applyToIndex(const BatchRecord &record) {
            for (const auto &entry : record.entries) {
                Key key(entry.key.begin(), entry.key.end());
                if (entry.erased)
                    index_.erase(key);
                else
                    index_[key] = ByteBuf(entry.value.begin(), entry.value.end());
            }
            sequence_ = record.sequence;
        }

        // ===========================================
        // Index management
        // ===========================================

        inline void loadIndex() {
            index_.clear();
            sequence_ = 0;

            const auto path = logPath();
            if (!std::filesystem::exists(path))
                return;
            const std::uintmax_t file_size = std::filesystem::file_size(path);
            std::uintmax_t good_end = 0;

            {
                std::ifstream in(path, std::ios::binary);
                if (!in)
                    throw std::runtime_error("Failed to open log for reading");

                while (good_end + sizeof(u32) <= file_size) {
                    u32 len;
                    in.read(reinterpret_cast<char *>(&len), sizeof(len));
                    if (!in || good_end + sizeof(u32) + len > file_size)
                        break;

                    ByteBuf data(len);
                    in.read(reinterpret_cast<char *>(data.data()), len);
                    if (!in)
                        break;

                    BatchRecord record;
                    try {
                        record = datapod::deserialize<Mode::NONE, BatchRecord>(data);
                    } catch (const std::exception &e) {
                        std::cout << "Discarding unreadable batch at offset " << good_end << ": " << e.what()
                                  << std::endl;
                        break;
                    }
                    applyToIndex(record);
                    good_end += sizeof(u32) + len;
                }
            }

            // Drop a torn tail so the next batch is appended after the last whole one
            if (good_end < file_size) {
                std::cout << "Truncating " << (file_size - good_end) << " trailing bytes from " << path.string()
                          << std::endl;
                std::filesystem::resize_file(path, good_end);
            }
        }

        inline void flushPending() {
            BatchRecord record;
            record.sequence = sequence_ + 1;
            for (const auto &op : pending_) {
                LogEntry entry;
                entry.key = Vector<u8>(op.key.begin(), op.key.end());
                entry.erased = op.value.has_value() ? 0 : 1;
                if (op.value.has_value())
                    entry.value = Vector<u8>(op.value->begin(), op.value->end());
                record.entries.push_back(entry);
            }
            pending_.clear();

            appendRecord(record);
            applyToIndex(record);
        }

        // ===========================================
        // Member variables
        // ===========================================

        std::filesystem::path base_path_;
        bool is_open_;
        OpenOptions::Synchronous sync_mode_;
        u64 sequence_ = 0;

        // In-memory index
        std::map<Key, ByteBuf> index_;

        // Pending writes
        std::vector<WriteOp> pending_;
    };

} // namespace multitoken::storage
