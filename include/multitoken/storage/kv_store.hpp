#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <multitoken/common/error.hpp>

namespace multitoken::storage {

    /// Raw key bytes
    using Key = std::string;

    /// One staged write; an empty value erases the key
    struct WriteOp {
        Key key;
        std::optional<dp::ByteBuf> value;
    };

    /// Key-value store collaborator. Keys are deterministic byte strings and
    /// a batch passed to apply() lands entirely or not at all.
    class KvStore {
      public:
        virtual ~KvStore() = default;

        virtual dp::Result<std::optional<dp::ByteBuf>, dp::Error> get(const Key &key) const = 0;

        /// All entries whose key starts with `prefix`, in key order
        virtual dp::Result<std::vector<std::pair<Key, dp::ByteBuf>>, dp::Error> scanPrefix(const Key &prefix) const = 0;

        virtual dp::Result<void, dp::Error> apply(const std::vector<WriteOp> &batch) = 0;

        virtual size_t size() const = 0;
    };

    // ===========================================
    // MemoryKvStore
    // ===========================================

    class MemoryKvStore : public KvStore {
      public:
        MemoryKvStore() = default;

        inline dp::Result<std::optional<dp::ByteBuf>, dp::Error> get(const Key &key) const override {
            auto it = entries_.find(key);
            if (it == entries_.end())
                return dp::Result<std::optional<dp::ByteBuf>, dp::Error>::ok(std::nullopt);
            return dp::Result<std::optional<dp::ByteBuf>, dp::Error>::ok(it->second);
        }

        inline dp::Result<std::vector<std::pair<Key, dp::ByteBuf>>, dp::Error>
        scanPrefix(const Key &prefix) const override {
            std::vector<std::pair<Key, dp::ByteBuf>> found;
            for (auto it = entries_.lower_bound(prefix); it != entries_.end(); ++it) {
                if (it->first.compare(0, prefix.size(), prefix) != 0)
                    break;
                found.emplace_back(it->first, it->second);
            }
            return dp::Result<std::vector<std::pair<Key, dp::ByteBuf>>, dp::Error>::ok(std::move(found));
        }

        inline dp::Result<void, dp::Error> apply(const std::vector<WriteOp> &batch) override {
            for (const auto &op : batch) {
                if (op.value.has_value())
                    entries_[op.key] = *op.value;
                else
                    entries_.erase(op.key);
            }
            return dp::Result<void, dp::Error>::ok();
        }

        inline size_t size() const override { return entries_.size(); }

      private:
        std::map<Key, dp::ByteBuf> entries_;
    };

} // namespace multitoken::storage
