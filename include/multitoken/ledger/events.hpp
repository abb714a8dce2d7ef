#pragma once

#include <deque>
#include <functional>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <multitoken/common/types.hpp>

namespace multitoken::ledger {

    enum class EventKind : dp::u8 {
        Mint = 0,
        Transfer = 1,
        Burn = 2,
    };

    inline std::string eventKindToString(EventKind kind) {
        switch (kind) {
        case EventKind::Mint:
            return "mt_mint";
        case EventKind::Transfer:
            return "mt_transfer";
        case EventKind::Burn:
            return "mt_burn";
        default:
            return "unknown";
        }
    }

    inline std::string escapeJson(const std::string &str) {
        std::string result;
        for (char c : str) {
            switch (c) {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    static const char *hex = "0123456789abcdef";
                    result += "\\u00";
                    result += hex[(c >> 4) & 0x0f];
                    result += hex[c & 0x0f];
                } else {
                    result += c;
                }
                break;
            }
        }
        return result;
    }

    /// One ledger event. For transfers `authorized_id` is set only when a delegated
    /// spender moved the owner's funds.
    struct LedgerEvent {
        EventKind kind{EventKind::Transfer};
        AccountId old_owner_id; // empty for mints
        AccountId new_owner_id; // empty for burns
        TokenId token_id;
        Balance amount{0};
        std::optional<AccountId> authorized_id;
        std::optional<std::string> memo;

        std::string toJson() const {
            std::ostringstream oss;
            oss << "{\"event\":\"" << eventKindToString(kind) << "\",\"token_id\":\"" << escapeJson(token_id)
                << "\",\"amount\":\"" << balance::toString(amount) << "\"";
            if (!old_owner_id.empty())
                oss << ",\"old_owner_id\":\"" << escapeJson(old_owner_id) << "\"";
            if (!new_owner_id.empty())
                oss << ",\"new_owner_id\":\"" << escapeJson(new_owner_id) << "\"";
            if (authorized_id)
                oss << ",\"authorized_id\":\"" << escapeJson(*authorized_id) << "\"";
            if (memo)
                oss << ",\"memo\":\"" << escapeJson(*memo) << "\"";
            oss << "}";
            return oss.str();
        }
    };

    /// Event-log collaborator. Events are staged per invocation and only
    /// published once the invocation commits. Listeners see every event; the
    /// log itself keeps only the most recent `historyLimit()` of them.
    class EventLog {
      public:
        using Listener = std::function<void(const LedgerEvent &)>;

        static constexpr size_t DEFAULT_HISTORY_LIMIT = 1024;

        explicit EventLog(size_t history_limit = DEFAULT_HISTORY_LIMIT) : history_limit_(history_limit) {}

        inline void emit(LedgerEvent event) { pending_.push_back(std::move(event)); }

        inline size_t pendingMark() const { return pending_.size(); }

        /// Drops events staged after `mark`
        inline void discardFrom(size_t mark) {
            if (pending_.size() > mark)
                pending_.resize(mark);
        }

        inline void publish() {
            for (auto &event : pending_) {
                for (const auto &listener : listeners_)
                    listener(event);
                published_.push_back(std::move(event));
            }
            pending_.clear();
            trim();
        }

        inline void subscribe(Listener listener) { listeners_.push_back(std::move(listener)); }

        /// Most recent published events, oldest first
        inline const std::deque<LedgerEvent> &published() const { return published_; }
        inline const std::vector<LedgerEvent> &pending() const { return pending_; }

        inline size_t historyLimit() const { return history_limit_; }
        inline void setHistoryLimit(size_t limit) {
            history_limit_ = limit;
            trim();
        }

        inline void clear() {
            pending_.clear();
            published_.clear();
        }

      private:
        inline void trim() {
            while (published_.size() > history_limit_)
                published_.pop_front();
        }

        size_t history_limit_;
        std::vector<LedgerEvent> pending_;
        std::deque<LedgerEvent> published_;
        std::vector<Listener> listeners_;
    };

} // namespace multitoken::ledger
