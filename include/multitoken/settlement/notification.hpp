#pragma once

#include <optional>
#include <string>
#include <vector>

#include <multitoken/common/types.hpp>

namespace multitoken::settlement {

    /// Payload delivered to a receiver after an optimistic transfer
    struct TransferNotification {
        AccountId sender;
        AccountId receiver;
        std::vector<AccountId> previous_owners;
        std::vector<TokenId> token_ids;
        std::vector<Balance> amounts;
        std::string message;
    };

    /// Receiver-side hook of the transfer-and-notify protocol.
    ///
    /// Returns the raw reply payload: a JSON array with one "unused amount"
    /// per token, e.g. `["30"]`. Throwing marks the notification as failed.
    class TokenReceiver {
      public:
        virtual ~TokenReceiver() = default;

        virtual std::string onTransfer(const TransferNotification &notification) = 0;
    };

    /// Outcome of a notification call as observed by the resolution step
    struct PromiseResult {
        enum class Status : dp::u8 { Successful = 0, Failed = 1 };

        Status status{Status::Failed};
        std::string payload;

        static PromiseResult successful(std::string payload) {
            return PromiseResult{Status::Successful, std::move(payload)};
        }
        static PromiseResult failed() { return PromiseResult{Status::Failed, {}}; }

        bool isSuccessful() const { return status == Status::Successful; }
    };

    /// Parses a receiver reply into `expected` unused amounts.
    /// Accepts decimal strings and bare integers; nullopt when malformed or of the wrong length.
    std::optional<std::vector<Balance>> parseUnusedAmounts(const std::string &payload, size_t expected);

    /// Formats unused amounts the way receivers are expected to reply
    std::string formatUnusedAmounts(const std::vector<Balance> &amounts);

} // namespace multitoken::settlement
