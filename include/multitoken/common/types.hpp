#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "balance.hpp"

namespace multitoken {

    using AccountId = std::string;
    using TokenId = std::string;

    /// Permission for a non-owner to move the owner's funds of one token
    struct Approval {
        dp::u64 approval_id{0};
        Balance amount{0}; // ceiling

        bool operator==(const Approval &other) const {
            return approval_id == other.approval_id && amount == other.amount;
        }
    };

    /// spender -> approval, per token
    using ApprovalMap = std::map<AccountId, Approval>;

    /// Per-token metadata (required when the metadata extension is enabled)
    struct TokenMetadata {
        std::optional<std::string> title;
        std::optional<std::string> description;
        std::optional<std::string> media;
        std::optional<std::string> media_hash;
        std::optional<std::string> issued_at;
        std::optional<std::string> expires_at;
        std::optional<std::string> starts_at;
        std::optional<std::string> updated_at;
        std::optional<std::string> extra;
        std::optional<std::string> reference;
        std::optional<std::string> reference_hash;

        bool operator==(const TokenMetadata &other) const {
            return title == other.title && description == other.description && media == other.media &&
                   media_hash == other.media_hash && issued_at == other.issued_at && expires_at == other.expires_at &&
                   starts_at == other.starts_at && updated_at == other.updated_at && extra == other.extra &&
                   reference == other.reference && reference_hash == other.reference_hash;
        }
    };

    /// View of a token as returned by mint and token lookups
    struct Token {
        TokenId token_id;
        AccountId owner_id;
        Balance supply{0};
        std::optional<TokenMetadata> metadata;
        std::optional<ApprovalMap> approvals;
        std::optional<dp::u64> next_approval_id;
    };

} // namespace multitoken
