#include <limits>
#include <multitoken/ledger/token_registry.hpp>

namespace multitoken::ledger {

    dp::Result<void, dp::Error> TokenRegistry::validateMetadata(const TokenMetadata &metadata) {
        if (metadata.title.has_value() && metadata.title->empty()) {
            return dp::Result<void, dp::Error>::err(invalid_metadata("Title must not be empty"));
        }
        if (metadata.media_hash.has_value() && !metadata.media.has_value()) {
            return dp::Result<void, dp::Error>::err(invalid_metadata("media_hash requires media"));
        }
        if (metadata.reference_hash.has_value() && !metadata.reference.has_value()) {
            return dp::Result<void, dp::Error>::err(invalid_metadata("reference_hash requires reference"));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<MintReceipt, dp::Error> TokenRegistry::mint(const MintRequest &request) {
        StateGuard guard(state_);
        dp::u64 initial_usage = state_.storageUsage();

        if (config_.extensions.metadata) {
            if (!request.metadata.has_value()) {
                return dp::Result<MintReceipt, dp::Error>::err(invalid_metadata("MUST provide metadata"));
            }
            auto valid = validateMetadata(*request.metadata);
            if (!valid.is_ok()) {
                return dp::Result<MintReceipt, dp::Error>::err(valid.error());
            }
        }

        if (state_.lastTokenId() == std::numeric_limits<dp::u64>::max()) {
            return dp::Result<MintReceipt, dp::Error>::err(id_space_exhausted());
        }
        dp::u64 next_id = state_.lastTokenId() + 1;
        state_.setLastTokenId(next_id);
        TokenId token_id = std::to_string(next_id);

        state_.setOwner(token_id, request.owner_id);
        if (config_.extensions.metadata)
            state_.setMetadata(token_id, *request.metadata);
        approvals_.initializeToken(token_id);
        state_.setSupply(token_id, 0);

        auto registered = ledger_.registerAccount(token_id, request.owner_id);
        if (!registered.is_ok()) {
            return dp::Result<MintReceipt, dp::Error>::err(registered.error());
        }
        Balance amount = request.amount.value_or(0);
        auto deposited = ledger_.deposit(token_id, request.owner_id, amount);
        if (!deposited.is_ok()) {
            return dp::Result<MintReceipt, dp::Error>::err(deposited.error());
        }

        MintReceipt receipt;
        if (request.refund_id.has_value()) {
            if (payments_ == nullptr) {
                return dp::Result<MintReceipt, dp::Error>::err(precheck_failed("No payment collaborator for refund"));
            }
            dp::u64 used = state_.storageUsage() - initial_usage + config_.extra_storage_in_bytes_per_emission;
            auto excess = payments_->storageRefund(used, request.attached_deposit);
            if (!excess.is_ok()) {
                return dp::Result<MintReceipt, dp::Error>::err(excess.error());
            }
            if (excess.value() > 0)
                receipt.refund = host::Refund{*request.refund_id, excess.value()};
        }

        auto minted = token(token_id);
        if (!minted.has_value()) {
            return dp::Result<MintReceipt, dp::Error>::err(not_found("Minted token vanished"));
        }
        receipt.token = *minted;

        LedgerEvent event;
        event.kind = EventKind::Mint;
        event.new_owner_id = request.owner_id;
        event.token_id = token_id;
        event.amount = amount;
        events_.emit(event);

        guard.commit();
        return dp::Result<MintReceipt, dp::Error>::ok(std::move(receipt));
    }

    std::optional<Token> TokenRegistry::token(const TokenId &token_id) const {
        auto owner = state_.ownerOf(token_id);
        auto supply = state_.supplyOf(token_id);
        if (!owner.has_value() || !supply.has_value())
            return std::nullopt;

        Token result;
        result.token_id = token_id;
        result.owner_id = *owner;
        result.supply = *supply;
        if (config_.extensions.metadata)
            result.metadata = state_.metadataOf(token_id);
        if (approvals_.enabled()) {
            result.approvals = state_.approvalsOf(token_id).value_or(ApprovalMap{});
            result.next_approval_id = state_.nextApprovalIdOf(token_id).value_or(0);
        }
        return result;
    }

} // namespace multitoken::ledger
