#include <multitoken/settlement/transfer_protocol.hpp>

#include <iostream>
#include <limits>

namespace multitoken::settlement {

    namespace {
        void accumulate(Balance &total, Balance value) {
            if (!balance::checkedAdd(total, value, total))
                total = BALANCE_MAX;
        }
    } // namespace

    dp::Result<void, dp::Error> AsyncTransferProtocol::precheck(const host::Invocation &invocation) const {
        if (invocation.attached_deposit < config_.required_deposit) {
            std::string msg =
                "Requires attached deposit of at least " + balance::toString(config_.required_deposit);
            return dp::Result<void, dp::Error>::err(precheck_failed(dp::String(msg.c_str())));
        }
        // The call keeps gas_for_transfer_call and must still leave a resolution's worth for the notification
        if (invocation.prepaid_gas <= config_.gas_for_transfer_call + config_.gas_for_resolve_transfer) {
            return dp::Result<void, dp::Error>::err(precheck_failed("More gas is required"));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<host::SettlementChain, dp::Error>
    AsyncTransferProtocol::transferCall(const host::Invocation &invocation, const AccountId &receiver_id,
                                        const TokenId &token_id, Balance amount, std::optional<dp::u64> approval_id,
                                        const std::optional<std::string> &memo, const std::string &message) {
        std::optional<std::vector<std::optional<dp::u64>>> approval_ids;
        if (approval_id.has_value())
            approval_ids = std::vector<std::optional<dp::u64>>{approval_id};
        return batchTransferCall(invocation, receiver_id, {token_id}, {amount}, approval_ids, memo, message);
    }

    dp::Result<host::SettlementChain, dp::Error> AsyncTransferProtocol::batchTransferCall(
        const host::Invocation &invocation, const AccountId &receiver_id, const std::vector<TokenId> &token_ids,
        const std::vector<Balance> &amounts, const std::optional<std::vector<std::optional<dp::u64>>> &approval_ids,
        const std::optional<std::string> &memo, const std::string &message) {
        auto checked = precheck(invocation);
        if (!checked.is_ok()) {
            return dp::Result<host::SettlementChain, dp::Error>::err(checked.error());
        }

        ledger::StateGuard guard(state_);

        auto receipts =
            engine_.transferBatch(invocation.predecessor, receiver_id, token_ids, amounts, approval_ids, memo);
        if (!receipts.is_ok()) {
            return dp::Result<host::SettlementChain, dp::Error>::err(receipts.error());
        }

        if (state_.lastSagaId() == std::numeric_limits<dp::u64>::max()) {
            return dp::Result<host::SettlementChain, dp::Error>::err(id_space_exhausted("Saga ids exhausted"));
        }

        SagaRecord saga;
        saga.id = state_.lastSagaId() + 1;
        saga.state = SagaState::Started;
        saga.sender = invocation.predecessor;
        saga.receiver = receiver_id;
        saga.token_ids = token_ids;
        saga.amounts = amounts;
        saga.message = message;
        for (const auto &receipt : receipts.value()) {
            saga.previous_owners.push_back(receipt.owner_id);
            saga.prior_approvals.push_back(receipt.removed_approvals);
        }

        state_.setLastSagaId(saga.id);
        state_.putSaga(saga);

        auto chain = chainFor(saga, invocation.prepaid_gas - config_.gas_for_transfer_call);
        guard.commit();
        return dp::Result<host::SettlementChain, dp::Error>::ok(std::move(chain));
    }

    dp::Result<void, dp::Error> AsyncTransferProtocol::markNotified(dp::u64 saga_id) {
        auto saga = state_.sagaOf(saga_id);
        if (!saga.has_value()) {
            if (wasSettled(saga_id))
                return dp::Result<void, dp::Error>::err(invalid_argument("Settlement is not awaiting notification"));
            return dp::Result<void, dp::Error>::err(not_found("Unknown settlement"));
        }
        if (saga->state != SagaState::Started) {
            return dp::Result<void, dp::Error>::err(invalid_argument("Settlement is not awaiting notification"));
        }
        saga->state = SagaState::Notified;
        state_.putSaga(*saga);
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<SettlementReport, dp::Error> AsyncTransferProtocol::resolveTransfer(const host::Invocation &invocation,
                                                                                  dp::u64 saga_id,
                                                                                  const PromiseResult &outcome) {
        if (invocation.predecessor != config_.account_id) {
            return dp::Result<SettlementReport, dp::Error>::err(unauthorized("Method resolve_transfer is private"));
        }

        auto saga = state_.sagaOf(saga_id);
        if (!saga.has_value()) {
            if (wasSettled(saga_id))
                return dp::Result<SettlementReport, dp::Error>::err(invalid_argument("Settlement already resolved"));
            return dp::Result<SettlementReport, dp::Error>::err(not_found("Unknown settlement"));
        }
        if (isTerminal(saga->state)) {
            return dp::Result<SettlementReport, dp::Error>::err(invalid_argument("Settlement already resolved"));
        }

        const size_t count = saga->token_ids.size();
        std::vector<Balance> unused(count, 0);
        bool aborted = false;
        if (!outcome.isSuccessful()) {
            unused = saga->amounts;
            aborted = true;
        } else if (auto reported = parseUnusedAmounts(outcome.payload, count)) {
            for (size_t i = 0; i < count; ++i)
                unused[i] = balance::min((*reported)[i], saga->amounts[i]);
        }
        // A malformed or missing reply leaves `unused` at zero: the receiver keeps everything

        ledger::StateGuard guard(state_);
        size_t event_mark = events_.pendingMark();

        SettlementReport report;
        report.saga_id = saga_id;
        report.state = aborted ? SagaState::Aborted : SagaState::Resolved;

        for (size_t i = 0; i < count; ++i) {
            const auto &token_id = saga->token_ids[i];
            const auto &previous_owner = saga->previous_owners[i];
            const Balance amount = saga->amounts[i];

            if (unused[i] == 0) {
                report.settled.push_back(amount);
                continue;
            }

            Balance held = state_.balanceOf(token_id, saga->receiver).value_or(0);
            Balance refund = balance::min(held, unused[i]);
            accumulate(report.shortfall, unused[i] - refund);
            if (refund == 0) {
                report.settled.push_back(amount);
                continue;
            }

            auto withdrawn = ledger_.withdraw(token_id, saga->receiver, refund);
            if (!withdrawn.is_ok()) {
                events_.discardFrom(event_mark);
                return dp::Result<SettlementReport, dp::Error>::err(withdrawn.error());
            }

            ledger::LedgerEvent event;
            event.token_id = token_id;
            event.amount = refund;
            event.old_owner_id = saga->receiver;

            if (ledger_.isRegistered(token_id, previous_owner)) {
                auto deposited = ledger_.deposit(token_id, previous_owner, refund);
                if (!deposited.is_ok()) {
                    events_.discardFrom(event_mark);
                    return dp::Result<SettlementReport, dp::Error>::err(deposited.error());
                }
                event.kind = ledger::EventKind::Transfer;
                event.new_owner_id = previous_owner;
                event.memo = std::string("refund");
                accumulate(report.refunded, refund);
                report.settled.push_back(amount - refund);
            } else {
                // The refund has nowhere to go; it leaves the tracked supply with the withdraw above
                std::cout << "Burned " << balance::toString(refund) << " of token " << token_id << ": "
                          << previous_owner << " is no longer registered" << std::endl;
                event.kind = ledger::EventKind::Burn;
                accumulate(report.burned, refund);
                report.settled.push_back(amount);
            }
            events_.emit(event);
        }

        saga->state = report.state;
        saga->settled = report.settled;
        state_.putSaga(*saga);

        guard.commit();
        return dp::Result<SettlementReport, dp::Error>::ok(std::move(report));
    }

    bool AsyncTransferProtocol::wasSettled(dp::u64 saga_id) const {
        // Ids are allocated in order and only settled sagas leave memory
        return saga_id != 0 && saga_id <= state_.lastSagaId();
    }

    host::SettlementChain AsyncTransferProtocol::chainFor(const SagaRecord &saga, dp::u64 notify_gas) const {
        host::SettlementChain chain;
        chain.saga_id = saga.id;
        chain.notification.sender = saga.sender;
        chain.notification.receiver = saga.receiver;
        chain.notification.previous_owners = saga.previous_owners;
        chain.notification.token_ids = saga.token_ids;
        chain.notification.amounts = saga.amounts;
        chain.notification.message = saga.message;
        chain.notify_gas = notify_gas;
        chain.resolve_gas = config_.gas_for_resolve_transfer;
        return chain;
    }

} // namespace multitoken::settlement
