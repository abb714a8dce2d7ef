#pragma once

#include <deque>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>

#include <multitoken/common/error.hpp>
#include <multitoken/host/invocation.hpp>
#include <multitoken/settlement/notification.hpp>
#include <multitoken/settlement/saga.hpp>

namespace multitoken::host {

    /// Notification call plus the resolution continuation that must follow it
    struct SettlementChain {
        dp::u64 saga_id{0};
        settlement::TransferNotification notification;
        dp::u64 notify_gas{0};
        dp::u64 resolve_gas{0};
    };

    /// Asynchronous call scheduler collaborator
    class CallScheduler {
      public:
        virtual ~CallScheduler() = default;

        virtual void schedule(SettlementChain chain) = 0;
    };

    /// The ledger side of a settlement chain, as seen by a scheduler
    class SettlementSink {
      public:
        virtual ~SettlementSink() = default;

        /// Identity the resolution continuation runs as
        virtual const AccountId &ledgerId() const = 0;

        virtual dp::Result<void, dp::Error> notificationDispatched(dp::u64 saga_id) = 0;

        virtual dp::Result<settlement::SettlementReport, dp::Error>
        resolveTransfer(const Invocation &invocation, dp::u64 saga_id, const settlement::PromiseResult &outcome) = 0;
    };

    // ===========================================
    // LocalScheduler - in-process FIFO scheduler
    // ===========================================

    /// Runs settlement chains in order when asked to. Receivers are looked up by
    /// account id; a missing or throwing receiver yields a failed promise. A chain
    /// whose saga cannot be marked notified is dropped undelivered.
    class LocalScheduler : public CallScheduler {
      public:
        LocalScheduler() = default;

        inline void attach(SettlementSink &sink) { sink_ = &sink; }

        inline void registerReceiver(const AccountId &account_id, std::shared_ptr<settlement::TokenReceiver> receiver) {
            receivers_[account_id] = std::move(receiver);
        }

        inline void schedule(SettlementChain chain) override { queued_.push_back(std::move(chain)); }

        inline size_t queued() const { return queued_.size(); }
        inline size_t awaitingResolution() const { return delivered_.size(); }

        /// Delivers every queued notification without resolving
        inline size_t deliverPending() {
            size_t count = 0;
            while (!queued_.empty()) {
                auto chain = std::move(queued_.front());
                queued_.pop_front();
                auto outcome = deliver(chain);
                if (!outcome.has_value())
                    continue;
                delivered_.emplace_back(std::move(chain), std::move(*outcome));
                ++count;
            }
            return count;
        }

        /// Runs the resolution continuation of every delivered notification
        inline size_t resolveDelivered() {
            size_t count = 0;
            while (!delivered_.empty()) {
                auto [chain, outcome] = std::move(delivered_.front());
                delivered_.pop_front();
                resolve(chain, outcome);
                ++count;
            }
            return count;
        }

        /// Runs chains one at a time, notification then resolution, until none are left
        inline size_t runPending() {
            size_t count = resolveDelivered();
            while (!queued_.empty()) {
                auto chain = std::move(queued_.front());
                queued_.pop_front();
                auto outcome = deliver(chain);
                if (!outcome.has_value())
                    continue;
                resolve(chain, *outcome);
                ++count;
            }
            return count;
        }

        inline const std::vector<settlement::SettlementReport> &reports() const { return reports_; }
        inline const std::vector<dp::Error> &failures() const { return failures_; }

      private:
        inline std::optional<settlement::PromiseResult> deliver(const SettlementChain &chain) {
            if (sink_ == nullptr) {
                failures_.push_back(invalid_argument("No ledger attached to scheduler"));
                return std::nullopt;
            }
            auto dispatched = sink_->notificationDispatched(chain.saga_id);
            if (!dispatched.is_ok()) {
                std::cout << "Dropping chain of saga " << chain.saga_id << ": "
                          << dispatched.error().message.c_str() << std::endl;
                failures_.push_back(dispatched.error());
                return std::nullopt;
            }

            auto it = receivers_.find(chain.notification.receiver);
            if (it == receivers_.end() || !it->second) {
                std::cout << "No receiver registered for " << chain.notification.receiver << std::endl;
                return settlement::PromiseResult::failed();
            }

            try {
                return settlement::PromiseResult::successful(it->second->onTransfer(chain.notification));
            } catch (const std::exception &e) {
                std::cout << "Receiver " << chain.notification.receiver << " failed: " << e.what() << std::endl;
                return settlement::PromiseResult::failed();
            }
        }

        inline void resolve(const SettlementChain &chain, const settlement::PromiseResult &outcome) {
            if (sink_ == nullptr) {
                failures_.push_back(invalid_argument("No ledger attached to scheduler"));
                return;
            }
            Invocation invocation(sink_->ledgerId(), 0, chain.resolve_gas);
            auto report = sink_->resolveTransfer(invocation, chain.saga_id, outcome);
            if (report.is_ok()) {
                reports_.push_back(report.value());
            } else {
                std::cout << "Resolution of saga " << chain.saga_id
                          << " failed: " << report.error().message.c_str() << std::endl;
                failures_.push_back(report.error());
            }
        }

        SettlementSink *sink_ = nullptr;
        std::map<AccountId, std::shared_ptr<settlement::TokenReceiver>> receivers_;
        std::deque<SettlementChain> queued_;
        std::deque<std::pair<SettlementChain, settlement::PromiseResult>> delivered_;
        std::vector<settlement::SettlementReport> reports_;
        std::vector<dp::Error> failures_;
    };

} // namespace multitoken::host
