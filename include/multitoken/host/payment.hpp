#pragma once

#include <iostream>
#include <vector>

#include <multitoken/common/error.hpp>
#include <multitoken/common/types.hpp>

namespace multitoken::host {

    /// Native funds owed to an account once an invocation commits
    struct Refund {
        AccountId recipient;
        Balance amount{0};
    };

    /// Payment collaborator charging storage against an attached deposit
    class PaymentGateway {
      public:
        virtual ~PaymentGateway() = default;

        /// Charges `storage_bytes` against `attached_deposit` and returns the excess owed back.
        /// Moves no funds; PrecheckFailed when the deposit does not cover the storage.
        virtual dp::Result<Balance, dp::Error> storageRefund(dp::u64 storage_bytes, Balance attached_deposit) const = 0;

        /// Sends native funds to `recipient`
        virtual dp::Result<void, dp::Error> payout(const Refund &refund) = 0;
    };

    /// In-process gateway that records refunds instead of moving native funds
    class LocalPaymentGateway : public PaymentGateway {
      public:
        // 10^19 per byte
        static constexpr Balance DEFAULT_BYTE_COST = static_cast<Balance>(10000000000000000000ULL);

        inline explicit LocalPaymentGateway(Balance byte_cost = DEFAULT_BYTE_COST) : byte_cost_(byte_cost) {}

        inline dp::Result<Balance, dp::Error> storageRefund(dp::u64 storage_bytes,
                                                            Balance attached_deposit) const override {
            Balance bytes = static_cast<Balance>(storage_bytes);
            if (bytes != 0 && byte_cost_ > BALANCE_MAX / bytes) {
                return dp::Result<Balance, dp::Error>::err(overflow("Storage cost overflow"));
            }
            Balance required = bytes * byte_cost_;
            if (attached_deposit < required) {
                std::string msg = "Must attach " + balance::toString(required) + " to cover storage";
                return dp::Result<Balance, dp::Error>::err(precheck_failed(dp::String(msg.c_str())));
            }

            Balance excess = attached_deposit - required;
            return dp::Result<Balance, dp::Error>::ok(excess > 1 ? excess : 0);
        }

        inline dp::Result<void, dp::Error> payout(const Refund &refund) override {
            refunds_.push_back(refund);
            std::cout << "Refunded " << balance::toString(refund.amount) << " storage deposit to " << refund.recipient
                      << std::endl;
            return dp::Result<void, dp::Error>::ok();
        }

        inline Balance byteCost() const { return byte_cost_; }
        inline const std::vector<Refund> &refunds() const { return refunds_; }

      private:
        Balance byte_cost_;
        std::vector<Refund> refunds_;
    };

} // namespace multitoken::host
