#pragma once

#include <multitoken/common/error.hpp>
#include <multitoken/ledger/ledger_state.hpp>

namespace multitoken::ledger {

    /// Per-(token, owner) balances with checked arithmetic.
    ///
    /// The tracked supply of a token moves with every deposit and withdraw, so
    /// it always equals the sum of the registered balances.
    class BalanceLedger {
      public:
        explicit BalanceLedger(LedgerState &state) : state_(state) {}

        /// Balance of a registered account; NotFound for unknown tokens, NotRegistered for absent entries
        dp::Result<Balance, dp::Error> balanceOf(const TokenId &token_id, const AccountId &account_id) const;

        bool isRegistered(const TokenId &token_id, const AccountId &account_id) const;

        /// Adds to the balance and to the token supply; Overflow if either would wrap
        dp::Result<void, dp::Error> deposit(const TokenId &token_id, const AccountId &account_id, Balance amount);

        /// Subtracts from the balance and from the token supply
        dp::Result<void, dp::Error> withdraw(const TokenId &token_id, const AccountId &account_id, Balance amount);

        /// Creates a zero balance entry
        dp::Result<void, dp::Error> registerAccount(const TokenId &token_id, const AccountId &account_id);

        /// Tracked supply counter of a token
        dp::Result<Balance, dp::Error> supplyOf(const TokenId &token_id) const;

        /// Recomputes the sum of all registered balances of a token
        dp::Result<Balance, dp::Error> sumOfBalances(const TokenId &token_id) const;

      private:
        LedgerState &state_;
    };

} // namespace multitoken::ledger
