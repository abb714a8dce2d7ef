#include <multitoken/ledger/balance_ledger.hpp>

namespace multitoken::ledger {

    dp::Result<Balance, dp::Error> BalanceLedger::balanceOf(const TokenId &token_id,
                                                            const AccountId &account_id) const {
        if (!state_.hasToken(token_id)) {
            return dp::Result<Balance, dp::Error>::err(not_found("This token does not exist"));
        }
        auto balance = state_.balanceOf(token_id, account_id);
        if (!balance.has_value()) {
            std::string msg = "The account " + account_id + " is not registered";
            return dp::Result<Balance, dp::Error>::err(not_registered(dp::String(msg.c_str())));
        }
        return dp::Result<Balance, dp::Error>::ok(*balance);
    }

    bool BalanceLedger::isRegistered(const TokenId &token_id, const AccountId &account_id) const {
        return state_.balanceOf(token_id, account_id).has_value();
    }

    dp::Result<void, dp::Error> BalanceLedger::deposit(const TokenId &token_id, const AccountId &account_id,
                                                       Balance amount) {
        auto balance_result = balanceOf(token_id, account_id);
        if (!balance_result.is_ok()) {
            return dp::Result<void, dp::Error>::err(balance_result.error());
        }

        Balance new_balance = 0;
        if (!balance::checkedAdd(balance_result.value(), amount, new_balance)) {
            return dp::Result<void, dp::Error>::err(overflow("Balance overflow"));
        }

        Balance new_supply = 0;
        if (!balance::checkedAdd(state_.supplyOf(token_id).value_or(0), amount, new_supply)) {
            return dp::Result<void, dp::Error>::err(overflow("Total supply overflow"));
        }

        state_.setBalance(token_id, account_id, new_balance);
        state_.setSupply(token_id, new_supply);
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> BalanceLedger::withdraw(const TokenId &token_id, const AccountId &account_id,
                                                        Balance amount) {
        auto balance_result = balanceOf(token_id, account_id);
        if (!balance_result.is_ok()) {
            return dp::Result<void, dp::Error>::err(balance_result.error());
        }

        Balance new_balance = 0;
        if (!balance::checkedSub(balance_result.value(), amount, new_balance)) {
            return dp::Result<void, dp::Error>::err(insufficient_balance());
        }

        // Unreachable while supply == sum of balances
        Balance new_supply = 0;
        if (!balance::checkedSub(state_.supplyOf(token_id).value_or(0), amount, new_supply)) {
            return dp::Result<void, dp::Error>::err(underflow("Total supply underflow"));
        }

        state_.setBalance(token_id, account_id, new_balance);
        state_.setSupply(token_id, new_supply);
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> BalanceLedger::registerAccount(const TokenId &token_id,
                                                               const AccountId &account_id) {
        if (!state_.hasToken(token_id)) {
            return dp::Result<void, dp::Error>::err(not_found("This token does not exist"));
        }
        if (state_.balanceOf(token_id, account_id).has_value()) {
            return dp::Result<void, dp::Error>::err(already_registered("The account is already registered"));
        }
        state_.setBalance(token_id, account_id, 0);
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<Balance, dp::Error> BalanceLedger::supplyOf(const TokenId &token_id) const {
        auto supply = state_.supplyOf(token_id);
        if (!supply.has_value()) {
            return dp::Result<Balance, dp::Error>::err(not_found("This token does not exist"));
        }
        return dp::Result<Balance, dp::Error>::ok(*supply);
    }

    dp::Result<Balance, dp::Error> BalanceLedger::sumOfBalances(const TokenId &token_id) const {
        if (!state_.hasToken(token_id)) {
            return dp::Result<Balance, dp::Error>::err(not_found("This token does not exist"));
        }
        Balance total = 0;
        for (const auto &[account_id, amount] : state_.balancesOf(token_id)) {
            if (!balance::checkedAdd(total, amount, total)) {
                return dp::Result<Balance, dp::Error>::err(overflow("Sum of balances overflow"));
            }
        }
        return dp::Result<Balance, dp::Error>::ok(total);
    }

} // namespace multitoken::ledger
