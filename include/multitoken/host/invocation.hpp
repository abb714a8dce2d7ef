#pragma once

#include <multitoken/common/types.hpp>

namespace multitoken::host {

    /// Caller context of one run-to-completion invocation
    struct Invocation {
        AccountId predecessor;
        Balance attached_deposit{0};
        dp::u64 prepaid_gas{0};

        Invocation() = default;
        Invocation(AccountId caller, Balance deposit = 0, dp::u64 gas = 0)
            : predecessor(std::move(caller)), attached_deposit(deposit), prepaid_gas(gas) {}
    };

} // namespace multitoken::host
