#pragma once

#include "types.hpp"

namespace multitoken {

    /// Tera-gas unit
    constexpr dp::u64 TGAS = 1000000000000ULL;

    /// Optional ledger extensions, fixed when the ledger is constructed
    struct Extensions {
        bool metadata = true;  // every token carries TokenMetadata
        bool approvals = true; // non-owners may transfer through approvals
    };

    /// Ledger configuration
    struct MultiTokenConfig {
        // Identity
        AccountId account_id = "multitoken.ledger"; // the ledger's own identity (resolution caller)
        AccountId owner_id = "multitoken.owner";    // only this account may mint

        Extensions extensions{};

        // Anti-griefing deposit required on every transfer-mutating call
        Balance required_deposit = 1;

        // Gas reserved for the resolution continuation
        dp::u64 gas_for_resolve_transfer = 5 * TGAS;
        // Gas kept by transferCall itself (includes the resolution reserve). A call must attach
        // more than this plus gas_for_resolve_transfer.
        dp::u64 gas_for_transfer_call = 25 * TGAS + 5 * TGAS;

        // Fixed storage overhead charged per minted token
        dp::u64 extra_storage_in_bytes_per_emission = 0;
    };

} // namespace multitoken
