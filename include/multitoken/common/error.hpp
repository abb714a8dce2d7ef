#pragma once

#include <datapod/datapod.hpp>

namespace multitoken {

    // ===========================================
    // Multitoken-specific error codes (200+)
    // ===========================================

    constexpr dp::u32 ERR_INVALID_ARGUMENT = 200;
    constexpr dp::u32 ERR_NOT_FOUND = 201;
    constexpr dp::u32 ERR_NOT_REGISTERED = 202;
    constexpr dp::u32 ERR_ALREADY_REGISTERED = 203;
    constexpr dp::u32 ERR_UNAUTHORIZED = 204;
    constexpr dp::u32 ERR_APPROVAL_MISMATCH = 205;
    constexpr dp::u32 ERR_OVERFLOW = 206;
    constexpr dp::u32 ERR_UNDERFLOW = 207;
    constexpr dp::u32 ERR_INSUFFICIENT_BALANCE = 208;
    constexpr dp::u32 ERR_PRECHECK_FAILED = 209;
    constexpr dp::u32 ERR_ID_SPACE_EXHAUSTED = 210;
    constexpr dp::u32 ERR_INVALID_METADATA = 211;
    constexpr dp::u32 ERR_STORAGE = 212;

    // ===========================================
    // Error factory functions
    // ===========================================

    inline dp::Error invalid_argument(const dp::String &msg = "Invalid argument") {
        return dp::Error{ERR_INVALID_ARGUMENT, msg};
    }

    inline dp::Error not_found(const dp::String &msg = "Token not found") { return dp::Error{ERR_NOT_FOUND, msg}; }

    inline dp::Error not_registered(const dp::String &msg = "Account is not registered") {
        return dp::Error{ERR_NOT_REGISTERED, msg};
    }

    inline dp::Error already_registered(const dp::String &msg = "Account is already registered") {
        return dp::Error{ERR_ALREADY_REGISTERED, msg};
    }

    inline dp::Error unauthorized(const dp::String &msg = "Sender not approved") {
        return dp::Error{ERR_UNAUTHORIZED, msg};
    }

    inline dp::Error approval_mismatch(const dp::String &msg = "The actual approval_id is different from given") {
        return dp::Error{ERR_APPROVAL_MISMATCH, msg};
    }

    inline dp::Error overflow(const dp::String &msg = "Balance overflow") { return dp::Error{ERR_OVERFLOW, msg}; }

    inline dp::Error underflow(const dp::String &msg = "Total supply underflow") {
        return dp::Error{ERR_UNDERFLOW, msg};
    }

    inline dp::Error insufficient_balance(const dp::String &msg = "The account doesn't have enough balance") {
        return dp::Error{ERR_INSUFFICIENT_BALANCE, msg};
    }

    inline dp::Error precheck_failed(const dp::String &msg = "Precondition failed") {
        return dp::Error{ERR_PRECHECK_FAILED, msg};
    }

    inline dp::Error id_space_exhausted(const dp::String &msg = "u64 overflow, cannot mint any more tokens") {
        return dp::Error{ERR_ID_SPACE_EXHAUSTED, msg};
    }

    inline dp::Error invalid_metadata(const dp::String &msg = "Invalid token metadata") {
        return dp::Error{ERR_INVALID_METADATA, msg};
    }

    inline dp::Error storage_error(const dp::String &msg = "Storage failure") { return dp::Error{ERR_STORAGE, msg}; }

} // namespace multitoken
