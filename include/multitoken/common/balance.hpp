#pragma once

#include <datapod/datapod.hpp>
#include <limits>
#include <string>

#include "error.hpp"

namespace multitoken {

    /// Unsigned 128-bit token amount
    __extension__ typedef unsigned __int128 Balance;

    constexpr Balance BALANCE_MAX = ~static_cast<Balance>(0);

    namespace balance {

        /// a + b, false if the sum does not fit
        inline bool checkedAdd(Balance a, Balance b, Balance &out) {
            if (a > BALANCE_MAX - b)
                return false;
            out = a + b;
            return true;
        }

        /// a - b, false if b > a
        inline bool checkedSub(Balance a, Balance b, Balance &out) {
            if (b > a)
                return false;
            out = a - b;
            return true;
        }

        inline Balance min(Balance a, Balance b) { return a < b ? a : b; }

        inline dp::u64 high(Balance value) { return static_cast<dp::u64>(value >> 64); }

        inline dp::u64 low(Balance value) { return static_cast<dp::u64>(value); }

        inline Balance fromParts(dp::u64 high, dp::u64 low) { return (static_cast<Balance>(high) << 64) | low; }

        /// Decimal rendering (amounts are exchanged as decimal strings)
        inline std::string toString(Balance value) {
            if (value == 0)
                return "0";
            std::string digits;
            while (value > 0) {
                digits.insert(digits.begin(), static_cast<char>('0' + static_cast<int>(value % 10)));
                value /= 10;
            }
            return digits;
        }

        /// Parse a non-negative decimal integer, rejecting anything above BALANCE_MAX
        inline dp::Result<Balance, dp::Error> parse(const std::string &text) {
            if (text.empty() || text.size() > 39) {
                return dp::Result<Balance, dp::Error>::err(invalid_argument("Malformed amount"));
            }
            Balance value = 0;
            for (char c : text) {
                if (c < '0' || c > '9') {
                    return dp::Result<Balance, dp::Error>::err(invalid_argument("Malformed amount"));
                }
                Balance digit = static_cast<Balance>(c - '0');
                if (value > (BALANCE_MAX - digit) / 10) {
                    return dp::Result<Balance, dp::Error>::err(overflow("Amount exceeds 128 bits"));
                }
                value = value * 10 + digit;
            }
            return dp::Result<Balance, dp::Error>::ok(value);
        }

    } // namespace balance

} // namespace multitoken
