#pragma once

#include "error.hpp"

#include <boost/multiprecision/cpp_int.hpp>
#include <cctype>
#include <datapod/datapod.hpp>
#include <string>
#include <utility>

namespace creatorledger {

    /// Caller / account identifier supplied by the runtime
    using Address = std::string;

    /// Dense content identifier, assigned from 0 in call order
    using ContentId = dp::u64;

    /// Seconds on the runtime clock
    using Timestamp = dp::u64;

    /// Token amounts and aggregate totals. 256-bit, throws on overflow/underflow.
    using Amount = boost::multiprecision::checked_uint256_t;

    constexpr dp::u32 BPS_DENOMINATOR = 10000;
    constexpr dp::u32 MAX_PLATFORM_FEE_BPS = 1000;
    constexpr Timestamp DEFAULT_SUBSCRIPTION_PERIOD = 30ULL * 24 * 60 * 60;

    /// Per-call input supplied by the ledger runtime
    struct CallContext {
        Address caller;
        Timestamp now{0};

        CallContext() = default;
        CallContext(Address who, Timestamp at) : caller(std::move(who)), now(at) {}
    };

    /// Decimal representation of an amount
    inline std::string amountToString(const Amount &amount) { return amount.str(); }

    /// Parse a base-10 amount. Rejects signs, hex prefixes and values above 2^256-1.
    inline dp::Result<Amount, dp::Error> parseAmount(const std::string &text) {
        if (text.empty()) {
            return dp::Result<Amount, dp::Error>::err(invalid_amount("Empty amount"));
        }
        for (char c : text) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                auto msg = "Not a decimal amount: " + text;
                return dp::Result<Amount, dp::Error>::err(invalid_amount(dp::String(msg.c_str())));
            }
        }
        try {
            return dp::Result<Amount, dp::Error>::ok(Amount(text));
        } catch (const std::exception &e) {
            return dp::Result<Amount, dp::Error>::err(overflow(dp::String(e.what())));
        }
    }

    /// Split a payment into {creator share, platform cut}. The cut is floor(amount * bps / 10000).
    inline std::pair<Amount, Amount> splitPlatformFee(const Amount &amount, dp::u32 fee_bps) {
        // amount * bps can exceed 256 bits, so split the multiplication
        Amount whole = amount / BPS_DENOMINATOR;
        Amount rest = amount % BPS_DENOMINATOR;
        Amount cut = whole * fee_bps + (rest * fee_bps) / BPS_DENOMINATOR;
        Amount share = amount - cut;
        return {share, cut};
    }

} // namespace creatorledger
