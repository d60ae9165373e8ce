#pragma once

#include <creatorledger/common/error.hpp>
#include <creatorledger/common/types.hpp>
#include <sstream>
#include <string>

namespace creatorledger::ledger {

    /// Platform configuration, fixed once at ledger initialization
    struct PlatformConfig {
        std::string payment_token;                                   // Token handed to the payment collaborator
        Address treasury;                                            // Receives the platform cut
        dp::u32 platform_fee_bps = 0;                                // 0..1000 (at most 10%)
        Timestamp subscription_period = DEFAULT_SUBSCRIPTION_PERIOD; // Seconds
        bool verbose = false;                                        // Log committed operations to stdout

        /// Check invariants. Fee above 1000 bps fails with ERR_FEE_TOO_HIGH.
        inline dp::Result<void, dp::Error> validate() const {
            if (platform_fee_bps > MAX_PLATFORM_FEE_BPS) {
                return dp::Result<void, dp::Error>::err(fee_too_high());
            }
            if (subscription_period == 0) {
                return dp::Result<void, dp::Error>::err(invalid_config("Subscription period must be positive"));
            }
            if (platform_fee_bps > 0 && treasury.empty()) {
                return dp::Result<void, dp::Error>::err(invalid_config("Treasury required when a platform fee is set"));
            }
            return dp::Result<void, dp::Error>::ok();
        }

        inline bool operator==(const PlatformConfig &other) const {
            return payment_token == other.payment_token && treasury == other.treasury &&
                   platform_fee_bps == other.platform_fee_bps && subscription_period == other.subscription_period &&
                   verbose == other.verbose;
        }

        inline std::string toString() const {
            std::stringstream ss;
            ss << "token=" << payment_token << " treasury=" << treasury << " fee_bps=" << platform_fee_bps
               << " subscription_period=" << subscription_period << "s";
            return ss.str();
        }
    };

} // namespace creatorledger::ledger
