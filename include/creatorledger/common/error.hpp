#pragma once

#include <datapod/datapod.hpp>

namespace creatorledger {

    // ===========================================
    // Ledger error codes (200+)
    // ===========================================

    constexpr dp::u32 ERR_ALREADY_REGISTERED = 200;
    constexpr dp::u32 ERR_NOT_A_CREATOR = 201;
    constexpr dp::u32 ERR_SUBSCRIPTIONS_NOT_ENABLED = 202;
    constexpr dp::u32 ERR_TIPPING_NOT_ENABLED = 203;
    constexpr dp::u32 ERR_INVALID_AMOUNT = 204;
    constexpr dp::u32 ERR_ALREADY_ENGAGED = 205;
    constexpr dp::u32 ERR_NOT_SUBSCRIBED = 206;
    constexpr dp::u32 ERR_NOT_FOUND = 207;
    constexpr dp::u32 ERR_FEE_TOO_HIGH = 208;
    constexpr dp::u32 ERR_PAYMENT_FAILED = 209;
    constexpr dp::u32 ERR_INVALID_PROFILE = 210;
    constexpr dp::u32 ERR_INVALID_CALLER = 211;
    constexpr dp::u32 ERR_INVALID_CONFIG = 212;
    constexpr dp::u32 ERR_OVERFLOW = 213;
    constexpr dp::u32 ERR_NOT_INITIALIZED = 214;
    constexpr dp::u32 ERR_ALREADY_INITIALIZED = 215;
    constexpr dp::u32 ERR_STORAGE_FAILED = 216;

    // ===========================================
    // Error factory functions
    // ===========================================

    inline dp::Error already_registered(const dp::String &msg = "Creator already registered") {
        return dp::Error{ERR_ALREADY_REGISTERED, msg};
    }

    inline dp::Error not_a_creator(const dp::String &msg = "Address is not a registered creator") {
        return dp::Error{ERR_NOT_A_CREATOR, msg};
    }

    inline dp::Error subscriptions_not_enabled(const dp::String &msg = "Creator has no subscription fee set") {
        return dp::Error{ERR_SUBSCRIPTIONS_NOT_ENABLED, msg};
    }

    inline dp::Error tipping_not_enabled(const dp::String &msg = "Tipping is disabled for this content") {
        return dp::Error{ERR_TIPPING_NOT_ENABLED, msg};
    }

    inline dp::Error invalid_amount(const dp::String &msg = "Amount must be greater than zero") {
        return dp::Error{ERR_INVALID_AMOUNT, msg};
    }

    inline dp::Error already_engaged(const dp::String &msg = "Already engaged with this content") {
        return dp::Error{ERR_ALREADY_ENGAGED, msg};
    }

    inline dp::Error not_subscribed(const dp::String &msg = "Active subscription required") {
        return dp::Error{ERR_NOT_SUBSCRIBED, msg};
    }

    inline dp::Error not_found(const dp::String &msg = "Record not found") { return dp::Error{ERR_NOT_FOUND, msg}; }

    inline dp::Error fee_too_high(const dp::String &msg = "Platform fee exceeds 1000 basis points") {
        return dp::Error{ERR_FEE_TOO_HIGH, msg};
    }

    inline dp::Error payment_failed(const dp::String &msg = "Payment transfer failed") {
        return dp::Error{ERR_PAYMENT_FAILED, msg};
    }

    inline dp::Error invalid_profile(const dp::String &msg = "Profile data must not be empty") {
        return dp::Error{ERR_INVALID_PROFILE, msg};
    }

    inline dp::Error invalid_caller(const dp::String &msg = "Caller address is empty") {
        return dp::Error{ERR_INVALID_CALLER, msg};
    }

    inline dp::Error invalid_config(const dp::String &msg = "Invalid platform configuration") {
        return dp::Error{ERR_INVALID_CONFIG, msg};
    }

    inline dp::Error overflow(const dp::String &msg = "Arithmetic overflow") { return dp::Error{ERR_OVERFLOW, msg}; }

    inline dp::Error not_initialized(const dp::String &msg = "Ledger not initialized") {
        return dp::Error{ERR_NOT_INITIALIZED, msg};
    }

    inline dp::Error already_initialized(const dp::String &msg = "Ledger already initialized") {
        return dp::Error{ERR_ALREADY_INITIALIZED, msg};
    }

    inline dp::Error storage_failed(const dp::String &msg = "Storage operation failed") {
        return dp::Error{ERR_STORAGE_FAILED, msg};
    }

} // namespace creatorledger
