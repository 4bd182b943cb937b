#pragma once

#include <datapod/datapod.hpp>

namespace escrowit {

    // ===========================================
    // Escrowit error codes (100+)
    // ===========================================

    // Validation
    constexpr dp::u32 ERR_INVALID_AMOUNT = 100;
    constexpr dp::u32 ERR_INVALID_PERCENTAGE = 101;
    constexpr dp::u32 ERR_EMPTY_STRING = 102;
    constexpr dp::u32 ERR_ZERO_VALUE = 103;
    constexpr dp::u32 ERR_INVALID_RATING = 104;
    constexpr dp::u32 ERR_INVALID_DEADLINE = 105;
    constexpr dp::u32 ERR_INVALID_ADDRESS = 106;

    // Authorization
    constexpr dp::u32 ERR_UNAUTHORIZED_ACCESS = 120;

    // State
    constexpr dp::u32 ERR_DONATION_NOT_ACTIVE = 140;
    constexpr dp::u32 ERR_DEADLINE_PASSED = 141;
    constexpr dp::u32 ERR_ALREADY_RATED = 142;
    constexpr dp::u32 ERR_ALREADY_DISTRIBUTED = 143;
    constexpr dp::u32 ERR_DONATION_NOT_FOUND = 144;
    constexpr dp::u32 ERR_PAUSED = 145;
    constexpr dp::u32 ERR_NOT_PAUSED = 146;
    constexpr dp::u32 ERR_REENTRANT_CALL = 147;

    // Resource
    constexpr dp::u32 ERR_INSUFFICIENT_FUNDS = 160;
    constexpr dp::u32 ERR_TRANSFER_FAILED = 161;
    constexpr dp::u32 ERR_AMOUNT_OVERFLOW = 162;

    // Storage
    constexpr dp::u32 ERR_STORE_NOT_OPEN = 180;
    constexpr dp::u32 ERR_STORAGE_FAILED = 181;

    // ===========================================
    // Error factory functions
    // ===========================================

    inline dp::Error invalid_amount(const dp::String &msg = "Invalid amount") {
        return dp::Error{ERR_INVALID_AMOUNT, msg};
    }

    inline dp::Error invalid_percentage(const dp::String &msg = "Equity percentage out of range") {
        return dp::Error{ERR_INVALID_PERCENTAGE, msg};
    }

    inline dp::Error empty_string(const dp::String &msg = "String must not be empty") {
        return dp::Error{ERR_EMPTY_STRING, msg};
    }

    inline dp::Error zero_value(const dp::String &msg = "Value must be greater than zero") {
        return dp::Error{ERR_ZERO_VALUE, msg};
    }

    inline dp::Error invalid_rating(const dp::String &msg = "Rating must be between 1 and 5") {
        return dp::Error{ERR_INVALID_RATING, msg};
    }

    inline dp::Error invalid_deadline(const dp::String &msg = "Invalid deadline") {
        return dp::Error{ERR_INVALID_DEADLINE, msg};
    }

    inline dp::Error invalid_address(const dp::String &msg = "Invalid address") {
        return dp::Error{ERR_INVALID_ADDRESS, msg};
    }

    inline dp::Error unauthorized_access(const dp::String &msg = "Unauthorized access") {
        return dp::Error{ERR_UNAUTHORIZED_ACCESS, msg};
    }

    inline dp::Error donation_not_active(const dp::String &msg = "Donation is not active") {
        return dp::Error{ERR_DONATION_NOT_ACTIVE, msg};
    }

    inline dp::Error deadline_passed(const dp::String &msg = "Funding deadline has passed") {
        return dp::Error{ERR_DEADLINE_PASSED, msg};
    }

    inline dp::Error already_rated(const dp::String &msg = "Already rated") {
        return dp::Error{ERR_ALREADY_RATED, msg};
    }

    inline dp::Error already_distributed(const dp::String &msg = "Donation already distributed") {
        return dp::Error{ERR_ALREADY_DISTRIBUTED, msg};
    }

    inline dp::Error donation_not_found(const dp::String &msg = "Donation not found") {
        return dp::Error{ERR_DONATION_NOT_FOUND, msg};
    }

    inline dp::Error paused(const dp::String &msg = "Ledger is paused") { return dp::Error{ERR_PAUSED, msg}; }

    inline dp::Error not_paused(const dp::String &msg = "Ledger is not paused") {
        return dp::Error{ERR_NOT_PAUSED, msg};
    }

    inline dp::Error reentrant_call(const dp::String &msg = "Reentrant call") {
        return dp::Error{ERR_REENTRANT_CALL, msg};
    }

    inline dp::Error insufficient_funds(const dp::String &msg = "Insufficient funds in escrow") {
        return dp::Error{ERR_INSUFFICIENT_FUNDS, msg};
    }

    inline dp::Error transfer_failed(const dp::String &msg = "Transfer failed") {
        return dp::Error{ERR_TRANSFER_FAILED, msg};
    }

    inline dp::Error amount_overflow(const dp::String &msg = "Amount overflow") {
        return dp::Error{ERR_AMOUNT_OVERFLOW, msg};
    }

    inline dp::Error store_not_open(const dp::String &msg = "Store not open") {
        return dp::Error{ERR_STORE_NOT_OPEN, msg};
    }

    inline dp::Error storage_failed(const dp::String &msg = "Storage operation failed") {
        return dp::Error{ERR_STORAGE_FAILED, msg};
    }

    /// True when the result failed with the given escrowit error code
    template <typename R> inline bool failedWith(const R &result, dp::u32 code) {
        return result.is_err() && result.error().code == code;
    }

} // namespace escrowit
