// LIQUIDSTAKE - Operation Status
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License
//
// Result type for every pool entry point. A non-OK status means the call
// aborted and left counters, balances and delegations untouched.

#ifndef LIQUIDSTAKE_CORE_STATUS_H
#define LIQUIDSTAKE_CORE_STATUS_H

#include <string>

namespace liquidstake {

// ============================================================================
// Error Codes
// ============================================================================

/// Specific failure reasons reported by pool operations
enum class StakingError {
    OK = 0,

    // Permission
    NOT_ADMIN,
    ACCOUNT_FROZEN,

    // Lifecycle
    ALREADY_INITIALIZED,
    NOT_INITIALIZED,

    // Arguments
    BELOW_MINIMUM_STAKE,
    ABOVE_MAXIMUM_STAKE,
    ZERO_AMOUNT,
    UNSTAKE_TOO_SMALL,
    INTERVAL_TOO_SHORT,
    NO_REWARDS,
    TOKEN_KIND_MISMATCH,
    NON_ZERO_DESTROY,
    UNKNOWN_POOL,

    // Arithmetic
    STAKE_OVERFLOW,

    // Balances
    INSUFFICIENT_STAKED,
    INSUFFICIENT_BALANCE,

    // External collaborators
    VALIDATOR_CALL_FAILED,
};

/// Coarse error taxonomy exposed to callers
enum class ErrorCategory {
    None,
    PermissionDenied,
    AlreadyExists,
    NotFound,
    InvalidArgument,
    ArithmeticOverflow,
    InsufficientBalance,
    ExternalCallFailed,
};

/// Human readable description of an error code
const char* StakingErrorToString(StakingError err);

/// Stable identifier of an error code (e.g. "BELOW_MINIMUM_STAKE")
const char* StakingErrorName(StakingError err);

/// Taxonomy bucket an error code belongs to
ErrorCategory ErrorCategoryOf(StakingError err);

const char* ErrorCategoryToString(ErrorCategory category);

// ============================================================================
// Status
// ============================================================================

/**
 * Outcome of a pool operation: an error code plus optional context.
 */
class Status {
public:
    Status() : code_(StakingError::OK) {}
    Status(StakingError code, const std::string& msg = "")
        : code_(code), message_(msg) {}

    static Status Ok() { return Status(); }
    static Status Error(StakingError code, const std::string& msg = "") {
        return Status(code, msg);
    }

    bool ok() const { return code_ == StakingError::OK; }

    StakingError code() const { return code_; }
    ErrorCategory category() const { return ErrorCategoryOf(code_); }
    const std::string& message() const { return message_; }

    /// "OK", or "<Category>: <description>[: <context>]"
    std::string ToString() const;

private:
    StakingError code_;
    std::string message_;
};

} // namespace liquidstake

#endif // LIQUIDSTAKE_CORE_STATUS_H
