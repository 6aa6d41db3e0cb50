// LIQUIDSTAKE - Operation Status Implementation
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License

#include "liquidstake/core/status.h"

namespace liquidstake {

const char* StakingErrorToString(StakingError err) {
    switch (err) {
        case StakingError::OK: return "OK";

        case StakingError::NOT_ADMIN: return "Caller is not the pool admin";
        case StakingError::ACCOUNT_FROZEN: return "Account is frozen";

        case StakingError::ALREADY_INITIALIZED: return "Pool already initialized";
        case StakingError::NOT_INITIALIZED: return "Pool not initialized";

        case StakingError::BELOW_MINIMUM_STAKE: return "Stake amount below minimum";
        case StakingError::ABOVE_MAXIMUM_STAKE: return "Stake amount above maximum";
        case StakingError::ZERO_AMOUNT: return "Amount must be greater than zero";
        case StakingError::UNSTAKE_TOO_SMALL: return "Unstake amount rounds to zero";
        case StakingError::INTERVAL_TOO_SHORT: return "Reward claim interval too short";
        case StakingError::NO_REWARDS: return "No rewards to claim";
        case StakingError::TOKEN_KIND_MISMATCH: return "Token kind does not match";
        case StakingError::NON_ZERO_DESTROY: return "Cannot destroy a non-zero value";
        case StakingError::UNKNOWN_POOL: return "Unknown pool address";

        case StakingError::STAKE_OVERFLOW: return "Total staked would exceed limit";

        case StakingError::INSUFFICIENT_STAKED: return "Insufficient staked balance";
        case StakingError::INSUFFICIENT_BALANCE: return "Insufficient balance";

        case StakingError::VALIDATOR_CALL_FAILED: return "Validator call failed";

        default: return "Unknown error";
    }
}

const char* StakingErrorName(StakingError err) {
    switch (err) {
        case StakingError::OK: return "OK";
        case StakingError::NOT_ADMIN: return "NOT_ADMIN";
        case StakingError::ACCOUNT_FROZEN: return "ACCOUNT_FROZEN";
        case StakingError::ALREADY_INITIALIZED: return "ALREADY_INITIALIZED";
        case StakingError::NOT_INITIALIZED: return "NOT_INITIALIZED";
        case StakingError::BELOW_MINIMUM_STAKE: return "BELOW_MINIMUM_STAKE";
        case StakingError::ABOVE_MAXIMUM_STAKE: return "ABOVE_MAXIMUM_STAKE";
        case StakingError::ZERO_AMOUNT: return "ZERO_AMOUNT";
        case StakingError::UNSTAKE_TOO_SMALL: return "UNSTAKE_TOO_SMALL";
        case StakingError::INTERVAL_TOO_SHORT: return "INTERVAL_TOO_SHORT";
        case StakingError::NO_REWARDS: return "NO_REWARDS";
        case StakingError::TOKEN_KIND_MISMATCH: return "TOKEN_KIND_MISMATCH";
        case StakingError::NON_ZERO_DESTROY: return "NON_ZERO_DESTROY";
        case StakingError::UNKNOWN_POOL: return "UNKNOWN_POOL";
        case StakingError::STAKE_OVERFLOW: return "STAKE_OVERFLOW";
        case StakingError::INSUFFICIENT_STAKED: return "INSUFFICIENT_STAKED";
        case StakingError::INSUFFICIENT_BALANCE: return "INSUFFICIENT_BALANCE";
        case StakingError::VALIDATOR_CALL_FAILED: return "VALIDATOR_CALL_FAILED";
        default: return "UNKNOWN";
    }
}

ErrorCategory ErrorCategoryOf(StakingError err) {
    switch (err) {
        case StakingError::OK:
            return ErrorCategory::None;

        case StakingError::NOT_ADMIN:
        case StakingError::ACCOUNT_FROZEN:
            return ErrorCategory::PermissionDenied;

        case StakingError::ALREADY_INITIALIZED:
            return ErrorCategory::AlreadyExists;

        case StakingError::NOT_INITIALIZED:
            return ErrorCategory::NotFound;

        case StakingError::STAKE_OVERFLOW:
            return ErrorCategory::ArithmeticOverflow;

        case StakingError::INSUFFICIENT_STAKED:
        case StakingError::INSUFFICIENT_BALANCE:
            return ErrorCategory::InsufficientBalance;

        case StakingError::VALIDATOR_CALL_FAILED:
            return ErrorCategory::ExternalCallFailed;

        default:
            return ErrorCategory::InvalidArgument;
    }
}

const char* ErrorCategoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::None: return "None";
        case ErrorCategory::PermissionDenied: return "PermissionDenied";
        case ErrorCategory::AlreadyExists: return "AlreadyExists";
        case ErrorCategory::NotFound: return "NotFound";
        case ErrorCategory::InvalidArgument: return "InvalidArgument";
        case ErrorCategory::ArithmeticOverflow: return "ArithmeticOverflow";
        case ErrorCategory::InsufficientBalance: return "InsufficientBalance";
        case ErrorCategory::ExternalCallFailed: return "ExternalCallFailed";
        default: return "Unknown";
    }
}

std::string Status::ToString() const {
    if (ok()) return "OK";
    std::string result = ErrorCategoryToString(category());
    result += ": ";
    result += StakingErrorToString(code_);
    if (!message_.empty()) {
        result += ": " + message_;
    }
    return result;
}

} // namespace liquidstake
