// LIQUIDSTAKE - Pool State
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License
//
// Constants and the administrative state of a liquid-staking pool.

#ifndef LIQUIDSTAKE_STAKING_POOL_H
#define LIQUIDSTAKE_STAKING_POOL_H

#include "liquidstake/core/types.h"

#include <cstdint>
#include <vector>

namespace liquidstake {
namespace staking {

// ============================================================================
// Staking Constants
// ============================================================================

/// Fixed-point scale of the exchange rate (1.0 == 1,000,000)
constexpr Amount EXCHANGE_RATE_SCALE = 1000000;

/// Minimum single stake (1 token)
constexpr Amount MINIMUM_STAKE = 1 * COIN;

/// Maximum single stake, also the ceiling for total staked (10M tokens)
constexpr Amount MAXIMUM_STAKE = 10000000 * COIN;

/// Shortest allowed reward claim interval (1 hour)
constexpr Duration MIN_REWARD_CLAIM_INTERVAL = 3600;

/// Reward claim interval set at initialization (1 day)
constexpr Duration DEFAULT_REWARD_CLAIM_INTERVAL = 86400;

/// Unbonding period reported to clients (21 days)
constexpr Duration UNSTAKING_PERIOD = 21 * 86400;

/// Reward split, in parts of RATIO_DENOMINATOR
constexpr Amount MEV_RATIO = 10;
constexpr Amount PROTOCOL_FEE_RATIO = 10;
constexpr Amount LP_RATIO = 80;
constexpr Amount RATIO_DENOMINATOR = 100;

static_assert(MEV_RATIO + PROTOCOL_FEE_RATIO + LP_RATIO == RATIO_DENOMINATOR,
              "reward split must cover the whole reward");

// ============================================================================
// Reward Claim Phase
// ============================================================================

enum class ClaimPhase : uint8_t {
    Idle = 0,
    Claiming = 1,
    Distributing = 2,
};

const char* ClaimPhaseToString(ClaimPhase phase);

// ============================================================================
// Pool State
// ============================================================================

/**
 * Administrative state of the pool. Exists once initialize succeeds and is
 * never destroyed.
 */
struct PoolState {
    /// Pool owner; the only principal allowed to run admin operations
    Address admin;

    /// Delegation target
    ValidatorId validator;

    /// Validator operator key bytes
    std::vector<Byte> validatorOperator;

    /// Time of the last successful reward claim
    Timestamp lastRewardClaim{0};

    /// Minimum spacing between reward claims
    Duration rewardClaimInterval{DEFAULT_REWARD_CLAIM_INTERVAL};

    /// Receives the MEV share of rewards
    Address mevRecipient;

    /// Receives the protocol fee share of rewards
    Address treasury;

    /// Shared account holding undistributed LP rewards
    Address lpRewardVault;

    ClaimPhase phase{ClaimPhase::Idle};
};

/// Deterministic account address for a named pool sub-account
Address DerivePoolAccount(const Address& admin, const char* purpose);

} // namespace staking
} // namespace liquidstake

#endif // LIQUIDSTAKE_STAKING_POOL_H
