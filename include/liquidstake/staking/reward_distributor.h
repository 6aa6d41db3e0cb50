// LIQUIDSTAKE - Reward Distributor
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License
//
// Interval-gated reward claims and the fixed MEV / protocol / LP split.
// A claim walks Idle -> Claiming -> Distributing -> Idle.

#ifndef LIQUIDSTAKE_STAKING_REWARD_DISTRIBUTOR_H
#define LIQUIDSTAKE_STAKING_REWARD_DISTRIBUTOR_H

#include "liquidstake/asset/fungible_asset.h"
#include "liquidstake/core/status.h"
#include "liquidstake/core/types.h"
#include "liquidstake/staking/events.h"
#include "liquidstake/staking/exchange_rate.h"
#include "liquidstake/staking/lp_rewards.h"
#include "liquidstake/staking/pool.h"
#include "liquidstake/staking/validator_service.h"

namespace liquidstake {

namespace ledger {
class ILedger;
}

namespace staking {

// ============================================================================
// Reward Split
// ============================================================================

struct RewardSplit {
    Amount mev{0};
    Amount protocolFee{0};
    Amount lp{0};

    Amount Sum() const { return mev + protocolFee + lp; }
};

/// floor(total * ratio / 100) for each bucket; the remainder is at most 2
RewardSplit SplitReward(Amount total);

// ============================================================================
// Claim Outcome
// ============================================================================

struct ClaimOutcome {
    /// False when the interval had not elapsed and nothing happened
    bool claimed{false};
    Amount totalRewards{0};
    Amount mevAmount{0};
    Amount protocolFee{0};
    Amount lpRewards{0};
    Timestamp timestamp{0};
    /// Identifier of this claim, for clients that track submissions
    Hash256 txHash;
};

// ============================================================================
// RewardDistributor
// ============================================================================

class RewardDistributor {
public:
    RewardDistributor(ledger::ILedger& ledger,
                      IValidatorService& validators,
                      LpRewardLedger& lpRewards,
                      const EventSink& events);

    /// now >= lastRewardClaim + rewardClaimInterval
    static bool CanClaim(const PoolState& pool, Timestamp now);

    /**
     * Claim validator rewards for the admin and distribute them. Returns OK
     * without doing anything when the interval has not elapsed.
     *
     * @return NOT_ADMIN, NO_REWARDS, ACCOUNT_FROZEN or VALIDATOR_CALL_FAILED
     */
    Status TryClaimRewards(PoolState& pool, const ExchangeRateLedger& rates,
                           const Address& caller, Timestamp now, ClaimOutcome* outcome);

    /// Pay a staker's pending LP reward out of the vault
    Status ClaimLpRewards(const PoolState& pool, const Address& staker, Amount* claimed);

private:
    /// Split total out of the admin account and route each share
    Status DistributeRewards(PoolState& pool, const ExchangeRateLedger& rates,
                             Amount total, Timestamp now, RewardSplit* split);

    /// Move a claimed reward from the admin back to the validator
    void ReturnClaimedReward(const PoolState& pool, Amount reward);

    /// Route the LP share to the vault, or to the treasury if nobody is staked
    Status DistributeToLps(const PoolState& pool, const ExchangeRateLedger& rates,
                           FungibleAsset&& value);

    ledger::ILedger& ledger_;
    IValidatorService& validators_;
    LpRewardLedger& lpRewards_;
    const EventSink& events_;
};

} // namespace staking
} // namespace liquidstake

#endif // LIQUIDSTAKE_STAKING_REWARD_DISTRIBUTOR_H
