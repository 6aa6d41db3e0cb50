// LIQUIDSTAKE - Liquid Staking Service
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License
//
// Entry points of the liquid-staking pool. The service owns the pool state,
// the token issuer and its capabilities; the host ledger and the validator
// service are injected. All calls are serialized on an internal mutex.

#ifndef LIQUIDSTAKE_STAKING_LIQUID_STAKING_H
#define LIQUIDSTAKE_STAKING_LIQUID_STAKING_H

#include "liquidstake/asset/token_issuer.h"
#include "liquidstake/core/status.h"
#include "liquidstake/core/types.h"
#include "liquidstake/staking/events.h"
#include "liquidstake/staking/exchange_rate.h"
#include "liquidstake/staking/lp_rewards.h"
#include "liquidstake/staking/pool.h"
#include "liquidstake/staking/reward_distributor.h"
#include "liquidstake/staking/staking_engine.h"
#include "liquidstake/staking/validator_service.h"

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace liquidstake {

namespace ledger {
class ILedger;
}

namespace staking {

/// Supplies the current host time in seconds
using TimeSource = std::function<Timestamp()>;

// ============================================================================
// Configuration and Snapshots
// ============================================================================

struct ServiceConfig {
    /// Principal allowed to initialize and administer the pool
    Address admin;

    /// Interval applied at initialization
    Duration rewardClaimInterval{DEFAULT_REWARD_CLAIM_INTERVAL};

    /// Reward recipients applied at initialization (default: admin)
    std::optional<Address> mevRecipient;
    std::optional<Address> treasury;
};

/// Everything a query client needs in one record
struct PoolInfo {
    PoolState state;
    Amount totalStaked{0};
    Amount totalDelegation{0};
    Amount exchangeRate{EXCHANGE_RATE_SCALE};
    Amount stakedSupply{0};
    Duration unstakingPeriod{UNSTAKING_PERIOD};
    bool canClaimRewards{false};
    Timestamp nextRewardClaim{0};
    Amount lpRewardCarry{0};
};

/// Service state as persisted by the state store
struct ServiceSnapshot {
    std::optional<PoolState> pool;
    ExchangeRateState rates;
    std::map<Address, LpPosition> lpPositions;
    Amount lpCarry{0};
    Amount baseSupply{0};
    Amount stakedSupply{0};
};

// ============================================================================
// LiquidStakingService
// ============================================================================

class LiquidStakingService {
public:
    LiquidStakingService(const ServiceConfig& config,
                         ledger::ILedger& ledger,
                         IValidatorService& validators,
                         EventSink events = nullptr,
                         TimeSource now = nullptr);

    LiquidStakingService(const LiquidStakingService&) = delete;
    LiquidStakingService& operator=(const LiquidStakingService&) = delete;

    // ========================================================================
    // Entry Points
    // ========================================================================

    /**
     * Create the pool and the token capabilities. Admin only, once.
     *
     * @return NOT_ADMIN, ALREADY_INITIALIZED or INTERVAL_TOO_SHORT
     */
    Status Initialize(const Address& caller, const ValidatorId& validator,
                      const std::vector<Byte>& validatorOperator);

    /// Stake amount base units; mints the same amount of staked tokens
    Status Stake(const Address& staker, Amount amount);

    /**
     * Burn amount staked tokens and return their base value.
     *
     * @param[out] baseReturned Base units paid back (optional)
     */
    Status Unstake(const Address& staker, Amount amount, Amount* baseReturned = nullptr);

    /// Replace the delegation target. Existing delegations are not moved.
    Status UpdateValidator(const Address& caller, const ValidatorId& validator,
                           const std::vector<Byte>& validatorOperator);

    Status UpdateRewardClaimInterval(const Address& caller, Duration interval);

    Status UpdateRewardRecipients(const Address& caller, const Address& mevRecipient,
                                  const Address& treasury);

    /// Freeze or thaw an account's balance of one token kind. Admin only.
    Status SetAccountFrozen(const Address& caller, const Address& account,
                            asset::TokenKind kind, bool frozen);

    /// Claim and distribute rewards if the interval has elapsed
    Status TryClaimRewards(const Address& caller, ClaimOutcome* outcome = nullptr);

    /// Pay out a staker's accumulated LP rewards
    Status ClaimLpRewards(const Address& staker, Amount* claimed = nullptr);

    // ========================================================================
    // Queries
    // ========================================================================

    bool IsInitialized() const;
    Amount GetExchangeRate() const;
    Amount GetTotalStaked() const;
    Amount GetTotalDelegation() const;
    std::optional<ValidatorId> GetValidator() const;
    std::optional<std::vector<Byte>> GetValidatorOperator() const;
    Duration GetUnstakingPeriod() const { return UNSTAKING_PERIOD; }
    bool CanClaimRewards() const;
    Amount GetPendingLpRewards(const Address& staker) const;
    std::optional<PoolInfo> GetPoolInfo() const;
    Amount GetStakedSupply() const;
    ClaimPhase GetClaimPhase() const;
    static asset::TokenMetadata GetTokenMetadata(asset::TokenKind kind);

    const Address& Admin() const { return config_.admin; }

    // ========================================================================
    // Persistence
    // ========================================================================

    ServiceSnapshot Snapshot() const;

    /// Load persisted state into a fresh service
    /// @return NOT_ADMIN if the stored pool belongs to another admin
    Status Restore(const ServiceSnapshot& snapshot);

private:
    Status CheckInitialized() const;
    Status CheckAdmin(const Address& caller) const;
    Timestamp Now() const;

    const ServiceConfig config_;
    ledger::ILedger& ledger_;
    IValidatorService& validators_;
    const EventSink events_;
    const TimeSource now_;

    mutable std::mutex mutex_;

    asset::TokenIssuer issuer_;
    std::optional<asset::IssuerCapabilities> caps_;
    std::optional<PoolState> pool_;
    ExchangeRateLedger rates_;
    LpRewardLedger lpRewards_;
    StakingEngine engine_;
    RewardDistributor distributor_;
};

} // namespace staking
} // namespace liquidstake

#endif // LIQUIDSTAKE_STAKING_LIQUID_STAKING_H
