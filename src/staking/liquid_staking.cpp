// LIQUIDSTAKE - Liquid Staking Service Implementation
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License

#include "liquidstake/staking/liquid_staking.h"
#include "liquidstake/ledger/ledger.h"
#include "liquidstake/util/logging.h"
#include "liquidstake/util/time.h"

#include <stdexcept>
#include <string>

namespace liquidstake {
namespace staking {

using asset::TokenKind;

LiquidStakingService::LiquidStakingService(const ServiceConfig& config,
                                           ledger::ILedger& ledger,
                                           IValidatorService& validators,
                                           EventSink events,
                                           TimeSource now)
    : config_(config)
    , ledger_(ledger)
    , validators_(validators)
    , events_(std::move(events))
    , now_(now ? std::move(now) : TimeSource([] { return util::GetTime(); }))
    , engine_(ledger_, validators_, issuer_, rates_, lpRewards_, events_)
    , distributor_(ledger_, validators_, lpRewards_, events_) {}

Timestamp LiquidStakingService::Now() const {
    return now_();
}

Status LiquidStakingService::CheckInitialized() const {
    if (!pool_) {
        return Status::Error(StakingError::NOT_INITIALIZED);
    }
    return Status::Ok();
}

Status LiquidStakingService::CheckAdmin(const Address& caller) const {
    if (caller != config_.admin) {
        return Status::Error(StakingError::NOT_ADMIN, caller.ToHex());
    }
    return Status::Ok();
}

// ============================================================================
// Initialization
// ============================================================================

Status LiquidStakingService::Initialize(const Address& caller, const ValidatorId& validator,
                                        const std::vector<Byte>& validatorOperator) {
    std::lock_guard<std::mutex> lock(mutex_);

    Status status = CheckAdmin(caller);
    if (!status.ok()) {
        return status;
    }
    if (pool_) {
        return Status::Error(StakingError::ALREADY_INITIALIZED);
    }
    if (config_.rewardClaimInterval < MIN_REWARD_CLAIM_INTERVAL) {
        return Status::Error(StakingError::INTERVAL_TOO_SHORT,
                             "configured interval " +
                             std::to_string(config_.rewardClaimInterval));
    }

    caps_ = issuer_.Initialize();
    if (!caps_) {
        throw std::logic_error("initialize: token issuer already handed out its capabilities");
    }

    PoolState pool;
    pool.admin = config_.admin;
    pool.validator = validator;
    pool.validatorOperator = validatorOperator;
    pool.lastRewardClaim = Now();
    pool.rewardClaimInterval = config_.rewardClaimInterval;
    pool.mevRecipient = config_.mevRecipient ? *config_.mevRecipient : config_.admin;
    pool.treasury = config_.treasury ? *config_.treasury : config_.admin;
    pool.lpRewardVault = DerivePoolAccount(config_.admin, "lp-reward-vault");
    pool.phase = ClaimPhase::Idle;
    pool_ = pool;

    LOG_INFO(util::LogCategory::STAKING) << "Pool initialized by " << caller.ToHex()
                                         << ", validator " << validator.ToHex()
                                         << ", claim interval "
                                         << util::FormatDuration(pool.rewardClaimInterval);
    return Status::Ok();
}

// ============================================================================
// Staking
// ============================================================================

Status LiquidStakingService::Stake(const Address& staker, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);

    Status status = CheckInitialized();
    if (!status.ok()) {
        return status;
    }
    return engine_.Stake(*pool_, *caps_, staker, amount);
}

Status LiquidStakingService::Unstake(const Address& staker, Amount amount,
                                     Amount* baseReturned) {
    std::lock_guard<std::mutex> lock(mutex_);

    Status status = CheckInitialized();
    if (!status.ok()) {
        return status;
    }
    return engine_.Unstake(*pool_, *caps_, staker, amount, baseReturned);
}

// ============================================================================
// Administration
// ============================================================================

Status LiquidStakingService::UpdateValidator(const Address& caller, const ValidatorId& validator,
                                             const std::vector<Byte>& validatorOperator) {
    std::lock_guard<std::mutex> lock(mutex_);

    Status status = CheckInitialized();
    if (status.ok()) {
        status = CheckAdmin(caller);
    }
    if (!status.ok()) {
        return status;
    }

    ValidatorUpdatedEvent event{pool_->validator, validator,
                                pool_->validatorOperator, validatorOperator};
    pool_->validator = validator;
    pool_->validatorOperator = validatorOperator;

    if (rates_.TotalDelegation() > 0) {
        LOG_WARN(util::LogCategory::STAKING) << rates_.TotalDelegation()
                                             << " remains delegated to "
                                             << event.oldValidator.ToHex();
    }
    EmitEvent(events_, event);
    return Status::Ok();
}

Status LiquidStakingService::UpdateRewardClaimInterval(const Address& caller, Duration interval) {
    std::lock_guard<std::mutex> lock(mutex_);

    Status status = CheckInitialized();
    if (status.ok()) {
        status = CheckAdmin(caller);
    }
    if (!status.ok()) {
        return status;
    }
    if (interval < MIN_REWARD_CLAIM_INTERVAL) {
        return Status::Error(StakingError::INTERVAL_TOO_SHORT,
                             std::to_string(interval) + " < " +
                             std::to_string(MIN_REWARD_CLAIM_INTERVAL));
    }

    RewardIntervalUpdatedEvent event{pool_->rewardClaimInterval, interval};
    pool_->rewardClaimInterval = interval;
    EmitEvent(events_, event);
    return Status::Ok();
}

Status LiquidStakingService::UpdateRewardRecipients(const Address& caller,
                                                    const Address& mevRecipient,
                                                    const Address& treasury) {
    std::lock_guard<std::mutex> lock(mutex_);

    Status status = CheckInitialized();
    if (status.ok()) {
        status = CheckAdmin(caller);
    }
    if (!status.ok()) {
        return status;
    }

    pool_->mevRecipient = mevRecipient;
    pool_->treasury = treasury;
    LOG_INFO(util::LogCategory::REWARDS) << "Reward recipients: mev " << mevRecipient.ToHex()
                                         << ", treasury " << treasury.ToHex();
    return Status::Ok();
}

Status LiquidStakingService::SetAccountFrozen(const Address& caller, const Address& account,
                                              TokenKind kind, bool frozen) {
    std::lock_guard<std::mutex> lock(mutex_);

    Status status = CheckInitialized();
    if (status.ok()) {
        status = CheckAdmin(caller);
    }
    if (!status.ok()) {
        return status;
    }

    const asset::CapabilitySet& caps = kind == TokenKind::Base ? caps_->base : caps_->staked;
    return issuer_.SetFrozen(caps.freeze, ledger_, account, frozen);
}

// ============================================================================
// Rewards
// ============================================================================

Status LiquidStakingService::TryClaimRewards(const Address& caller, ClaimOutcome* outcome) {
    std::lock_guard<std::mutex> lock(mutex_);

    Status status = CheckInitialized();
    if (!status.ok()) {
        return status;
    }
    return distributor_.TryClaimRewards(*pool_, rates_, caller, Now(), outcome);
}

Status LiquidStakingService::ClaimLpRewards(const Address& staker, Amount* claimed) {
    std::lock_guard<std::mutex> lock(mutex_);

    Status status = CheckInitialized();
    if (!status.ok()) {
        return status;
    }
    return distributor_.ClaimLpRewards(*pool_, staker, claimed);
}

// ============================================================================
// Queries
// ============================================================================

bool LiquidStakingService::IsInitialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pool_.has_value();
}

Amount LiquidStakingService::GetExchangeRate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rates_.ExchangeRate();
}

Amount LiquidStakingService::GetTotalStaked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rates_.TotalStaked();
}

Amount LiquidStakingService::GetTotalDelegation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rates_.TotalDelegation();
}

std::optional<ValidatorId> LiquidStakingService::GetValidator() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!pool_) {
        return std::nullopt;
    }
    return pool_->validator;
}

std::optional<std::vector<Byte>> LiquidStakingService::GetValidatorOperator() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!pool_) {
        return std::nullopt;
    }
    return pool_->validatorOperator;
}

bool LiquidStakingService::CanClaimRewards() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pool_ && RewardDistributor::CanClaim(*pool_, Now());
}

Amount LiquidStakingService::GetPendingLpRewards(const Address& staker) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lpRewards_.Pending(staker);
}

std::optional<PoolInfo> LiquidStakingService::GetPoolInfo() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!pool_) {
        return std::nullopt;
    }

    PoolInfo info;
    info.state = *pool_;
    info.totalStaked = rates_.TotalStaked();
    info.totalDelegation = rates_.TotalDelegation();
    info.exchangeRate = rates_.ExchangeRate();
    info.stakedSupply = issuer_.Supply(TokenKind::Staked);
    info.canClaimRewards = RewardDistributor::CanClaim(*pool_, Now());
    info.nextRewardClaim = pool_->lastRewardClaim + pool_->rewardClaimInterval;
    info.lpRewardCarry = lpRewards_.Carry();
    return info;
}

Amount LiquidStakingService::GetStakedSupply() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return issuer_.Supply(TokenKind::Staked);
}

ClaimPhase LiquidStakingService::GetClaimPhase() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pool_ ? pool_->phase : ClaimPhase::Idle;
}

asset::TokenMetadata LiquidStakingService::GetTokenMetadata(TokenKind kind) {
    return asset::TokenIssuer::GetMetadata(kind);
}

// ============================================================================
// Persistence
// ============================================================================

ServiceSnapshot LiquidStakingService::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);

    ServiceSnapshot snapshot;
    snapshot.pool = pool_;
    snapshot.rates = rates_.State();
    snapshot.lpPositions = lpRewards_.Positions();
    snapshot.lpCarry = lpRewards_.Carry();
    snapshot.baseSupply = issuer_.Supply(TokenKind::Base);
    snapshot.stakedSupply = issuer_.Supply(TokenKind::Staked);
    return snapshot;
}

Status LiquidStakingService::Restore(const ServiceSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (pool_) {
        return Status::Error(StakingError::ALREADY_INITIALIZED,
                             "cannot restore over a live pool");
    }
    if (!snapshot.pool) {
        return Status::Ok();
    }
    if (snapshot.pool->admin != config_.admin) {
        return Status::Error(StakingError::NOT_ADMIN,
                             "stored pool belongs to " + snapshot.pool->admin.ToHex());
    }

    caps_ = issuer_.Initialize();
    if (!caps_) {
        throw std::logic_error("restore: token issuer already handed out its capabilities");
    }
    issuer_.RestoreSupply(TokenKind::Base, snapshot.baseSupply);
    issuer_.RestoreSupply(TokenKind::Staked, snapshot.stakedSupply);

    pool_ = snapshot.pool;
    pool_->phase = ClaimPhase::Idle;
    rates_.Restore(snapshot.rates);
    lpRewards_.Restore(snapshot.lpPositions, snapshot.lpCarry);

    LOG_INFO(util::LogCategory::STAKING) << "Restored pool: total staked "
                                         << rates_.TotalStaked() << ", rate "
                                         << rates_.ExchangeRate() << ", "
                                         << snapshot.lpPositions.size() << " LP positions";
    return Status::Ok();
}

} // namespace staking
} // namespace liquidstake
