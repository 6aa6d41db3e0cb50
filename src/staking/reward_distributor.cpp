// LIQUIDSTAKE - Reward Distributor Implementation
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License

#include "liquidstake/staking/reward_distributor.h"
#include "liquidstake/core/arith.h"
#include "liquidstake/crypto/hash.h"
#include "liquidstake/ledger/ledger.h"
#include "liquidstake/util/logging.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace liquidstake {
namespace staking {

using asset::TokenKind;

RewardSplit SplitReward(Amount total) {
    RewardSplit split;
    split.mev = *MulDiv(total, MEV_RATIO, RATIO_DENOMINATOR);
    split.protocolFee = *MulDiv(total, PROTOCOL_FEE_RATIO, RATIO_DENOMINATOR);
    split.lp = *MulDiv(total, LP_RATIO, RATIO_DENOMINATOR);
    return split;
}

namespace {

/// Deposits made during a distribution, undone if a later step fails
class DepositJournal {
public:
    DepositJournal(ledger::ILedger& ledger, const Address& source)
        : ledger_(ledger), source_(source) {}

    Status Pay(const Address& to, Amount amount) {
        if (amount == 0) {
            return Status::Ok();
        }
        FungibleAsset value;
        Status status = ledger_.Withdraw(source_, TokenKind::Base, amount, &value);
        if (!status.ok()) {
            return status;
        }
        status = ledger_.Deposit(to, std::move(value));
        if (!status.ok()) {
            Restore(std::move(value));
            return status;
        }
        entries_.emplace_back(to, amount);
        return Status::Ok();
    }

    void Restore(FungibleAsset&& value) {
        if (value.IsZero()) {
            return;
        }
        Status status = ledger_.Deposit(source_, std::move(value));
        if (!status.ok()) {
            throw std::logic_error("reward rollback: cannot return value to admin: " +
                                   status.ToString());
        }
    }

    void Rollback() {
        for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
            FungibleAsset value;
            Status status = ledger_.Withdraw(it->first, TokenKind::Base, it->second, &value);
            if (!status.ok()) {
                throw std::logic_error("reward rollback: cannot reclaim " +
                                       std::to_string(it->second) + " from " +
                                       it->first.ToHex() + ": " + status.ToString());
            }
            Restore(std::move(value));
        }
        entries_.clear();
    }

private:
    ledger::ILedger& ledger_;
    Address source_;
    std::vector<std::pair<Address, Amount>> entries_;
};

Hash256 ClaimHash(const Address& admin, Timestamp now, Amount total) {
    return SHA256Hash("try_claim_rewards:" + admin.ToHex() + ":" + std::to_string(now) +
                      ":" + std::to_string(total));
}

} // namespace

RewardDistributor::RewardDistributor(ledger::ILedger& ledger,
                                     IValidatorService& validators,
                                     LpRewardLedger& lpRewards,
                                     const EventSink& events)
    : ledger_(ledger)
    , validators_(validators)
    , lpRewards_(lpRewards)
    , events_(events) {}

bool RewardDistributor::CanClaim(const PoolState& pool, Timestamp now) {
    return now >= pool.lastRewardClaim + pool.rewardClaimInterval;
}

// ============================================================================
// Claim
// ============================================================================

Status RewardDistributor::TryClaimRewards(PoolState& pool, const ExchangeRateLedger& rates,
                                          const Address& caller, Timestamp now,
                                          ClaimOutcome* outcome) {
    if (caller != pool.admin) {
        return Status::Error(StakingError::NOT_ADMIN, caller.ToHex());
    }

    ClaimOutcome result;
    result.timestamp = now;

    if (!CanClaim(pool, now)) {
        LOG_DEBUG(util::LogCategory::REWARDS)
            << "Reward claim skipped, next claim at "
            << pool.lastRewardClaim + pool.rewardClaimInterval;
        if (outcome) {
            *outcome = result;
        }
        return Status::Ok();
    }

    for (const Address* account : {&pool.admin, &pool.mevRecipient, &pool.treasury,
                                   &pool.lpRewardVault}) {
        if (ledger_.IsFrozen(*account, TokenKind::Base)) {
            return Status::Error(StakingError::ACCOUNT_FROZEN,
                                 "reward account " + account->ToHex() + " is frozen");
        }
    }

    pool.phase = ClaimPhase::Claiming;

    Amount before = ledger_.Balance(pool.admin, TokenKind::Base);
    Status status = validators_.ClaimReward(pool.admin, pool.validator);
    if (!status.ok()) {
        pool.phase = ClaimPhase::Idle;
        LOG_WARN(util::LogCategory::REWARDS) << "Validator reward claim failed: "
                                             << status.ToString();
        return status;
    }
    Amount after = ledger_.Balance(pool.admin, TokenKind::Base);
    Amount reward = after > before ? after - before : 0;

    if (reward == 0) {
        pool.phase = ClaimPhase::Idle;
        return Status::Error(StakingError::NO_REWARDS, "validator paid no rewards");
    }

    pool.phase = ClaimPhase::Distributing;

    RewardSplit split;
    status = DistributeRewards(pool, rates, reward, now, &split);
    pool.phase = ClaimPhase::Idle;
    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::REWARDS) << "Reward distribution of " << reward
                                              << " failed: " << status.ToString();
        ReturnClaimedReward(pool, reward);
        return status;
    }

    pool.lastRewardClaim = now;

    result.claimed = true;
    result.totalRewards = reward;
    result.mevAmount = split.mev;
    result.protocolFee = split.protocolFee;
    result.lpRewards = split.lp;
    result.txHash = ClaimHash(pool.admin, now, reward);
    if (outcome) {
        *outcome = result;
    }

    EmitEvent(events_, RewardsDistributedEvent{reward, split.mev, split.protocolFee,
                                               split.lp, now});
    return Status::Ok();
}

void RewardDistributor::ReturnClaimedReward(const PoolState& pool, Amount reward) {
    FungibleAsset value;
    Status status = ledger_.Withdraw(pool.admin, TokenKind::Base, reward, &value);
    if (!status.ok()) {
        throw std::logic_error("reward rollback: cannot take back " + std::to_string(reward) +
                               " from admin: " + status.ToString());
    }
    status = validators_.ReturnReward(pool.validator, std::move(value));
    if (!status.ok()) {
        throw std::logic_error("reward rollback: validator refused " + std::to_string(reward) +
                               ": " + status.ToString());
    }
}

// ============================================================================
// Distribution
// ============================================================================

Status RewardDistributor::DistributeRewards(PoolState& pool, const ExchangeRateLedger& rates,
                                            Amount total, Timestamp now, RewardSplit* split) {
    *split = SplitReward(total);

    DepositJournal journal(ledger_, pool.admin);

    Status status = journal.Pay(pool.mevRecipient, split->mev);
    if (!status.ok()) {
        return status;
    }
    status = journal.Pay(pool.treasury, split->protocolFee);
    if (!status.ok()) {
        journal.Rollback();
        return status;
    }

    FungibleAsset lpValue;
    status = ledger_.Withdraw(pool.admin, TokenKind::Base, split->lp, &lpValue);
    if (!status.ok()) {
        journal.Rollback();
        return status;
    }
    status = DistributeToLps(pool, rates, std::move(lpValue));
    if (!status.ok()) {
        journal.Restore(std::move(lpValue));
        journal.Rollback();
        return status;
    }

    Amount remainder = total - split->Sum();
    LOG_INFO(util::LogCategory::REWARDS) << "Distributed " << total << " at " << now
                                         << ": mev " << split->mev << ", protocol "
                                         << split->protocolFee << ", lp " << split->lp
                                         << ", unallocated " << remainder;
    return Status::Ok();
}

Status RewardDistributor::DistributeToLps(const PoolState& pool, const ExchangeRateLedger& rates,
                                          FungibleAsset&& value) {
    if (value.IsZero()) {
        return FungibleAsset::DestroyZero(std::move(value));
    }

    if (rates.TotalStaked() == 0) {
        Amount amount = value.Value();
        Status status = ledger_.Deposit(pool.treasury, std::move(value));
        if (status.ok()) {
            LOG_INFO(util::LogCategory::REWARDS) << "No stakers; LP share " << amount
                                                 << " sent to treasury";
        }
        return status;
    }

    Amount amount = value.Value();
    Status status = ledger_.Deposit(pool.lpRewardVault, std::move(value));
    if (!status.ok()) {
        return status;
    }

    status = lpRewards_.Credit(amount);
    if (!status.ok()) {
        // Take the value back out of the vault so the caller still holds it
        Status reclaim = ledger_.Withdraw(pool.lpRewardVault, TokenKind::Base, amount, &value);
        if (!reclaim.ok()) {
            throw std::logic_error("LP credit rollback failed: " + reclaim.ToString());
        }
        return status;
    }
    return Status::Ok();
}

// ============================================================================
// LP Claims
// ============================================================================

Status RewardDistributor::ClaimLpRewards(const PoolState& pool, const Address& staker,
                                         Amount* claimed) {
    Amount pending = lpRewards_.Pending(staker);
    if (pending == 0) {
        return Status::Error(StakingError::NO_REWARDS,
                             "no LP rewards pending for " + staker.ToHex());
    }

    FungibleAsset reward;
    Status status = ledger_.Withdraw(pool.lpRewardVault, TokenKind::Base, pending, &reward);
    if (!status.ok()) {
        return status;
    }
    status = ledger_.Deposit(staker, std::move(reward));
    if (!status.ok()) {
        Status restore = ledger_.Deposit(pool.lpRewardVault, std::move(reward));
        if (!restore.ok()) {
            throw std::logic_error("LP claim rollback failed: " + restore.ToString());
        }
        return status;
    }

    lpRewards_.TakePending(staker);
    if (claimed) {
        *claimed = pending;
    }

    EmitEvent(events_, LpRewardsClaimedEvent{staker, pending});
    return Status::Ok();
}

} // namespace staking
} // namespace liquidstake
