// LIQUIDSTAKE - Staking Engine Implementation
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License

#include "liquidstake/staking/staking_engine.h"
#include "liquidstake/ledger/ledger.h"
#include "liquidstake/util/logging.h"

#include <stdexcept>
#include <string>

namespace liquidstake {
namespace staking {

using asset::TokenKind;

namespace {

/// Compensation steps must succeed; a failure here leaves the host
/// inconsistent and aborts the transaction.
void RequireCompensation(const Status& status, const char* step) {
    if (!status.ok()) {
        throw std::logic_error(std::string("compensation failed (") + step + "): " +
                               status.ToString());
    }
}

} // namespace

StakingEngine::StakingEngine(ledger::ILedger& ledger,
                             IValidatorService& validators,
                             asset::TokenIssuer& issuer,
                             ExchangeRateLedger& rates,
                             LpRewardLedger& lpRewards,
                             const EventSink& events)
    : ledger_(ledger)
    , validators_(validators)
    , issuer_(issuer)
    , rates_(rates)
    , lpRewards_(lpRewards)
    , events_(events) {}

// ============================================================================
// Stake
// ============================================================================

Status StakingEngine::Stake(const PoolState& pool, const asset::IssuerCapabilities& caps,
                            const Address& staker, Amount amount) {
    Status status = rates_.CheckStake(amount);
    if (!status.ok()) {
        return status;
    }
    if (ledger_.IsFrozen(staker, TokenKind::Staked)) {
        return Status::Error(StakingError::ACCOUNT_FROZEN,
                             "staked balance of " + staker.ToHex() + " is frozen");
    }

    FungibleAsset base;
    status = ledger_.Withdraw(staker, TokenKind::Base, amount, &base);
    if (!status.ok()) {
        return status;
    }

    status = validators_.Delegate(staker, std::move(base), pool.validator);
    if (!status.ok()) {
        RequireCompensation(ledger_.Deposit(staker, std::move(base)), "return base");
        LOG_WARN(util::LogCategory::STAKING) << "Delegation failed for " << staker.ToHex()
                                             << ": " << status.ToString();
        return status;
    }

    // Minted at face value; the rate only governs the unstake conversion
    FungibleAsset staked = issuer_.Mint(caps.staked.mint, amount);
    status = ledger_.Deposit(staker, std::move(staked));
    if (!status.ok()) {
        RequireCompensation(issuer_.Burn(caps.staked.burn, std::move(staked)), "burn mint");
        FungibleAsset refund;
        RequireCompensation(validators_.Undelegate(staker, pool.validator, amount, &refund),
                            "undelegate");
        RequireCompensation(ledger_.Deposit(staker, std::move(refund)), "return base");
        return status;
    }

    rates_.RecordStake(amount);
    rates_.UpdateExchangeRate(issuer_.Supply(TokenKind::Staked));
    lpRewards_.AddShares(staker, amount);

    LOG_INFO(util::LogCategory::STAKING) << "Staked " << amount << " for " << staker.ToHex()
                                         << ", total staked " << rates_.TotalStaked();
    EmitEvent(events_, StakeEvent{staker, amount, pool.validator});
    return Status::Ok();
}

// ============================================================================
// Unstake
// ============================================================================

Status StakingEngine::Unstake(const PoolState& pool, const asset::IssuerCapabilities& caps,
                              const Address& staker, Amount amount, Amount* baseReturned) {
    if (amount == 0) {
        return Status::Error(StakingError::ZERO_AMOUNT, "unstake amount must be positive");
    }

    Amount unstakeAmount = 0;
    Status status = rates_.CheckUnstake(amount, &unstakeAmount);
    if (!status.ok()) {
        return status;
    }
    if (ledger_.IsFrozen(staker, TokenKind::Base)) {
        return Status::Error(StakingError::ACCOUNT_FROZEN,
                             "base balance of " + staker.ToHex() + " is frozen");
    }

    FungibleAsset staked;
    status = ledger_.Withdraw(staker, TokenKind::Staked, amount, &staked);
    if (!status.ok()) {
        return status;
    }

    FungibleAsset base;
    status = validators_.Undelegate(staker, pool.validator, unstakeAmount, &base);
    if (!status.ok()) {
        RequireCompensation(ledger_.Deposit(staker, std::move(staked)), "return staked");
        LOG_WARN(util::LogCategory::STAKING) << "Undelegation failed for " << staker.ToHex()
                                             << ": " << status.ToString();
        return status;
    }

    status = ledger_.Deposit(staker, std::move(base));
    if (!status.ok()) {
        RequireCompensation(validators_.Delegate(staker, std::move(base), pool.validator),
                            "redelegate");
        RequireCompensation(ledger_.Deposit(staker, std::move(staked)), "return staked");
        return status;
    }

    status = issuer_.Burn(caps.staked.burn, std::move(staked));
    if (!status.ok()) {
        throw std::logic_error("unstake: cannot burn withdrawn staked tokens: " +
                               status.ToString());
    }

    rates_.RecordUnstake(unstakeAmount);
    rates_.UpdateExchangeRate(issuer_.Supply(TokenKind::Staked));
    lpRewards_.RemoveShares(staker, unstakeAmount);

    if (baseReturned) {
        *baseReturned = unstakeAmount;
    }

    LOG_INFO(util::LogCategory::STAKING) << "Unstaked " << amount << " staked for "
                                         << unstakeAmount << " base, staker "
                                         << staker.ToHex() << ", total staked "
                                         << rates_.TotalStaked();
    EmitEvent(events_, UnstakeEvent{staker, unstakeAmount, pool.validator});
    return Status::Ok();
}

} // namespace staking
} // namespace liquidstake
