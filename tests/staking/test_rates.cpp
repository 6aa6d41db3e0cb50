// LIQUIDSTAKE - Exchange Rate, LP Reward and Reward Split Tests
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License

#include <gtest/gtest.h>

#include "liquidstake/ledger/ledger.h"
#include "liquidstake/staking/exchange_rate.h"
#include "liquidstake/staking/lp_rewards.h"
#include "liquidstake/staking/reward_distributor.h"
#include "liquidstake/staking/validator_service.h"
#include "liquidstake/util/logging.h"

#include <cstdint>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace liquidstake {
namespace staking {
namespace test {

namespace {

Address MakeAddress(Byte tag) {
    return Address(&tag, 1);
}

} // namespace

// ============================================================================
// Exchange Rate Ledger
// ============================================================================

TEST(ExchangeRateTest, StartsAtParity) {
    ExchangeRateLedger rates;
    EXPECT_EQ(rates.ExchangeRate(), EXCHANGE_RATE_SCALE);
    EXPECT_EQ(rates.TotalStaked(), 0u);
    EXPECT_EQ(rates.TotalDelegation(), 0u);
    ASSERT_TRUE(rates.ConvertToBase(12345).has_value());
    EXPECT_EQ(*rates.ConvertToBase(12345), 12345u);
}

TEST(ExchangeRateTest, StakeBounds) {
    ExchangeRateLedger rates;
    EXPECT_EQ(rates.CheckStake(MINIMUM_STAKE - 1).code(), StakingError::BELOW_MINIMUM_STAKE);
    EXPECT_EQ(rates.CheckStake(0).code(), StakingError::BELOW_MINIMUM_STAKE);
    EXPECT_TRUE(rates.CheckStake(MINIMUM_STAKE).ok());
    EXPECT_TRUE(rates.CheckStake(MAXIMUM_STAKE).ok());
    EXPECT_EQ(rates.CheckStake(MAXIMUM_STAKE + 1).code(), StakingError::ABOVE_MAXIMUM_STAKE);
}

TEST(ExchangeRateTest, TotalCeiling) {
    ExchangeRateLedger rates;
    rates.RecordStake(MAXIMUM_STAKE - COIN);

    EXPECT_TRUE(rates.CheckStake(COIN).ok());
    EXPECT_EQ(rates.CheckStake(COIN + 1).code(), StakingError::STAKE_OVERFLOW);
}

TEST(ExchangeRateTest, RecordStakeAndUnstake) {
    ExchangeRateLedger rates;
    rates.RecordStake(500);
    rates.RecordStake(300);
    EXPECT_EQ(rates.TotalStaked(), 800u);
    EXPECT_EQ(rates.TotalDelegation(), 800u);

    rates.RecordUnstake(200);
    EXPECT_EQ(rates.TotalStaked(), 600u);
    EXPECT_EQ(rates.TotalDelegation(), 600u);

    EXPECT_THROW(rates.RecordUnstake(601), std::logic_error);
    EXPECT_EQ(rates.TotalStaked(), 600u);
}

TEST(ExchangeRateTest, DelegationSaturatesAtZero) {
    ExchangeRateLedger rates;
    ExchangeRateState state;
    state.totalStaked = 100;
    state.totalDelegation = 40;
    rates.Restore(state);

    std::vector<util::LogEntry> warnings;
    auto& logger = util::Logger::Instance();
    logger.ClearSinks();
    logger.EnableAllCategories();
    logger.SetLevel(util::LogLevel::Info);
    logger.AddSink(std::make_shared<util::CallbackSink>(
        [&warnings](const util::LogEntry& entry) { warnings.push_back(entry); },
        util::LogLevel::Warn));

    rates.RecordUnstake(30);
    EXPECT_TRUE(warnings.empty());
    rates.RecordUnstake(30);
    logger.ClearSinks();

    EXPECT_EQ(rates.TotalStaked(), 40u);
    EXPECT_EQ(rates.TotalDelegation(), 0u);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].level, util::LogLevel::Warn);
    EXPECT_EQ(warnings[0].category, util::LogCategory::STAKING);
    EXPECT_NE(warnings[0].message.find("below unstake of 30"), std::string::npos);
}

TEST(ExchangeRateTest, UnstakeConversionAtParity) {
    ExchangeRateLedger rates;
    rates.RecordStake(1000);

    Amount base = 0;
    ASSERT_TRUE(rates.CheckUnstake(400, &base).ok());
    EXPECT_EQ(base, 400u);

    EXPECT_EQ(rates.CheckUnstake(1001, &base).code(), StakingError::INSUFFICIENT_STAKED);
    EXPECT_EQ(rates.CheckUnstake(0, &base).code(), StakingError::UNSTAKE_TOO_SMALL);
}

TEST(ExchangeRateTest, UnstakeConversionAwayFromParity) {
    ExchangeRateLedger rates;
    ExchangeRateState state;
    state.totalStaked = 2000;
    state.totalDelegation = 2000;
    state.exchangeRate = 2 * EXCHANGE_RATE_SCALE;
    rates.Restore(state);

    Amount base = 0;
    ASSERT_TRUE(rates.CheckUnstake(500, &base).ok());
    EXPECT_EQ(base, 250u);
    EXPECT_EQ(rates.CheckUnstake(1, &base).code(), StakingError::UNSTAKE_TOO_SMALL);

    state.exchangeRate = EXCHANGE_RATE_SCALE / 2;
    rates.Restore(state);
    ASSERT_TRUE(rates.CheckUnstake(1000, &base).ok());
    EXPECT_EQ(base, 2000u);
    EXPECT_EQ(rates.CheckUnstake(1001, &base).code(), StakingError::INSUFFICIENT_STAKED);
}

TEST(ExchangeRateTest, UpdateFollowsSupply) {
    ExchangeRateLedger rates;
    rates.RecordStake(3000);

    rates.UpdateExchangeRate(3000);
    EXPECT_EQ(rates.ExchangeRate(), EXCHANGE_RATE_SCALE);

    rates.UpdateExchangeRate(2000);
    EXPECT_EQ(rates.ExchangeRate(), 666666u);

    rates.UpdateExchangeRate(0);
    EXPECT_EQ(rates.ExchangeRate(), EXCHANGE_RATE_SCALE);
}

TEST(ExchangeRateTest, BurningWholeSupplyReleasesAllStake) {
    ExchangeRateLedger rates;
    rates.RecordStake(3000);
    rates.UpdateExchangeRate(2000);

    Amount base = 0;
    ASSERT_TRUE(rates.CheckUnstake(2000, &base).ok());
    EXPECT_EQ(base, 3000u);
    ASSERT_TRUE(rates.CheckUnstake(1000, &base).ok());
    EXPECT_EQ(base, 1500u);

    // More staked tokens than supply: each one is worth less than a base unit
    rates.UpdateExchangeRate(6000);
    EXPECT_EQ(rates.ExchangeRate(), 2 * EXCHANGE_RATE_SCALE);
    ASSERT_TRUE(rates.CheckUnstake(6000, &base).ok());
    EXPECT_EQ(base, 3000u);
}

TEST(ExchangeRateTest, RateNeverZero) {
    ExchangeRateLedger rates;
    rates.UpdateExchangeRate(1000);
    EXPECT_EQ(rates.ExchangeRate(), EXCHANGE_RATE_SCALE);

    ExchangeRateState state;
    state.exchangeRate = 0;
    rates.Restore(state);
    EXPECT_EQ(rates.ExchangeRate(), EXCHANGE_RATE_SCALE);
}

// ============================================================================
// LP Reward Ledger
// ============================================================================

TEST(LpRewardLedgerTest, ProRataCredit) {
    LpRewardLedger lp;
    Address alice = MakeAddress(0x01);
    Address bob = MakeAddress(0x02);

    lp.AddShares(alice, 300);
    lp.AddShares(bob, 100);
    EXPECT_EQ(lp.TotalShares(), 400u);

    ASSERT_TRUE(lp.Credit(800000).ok());
    EXPECT_EQ(lp.Pending(alice), 600000u);
    EXPECT_EQ(lp.Pending(bob), 200000u);
    EXPECT_EQ(lp.Carry(), 0u);
    EXPECT_EQ(lp.TotalPending(), 800000u);
}

TEST(LpRewardLedgerTest, RemainderCarriesForward) {
    LpRewardLedger lp;
    lp.AddShares(MakeAddress(0x01), 1);
    lp.AddShares(MakeAddress(0x02), 1);
    lp.AddShares(MakeAddress(0x03), 1);

    ASSERT_TRUE(lp.Credit(10).ok());
    EXPECT_EQ(lp.Pending(MakeAddress(0x01)), 3u);
    EXPECT_EQ(lp.Carry(), 1u);

    ASSERT_TRUE(lp.Credit(2).ok());
    EXPECT_EQ(lp.Pending(MakeAddress(0x02)), 4u);
    EXPECT_EQ(lp.Carry(), 0u);
    EXPECT_EQ(lp.TotalPending() + lp.Carry(), 12u);
}

TEST(LpRewardLedgerTest, CreditWithoutSharesIsCarried) {
    LpRewardLedger lp;
    ASSERT_TRUE(lp.Credit(500).ok());
    EXPECT_EQ(lp.Carry(), 500u);

    Address alice = MakeAddress(0x01);
    lp.AddShares(alice, 10);
    ASSERT_TRUE(lp.Credit(100).ok());
    EXPECT_EQ(lp.Pending(alice), 600u);
    EXPECT_EQ(lp.Carry(), 0u);
}

TEST(LpRewardLedgerTest, RemoveSharesAndPrune) {
    LpRewardLedger lp;
    Address alice = MakeAddress(0x01);
    lp.AddShares(alice, 50);
    lp.AddShares(alice, 0);

    EXPECT_EQ(lp.RemoveShares(alice, 80), 50u);
    EXPECT_EQ(lp.Shares(alice), 0u);
    EXPECT_TRUE(lp.Positions().empty());
    EXPECT_EQ(lp.RemoveShares(MakeAddress(0x09), 1), 0u);

    lp.AddShares(alice, 10);
    ASSERT_TRUE(lp.Credit(40).ok());
    lp.RemoveShares(alice, 10);
    // Pending rewards survive the exit
    EXPECT_EQ(lp.Pending(alice), 40u);
    EXPECT_EQ(lp.Positions().size(), 1u);

    EXPECT_EQ(lp.TakePending(alice), 40u);
    EXPECT_TRUE(lp.Positions().empty());
    EXPECT_EQ(lp.TakePending(alice), 0u);
}

TEST(LpRewardLedgerTest, OverflowLeavesStateUntouched) {
    LpRewardLedger lp;
    Address alice = MakeAddress(0x01);
    lp.AddShares(alice, 1);
    ASSERT_TRUE(lp.Credit(UINT64_MAX - 5).ok());

    EXPECT_EQ(lp.Credit(10).code(), StakingError::STAKE_OVERFLOW);
    EXPECT_EQ(lp.Pending(alice), UINT64_MAX - 5);
    EXPECT_EQ(lp.Carry(), 0u);
}

TEST(LpRewardLedgerTest, RestoreRecomputesShares) {
    std::map<Address, LpPosition> positions;
    positions[MakeAddress(0x01)] = LpPosition{70, 5};
    positions[MakeAddress(0x02)] = LpPosition{30, 0};

    LpRewardLedger lp;
    lp.Restore(positions, 3);
    EXPECT_EQ(lp.TotalShares(), 100u);
    EXPECT_EQ(lp.Carry(), 3u);
    EXPECT_EQ(lp.Pending(MakeAddress(0x01)), 5u);
}

// ============================================================================
// Reward Split
// ============================================================================

TEST(RewardSplitTest, FixedRatios) {
    RewardSplit split = SplitReward(1000000);
    EXPECT_EQ(split.mev, 100000u);
    EXPECT_EQ(split.protocolFee, 100000u);
    EXPECT_EQ(split.lp, 800000u);
    EXPECT_EQ(split.Sum(), 1000000u);
}

TEST(RewardSplitTest, FloorsEachBucket) {
    RewardSplit split = SplitReward(999);
    EXPECT_EQ(split.mev, 99u);
    EXPECT_EQ(split.protocolFee, 99u);
    EXPECT_EQ(split.lp, 799u);
    EXPECT_LE(999 - split.Sum(), 2u);

    split = SplitReward(9);
    EXPECT_EQ(split.mev, 0u);
    EXPECT_EQ(split.lp, 7u);
}

TEST(RewardSplitTest, LargeRewardDoesNotOverflow) {
    RewardSplit split = SplitReward(UINT64_MAX);
    EXPECT_EQ(split.mev, UINT64_MAX / 10);
    EXPECT_LE(split.Sum(), UINT64_MAX);
}

TEST(RewardGateTest, IntervalBoundary) {
    PoolState pool;
    pool.lastRewardClaim = 1000;
    pool.rewardClaimInterval = MIN_REWARD_CLAIM_INTERVAL;

    EXPECT_FALSE(RewardDistributor::CanClaim(pool, 1000));
    EXPECT_FALSE(RewardDistributor::CanClaim(pool, 1000 + MIN_REWARD_CLAIM_INTERVAL - 1));
    EXPECT_TRUE(RewardDistributor::CanClaim(pool, 1000 + MIN_REWARD_CLAIM_INTERVAL));
}

// ============================================================================
// Simulated Validator
// ============================================================================

class SimulatedValidatorTest : public ::testing::Test {
protected:
    SimulatedValidatorTest()
        : reserve_(MakeAddress(0xee))
        , validator_(ledger_, reserve_)
        , target_(MakeAddress(0x77))
        , staker_(MakeAddress(0x01)) {}

    ledger::InMemoryLedger ledger_;
    Address reserve_;
    SimulatedValidator validator_;
    ValidatorId target_;
    Address staker_;
};

TEST_F(SimulatedValidatorTest, DelegateParksValueInCustody) {
    ASSERT_TRUE(ledger_.Credit(staker_, asset::TokenKind::Base, 100).ok());
    FungibleAsset value;
    ASSERT_TRUE(ledger_.Withdraw(staker_, asset::TokenKind::Base, 100, &value).ok());

    ASSERT_TRUE(validator_.Delegate(staker_, std::move(value), target_).ok());
    EXPECT_EQ(validator_.Delegated(target_), 100u);
    EXPECT_EQ(ledger_.Balance(SimulatedValidator::CustodyAccount(target_),
                              asset::TokenKind::Base), 100u);

    FungibleAsset released;
    ASSERT_TRUE(validator_.Undelegate(staker_, target_, 40, &released).ok());
    EXPECT_EQ(released.Value(), 40u);
    EXPECT_EQ(validator_.Delegated(target_), 60u);
    ASSERT_TRUE(ledger_.Deposit(staker_, std::move(released)).ok());

    FungibleAsset tooMuch;
    EXPECT_EQ(validator_.Undelegate(staker_, target_, 61, &tooMuch).code(),
              StakingError::VALIDATOR_CALL_FAILED);
}

TEST_F(SimulatedValidatorTest, DelegateRejectsWrongKindAndZero) {
    FungibleAsset zero(asset::TokenKind::Base);
    EXPECT_EQ(validator_.Delegate(staker_, std::move(zero), target_).code(),
              StakingError::ZERO_AMOUNT);

    ASSERT_TRUE(ledger_.Credit(staker_, asset::TokenKind::Staked, 5).ok());
    FungibleAsset staked(asset::TokenKind::Staked);
    ASSERT_TRUE(ledger_.Withdraw(staker_, asset::TokenKind::Staked, 5, &staked).ok());
    EXPECT_EQ(validator_.Delegate(staker_, std::move(staked), target_).code(),
              StakingError::TOKEN_KIND_MISMATCH);
    EXPECT_EQ(staked.Value(), 5u);
    ASSERT_TRUE(ledger_.Deposit(staker_, std::move(staked)).ok());
}

TEST_F(SimulatedValidatorTest, ClaimPaysFromReserve) {
    Address claimer = MakeAddress(0xad);

    // Nothing accrued: succeeds with no payment
    ASSERT_TRUE(validator_.ClaimReward(claimer, target_).ok());
    EXPECT_EQ(ledger_.Balance(claimer, asset::TokenKind::Base), 0u);

    EXPECT_EQ(validator_.AccrueRewards(target_, 0).code(), StakingError::ZERO_AMOUNT);
    ASSERT_TRUE(validator_.AccrueRewards(target_, 700).ok());
    EXPECT_EQ(validator_.PendingRewards(target_), 700u);

    // Reserve cannot cover the claim yet
    EXPECT_EQ(validator_.ClaimReward(claimer, target_).code(),
              StakingError::VALIDATOR_CALL_FAILED);
    EXPECT_EQ(validator_.PendingRewards(target_), 700u);

    ASSERT_TRUE(ledger_.Credit(reserve_, asset::TokenKind::Base, 1000).ok());
    ASSERT_TRUE(validator_.ClaimReward(claimer, target_).ok());
    EXPECT_EQ(ledger_.Balance(claimer, asset::TokenKind::Base), 700u);
    EXPECT_EQ(ledger_.Balance(reserve_, asset::TokenKind::Base), 300u);
    EXPECT_EQ(validator_.PendingRewards(target_), 0u);
}

TEST_F(SimulatedValidatorTest, ReturnedRewardIsPendingAgain) {
    Address claimer = MakeAddress(0xad);
    ASSERT_TRUE(ledger_.Credit(reserve_, asset::TokenKind::Base, 500).ok());
    ASSERT_TRUE(validator_.AccrueRewards(target_, 500).ok());
    ASSERT_TRUE(validator_.ClaimReward(claimer, target_).ok());
    EXPECT_EQ(validator_.PendingRewards(target_), 0u);

    FungibleAsset reward;
    ASSERT_TRUE(ledger_.Withdraw(claimer, asset::TokenKind::Base, 500, &reward).ok());
    ASSERT_TRUE(validator_.ReturnReward(target_, std::move(reward)).ok());
    EXPECT_EQ(validator_.PendingRewards(target_), 500u);
    EXPECT_EQ(ledger_.Balance(reserve_, asset::TokenKind::Base), 500u);
    EXPECT_EQ(ledger_.Balance(claimer, asset::TokenKind::Base), 0u);

    // The reward can be claimed again in full
    ASSERT_TRUE(validator_.ClaimReward(claimer, target_).ok());
    EXPECT_EQ(ledger_.Balance(claimer, asset::TokenKind::Base), 500u);
}

TEST_F(SimulatedValidatorTest, SnapshotRoundTrip) {
    ASSERT_TRUE(validator_.AccrueRewards(target_, 9).ok());
    auto records = validator_.Snapshot();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].validator, target_);
    EXPECT_EQ(records[0].pendingRewards, 9u);

    SimulatedValidator restored(ledger_, reserve_);
    restored.Restore(records);
    EXPECT_EQ(restored.PendingRewards(target_), 9u);
    EXPECT_EQ(restored.Delegated(target_), 0u);
}

} // namespace test
} // namespace staking
} // namespace liquidstake
