// LIQUIDSTAKE - State Store Tests
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License

#include <gtest/gtest.h>

#include "liquidstake/db/memorydb.h"
#include "liquidstake/store/state_store.h"

#include <string>
#include <vector>

namespace liquidstake {
namespace store {
namespace test {

using asset::TokenKind;

namespace {

Address MakeAddress(Byte tag) {
    return Address(&tag, 1);
}

} // namespace

class StateStoreTest : public ::testing::Test {
protected:
    StateStoreTest()
        : admin_(MakeAddress(0xad))
        , alice_(MakeAddress(0xa1))
        , reserve_(MakeAddress(0xee))
        , validatorId_(MakeAddress(0x55)) {}

    staking::ServiceConfig Config() const {
        staking::ServiceConfig config;
        config.admin = admin_;
        return config;
    }

    db::MemoryDatabase db_;
    Address admin_;
    Address alice_;
    Address reserve_;
    ValidatorId validatorId_;
    Timestamp now_{1704067200};
};

TEST_F(StateStoreTest, EmptyDatabaseHasNoState) {
    StateStore store(db_);
    EXPECT_FALSE(store.HasState());

    PersistedState state;
    EXPECT_TRUE(store.Read(&state).IsNotFound());

    ledger::InMemoryLedger ledger;
    staking::SimulatedValidator validator(ledger, reserve_);
    staking::LiquidStakingService service(Config(), ledger, validator);
    EXPECT_TRUE(store.Load(service, ledger, validator).IsNotFound());
    EXPECT_FALSE(service.IsInitialized());
}

TEST_F(StateStoreTest, CommitAndLoadRoundTrip) {
    {
        ledger::InMemoryLedger ledger;
        staking::SimulatedValidator validator(ledger, reserve_);
        staking::LiquidStakingService service(Config(), ledger, validator, nullptr,
                                              [this]() { return now_; });

        ASSERT_TRUE(service.Initialize(admin_, validatorId_, {0x02}).ok());
        ASSERT_TRUE(ledger.Credit(alice_, TokenKind::Base, 100 * COIN).ok());
        ASSERT_TRUE(service.Stake(alice_, 40 * COIN).ok());
        ASSERT_TRUE(ledger.Credit(reserve_, TokenKind::Base, 1000).ok());
        ASSERT_TRUE(validator.AccrueRewards(validatorId_, 1000).ok());
        now_ += staking::DEFAULT_REWARD_CLAIM_INTERVAL;
        ASSERT_TRUE(service.TryClaimRewards(admin_).ok());
        ASSERT_TRUE(service.SetAccountFrozen(admin_, alice_, TokenKind::Staked, true).ok());

        StateStore store(db_);
        ASSERT_TRUE(store.Commit(service, ledger, validator).ok());
        EXPECT_EQ(store.CommitCount(), 1u);
        EXPECT_TRUE(store.HasState());
    }

    ledger::InMemoryLedger ledger;
    staking::SimulatedValidator validator(ledger, reserve_);
    staking::LiquidStakingService service(Config(), ledger, validator, nullptr,
                                          [this]() { return now_; });
    StateStore store(db_);
    ASSERT_TRUE(store.Load(service, ledger, validator).ok());

    EXPECT_TRUE(service.IsInitialized());
    EXPECT_EQ(service.GetValidator(), validatorId_);
    EXPECT_EQ(service.GetTotalStaked(), 40 * COIN);
    EXPECT_EQ(service.GetTotalDelegation(), 40 * COIN);
    EXPECT_EQ(service.GetStakedSupply(), 40 * COIN);
    EXPECT_EQ(service.GetPendingLpRewards(alice_), 800u);
    EXPECT_FALSE(service.CanClaimRewards());

    EXPECT_EQ(ledger.Balance(alice_, TokenKind::Base), 60 * COIN);
    EXPECT_EQ(ledger.Balance(alice_, TokenKind::Staked), 40 * COIN);
    EXPECT_TRUE(ledger.IsFrozen(alice_, TokenKind::Staked));
    EXPECT_EQ(validator.Delegated(validatorId_), 40 * COIN);
    EXPECT_EQ(validator.PendingRewards(validatorId_), 0u);

    auto info = service.GetPoolInfo();
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->state.lastRewardClaim, now_);
    EXPECT_EQ(ledger.Balance(info->state.lpRewardVault, TokenKind::Base), 800u);
}

TEST_F(StateStoreTest, WriteReplacesKeyedRecords) {
    StateStore store(db_);

    PersistedState first;
    first.balances.push_back(ledger::BalanceRecord{alice_, TokenKind::Base, 5});
    first.balances.push_back(ledger::BalanceRecord{admin_, TokenKind::Staked, 7});
    ASSERT_TRUE(store.Write(first).ok());

    PersistedState second;
    second.balances.push_back(ledger::BalanceRecord{alice_, TokenKind::Base, 9});
    ASSERT_TRUE(store.Write(second).ok());

    PersistedState read;
    ASSERT_TRUE(store.Read(&read).ok());
    ASSERT_EQ(read.balances.size(), 1u);
    EXPECT_EQ(read.balances[0].owner, alice_);
    EXPECT_EQ(read.balances[0].amount, 9u);
    EXPECT_FALSE(read.service.pool.has_value());
    EXPECT_EQ(store.CommitCount(), 2u);
}

TEST_F(StateStoreTest, UnknownSchemaVersionIsCorruption) {
    StateStore store(db_);
    ASSERT_TRUE(store.Write(PersistedState()).ok());

    ASSERT_TRUE(db_.Put(db::MakeKey(db::prefix::VERSION), std::string(1, '\x02')).ok());

    PersistedState state;
    EXPECT_TRUE(store.Read(&state).IsCorruption());
}

TEST_F(StateStoreTest, DamagedRecordIsCorruption) {
    StateStore store(db_);
    ASSERT_TRUE(store.Write(PersistedState()).ok());

    // Version byte only, counters missing
    ASSERT_TRUE(db_.Put(db::MakeKey(db::prefix::RATES), std::string(1, '\x01')).ok());

    PersistedState state;
    EXPECT_TRUE(store.Read(&state).IsCorruption());
}

TEST_F(StateStoreTest, RecordWithUnknownVersionIsCorruption) {
    StateStore store(db_);
    PersistedState written;
    written.balances.push_back(ledger::BalanceRecord{alice_, TokenKind::Base, 5});
    ASSERT_TRUE(store.Write(written).ok());

    ASSERT_TRUE(db_.Put(db::MakeKey(db::prefix::LP_CARRY),
                        std::string("\x09\x00\x00\x00\x00\x00\x00\x00\x00", 9)).ok());

    PersistedState state;
    db::Status status = store.Read(&state);
    EXPECT_TRUE(status.IsCorruption());
    EXPECT_NE(status.message().find("unknown version"), std::string::npos);
}

TEST_F(StateStoreTest, LoadRejectsForeignAdmin) {
    {
        ledger::InMemoryLedger ledger;
        staking::SimulatedValidator validator(ledger, reserve_);
        staking::LiquidStakingService service(Config(), ledger, validator);
        ASSERT_TRUE(service.Initialize(admin_, validatorId_, {}).ok());
        ASSERT_TRUE(StateStore(db_).Commit(service, ledger, validator).ok());
    }

    staking::ServiceConfig other;
    other.admin = alice_;
    ledger::InMemoryLedger ledger;
    staking::SimulatedValidator validator(ledger, reserve_);
    staking::LiquidStakingService service(other, ledger, validator);

    StateStore store(db_);
    db::Status status = store.Load(service, ledger, validator);
    EXPECT_EQ(status.code(), db::Status::INVALID_ARGUMENT);
    EXPECT_FALSE(service.IsInitialized());
}

} // namespace test
} // namespace store
} // namespace liquidstake
