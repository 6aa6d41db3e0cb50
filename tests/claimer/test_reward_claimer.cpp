// LIQUIDSTAKE - Reward Claimer Tests
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License

#include <gtest/gtest.h>

#include "liquidstake/claimer/reward_claimer.h"
#include "liquidstake/ledger/ledger.h"
#include "liquidstake/rpc/commands.h"
#include "liquidstake/staking/liquid_staking.h"
#include "liquidstake/staking/validator_service.h"
#include "liquidstake/util/config.h"
#include "liquidstake/util/logging.h"

#include <atomic>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace liquidstake {
namespace claimer {
namespace test {

namespace ErrorCode = rpc::ErrorCode;
using rpc::JSONValue;
using rpc::RPCResponse;

namespace {

const char* TEST_MNEMONIC =
    "abandon abandon abandon abandon abandon abandon "
    "abandon abandon abandon abandon abandon about";

/// Canned responses keyed by method, with a record of every call made
struct ScriptedTransport {
    std::vector<std::pair<std::string, JSONValue>> calls;
    std::vector<RPCResponse> canClaim;
    std::vector<RPCResponse> tryClaim;

    RewardClaimer::Transport Bind() {
        return [this](const std::string& method, const JSONValue& params) {
            calls.emplace_back(method, params);
            std::vector<RPCResponse>& queue = method == "can_claim_rewards" ? canClaim : tryClaim;
            if (queue.empty()) {
                return RPCResponse::Error(ErrorCode::NETWORK_ERROR, "no scripted response",
                                          JSONValue(1));
            }
            RPCResponse next = queue.front();
            queue.erase(queue.begin());
            return next;
        };
    }
};

RPCResponse CanClaim(bool value) {
    JSONValue::Object result;
    result["can_claim"] = value;
    return RPCResponse::Success(JSONValue(std::move(result)), JSONValue(1));
}

RPCResponse ClaimResult(int code, bool claimed, const std::string& hash, const std::string& log) {
    JSONValue::Object result;
    result["code"] = code;
    result["claimed"] = claimed;
    result["hash"] = hash;
    result["log"] = log;
    return RPCResponse::Success(JSONValue(std::move(result)), JSONValue(2));
}

} // namespace

// ============================================================================
// Test Fixture
// ============================================================================

class RewardClaimerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& logger = util::Logger::Instance();
        logger.ClearSinks();
        logger.EnableAllCategories();
        logger.SetLevel(util::LogLevel::Info);
        logger.AddSink(std::make_shared<util::CallbackSink>(
            [this](const util::LogEntry& entry) {
                if (entry.category == util::LogCategory::CLAIMER) {
                    messages_.push_back(entry.message);
                }
            }));

        config_.adminMnemonic = TEST_MNEMONIC;
        config_.contractAddress = "pool-1";
    }

    void TearDown() override {
        util::Logger::Instance().ClearSinks();
    }

    bool Logged(const std::string& message) const {
        for (const auto& m : messages_) {
            if (m == message) return true;
        }
        return false;
    }

    ClaimerConfig config_;
    ScriptedTransport transport_;
    std::vector<std::string> messages_;
};

// ============================================================================
// Admin Derivation
// ============================================================================

TEST(DeriveAdminAddressTest, KnownMnemonic) {
    EXPECT_EQ(DeriveAdminAddress(TEST_MNEMONIC).ToHex(),
              "62a772f85e4be6226108b56c0b1cf935c2490e43");
}

TEST(DeriveAdminAddressTest, DeterministicAndDistinct) {
    Address a = DeriveAdminAddress("one two three");
    EXPECT_EQ(a, DeriveAdminAddress("one two three"));
    EXPECT_NE(a, DeriveAdminAddress("one two four"));
    EXPECT_FALSE(DeriveAdminAddress("").IsNull());
}

// ============================================================================
// Configuration
// ============================================================================

TEST(ClaimerConfigTest, DefaultsAndOverrides) {
    util::ConfigManager empty;
    ClaimerConfig defaults = ClaimerConfig::FromConfig(empty);
    EXPECT_EQ(defaults.rpcEndpoint, DEFAULT_RPC_ENDPOINT);
    EXPECT_EQ(defaults.claimSchedule, DEFAULT_CLAIM_SCHEDULE);
    EXPECT_TRUE(defaults.adminMnemonic.empty());

    util::ConfigManager config;
    auto parsed = config.ParseString(
        "rpcendpoint=http://10.0.0.5:8645\n"
        "claimschedule=\"*/15 * * * *\"\n"
        "adminmnemonic=\"word word\"\n");
    ASSERT_TRUE(parsed.success) << parsed.Describe();

    ClaimerConfig loaded = ClaimerConfig::FromConfig(config);
    EXPECT_EQ(loaded.rpcEndpoint, "http://10.0.0.5:8645");
    EXPECT_EQ(loaded.claimSchedule, "*/15 * * * *");
    EXPECT_EQ(loaded.adminMnemonic, "word word");
}

TEST(ClaimerConfigTest, EnvironmentNames) {
    const auto& env = ClaimerEnvironment();
    EXPECT_EQ(env.at("CLAIM_CRON_SCHEDULE"), util::ConfigKeys::CLAIMSCHEDULE);
    EXPECT_EQ(env.at("ADMIN_MNEMONIC"), util::ConfigKeys::ADMINMNEMONIC);
    EXPECT_EQ(env.count("RPC_ENDPOINT"), 1u);
}

TEST_F(RewardClaimerTest, RejectsBadScheduleOrEndpoint) {
    config_.claimSchedule = "61 * * * *";
    EXPECT_THROW(RewardClaimer(config_, transport_.Bind()), std::invalid_argument);

    config_.claimSchedule = DEFAULT_CLAIM_SCHEDULE;
    config_.rpcEndpoint = "https://node:443";
    EXPECT_THROW(RewardClaimer claimer(config_), std::invalid_argument);
}

TEST_F(RewardClaimerTest, NextRunFollowsSchedule) {
    RewardClaimer claimer(config_, transport_.Bind());
    // 2024-01-01 00:10:00 UTC
    auto next = claimer.NextRun(1704067800);
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(*next, 1704070800);
}

// ============================================================================
// Claim Runs
// ============================================================================

TEST_F(RewardClaimerTest, NotReadySkipsClaim) {
    transport_.canClaim.push_back(CanClaim(false));
    RewardClaimer claimer(config_, transport_.Bind());

    EXPECT_EQ(claimer.ClaimRewards(), TickResult::NotReady);
    ASSERT_EQ(transport_.calls.size(), 1u);
    EXPECT_EQ(transport_.calls[0].first, "can_claim_rewards");
    EXPECT_EQ(transport_.calls[0].second["contract"].GetString(), "pool-1");
    EXPECT_TRUE(Logged("Cannot claim rewards yet - waiting for next interval"));
    EXPECT_EQ(claimer.GetFailureCount(), 0u);
}

TEST_F(RewardClaimerTest, ClaimSubmittedAsAdmin) {
    std::string hash(64, 'f');
    transport_.canClaim.push_back(CanClaim(true));
    transport_.tryClaim.push_back(ClaimResult(0, true, hash, "rewards distributed"));
    RewardClaimer claimer(config_, transport_.Bind());

    EXPECT_EQ(claimer.ClaimRewards(), TickResult::Claimed);
    ASSERT_EQ(transport_.calls.size(), 2u);
    EXPECT_EQ(transport_.calls[1].first, "try_claim_rewards");
    EXPECT_EQ(transport_.calls[1].second["sender"].GetString(), claimer.AdminAddress().ToHex());
    EXPECT_EQ(transport_.calls[1].second["contract"].GetString(), "pool-1");
    EXPECT_TRUE(Logged("Reward claim successful! TxHash: " + hash));
    EXPECT_EQ(claimer.GetClaimCount(), 1u);
}

TEST_F(RewardClaimerTest, CheckFailureIsLogged) {
    transport_.canClaim.push_back(
        RPCResponse::Error(ErrorCode::NETWORK_ERROR, "connection refused", JSONValue(1)));
    RewardClaimer claimer(config_, transport_.Bind());

    EXPECT_EQ(claimer.ClaimRewards(), TickResult::CheckFailed);
    EXPECT_EQ(transport_.calls.size(), 1u);
    EXPECT_TRUE(Logged("Error checking reward claim availability: connection refused"));
    EXPECT_EQ(claimer.GetFailureCount(), 1u);
}

TEST_F(RewardClaimerTest, MalformedCheckIsFailure) {
    transport_.canClaim.push_back(RPCResponse::Success(JSONValue(true), JSONValue(1)));
    RewardClaimer claimer(config_, transport_.Bind());
    EXPECT_EQ(claimer.ClaimRewards(), TickResult::CheckFailed);
}

TEST_F(RewardClaimerTest, SubmissionErrorIsClaimFailed) {
    transport_.canClaim.push_back(CanClaim(true));
    transport_.tryClaim.push_back(
        RPCResponse::Error(ErrorCode::UNAUTHORIZED, "Authorization failed (HTTP 401)",
                           JSONValue(2)));
    RewardClaimer claimer(config_, transport_.Bind());

    EXPECT_EQ(claimer.ClaimRewards(), TickResult::ClaimFailed);
    EXPECT_TRUE(Logged("Error during reward claim: Authorization failed (HTTP 401)"));
}

TEST_F(RewardClaimerTest, NonZeroCodeIsRejected) {
    transport_.canClaim.push_back(CanClaim(true));
    transport_.tryClaim.push_back(ClaimResult(1, false, "", "PermissionDenied: not admin"));
    RewardClaimer claimer(config_, transport_.Bind());

    EXPECT_EQ(claimer.ClaimRewards(), TickResult::Rejected);
    EXPECT_TRUE(Logged("Reward claim failed: PermissionDenied: not admin"));
    EXPECT_EQ(claimer.GetClaimCount(), 0u);
    EXPECT_EQ(claimer.GetFailureCount(), 1u);
}

TEST_F(RewardClaimerTest, LostRaceIsNotReady) {
    transport_.canClaim.push_back(CanClaim(true));
    transport_.tryClaim.push_back(
        ClaimResult(0, false, "", "reward claim interval has not elapsed"));
    RewardClaimer claimer(config_, transport_.Bind());
    EXPECT_EQ(claimer.ClaimRewards(), TickResult::NotReady);
}

TEST_F(RewardClaimerTest, StopBeforeFirstRun) {
    RewardClaimer claimer(config_, transport_.Bind());
    std::atomic<bool> stop{true};
    claimer.Run(stop);
    EXPECT_TRUE(transport_.calls.empty());
    EXPECT_TRUE(Logged("Starting reward claim automation system"));
    EXPECT_TRUE(Logged("Reward claim automation stopped"));
}

// ============================================================================
// Against the Command Table
// ============================================================================

TEST_F(RewardClaimerTest, ClaimsThroughCommandTable) {
    ledger::InMemoryLedger ledger;
    staking::SimulatedValidator validator(ledger, staking::SimulatedValidator::DefaultReserveAccount());
    Timestamp now = 1704067200;

    staking::ServiceConfig serviceConfig;
    serviceConfig.admin = DeriveAdminAddress(TEST_MNEMONIC);
    staking::LiquidStakingService service(serviceConfig, ledger, validator, nullptr,
                                          [&now]() { return now; });

    rpc::RPCCommandTable table(service, ledger, validator);
    rpc::RPCServerConfig serverConfig;
    serverConfig.enableRateLimiting = false;
    rpc::RPCServer server(serverConfig);
    table.RegisterCommands(server);

    rpc::RPCContext ctx;
    ctx.username = "__cookie__";
    RewardClaimer::Transport local = [&](const std::string& method, const JSONValue& params) {
        return server.HandleRequest(rpc::RPCRequest(method, params, JSONValue(1)), ctx);
    };

    ValidatorId validatorId = Address::FromHex(std::string(40, '5'));
    ASSERT_TRUE(service.Initialize(serviceConfig.admin, validatorId, {}).ok());

    RewardClaimer claimer(config_, local);
    EXPECT_EQ(claimer.ClaimRewards(), TickResult::NotReady);

    ASSERT_TRUE(ledger.Credit(validator.ReserveAccount(), asset::TokenKind::Base, 1000).ok());
    ASSERT_TRUE(validator.AccrueRewards(validatorId, 1000).ok());
    now += staking::DEFAULT_REWARD_CLAIM_INTERVAL;

    EXPECT_EQ(claimer.ClaimRewards(), TickResult::Claimed);
    // Recipients default to the admin and nobody stakes, so every share lands there
    EXPECT_EQ(ledger.Balance(serviceConfig.admin, asset::TokenKind::Base), 1000u);
    EXPECT_FALSE(service.CanClaimRewards());

    // A claimer with a different mnemonic is turned away by the pool
    config_.adminMnemonic = "someone else";
    RewardClaimer stranger(config_, local);
    now += staking::DEFAULT_REWARD_CLAIM_INTERVAL;
    EXPECT_EQ(stranger.ClaimRewards(), TickResult::Rejected);
}

} // namespace test
} // namespace claimer
} // namespace liquidstake
