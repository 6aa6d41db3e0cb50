// LIQUIDSTAKE - Reward Claimer Implementation
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License

#include "liquidstake/claimer/reward_claimer.h"
#include "liquidstake/crypto/hash.h"
#include "liquidstake/rpc/client.h"
#include "liquidstake/util/config.h"
#include "liquidstake/util/logging.h"
#include "liquidstake/util/time.h"

#include <algorithm>
#include <memory>
#include <stdexcept>

namespace liquidstake {
namespace claimer {

using rpc::JSONValue;
using rpc::RPCResponse;

namespace {

constexpr uint32_t SEED_ITERATIONS = 2048;
constexpr size_t SEED_LENGTH = 64;

/// Longest single sleep, so a stop request is seen promptly
constexpr int64_t MAX_SLEEP_MS = 1000;

util::CronSchedule ParseSchedule(const std::string& expression) {
    std::string error;
    auto schedule = util::CronSchedule::Parse(expression, &error);
    if (!schedule) {
        throw std::invalid_argument("Invalid claim schedule \"" + expression + "\": " + error);
    }
    return *schedule;
}

RewardClaimer::Transport MakeClientTransport(const ClaimerConfig& config) {
    rpc::RPCClientConfig clientConfig;
    if (!rpc::ParseEndpoint(config.rpcEndpoint, clientConfig)) {
        throw std::invalid_argument("Invalid RPC endpoint: " + config.rpcEndpoint);
    }
    clientConfig.rpcUser = config.rpcUser;
    clientConfig.rpcPassword = config.rpcPassword;

    auto client = std::make_shared<rpc::RPCClient>(clientConfig);
    return [client](const std::string& method, const JSONValue& params) {
        return client->Call(method, params);
    };
}

} // namespace

// ============================================================================
// Configuration
// ============================================================================

ClaimerConfig ClaimerConfig::FromConfig(const util::ConfigManager& config) {
    namespace keys = util::ConfigKeys;

    ClaimerConfig result;
    result.rpcEndpoint = config.GetString(keys::RPCENDPOINT, DEFAULT_RPC_ENDPOINT);
    result.contractAddress = config.GetString(keys::CONTRACTADDRESS, "");
    result.adminMnemonic = config.GetString(keys::ADMINMNEMONIC, "");
    result.claimSchedule = config.GetString(keys::CLAIMSCHEDULE, DEFAULT_CLAIM_SCHEDULE);
    result.rpcUser = config.GetString(keys::RPCUSER, "");
    result.rpcPassword = config.GetString(keys::RPCPASSWORD, "");
    return result;
}

const std::map<std::string, std::string>& ClaimerEnvironment() {
    static const std::map<std::string, std::string> variables = {
        {"RPC_ENDPOINT", util::ConfigKeys::RPCENDPOINT},
        {"CONTRACT_ADDRESS", util::ConfigKeys::CONTRACTADDRESS},
        {"ADMIN_MNEMONIC", util::ConfigKeys::ADMINMNEMONIC},
        {"CLAIM_CRON_SCHEDULE", util::ConfigKeys::CLAIMSCHEDULE},
        {"LOG_LEVEL", util::ConfigKeys::LOGLEVEL},
        {"LOG_FILE", util::ConfigKeys::LOGFILE},
        {"RPC_USER", util::ConfigKeys::RPCUSER},
        {"RPC_PASSWORD", util::ConfigKeys::RPCPASSWORD},
    };
    return variables;
}

Address DeriveAdminAddress(const std::string& mnemonic) {
    std::vector<Byte> seed = PBKDF2_SHA512(mnemonic, "mnemonic", SEED_ITERATIONS, SEED_LENGTH);
    Hash256 digest = SHA256Hash(seed);
    return Address(digest.data(), Address::SIZE);
}

const char* TickResultToString(TickResult result) {
    switch (result) {
        case TickResult::NotReady:    return "not-ready";
        case TickResult::Claimed:     return "claimed";
        case TickResult::Rejected:    return "rejected";
        case TickResult::CheckFailed: return "check-failed";
        case TickResult::ClaimFailed: return "claim-failed";
    }
    return "unknown";
}

// ============================================================================
// RewardClaimer
// ============================================================================

RewardClaimer::RewardClaimer(const ClaimerConfig& config, Transport transport)
    : config_(config),
      schedule_(ParseSchedule(config.claimSchedule)),
      transport_(transport ? std::move(transport) : MakeClientTransport(config)),
      admin_(DeriveAdminAddress(config.adminMnemonic)) {
    if (config_.adminMnemonic.empty()) {
        LOG_WARN(util::LogCategory::CLAIMER) << "No admin mnemonic configured; claims will be "
                                             << "rejected unless the pool admin matches "
                                             << admin_.ToHex();
    }
}

JSONValue RewardClaimer::BaseParams() const {
    JSONValue::Object params;
    if (!config_.contractAddress.empty()) {
        params["contract"] = config_.contractAddress;
    }
    return JSONValue(std::move(params));
}

std::optional<bool> RewardClaimer::CanClaimRewards() {
    RPCResponse response = transport_("can_claim_rewards", BaseParams());
    if (response.IsError()) {
        LOG_ERROR(util::LogCategory::CLAIMER) << "Error checking reward claim availability: "
                                              << response.GetErrorMessage();
        return std::nullopt;
    }

    const JSONValue& result = response.GetResult();
    if (!result.IsObject() || !result["can_claim"].IsBool()) {
        LOG_ERROR(util::LogCategory::CLAIMER) << "Error checking reward claim availability: "
                                              << "malformed response " << result.ToJSON();
        return std::nullopt;
    }
    return result["can_claim"].GetBool();
}

TickResult RewardClaimer::ClaimRewards() {
    std::optional<bool> canClaim = CanClaimRewards();
    if (!canClaim || !*canClaim) {
        LOG_INFO(util::LogCategory::CLAIMER)
            << "Cannot claim rewards yet - waiting for next interval";
        if (!canClaim) {
            ++failures_;
            return TickResult::CheckFailed;
        }
        return TickResult::NotReady;
    }

    JSONValue params = BaseParams();
    params["sender"] = admin_.ToHex();

    RPCResponse response = transport_("try_claim_rewards", params);
    if (response.IsError()) {
        ++failures_;
        LOG_ERROR(util::LogCategory::CLAIMER) << "Error during reward claim: "
                                              << response.GetErrorMessage();
        return TickResult::ClaimFailed;
    }

    const JSONValue& result = response.GetResult();
    if (!result.IsObject() || !result["code"].IsInt()) {
        ++failures_;
        LOG_ERROR(util::LogCategory::CLAIMER) << "Error during reward claim: "
                                              << "malformed response " << result.ToJSON();
        return TickResult::ClaimFailed;
    }

    if (result["code"].GetInt() != 0) {
        ++failures_;
        LOG_ERROR(util::LogCategory::CLAIMER) << "Reward claim failed: "
                                              << result["log"].GetString();
        return TickResult::Rejected;
    }

    // Another caller may have claimed between the check and the submission
    if (result["claimed"].IsBool() && !result["claimed"].GetBool()) {
        LOG_INFO(util::LogCategory::CLAIMER)
            << "Cannot claim rewards yet - waiting for next interval";
        return TickResult::NotReady;
    }

    ++claims_;
    LOG_INFO(util::LogCategory::CLAIMER) << "Reward claim successful! TxHash: "
                                         << result["hash"].GetString();
    return TickResult::Claimed;
}

void RewardClaimer::Run(const std::atomic<bool>& stop) {
    LOG_INFO(util::LogCategory::CLAIMER) << "Starting reward claim automation system";

    std::optional<int64_t> next = schedule_.NextAfter(util::GetTime());
    if (!next) {
        LOG_ERROR(util::LogCategory::CLAIMER) << "Claim schedule \"" << schedule_.Expression()
                                              << "\" never fires";
        return;
    }
    LOG_INFO(util::LogCategory::CLAIMER) << "Next reward claim scheduled for: "
                                         << util::FormatISO8601(*next);

    while (!stop.load()) {
        int64_t now = util::GetTime();
        if (now >= *next) {
            TickResult result = ClaimRewards();
            LOG_DEBUG(util::LogCategory::CLAIMER) << "Scheduled run finished: "
                                                  << TickResultToString(result);

            next = schedule_.NextAfter(now);
            if (!next) {
                LOG_ERROR(util::LogCategory::CLAIMER) << "Claim schedule has no further runs";
                return;
            }
            LOG_DEBUG(util::LogCategory::CLAIMER) << "Next reward claim scheduled for: "
                                                  << util::FormatISO8601(*next);
            continue;
        }

        int64_t waitMs = std::min<int64_t>((*next - now) * 1000, MAX_SLEEP_MS);
        if (util::SleepInterruptible(util::Milliseconds(waitMs), stop)) {
            break;
        }
    }

    LOG_INFO(util::LogCategory::CLAIMER) << "Reward claim automation stopped";
}

} // namespace claimer
} // namespace liquidstake
