// LIQUIDSTAKE - Reward Claimer
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License
//
// Scheduled automation that asks the daemon whether the reward claim
// interval has elapsed and, if so, submits try_claim_rewards as the admin.

#ifndef LIQUIDSTAKE_CLAIMER_REWARD_CLAIMER_H
#define LIQUIDSTAKE_CLAIMER_REWARD_CLAIMER_H

#include "liquidstake/core/types.h"
#include "liquidstake/rpc/protocol.h"
#include "liquidstake/util/cron.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace liquidstake {

namespace util { class ConfigManager; }

namespace claimer {

// ============================================================================
// Configuration
// ============================================================================

constexpr const char* DEFAULT_RPC_ENDPOINT = "http://localhost:26657";
constexpr const char* DEFAULT_CLAIM_SCHEDULE = "0 * * * *";
constexpr const char* DEFAULT_LOG_FILE = "reward-claimer.log";

struct ClaimerConfig {
    std::string rpcEndpoint{DEFAULT_RPC_ENDPOINT};
    std::string contractAddress;
    std::string adminMnemonic;
    std::string claimSchedule{DEFAULT_CLAIM_SCHEDULE};
    std::string rpcUser;
    std::string rpcPassword;

    /// Read the claimer keys, falling back to the defaults above
    static ClaimerConfig FromConfig(const util::ConfigManager& config);
};

/// Environment variables understood by reward-claimer, mapped to config keys
const std::map<std::string, std::string>& ClaimerEnvironment();

/**
 * Derive the admin address from a mnemonic phrase.
 *
 * seed = PBKDF2-HMAC-SHA512(mnemonic, "mnemonic", 2048, 64 bytes);
 * address = first 20 bytes of SHA-256(seed).
 */
Address DeriveAdminAddress(const std::string& mnemonic);

// ============================================================================
// Reward Claimer
// ============================================================================

enum class TickResult {
    NotReady,       // interval has not elapsed
    Claimed,
    Rejected,       // daemon answered with a non-zero code
    CheckFailed,    // can_claim_rewards could not be evaluated
    ClaimFailed,    // try_claim_rewards could not be submitted
};

const char* TickResultToString(TickResult result);

class RewardClaimer {
public:
    /// Sends one JSON-RPC call and returns the response (never throws for I/O)
    using Transport = std::function<rpc::RPCResponse(const std::string& method,
                                                     const rpc::JSONValue& params)>;

    /**
     * @param transport Defaults to an rpc::RPCClient on config.rpcEndpoint
     * @throws std::invalid_argument on a bad schedule or endpoint
     */
    explicit RewardClaimer(const ClaimerConfig& config, Transport transport = nullptr);

    /// One scheduled run: check, then claim if allowed
    TickResult ClaimRewards();

    /// First scheduled run strictly after the given time
    std::optional<int64_t> NextRun(int64_t after) const { return schedule_.NextAfter(after); }

    /**
     * Log the start banner, then run ClaimRewards on every schedule match
     * until stop is set. Returns early only if the schedule never fires.
     */
    void Run(const std::atomic<bool>& stop);

    const Address& AdminAddress() const { return admin_; }
    const ClaimerConfig& GetConfig() const { return config_; }

    uint64_t GetClaimCount() const { return claims_; }
    uint64_t GetFailureCount() const { return failures_; }

private:
    /// nullopt if the daemon could not be asked (already logged)
    std::optional<bool> CanClaimRewards();

    rpc::JSONValue BaseParams() const;

    ClaimerConfig config_;
    util::CronSchedule schedule_;
    Transport transport_;
    Address admin_;

    uint64_t claims_{0};
    uint64_t failures_{0};
};

} // namespace claimer
} // namespace liquidstake

#endif // LIQUIDSTAKE_CLAIMER_REWARD_CLAIMER_H
