// LIQUIDSTAKE - RPC Commands
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License
//
// JSON-RPC methods of liquidstaked.
//
// Categories:
// - Staking: initialize, stake, unstake, claim_lp_rewards
// - Admin: update_validator, update_reward_claim_interval, ...
// - Rewards: try_claim_rewards, can_claim_rewards
// - Query: get_exchange_rate, get_pool_info, ...
// - Host: credit, accrue_rewards, get_balance
// - Utility: help, stop, uptime
//
// Parameters are passed as a JSON object. The acting principal is the
// "sender" parameter (hex address).

#ifndef LIQUIDSTAKE_RPC_COMMANDS_H
#define LIQUIDSTAKE_RPC_COMMANDS_H

#include "liquidstake/asset/fungible_asset.h"
#include "liquidstake/core/status.h"
#include "liquidstake/core/types.h"
#include "liquidstake/rpc/server.h"

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace liquidstake {

namespace ledger { class InMemoryLedger; }
namespace staking {
class LiquidStakingService;
class SimulatedValidator;
}
namespace store { class StateStore; }

namespace rpc {

// ============================================================================
// Command Categories
// ============================================================================

namespace Category {
    constexpr const char* STAKING = "Staking";
    constexpr const char* ADMIN = "Admin";
    constexpr const char* REWARDS = "Rewards";
    constexpr const char* QUERY = "Query";
    constexpr const char* HOST = "Host";
    constexpr const char* UTILITY = "Utility";
}

// ============================================================================
// RPC Command Table - Registration
// ============================================================================

/**
 * Owns the command definitions and the objects they act on.
 */
class RPCCommandTable {
public:
    /**
     * @param store Optional; when set every successful mutation is committed
     */
    RPCCommandTable(staking::LiquidStakingService& service,
                    ledger::InMemoryLedger& ledger,
                    staking::SimulatedValidator& validator,
                    store::StateStore* store = nullptr);

    /// Register all commands with the server
    void RegisterCommands(RPCServer& server);

    std::vector<RPCMethod> GetAllCommands() const { return commands_; }
    std::vector<RPCMethod> GetCommandsByCategory(const std::string& category) const;

    /// Invoked by the "stop" command
    void SetShutdownCallback(std::function<void()> callback) { shutdown_ = std::move(callback); }

    /**
     * Persist current state if a store is attached.
     * @return false if the write failed (already logged)
     */
    bool CommitState();

    staking::LiquidStakingService& GetService() const { return service_; }
    ledger::InMemoryLedger& GetLedger() const { return ledger_; }
    staking::SimulatedValidator& GetValidator() const { return validator_; }
    const std::function<void()>& GetShutdownCallback() const { return shutdown_; }
    int64_t GetUptime() const;

private:
    void RegisterStakingCommands();
    void RegisterAdminCommands();
    void RegisterRewardCommands();
    void RegisterQueryCommands();
    void RegisterHostCommands();
    void RegisterUtilityCommands();

    std::vector<RPCMethod> commands_;

    staking::LiquidStakingService& service_;
    ledger::InMemoryLedger& ledger_;
    staking::SimulatedValidator& validator_;
    store::StateStore* store_;
    std::function<void()> shutdown_;
    std::chrono::steady_clock::time_point startTime_;
};

// ============================================================================
// Staking Commands
// ============================================================================

/// Params: sender, validator, operator (hex, may be empty)
RPCResponse cmd_initialize(const RPCRequest& req, const RPCContext& ctx,
                           RPCCommandTable* table);

/// Params: sender, amount. Returns: staked amount and new totals
RPCResponse cmd_stake(const RPCRequest& req, const RPCContext& ctx,
                      RPCCommandTable* table);

/// Params: sender, amount. Returns: base_returned
RPCResponse cmd_unstake(const RPCRequest& req, const RPCContext& ctx,
                        RPCCommandTable* table);

/// Params: sender. Returns: claimed
RPCResponse cmd_claim_lp_rewards(const RPCRequest& req, const RPCContext& ctx,
                                 RPCCommandTable* table);

// ============================================================================
// Admin Commands
// ============================================================================

RPCResponse cmd_update_validator(const RPCRequest& req, const RPCContext& ctx,
                                 RPCCommandTable* table);

RPCResponse cmd_update_reward_claim_interval(const RPCRequest& req, const RPCContext& ctx,
                                             RPCCommandTable* table);

RPCResponse cmd_update_reward_recipients(const RPCRequest& req, const RPCContext& ctx,
                                         RPCCommandTable* table);

/// Params: sender, account, kind ("base" | "staked"), frozen
RPCResponse cmd_set_account_frozen(const RPCRequest& req, const RPCContext& ctx,
                                   RPCCommandTable* table);

// ============================================================================
// Reward Commands
// ============================================================================

/**
 * Params: sender.
 * Returns: {code, hash, log, claimed, total, mev, protocol, lp, timestamp}.
 * Rejections are reported in-band with a non-zero code and the reason in log.
 */
RPCResponse cmd_try_claim_rewards(const RPCRequest& req, const RPCContext& ctx,
                                  RPCCommandTable* table);

/// Returns: {can_claim}
RPCResponse cmd_can_claim_rewards(const RPCRequest& req, const RPCContext& ctx,
                                  RPCCommandTable* table);

// ============================================================================
// Query Commands
// ============================================================================

RPCResponse cmd_get_exchange_rate(const RPCRequest& req, const RPCContext& ctx,
                                  RPCCommandTable* table);

RPCResponse cmd_get_total_staked(const RPCRequest& req, const RPCContext& ctx,
                                 RPCCommandTable* table);

RPCResponse cmd_get_total_delegation(const RPCRequest& req, const RPCContext& ctx,
                                     RPCCommandTable* table);

/// Returns: validator hex, or null before initialization
RPCResponse cmd_get_validator(const RPCRequest& req, const RPCContext& ctx,
                              RPCCommandTable* table);

RPCResponse cmd_get_validator_operator(const RPCRequest& req, const RPCContext& ctx,
                                       RPCCommandTable* table);

RPCResponse cmd_get_unstaking_period(const RPCRequest& req, const RPCContext& ctx,
                                     RPCCommandTable* table);

RPCResponse cmd_is_initialized(const RPCRequest& req, const RPCContext& ctx,
                               RPCCommandTable* table);

RPCResponse cmd_get_pool_info(const RPCRequest& req, const RPCContext& ctx,
                              RPCCommandTable* table);

/// Params: kind
RPCResponse cmd_get_token_metadata(const RPCRequest& req, const RPCContext& ctx,
                                   RPCCommandTable* table);

RPCResponse cmd_get_staked_supply(const RPCRequest& req, const RPCContext& ctx,
                                  RPCCommandTable* table);

RPCResponse cmd_get_claim_phase(const RPCRequest& req, const RPCContext& ctx,
                                RPCCommandTable* table);

/// Params: staker
RPCResponse cmd_get_pending_lp_rewards(const RPCRequest& req, const RPCContext& ctx,
                                       RPCCommandTable* table);

// ============================================================================
// Host Simulation Commands
// ============================================================================

/// Params: account, amount. Mints base units to account.
RPCResponse cmd_credit(const RPCRequest& req, const RPCContext& ctx,
                       RPCCommandTable* table);

/// Params: amount, validator (default: pool validator)
RPCResponse cmd_accrue_rewards(const RPCRequest& req, const RPCContext& ctx,
                               RPCCommandTable* table);

/// Params: account, kind (default "base")
RPCResponse cmd_get_balance(const RPCRequest& req, const RPCContext& ctx,
                            RPCCommandTable* table);

// ============================================================================
// Utility Commands
// ============================================================================

RPCResponse cmd_help(const RPCRequest& req, const RPCContext& ctx,
                     RPCCommandTable* table);

RPCResponse cmd_stop(const RPCRequest& req, const RPCContext& ctx,
                     RPCCommandTable* table);

RPCResponse cmd_uptime(const RPCRequest& req, const RPCContext& ctx,
                       RPCCommandTable* table);

// ============================================================================
// Helper Functions
// ============================================================================

/// Non-negative integer, or a decimal string for values beyond int64
/// @throws std::invalid_argument
Amount ParseAmount(const JSONValue& value);

/// Integer when it fits in int64, decimal string otherwise
JSONValue FormatAmount(Amount amount);

/// 40 hex characters, optional 0x prefix
/// @throws std::invalid_argument
Address ParseAddress(const JSONValue& value, const std::string& name);

/// @throws std::invalid_argument
asset::TokenKind ParseTokenKind(const JSONValue& value, const std::string& name);

/// STAKING_ERROR response with data {error, category}
RPCResponse StakingErrorResponse(const Status& status, const JSONValue& id);

/// Get required parameter
/// @throws std::invalid_argument if missing or of the wrong type
template<typename T>
T GetRequiredParam(const RPCRequest& req, const std::string& name);

/// Get optional parameter with default
template<typename T>
T GetOptionalParam(const RPCRequest& req, const std::string& name, const T& defaultValue);

template<>
std::string GetOptionalParam<std::string>(const RPCRequest& req, const std::string& name,
                                          const std::string& defaultValue);

} // namespace rpc
} // namespace liquidstake

#endif // LIQUIDSTAKE_RPC_COMMANDS_H
