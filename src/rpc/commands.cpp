// LIQUIDSTAKE - RPC Commands Implementation
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License

#include "liquidstake/rpc/commands.h"
#include "liquidstake/core/arith.h"
#include "liquidstake/core/hex.h"
#include "liquidstake/ledger/ledger.h"
#include "liquidstake/staking/liquid_staking.h"
#include "liquidstake/staking/validator_service.h"
#include "liquidstake/store/state_store.h"
#include "liquidstake/util/logging.h"

#include <algorithm>
#include <cctype>
#include <limits>
#include <map>
#include <optional>
#include <stdexcept>

namespace liquidstake {
namespace rpc {

using asset::TokenKind;

namespace {

/// Response for a state-changing call: error, or commit and succeed
RPCResponse Mutated(RPCCommandTable* table, const Status& status,
                    const JSONValue& result, const JSONValue& id) {
    if (!status.ok()) {
        return StakingErrorResponse(status, id);
    }
    if (!table->CommitState()) {
        return RPCResponse::Error(ErrorCode::STORAGE_ERROR,
                                  "Operation applied but state could not be persisted", id);
    }
    return RPCResponse::Success(result, id);
}

std::vector<Byte> ParseOperator(const RPCRequest& req) {
    std::string hex = GetOptionalParam<std::string>(req, "operator", "");
    if (hex.empty()) {
        return {};
    }
    if (!IsValidHex(hex)) {
        throw std::invalid_argument("Parameter must be hex: operator");
    }
    return HexToBytes(hex);
}

JSONValue PoolInfoToJSON(const staking::PoolInfo& info) {
    JSONValue::Object result;
    result["admin"] = info.state.admin.ToHex();
    result["validator"] = info.state.validator.ToHex();
    result["validator_operator"] = BytesToHex(info.state.validatorOperator);
    result["last_reward_claim"] = info.state.lastRewardClaim;
    result["reward_claim_interval"] = info.state.rewardClaimInterval;
    result["mev_recipient"] = info.state.mevRecipient.ToHex();
    result["treasury"] = info.state.treasury.ToHex();
    result["lp_reward_vault"] = info.state.lpRewardVault.ToHex();
    result["claim_phase"] = staking::ClaimPhaseToString(info.state.phase);
    result["total_staked"] = FormatAmount(info.totalStaked);
    result["total_delegation"] = FormatAmount(info.totalDelegation);
    result["exchange_rate"] = FormatAmount(info.exchangeRate);
    result["staked_supply"] = FormatAmount(info.stakedSupply);
    result["unstaking_period"] = info.unstakingPeriod;
    result["can_claim_rewards"] = info.canClaimRewards;
    result["next_reward_claim"] = info.nextRewardClaim;
    result["lp_reward_carry"] = FormatAmount(info.lpRewardCarry);
    return JSONValue(std::move(result));
}

} // namespace

// ============================================================================
// Helper Functions Implementation
// ============================================================================

Amount ParseAmount(const JSONValue& value) {
    if (value.IsInt()) {
        int64_t v = value.GetInt();
        if (v < 0) {
            throw std::invalid_argument("Amount must not be negative");
        }
        return static_cast<Amount>(v);
    }
    if (value.IsString()) {
        const std::string& str = value.GetString();
        if (str.empty() || str.size() > 20 ||
            !std::all_of(str.begin(), str.end(), [](unsigned char c) { return std::isdigit(c); })) {
            throw std::invalid_argument("Amount must be a non-negative integer");
        }
        try {
            return std::stoull(str);
        } catch (const std::out_of_range&) {
            throw std::invalid_argument("Amount out of range");
        }
    }
    throw std::invalid_argument("Invalid amount format");
}

JSONValue FormatAmount(Amount amount) {
    if (amount > static_cast<Amount>(std::numeric_limits<int64_t>::max())) {
        return JSONValue(std::to_string(amount));
    }
    return JSONValue(static_cast<int64_t>(amount));
}

Address ParseAddress(const JSONValue& value, const std::string& name) {
    if (!value.IsString()) {
        throw std::invalid_argument("Missing or non-string address: " + name);
    }
    try {
        return Address::FromHex(value.GetString());
    } catch (const std::invalid_argument&) {
        throw std::invalid_argument("Invalid address for " + name + ": expected " +
                                    std::to_string(Address::SIZE * 2) + " hex characters");
    }
}

TokenKind ParseTokenKind(const JSONValue& value, const std::string& name) {
    std::optional<TokenKind> kind;
    if (value.IsString()) {
        kind = asset::TokenKindFromString(value.GetString());
    }
    if (!kind) {
        throw std::invalid_argument("Parameter " + name + " must be \"base\" or \"staked\"");
    }
    return *kind;
}

RPCResponse StakingErrorResponse(const Status& status, const JSONValue& id) {
    JSONValue::Object data;
    data["error"] = StakingErrorName(status.code());
    data["category"] = ErrorCategoryToString(status.category());
    return RPCResponse::Error(ErrorCode::STAKING_ERROR, status.ToString(), id,
                              JSONValue(std::move(data)));
}

template<>
std::string GetRequiredParam<std::string>(const RPCRequest& req, const std::string& name) {
    const JSONValue& param = req.GetParam(name);
    if (param.IsNull()) {
        throw std::invalid_argument("Missing required parameter: " + name);
    }
    if (!param.IsString()) {
        throw std::invalid_argument("Parameter must be string: " + name);
    }
    return param.GetString();
}

template<>
int64_t GetRequiredParam<int64_t>(const RPCRequest& req, const std::string& name) {
    const JSONValue& param = req.GetParam(name);
    if (param.IsNull()) {
        throw std::invalid_argument("Missing required parameter: " + name);
    }
    if (!param.IsInt()) {
        throw std::invalid_argument("Parameter must be integer: " + name);
    }
    return param.GetInt();
}

template<>
bool GetRequiredParam<bool>(const RPCRequest& req, const std::string& name) {
    const JSONValue& param = req.GetParam(name);
    if (param.IsNull()) {
        throw std::invalid_argument("Missing required parameter: " + name);
    }
    if (!param.IsBool()) {
        throw std::invalid_argument("Parameter must be boolean: " + name);
    }
    return param.GetBool();
}

template<>
Amount GetRequiredParam<Amount>(const RPCRequest& req, const std::string& name) {
    const JSONValue& param = req.GetParam(name);
    if (param.IsNull()) {
        throw std::invalid_argument("Missing required parameter: " + name);
    }
    return ParseAmount(param);
}

template<>
Address GetRequiredParam<Address>(const RPCRequest& req, const std::string& name) {
    if (req.GetParam(name).IsNull()) {
        throw std::invalid_argument("Missing required parameter: " + name);
    }
    return ParseAddress(req.GetParam(name), name);
}

template<>
std::string GetOptionalParam<std::string>(const RPCRequest& req, const std::string& name,
                                          const std::string& defaultValue) {
    const JSONValue& param = req.GetParam(name);
    if (param.IsNull()) return defaultValue;
    if (!param.IsString()) {
        throw std::invalid_argument("Parameter must be string: " + name);
    }
    return param.GetString();
}

// ============================================================================
// RPCCommandTable Implementation
// ============================================================================

RPCCommandTable::RPCCommandTable(staking::LiquidStakingService& service,
                                 ledger::InMemoryLedger& ledger,
                                 staking::SimulatedValidator& validator,
                                 store::StateStore* store)
    : service_(service), ledger_(ledger), validator_(validator), store_(store),
      startTime_(std::chrono::steady_clock::now()) {
    RegisterStakingCommands();
    RegisterAdminCommands();
    RegisterRewardCommands();
    RegisterQueryCommands();
    RegisterHostCommands();
    RegisterUtilityCommands();
}

void RPCCommandTable::RegisterCommands(RPCServer& server) {
    for (const auto& cmd : commands_) {
        server.RegisterMethod(cmd);
    }
}

std::vector<RPCMethod> RPCCommandTable::GetCommandsByCategory(const std::string& category) const {
    std::vector<RPCMethod> result;
    for (const auto& cmd : commands_) {
        if (cmd.category == category) {
            result.push_back(cmd);
        }
    }
    return result;
}

bool RPCCommandTable::CommitState() {
    if (!store_) {
        return true;
    }
    db::Status status = store_->Commit(service_, ledger_, validator_);
    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::RPC) << "Failed to persist state: " << status.ToString();
        return false;
    }
    return true;
}

int64_t RPCCommandTable::GetUptime() const {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::seconds>(now - startTime_).count();
}

// ============================================================================
// Command Registration
// ============================================================================

void RPCCommandTable::RegisterStakingCommands() {
    RPCCommandTable* table = this;

    commands_.push_back({
        "initialize",
        Category::STAKING,
        "Create the pool and its tokens. Admin only, once.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_initialize(req, ctx, table);
        },
        true,
        {"sender", "validator", "operator"}
    });

    commands_.push_back({
        "stake",
        Category::STAKING,
        "Delegate base units through the pool and receive staked tokens 1:1.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_stake(req, ctx, table);
        },
        true,
        {"sender", "amount"}
    });

    commands_.push_back({
        "unstake",
        Category::STAKING,
        "Burn staked tokens and receive their base value.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_unstake(req, ctx, table);
        },
        true,
        {"sender", "amount"}
    });

    commands_.push_back({
        "claim_lp_rewards",
        Category::STAKING,
        "Pay out the sender's accumulated liquidity-provider rewards.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_claim_lp_rewards(req, ctx, table);
        },
        true,
        {"sender"}
    });
}

void RPCCommandTable::RegisterAdminCommands() {
    RPCCommandTable* table = this;

    commands_.push_back({
        "update_validator",
        Category::ADMIN,
        "Change the delegation target for future stakes.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_update_validator(req, ctx, table);
        },
        true,
        {"sender", "validator", "operator"}
    });

    commands_.push_back({
        "update_reward_claim_interval",
        Category::ADMIN,
        "Set the minimum number of seconds between reward claims.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_update_reward_claim_interval(req, ctx, table);
        },
        true,
        {"sender", "interval"}
    });

    commands_.push_back({
        "update_reward_recipients",
        Category::ADMIN,
        "Set the accounts receiving the MEV and protocol-fee shares.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_update_reward_recipients(req, ctx, table);
        },
        true,
        {"sender", "mev_recipient", "treasury"}
    });

    commands_.push_back({
        "set_account_frozen",
        Category::ADMIN,
        "Freeze or thaw an account's balance of one token kind.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_set_account_frozen(req, ctx, table);
        },
        true,
        {"sender", "account", "kind", "frozen"}
    });
}

void RPCCommandTable::RegisterRewardCommands() {
    RPCCommandTable* table = this;

    commands_.push_back({
        "try_claim_rewards",
        Category::REWARDS,
        "Claim validator rewards and split them, if the claim interval has elapsed.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_try_claim_rewards(req, ctx, table);
        },
        true,
        {"sender"}
    });

    commands_.push_back({
        "can_claim_rewards",
        Category::REWARDS,
        "Whether the reward claim interval has elapsed.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_can_claim_rewards(req, ctx, table);
        },
        false,
        {}
    });
}

void RPCCommandTable::RegisterQueryCommands() {
    RPCCommandTable* table = this;
    using CommandFn = RPCResponse (*)(const RPCRequest&, const RPCContext&, RPCCommandTable*);

    auto query = [this, table](const char* name, const char* description, CommandFn fn,
                               std::vector<std::string> args) {
        commands_.push_back({
            name,
            Category::QUERY,
            description,
            [table, fn](const RPCRequest& req, const RPCContext& ctx) {
                return fn(req, ctx, table);
            },
            false,
            std::move(args)
        });
    };

    query("get_exchange_rate", "Staked-to-base exchange rate, scaled by 1,000,000.",
          &cmd_get_exchange_rate, {});
    query("get_total_staked", "Base units staked through the pool.",
          &cmd_get_total_staked, {});
    query("get_total_delegation", "Base units delegated to validators.",
          &cmd_get_total_delegation, {});
    query("get_validator", "Current delegation target.",
          &cmd_get_validator, {});
    query("get_validator_operator", "Operator key of the current validator.",
          &cmd_get_validator_operator, {});
    query("get_unstaking_period", "Unbonding period in seconds.",
          &cmd_get_unstaking_period, {});
    query("is_initialized", "Whether the pool exists.",
          &cmd_is_initialized, {});
    query("get_pool_info", "All pool fields in one record.",
          &cmd_get_pool_info, {});
    query("get_token_metadata", "Name, symbol and decimals of a token kind.",
          &cmd_get_token_metadata, {"kind"});
    query("get_staked_supply", "Outstanding staked tokens.",
          &cmd_get_staked_supply, {});
    query("get_claim_phase", "State of the reward distributor.",
          &cmd_get_claim_phase, {});
    query("get_pending_lp_rewards", "Unclaimed liquidity-provider rewards of a staker.",
          &cmd_get_pending_lp_rewards, {"staker"});
}

void RPCCommandTable::RegisterHostCommands() {
    RPCCommandTable* table = this;

    commands_.push_back({
        "credit",
        Category::HOST,
        "Create base units in an account (simulation faucet).",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_credit(req, ctx, table);
        },
        true,
        {"account", "amount"}
    });

    commands_.push_back({
        "accrue_rewards",
        Category::HOST,
        "Fund and accrue validator rewards (simulation).",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_accrue_rewards(req, ctx, table);
        },
        true,
        {"amount", "validator"}
    });

    commands_.push_back({
        "get_balance",
        Category::HOST,
        "Ledger balance of an account.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_get_balance(req, ctx, table);
        },
        false,
        {"account", "kind"}
    });
}

void RPCCommandTable::RegisterUtilityCommands() {
    RPCCommandTable* table = this;

    commands_.push_back({
        "help",
        Category::UTILITY,
        "List all commands, or get help for a specified command.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_help(req, ctx, table);
        },
        false,
        {"command"}
    });

    commands_.push_back({
        "stop",
        Category::UTILITY,
        "Stop the daemon.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_stop(req, ctx, table);
        },
        true,
        {}
    });

    commands_.push_back({
        "uptime",
        Category::UTILITY,
        "Seconds since the daemon started.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_uptime(req, ctx, table);
        },
        false,
        {}
    });
}

// ============================================================================
// Staking Commands
// ============================================================================

RPCResponse cmd_initialize(const RPCRequest& req, const RPCContext& ctx,
                           RPCCommandTable* table) {
    try {
        Address sender = GetRequiredParam<Address>(req, "sender");
        ValidatorId validator = GetRequiredParam<Address>(req, "validator");
        std::vector<Byte> op = ParseOperator(req);

        Status status = table->GetService().Initialize(sender, validator, op);

        JSONValue::Object result;
        result["initialized"] = status.ok();
        result["validator"] = validator.ToHex();
        return Mutated(table, status, JSONValue(std::move(result)), req.GetId());
    } catch (const std::invalid_argument& e) {
        return InvalidParams(e.what(), req.GetId());
    }
}

RPCResponse cmd_stake(const RPCRequest& req, const RPCContext& ctx,
                      RPCCommandTable* table) {
    try {
        Address sender = GetRequiredParam<Address>(req, "sender");
        Amount amount = GetRequiredParam<Amount>(req, "amount");

        staking::LiquidStakingService& service = table->GetService();
        Status status = service.Stake(sender, amount);

        JSONValue::Object result;
        result["staked"] = FormatAmount(amount);
        result["total_staked"] = FormatAmount(service.GetTotalStaked());
        result["exchange_rate"] = FormatAmount(service.GetExchangeRate());
        return Mutated(table, status, JSONValue(std::move(result)), req.GetId());
    } catch (const std::invalid_argument& e) {
        return InvalidParams(e.what(), req.GetId());
    }
}

RPCResponse cmd_unstake(const RPCRequest& req, const RPCContext& ctx,
                        RPCCommandTable* table) {
    try {
        Address sender = GetRequiredParam<Address>(req, "sender");
        Amount amount = GetRequiredParam<Amount>(req, "amount");

        staking::LiquidStakingService& service = table->GetService();
        Amount baseReturned = 0;
        Status status = service.Unstake(sender, amount, &baseReturned);

        JSONValue::Object result;
        result["base_returned"] = FormatAmount(baseReturned);
        result["total_staked"] = FormatAmount(service.GetTotalStaked());
        return Mutated(table, status, JSONValue(std::move(result)), req.GetId());
    } catch (const std::invalid_argument& e) {
        return InvalidParams(e.what(), req.GetId());
    }
}

RPCResponse cmd_claim_lp_rewards(const RPCRequest& req, const RPCContext& ctx,
                                 RPCCommandTable* table) {
    try {
        Address sender = GetRequiredParam<Address>(req, "sender");

        Amount claimed = 0;
        Status status = table->GetService().ClaimLpRewards(sender, &claimed);

        JSONValue::Object result;
        result["claimed"] = FormatAmount(claimed);
        return Mutated(table, status, JSONValue(std::move(result)), req.GetId());
    } catch (const std::invalid_argument& e) {
        return InvalidParams(e.what(), req.GetId());
    }
}

// ============================================================================
// Admin Commands
// ============================================================================

RPCResponse cmd_update_validator(const RPCRequest& req, const RPCContext& ctx,
                                 RPCCommandTable* table) {
    try {
        Address sender = GetRequiredParam<Address>(req, "sender");
        ValidatorId validator = GetRequiredParam<Address>(req, "validator");
        std::vector<Byte> op = ParseOperator(req);

        Status status = table->GetService().UpdateValidator(sender, validator, op);

        JSONValue::Object result;
        result["validator"] = validator.ToHex();
        result["operator"] = BytesToHex(op);
        return Mutated(table, status, JSONValue(std::move(result)), req.GetId());
    } catch (const std::invalid_argument& e) {
        return InvalidParams(e.what(), req.GetId());
    }
}

RPCResponse cmd_update_reward_claim_interval(const RPCRequest& req, const RPCContext& ctx,
                                             RPCCommandTable* table) {
    try {
        Address sender = GetRequiredParam<Address>(req, "sender");
        int64_t interval = GetRequiredParam<int64_t>(req, "interval");

        Status status = table->GetService().UpdateRewardClaimInterval(sender, interval);

        JSONValue::Object result;
        result["interval"] = interval;
        return Mutated(table, status, JSONValue(std::move(result)), req.GetId());
    } catch (const std::invalid_argument& e) {
        return InvalidParams(e.what(), req.GetId());
    }
}

RPCResponse cmd_update_reward_recipients(const RPCRequest& req, const RPCContext& ctx,
                                         RPCCommandTable* table) {
    try {
        Address sender = GetRequiredParam<Address>(req, "sender");
        Address mev = GetRequiredParam<Address>(req, "mev_recipient");
        Address treasury = GetRequiredParam<Address>(req, "treasury");

        Status status = table->GetService().UpdateRewardRecipients(sender, mev, treasury);

        JSONValue::Object result;
        result["mev_recipient"] = mev.ToHex();
        result["treasury"] = treasury.ToHex();
        return Mutated(table, status, JSONValue(std::move(result)), req.GetId());
    } catch (const std::invalid_argument& e) {
        return InvalidParams(e.what(), req.GetId());
    }
}

RPCResponse cmd_set_account_frozen(const RPCRequest& req, const RPCContext& ctx,
                                   RPCCommandTable* table) {
    try {
        Address sender = GetRequiredParam<Address>(req, "sender");
        Address account = GetRequiredParam<Address>(req, "account");
        TokenKind kind = ParseTokenKind(req.GetParam("kind"), "kind");
        bool frozen = GetRequiredParam<bool>(req, "frozen");

        Status status = table->GetService().SetAccountFrozen(sender, account, kind, frozen);

        JSONValue::Object result;
        result["account"] = account.ToHex();
        result["kind"] = asset::TokenKindToString(kind);
        result["frozen"] = frozen;
        return Mutated(table, status, JSONValue(std::move(result)), req.GetId());
    } catch (const std::invalid_argument& e) {
        return InvalidParams(e.what(), req.GetId());
    }
}

// ============================================================================
// Reward Commands
// ============================================================================

RPCResponse cmd_try_claim_rewards(const RPCRequest& req, const RPCContext& ctx,
                                  RPCCommandTable* table) {
    try {
        Address sender = GetRequiredParam<Address>(req, "sender");

        staking::ClaimOutcome outcome;
        Status status = table->GetService().TryClaimRewards(sender, &outcome);

        JSONValue::Object result;
        result["code"] = static_cast<int>(status.code());
        result["claimed"] = outcome.claimed;
        result["total"] = FormatAmount(outcome.totalRewards);
        result["mev"] = FormatAmount(outcome.mevAmount);
        result["protocol"] = FormatAmount(outcome.protocolFee);
        result["lp"] = FormatAmount(outcome.lpRewards);
        result["timestamp"] = outcome.timestamp;

        if (!status.ok()) {
            result["hash"] = "";
            result["log"] = status.ToString();
            return RPCResponse::Success(JSONValue(std::move(result)), req.GetId());
        }

        result["hash"] = outcome.claimed ? outcome.txHash.ToHex() : std::string();
        result["log"] = outcome.claimed ? "rewards distributed"
                                        : "reward claim interval has not elapsed";
        return Mutated(table, status, JSONValue(std::move(result)), req.GetId());
    } catch (const std::invalid_argument& e) {
        return InvalidParams(e.what(), req.GetId());
    }
}

RPCResponse cmd_can_claim_rewards(const RPCRequest& req, const RPCContext& ctx,
                                  RPCCommandTable* table) {
    JSONValue::Object result;
    result["can_claim"] = table->GetService().CanClaimRewards();
    return RPCResponse::Success(JSONValue(std::move(result)), req.GetId());
}

// ============================================================================
// Query Commands
// ============================================================================

RPCResponse cmd_get_exchange_rate(const RPCRequest& req, const RPCContext& ctx,
                                  RPCCommandTable* table) {
    return RPCResponse::Success(FormatAmount(table->GetService().GetExchangeRate()),
                                req.GetId());
}

RPCResponse cmd_get_total_staked(const RPCRequest& req, const RPCContext& ctx,
                                 RPCCommandTable* table) {
    return RPCResponse::Success(FormatAmount(table->GetService().GetTotalStaked()),
                                req.GetId());
}

RPCResponse cmd_get_total_delegation(const RPCRequest& req, const RPCContext& ctx,
                                     RPCCommandTable* table) {
    return RPCResponse::Success(FormatAmount(table->GetService().GetTotalDelegation()),
                                req.GetId());
}

RPCResponse cmd_get_validator(const RPCRequest& req, const RPCContext& ctx,
                              RPCCommandTable* table) {
    auto validator = table->GetService().GetValidator();
    if (!validator) {
        return RPCResponse::Success(JSONValue(), req.GetId());
    }
    return RPCResponse::Success(JSONValue(validator->ToHex()), req.GetId());
}

RPCResponse cmd_get_validator_operator(const RPCRequest& req, const RPCContext& ctx,
                                       RPCCommandTable* table) {
    auto op = table->GetService().GetValidatorOperator();
    if (!op) {
        return RPCResponse::Success(JSONValue(), req.GetId());
    }
    return RPCResponse::Success(JSONValue(BytesToHex(*op)), req.GetId());
}

RPCResponse cmd_get_unstaking_period(const RPCRequest& req, const RPCContext& ctx,
                                     RPCCommandTable* table) {
    return RPCResponse::Success(JSONValue(table->GetService().GetUnstakingPeriod()),
                                req.GetId());
}

RPCResponse cmd_is_initialized(const RPCRequest& req, const RPCContext& ctx,
                               RPCCommandTable* table) {
    return RPCResponse::Success(JSONValue(table->GetService().IsInitialized()), req.GetId());
}

RPCResponse cmd_get_pool_info(const RPCRequest& req, const RPCContext& ctx,
                              RPCCommandTable* table) {
    auto info = table->GetService().GetPoolInfo();
    if (!info) {
        return RPCResponse::Success(JSONValue(), req.GetId());
    }
    return RPCResponse::Success(PoolInfoToJSON(*info), req.GetId());
}

RPCResponse cmd_get_token_metadata(const RPCRequest& req, const RPCContext& ctx,
                                   RPCCommandTable* table) {
    try {
        TokenKind kind = ParseTokenKind(req.GetParam("kind"), "kind");
        asset::TokenMetadata meta = staking::LiquidStakingService::GetTokenMetadata(kind);

        JSONValue::Object result;
        result["kind"] = asset::TokenKindToString(meta.kind);
        result["name"] = meta.name;
        result["symbol"] = meta.symbol;
        result["decimals"] = static_cast<int>(meta.decimals);
        return RPCResponse::Success(JSONValue(std::move(result)), req.GetId());
    } catch (const std::invalid_argument& e) {
        return InvalidParams(e.what(), req.GetId());
    }
}

RPCResponse cmd_get_staked_supply(const RPCRequest& req, const RPCContext& ctx,
                                  RPCCommandTable* table) {
    return RPCResponse::Success(FormatAmount(table->GetService().GetStakedSupply()),
                                req.GetId());
}

RPCResponse cmd_get_claim_phase(const RPCRequest& req, const RPCContext& ctx,
                                RPCCommandTable* table) {
    return RPCResponse::Success(
        JSONValue(staking::ClaimPhaseToString(table->GetService().GetClaimPhase())),
        req.GetId());
}

RPCResponse cmd_get_pending_lp_rewards(const RPCRequest& req, const RPCContext& ctx,
                                       RPCCommandTable* table) {
    try {
        Address staker = GetRequiredParam<Address>(req, "staker");
        return RPCResponse::Success(
            FormatAmount(table->GetService().GetPendingLpRewards(staker)), req.GetId());
    } catch (const std::invalid_argument& e) {
        return InvalidParams(e.what(), req.GetId());
    }
}

// ============================================================================
// Host Simulation Commands
// ============================================================================

RPCResponse cmd_credit(const RPCRequest& req, const RPCContext& ctx,
                       RPCCommandTable* table) {
    try {
        Address account = GetRequiredParam<Address>(req, "account");
        Amount amount = GetRequiredParam<Amount>(req, "amount");

        ledger::InMemoryLedger& ledger = table->GetLedger();
        Status status = ledger.Credit(account, TokenKind::Base, amount);

        JSONValue::Object result;
        result["account"] = account.ToHex();
        result["balance"] = FormatAmount(ledger.Balance(account, TokenKind::Base));
        return Mutated(table, status, JSONValue(std::move(result)), req.GetId());
    } catch (const std::invalid_argument& e) {
        return InvalidParams(e.what(), req.GetId());
    }
}

RPCResponse cmd_accrue_rewards(const RPCRequest& req, const RPCContext& ctx,
                               RPCCommandTable* table) {
    try {
        Amount amount = GetRequiredParam<Amount>(req, "amount");

        ValidatorId validator;
        if (!req.GetParam("validator").IsNull()) {
            validator = ParseAddress(req.GetParam("validator"), "validator");
        } else {
            auto current = table->GetService().GetValidator();
            if (!current) {
                return StakingErrorResponse(Status::Error(StakingError::NOT_INITIALIZED),
                                            req.GetId());
            }
            validator = *current;
        }

        staking::SimulatedValidator& sim = table->GetValidator();
        ledger::InMemoryLedger& ledger = table->GetLedger();

        // Rewards are paid from the reserve, so both sides must accept the amount
        Status status;
        if (amount == 0) {
            status = Status::Error(StakingError::ZERO_AMOUNT);
        } else if (!CheckedAdd(sim.PendingRewards(validator), amount) ||
                   !CheckedAdd(ledger.Balance(sim.ReserveAccount(), TokenKind::Base), amount)) {
            status = Status::Error(StakingError::STAKE_OVERFLOW, "reward accrual overflow");
        } else {
            status = ledger.Credit(sim.ReserveAccount(), TokenKind::Base, amount);
            if (status.ok()) {
                status = sim.AccrueRewards(validator, amount);
            }
        }

        JSONValue::Object result;
        result["validator"] = validator.ToHex();
        result["pending"] = FormatAmount(sim.PendingRewards(validator));
        return Mutated(table, status, JSONValue(std::move(result)), req.GetId());
    } catch (const std::invalid_argument& e) {
        return InvalidParams(e.what(), req.GetId());
    }
}

RPCResponse cmd_get_balance(const RPCRequest& req, const RPCContext& ctx,
                            RPCCommandTable* table) {
    try {
        Address account = GetRequiredParam<Address>(req, "account");
        TokenKind kind = TokenKind::Base;
        if (!req.GetParam("kind").IsNull()) {
            kind = ParseTokenKind(req.GetParam("kind"), "kind");
        }

        ledger::InMemoryLedger& ledger = table->GetLedger();
        JSONValue::Object result;
        result["account"] = account.ToHex();
        result["kind"] = asset::TokenKindToString(kind);
        result["balance"] = FormatAmount(ledger.Balance(account, kind));
        result["frozen"] = ledger.IsFrozen(account, kind);
        return RPCResponse::Success(JSONValue(std::move(result)), req.GetId());
    } catch (const std::invalid_argument& e) {
        return InvalidParams(e.what(), req.GetId());
    }
}

// ============================================================================
// Utility Commands
// ============================================================================

RPCResponse cmd_help(const RPCRequest& req, const RPCContext& ctx,
                     RPCCommandTable* table) {
    try {
        std::string command = GetOptionalParam<std::string>(req, "command", "");

        if (command.empty()) {
            std::map<std::string, JSONValue::Array> byCategory;
            for (const auto& cmd : table->GetAllCommands()) {
                JSONValue::Object cmdInfo;
                cmdInfo["name"] = cmd.name;
                cmdInfo["description"] = cmd.description;
                byCategory[cmd.category].push_back(JSONValue(std::move(cmdInfo)));
            }

            JSONValue::Object result;
            for (auto& entry : byCategory) {
                result[entry.first] = JSONValue(std::move(entry.second));
            }
            return RPCResponse::Success(JSONValue(std::move(result)), req.GetId());
        }

        for (const auto& cmd : table->GetAllCommands()) {
            if (cmd.name != command) continue;

            JSONValue::Array args;
            for (const auto& arg : cmd.argNames) {
                args.push_back(JSONValue(arg));
            }
            JSONValue::Object result;
            result["name"] = cmd.name;
            result["category"] = cmd.category;
            result["description"] = cmd.description;
            result["arguments"] = JSONValue(std::move(args));
            result["requires_auth"] = cmd.requiresAuth;
            return RPCResponse::Success(JSONValue(std::move(result)), req.GetId());
        }

        return RPCResponse::Error(ErrorCode::METHOD_NOT_FOUND,
                                  "Unknown command: " + command, req.GetId());
    } catch (const std::invalid_argument& e) {
        return InvalidParams(e.what(), req.GetId());
    }
}

RPCResponse cmd_stop(const RPCRequest& req, const RPCContext& ctx,
                     RPCCommandTable* table) {
    const auto& shutdown = table->GetShutdownCallback();
    if (!shutdown) {
        return RPCResponse::Error(ErrorCode::SERVER_ERROR, "Shutdown not available", req.GetId());
    }
    LOG_INFO(util::LogCategory::RPC) << "Shutdown requested by " << ctx.clientAddress;
    shutdown();
    return RPCResponse::Success(JSONValue("liquidstaked stopping"), req.GetId());
}

RPCResponse cmd_uptime(const RPCRequest& req, const RPCContext& ctx,
                       RPCCommandTable* table) {
    return RPCResponse::Success(JSONValue(table->GetUptime()), req.GetId());
}

} // namespace rpc
} // namespace liquidstake
