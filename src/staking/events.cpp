// LIQUIDSTAKE - Staking Events Implementation
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License

#include "liquidstake/staking/events.h"
#include "liquidstake/core/hex.h"
#include "liquidstake/util/logging.h"

#include <sstream>

namespace liquidstake {
namespace staking {

namespace {

struct NameVisitor {
    const char* operator()(const StakeEvent&) const { return "StakeEvent"; }
    const char* operator()(const UnstakeEvent&) const { return "UnstakeEvent"; }
    const char* operator()(const ValidatorUpdatedEvent&) const { return "ValidatorUpdatedEvent"; }
    const char* operator()(const RewardIntervalUpdatedEvent&) const {
        return "RewardIntervalUpdatedEvent";
    }
    const char* operator()(const RewardsDistributedEvent&) const {
        return "RewardsDistributedEvent";
    }
    const char* operator()(const LpRewardsClaimedEvent&) const { return "LpRewardsClaimedEvent"; }
};

struct FieldsVisitor {
    std::ostringstream& out;

    void operator()(const StakeEvent& e) const {
        out << "staker=" << e.staker.ToHex() << " amount=" << e.amount
            << " validator=" << e.validator.ToHex();
    }
    void operator()(const UnstakeEvent& e) const {
        out << "staker=" << e.staker.ToHex() << " unstake_amount=" << e.unstakeAmount
            << " validator=" << e.validator.ToHex();
    }
    void operator()(const ValidatorUpdatedEvent& e) const {
        out << "old_validator=" << e.oldValidator.ToHex()
            << " new_validator=" << e.newValidator.ToHex()
            << " old_operator=" << BytesToHex(e.oldOperator)
            << " new_operator=" << BytesToHex(e.newOperator);
    }
    void operator()(const RewardIntervalUpdatedEvent& e) const {
        out << "old_interval=" << e.oldInterval << " new_interval=" << e.newInterval;
    }
    void operator()(const RewardsDistributedEvent& e) const {
        out << "total=" << e.totalRewards << " mev=" << e.mevAmount
            << " protocol_fee=" << e.protocolFee << " lp=" << e.lpRewards
            << " timestamp=" << e.timestamp;
    }
    void operator()(const LpRewardsClaimedEvent& e) const {
        out << "staker=" << e.staker.ToHex() << " amount=" << e.amount;
    }
};

bool IsRewardEvent(const StakingEvent& event) {
    return std::holds_alternative<RewardsDistributedEvent>(event) ||
           std::holds_alternative<LpRewardsClaimedEvent>(event);
}

} // namespace

const char* EventName(const StakingEvent& event) {
    return std::visit(NameVisitor{}, event);
}

std::string EventToString(const StakingEvent& event) {
    std::ostringstream out;
    out << EventName(event) << " {";
    std::visit(FieldsVisitor{out}, event);
    out << "}";
    return out.str();
}

void EmitEvent(const EventSink& sink, const StakingEvent& event) {
    const char* category = IsRewardEvent(event) ? util::LogCategory::REWARDS
                                                : util::LogCategory::STAKING;
    LOG_INFO(category) << EventToString(event);

    if (sink) {
        sink(event);
    }
}

} // namespace staking
} // namespace liquidstake
