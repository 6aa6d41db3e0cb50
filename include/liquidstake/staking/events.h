// LIQUIDSTAKE - Staking Events
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License
//
// Records emitted by pool operations. The service hands every event to an
// injected sink after the operation has succeeded.

#ifndef LIQUIDSTAKE_STAKING_EVENTS_H
#define LIQUIDSTAKE_STAKING_EVENTS_H

#include "liquidstake/core/types.h"

#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace liquidstake {
namespace staking {

struct StakeEvent {
    Address staker;
    Amount amount{0};
    ValidatorId validator;
};

struct UnstakeEvent {
    Address staker;
    /// Base units returned to the staker
    Amount unstakeAmount{0};
    ValidatorId validator;
};

struct ValidatorUpdatedEvent {
    ValidatorId oldValidator;
    ValidatorId newValidator;
    std::vector<Byte> oldOperator;
    std::vector<Byte> newOperator;
};

struct RewardIntervalUpdatedEvent {
    Duration oldInterval{0};
    Duration newInterval{0};
};

struct RewardsDistributedEvent {
    Amount totalRewards{0};
    Amount mevAmount{0};
    Amount protocolFee{0};
    Amount lpRewards{0};
    Timestamp timestamp{0};
};

struct LpRewardsClaimedEvent {
    Address staker;
    Amount amount{0};
};

using StakingEvent = std::variant<StakeEvent,
                                  UnstakeEvent,
                                  ValidatorUpdatedEvent,
                                  RewardIntervalUpdatedEvent,
                                  RewardsDistributedEvent,
                                  LpRewardsClaimedEvent>;

/// Receives events; may be empty
using EventSink = std::function<void(const StakingEvent&)>;

/// Event type name, e.g. "StakeEvent"
const char* EventName(const StakingEvent& event);

/// One-line rendering used in logs
std::string EventToString(const StakingEvent& event);

/// Log the event and forward it to the sink
void EmitEvent(const EventSink& sink, const StakingEvent& event);

} // namespace staking
} // namespace liquidstake

#endif // LIQUIDSTAKE_STAKING_EVENTS_H
