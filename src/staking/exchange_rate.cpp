// LIQUIDSTAKE - Exchange-Rate Ledger Implementation
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License

#include "liquidstake/staking/exchange_rate.h"
#include "liquidstake/core/arith.h"
#include "liquidstake/util/logging.h"

#include <stdexcept>
#include <string>

namespace liquidstake {
namespace staking {

Status ExchangeRateLedger::CheckStake(Amount amount) const {
    if (amount < MINIMUM_STAKE) {
        return Status::Error(StakingError::BELOW_MINIMUM_STAKE,
                             std::to_string(amount) + " < " + std::to_string(MINIMUM_STAKE));
    }
    if (amount > MAXIMUM_STAKE) {
        return Status::Error(StakingError::ABOVE_MAXIMUM_STAKE,
                             std::to_string(amount) + " > " + std::to_string(MAXIMUM_STAKE));
    }

    auto total = CheckedAdd(state_.totalStaked, amount);
    if (!total || *total > MAXIMUM_STAKE) {
        return Status::Error(StakingError::STAKE_OVERFLOW,
                             "total staked would exceed " + std::to_string(MAXIMUM_STAKE));
    }
    return Status::Ok();
}

Status ExchangeRateLedger::CheckUnstake(Amount stakedAmount, Amount* unstakeAmount) const {
    auto base = ConvertToBase(stakedAmount);
    if (!base) {
        return Status::Error(StakingError::STAKE_OVERFLOW, "unstake conversion overflow");
    }
    if (*base == 0) {
        return Status::Error(StakingError::UNSTAKE_TOO_SMALL,
                             std::to_string(stakedAmount) + " converts to zero base units");
    }
    if (*base > state_.totalStaked) {
        return Status::Error(StakingError::INSUFFICIENT_STAKED,
                             std::to_string(*base) + " > total staked " +
                             std::to_string(state_.totalStaked));
    }
    *unstakeAmount = *base;
    return Status::Ok();
}

std::optional<Amount> ExchangeRateLedger::ConvertToBase(Amount stakedAmount) const {
    return MulDiv(stakedAmount, EXCHANGE_RATE_SCALE, state_.exchangeRate);
}

void ExchangeRateLedger::RecordStake(Amount amount) {
    auto staked = CheckedAdd(state_.totalStaked, amount);
    auto delegated = CheckedAdd(state_.totalDelegation, amount);
    if (!staked || !delegated) {
        throw std::logic_error("RecordStake: counter overflow on a checked stake");
    }
    state_.totalStaked = *staked;
    state_.totalDelegation = *delegated;
}

void ExchangeRateLedger::RecordUnstake(Amount amount) {
    auto staked = CheckedSub(state_.totalStaked, amount);
    if (!staked) {
        throw std::logic_error("RecordUnstake: total staked would go negative");
    }
    state_.totalStaked = *staked;

    // Delegation is tracked alongside total staked but may drift from it
    auto delegated = CheckedSub(state_.totalDelegation, amount);
    if (!delegated) {
        LOG_WARN(util::LogCategory::STAKING) << "Total delegation " << state_.totalDelegation
                                             << " is below unstake of " << amount
                                             << ", resetting to 0";
    }
    state_.totalDelegation = delegated ? *delegated : 0;
}

void ExchangeRateLedger::UpdateExchangeRate(Amount stakedSupply) {
    Amount rate = EXCHANGE_RATE_SCALE;
    if (stakedSupply > 0 && state_.totalStaked > 0) {
        auto computed = MulDiv(stakedSupply, EXCHANGE_RATE_SCALE, state_.totalStaked);
        if (computed && *computed > 0) {
            rate = *computed;
        }
    }

    if (rate != state_.exchangeRate) {
        LOG_INFO(util::LogCategory::STAKING) << "Exchange rate " << state_.exchangeRate
                                             << " -> " << rate;
        state_.exchangeRate = rate;
    }
}

void ExchangeRateLedger::Restore(const ExchangeRateState& state) {
    state_ = state;
    if (state_.exchangeRate == 0) {
        state_.exchangeRate = EXCHANGE_RATE_SCALE;
    }
}

} // namespace staking
} // namespace liquidstake
