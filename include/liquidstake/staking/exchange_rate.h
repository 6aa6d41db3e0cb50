// LIQUIDSTAKE - Exchange-Rate Ledger
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License
//
// Tracks total staked base value, total delegation and the staked:base
// conversion rate (scaled by EXCHANGE_RATE_SCALE).

#ifndef LIQUIDSTAKE_STAKING_EXCHANGE_RATE_H
#define LIQUIDSTAKE_STAKING_EXCHANGE_RATE_H

#include "liquidstake/core/status.h"
#include "liquidstake/core/types.h"
#include "liquidstake/staking/pool.h"

#include <optional>

namespace liquidstake {
namespace staking {

/// Persisted counters of the exchange-rate ledger
struct ExchangeRateState {
    Amount totalStaked{0};
    Amount totalDelegation{0};
    Amount exchangeRate{EXCHANGE_RATE_SCALE};
};

class ExchangeRateLedger {
public:
    ExchangeRateLedger() = default;

    Amount TotalStaked() const { return state_.totalStaked; }
    Amount TotalDelegation() const { return state_.totalDelegation; }

    /// Staked units per base unit, scaled by EXCHANGE_RATE_SCALE. Always > 0.
    Amount ExchangeRate() const { return state_.exchangeRate; }

    /**
     * Check a stake amount against the per-call bounds and the total
     * ceiling.
     *
     * @return BELOW_MINIMUM_STAKE, ABOVE_MAXIMUM_STAKE or STAKE_OVERFLOW
     */
    Status CheckStake(Amount amount) const;

    /**
     * Compute the base amount released for a staked amount:
     * floor(stakedAmount * EXCHANGE_RATE_SCALE / rate).
     *
     * @param[out] unstakeAmount Base units to release
     * @return UNSTAKE_TOO_SMALL if the result is zero,
     *         INSUFFICIENT_STAKED if it exceeds total staked
     */
    Status CheckUnstake(Amount stakedAmount, Amount* unstakeAmount) const;

    /// Base value of a staked amount at the current rate
    std::optional<Amount> ConvertToBase(Amount stakedAmount) const;

    /// Add a checked stake to both counters
    void RecordStake(Amount amount);

    /// Remove a checked unstake from both counters
    void RecordUnstake(Amount amount);

    /**
     * Recompute the rate from the outstanding staked supply over total
     * staked. This is the only place the rate changes. An empty supply or
     * an empty pool resets it to 1:1.
     */
    void UpdateExchangeRate(Amount stakedSupply);

    const ExchangeRateState& State() const { return state_; }
    void Restore(const ExchangeRateState& state);

private:
    ExchangeRateState state_;
};

} // namespace staking
} // namespace liquidstake

#endif // LIQUIDSTAKE_STAKING_EXCHANGE_RATE_H
