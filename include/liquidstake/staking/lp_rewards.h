// LIQUIDSTAKE - LP Reward Ledger
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License
//
// Per-staker share of the LP reward stream. Shares equal the base amount a
// staker has net staked. Each credited reward is split pro rata; the
// rounding remainder is carried into the next credit.
//
// Invariant: sum of all pending rewards plus the carry equals the balance of
// the LP reward vault.

#ifndef LIQUIDSTAKE_STAKING_LP_REWARDS_H
#define LIQUIDSTAKE_STAKING_LP_REWARDS_H

#include "liquidstake/core/status.h"
#include "liquidstake/core/types.h"

#include <map>

namespace liquidstake {
namespace staking {

struct LpPosition {
    Amount shares{0};
    Amount pending{0};
};

class LpRewardLedger {
public:
    LpRewardLedger() = default;

    void AddShares(const Address& staker, Amount shares);

    /// Remove up to shares from a staker; returns the amount removed
    Amount RemoveShares(const Address& staker, Amount shares);

    /**
     * Allocate a reward across all positions.
     *
     * @return STAKE_OVERFLOW if a pending balance would overflow; nothing
     *         changes in that case
     */
    Status Credit(Amount reward);

    Amount Pending(const Address& staker) const;
    Amount Shares(const Address& staker) const;

    /// Zero a staker's pending reward and return it
    Amount TakePending(const Address& staker);

    Amount TotalShares() const { return totalShares_; }
    Amount TotalPending() const;
    Amount Carry() const { return carry_; }

    const std::map<Address, LpPosition>& Positions() const { return positions_; }
    void Restore(const std::map<Address, LpPosition>& positions, Amount carry);

private:
    /// Drop positions with nothing left in them
    void Prune(const Address& staker);

    std::map<Address, LpPosition> positions_;
    Amount totalShares_{0};
    Amount carry_{0};
};

} // namespace staking
} // namespace liquidstake

#endif // LIQUIDSTAKE_STAKING_LP_REWARDS_H
