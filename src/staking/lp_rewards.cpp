// LIQUIDSTAKE - LP Reward Ledger Implementation
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License

#include "liquidstake/staking/lp_rewards.h"
#include "liquidstake/core/arith.h"
#include "liquidstake/util/logging.h"

#include <algorithm>
#include <stdexcept>
#include <vector>

namespace liquidstake {
namespace staking {

void LpRewardLedger::AddShares(const Address& staker, Amount shares) {
    if (shares == 0) {
        return;
    }
    auto total = CheckedAdd(totalShares_, shares);
    if (!total) {
        throw std::logic_error("AddShares: total share overflow");
    }
    positions_[staker].shares += shares;
    totalShares_ = *total;
}

Amount LpRewardLedger::RemoveShares(const Address& staker, Amount shares) {
    auto it = positions_.find(staker);
    if (it == positions_.end()) {
        return 0;
    }
    Amount removed = std::min(shares, it->second.shares);
    it->second.shares -= removed;
    totalShares_ -= removed;
    Prune(staker);
    return removed;
}

Status LpRewardLedger::Credit(Amount reward) {
    auto pool = CheckedAdd(reward, carry_);
    if (!pool) {
        return Status::Error(StakingError::STAKE_OVERFLOW, "LP reward pool overflow");
    }
    if (totalShares_ == 0) {
        carry_ = *pool;
        return Status::Ok();
    }

    // Compute every allocation before touching any position
    std::vector<std::pair<LpPosition*, Amount>> allocations;
    allocations.reserve(positions_.size());
    Amount distributed = 0;
    for (auto& entry : positions_) {
        if (entry.second.shares == 0) {
            continue;
        }
        auto share = MulDiv(*pool, entry.second.shares, totalShares_);
        if (!share) {
            return Status::Error(StakingError::STAKE_OVERFLOW, "LP share overflow");
        }
        if (!CheckedAdd(entry.second.pending, *share)) {
            return Status::Error(StakingError::STAKE_OVERFLOW, "pending LP reward overflow");
        }
        allocations.emplace_back(&entry.second, *share);
        distributed += *share;
    }

    for (auto& allocation : allocations) {
        allocation.first->pending += allocation.second;
    }
    carry_ = *pool - distributed;

    LOG_DEBUG(util::LogCategory::REWARDS) << "Credited " << distributed << " LP reward to "
                                          << allocations.size() << " positions, carry "
                                          << carry_;
    return Status::Ok();
}

Amount LpRewardLedger::Pending(const Address& staker) const {
    auto it = positions_.find(staker);
    return it == positions_.end() ? 0 : it->second.pending;
}

Amount LpRewardLedger::Shares(const Address& staker) const {
    auto it = positions_.find(staker);
    return it == positions_.end() ? 0 : it->second.shares;
}

Amount LpRewardLedger::TakePending(const Address& staker) {
    auto it = positions_.find(staker);
    if (it == positions_.end()) {
        return 0;
    }
    Amount pending = it->second.pending;
    it->second.pending = 0;
    Prune(staker);
    return pending;
}

Amount LpRewardLedger::TotalPending() const {
    Amount total = 0;
    for (const auto& entry : positions_) {
        total += entry.second.pending;
    }
    return total;
}

void LpRewardLedger::Restore(const std::map<Address, LpPosition>& positions, Amount carry) {
    positions_ = positions;
    carry_ = carry;
    totalShares_ = 0;
    for (const auto& entry : positions_) {
        totalShares_ += entry.second.shares;
    }
}

void LpRewardLedger::Prune(const Address& staker) {
    auto it = positions_.find(staker);
    if (it != positions_.end() && it->second.shares == 0 && it->second.pending == 0) {
        positions_.erase(it);
    }
}

} // namespace staking
} // namespace liquidstake
