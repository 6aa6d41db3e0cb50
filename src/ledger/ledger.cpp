// LIQUIDSTAKE - In-Memory Ledger Implementation
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License

#include "liquidstake/ledger/ledger.h"
#include "liquidstake/core/arith.h"
#include "liquidstake/util/logging.h"

namespace liquidstake {
namespace ledger {

Status InMemoryLedger::Withdraw(const Address& owner, TokenKind kind, Amount amount,
                                FungibleAsset* out) {
    std::lock_guard<std::mutex> lock(mutex_);

    AccountKey key{owner, kind};
    if (frozen_.count(key)) {
        return Status::Error(StakingError::ACCOUNT_FROZEN, owner.ToHex());
    }

    auto it = balances_.find(key);
    Amount balance = it == balances_.end() ? 0 : it->second;
    if (amount > balance) {
        return Status::Error(StakingError::INSUFFICIENT_BALANCE,
                             "balance " + std::to_string(balance) + " " +
                             asset::TokenKindToString(kind) + ", requested " +
                             std::to_string(amount));
    }

    if (amount > 0) {
        it->second -= amount;
        if (it->second == 0) {
            balances_.erase(it);
        }
    }

    *out = Materialize(kind, amount);
    return Status::Ok();
}

Status InMemoryLedger::Deposit(const Address& owner, FungibleAsset&& value) {
    if (value.IsZero()) {
        return Status::Error(StakingError::ZERO_AMOUNT, "cannot deposit a zero value");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    AccountKey key{owner, value.Kind()};
    if (frozen_.count(key)) {
        return Status::Error(StakingError::ACCOUNT_FROZEN, owner.ToHex());
    }

    Amount& balance = balances_[key];
    auto updated = CheckedAdd(balance, value.Value());
    if (!updated) {
        if (balance == 0) {
            balances_.erase(key);
        }
        return Status::Error(StakingError::STAKE_OVERFLOW, "account balance overflow");
    }

    balance = *updated;
    Absorb(value);
    return Status::Ok();
}

Amount InMemoryLedger::Balance(const Address& owner, TokenKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(AccountKey{owner, kind});
    return it == balances_.end() ? 0 : it->second;
}

bool InMemoryLedger::IsFrozen(const Address& owner, TokenKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frozen_.count(AccountKey{owner, kind}) > 0;
}

void InMemoryLedger::SetFrozen(const Address& owner, TokenKind kind, bool frozen) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (frozen) {
        frozen_.insert(AccountKey{owner, kind});
    } else {
        frozen_.erase(AccountKey{owner, kind});
    }
}

Status InMemoryLedger::Credit(const Address& owner, TokenKind kind, Amount amount) {
    if (amount == 0) {
        return Status::Error(StakingError::ZERO_AMOUNT);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    Amount& balance = balances_[AccountKey{owner, kind}];
    auto updated = CheckedAdd(balance, amount);
    if (!updated) {
        return Status::Error(StakingError::STAKE_OVERFLOW, "account balance overflow");
    }
    balance = *updated;

    LOG_DEBUG(util::LogCategory::LEDGER) << "Credited " << amount << " "
                                         << asset::TokenKindToString(kind)
                                         << " to " << owner.ToHex();
    return Status::Ok();
}

Amount InMemoryLedger::TotalBalance(TokenKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Amount total = 0;
    for (const auto& entry : balances_) {
        if (entry.first.second == kind) {
            total += entry.second;
        }
    }
    return total;
}

std::vector<BalanceRecord> InMemoryLedger::SnapshotBalances() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<BalanceRecord> records;
    records.reserve(balances_.size());
    for (const auto& entry : balances_) {
        if (entry.second > 0) {
            records.push_back(BalanceRecord{entry.first.first, entry.first.second, entry.second});
        }
    }
    return records;
}

std::vector<std::pair<Address, TokenKind>> InMemoryLedger::SnapshotFrozen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::pair<Address, TokenKind>>(frozen_.begin(), frozen_.end());
}

void InMemoryLedger::Restore(const std::vector<BalanceRecord>& balances,
                             const std::vector<std::pair<Address, TokenKind>>& frozen) {
    std::lock_guard<std::mutex> lock(mutex_);
    balances_.clear();
    frozen_.clear();
    for (const auto& record : balances) {
        if (record.amount > 0) {
            balances_[AccountKey{record.owner, record.kind}] = record.amount;
        }
    }
    frozen_.insert(frozen.begin(), frozen.end());
}

} // namespace ledger
} // namespace liquidstake
