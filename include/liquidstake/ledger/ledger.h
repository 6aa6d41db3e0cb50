// LIQUIDSTAKE - Host Ledger
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License
//
// Account balances owned by the host. The pool never edits balances
// directly: it withdraws bearer values from accounts and deposits them back.

#ifndef LIQUIDSTAKE_LEDGER_LEDGER_H
#define LIQUIDSTAKE_LEDGER_LEDGER_H

#include "liquidstake/asset/fungible_asset.h"
#include "liquidstake/core/status.h"
#include "liquidstake/core/types.h"

#include <map>
#include <mutex>
#include <set>
#include <utility>
#include <vector>

namespace liquidstake {
namespace ledger {

using asset::FungibleAsset;
using asset::TokenKind;

// ============================================================================
// Ledger Interface
// ============================================================================

class ILedger {
public:
    virtual ~ILedger() = default;

    /**
     * Take amount of kind out of an account.
     *
     * @param owner Account to debit
     * @param kind Token kind
     * @param amount Units to withdraw (may be zero)
     * @param[out] out Receives the withdrawn value on success
     * @return INSUFFICIENT_BALANCE or ACCOUNT_FROZEN on failure
     */
    virtual Status Withdraw(const Address& owner, TokenKind kind, Amount amount,
                            FungibleAsset* out) = 0;

    /**
     * Credit a value to an account. Zero values are rejected (they must be
     * destroyed instead). On failure the value is left with the caller.
     */
    virtual Status Deposit(const Address& owner, FungibleAsset&& value) = 0;

    virtual Amount Balance(const Address& owner, TokenKind kind) const = 0;

    virtual bool IsFrozen(const Address& owner, TokenKind kind) const = 0;

    virtual void SetFrozen(const Address& owner, TokenKind kind, bool frozen) = 0;

protected:
    /// Create a value backed by funds this ledger just debited
    static FungibleAsset Materialize(TokenKind kind, Amount amount) {
        return FungibleAsset(kind, amount);
    }

    /// Empty a value whose funds this ledger just credited
    static Amount Absorb(FungibleAsset& value) {
        return value.Release();
    }
};

// ============================================================================
// In-Memory Ledger
// ============================================================================

/// Single account balance record, used for persistence
struct BalanceRecord {
    Address owner;
    TokenKind kind;
    Amount amount;
};

/// Thread-safe map-backed ledger used by the daemon and tests
class InMemoryLedger : public ILedger {
public:
    InMemoryLedger() = default;

    Status Withdraw(const Address& owner, TokenKind kind, Amount amount,
                    FungibleAsset* out) override;
    Status Deposit(const Address& owner, FungibleAsset&& value) override;
    Amount Balance(const Address& owner, TokenKind kind) const override;
    bool IsFrozen(const Address& owner, TokenKind kind) const override;
    void SetFrozen(const Address& owner, TokenKind kind, bool frozen) override;

    /// Host faucet: create funds out of thin air (genesis and tests)
    Status Credit(const Address& owner, TokenKind kind, Amount amount);

    /// Sum of all balances of a kind
    Amount TotalBalance(TokenKind kind) const;

    // ========================================================================
    // Persistence
    // ========================================================================

    std::vector<BalanceRecord> SnapshotBalances() const;
    std::vector<std::pair<Address, TokenKind>> SnapshotFrozen() const;

    /// Replace all state with a snapshot
    void Restore(const std::vector<BalanceRecord>& balances,
                 const std::vector<std::pair<Address, TokenKind>>& frozen);

private:
    using AccountKey = std::pair<Address, TokenKind>;

    mutable std::mutex mutex_;
    std::map<AccountKey, Amount> balances_;
    std::set<AccountKey> frozen_;
};

} // namespace ledger
} // namespace liquidstake

#endif // LIQUIDSTAKE_LEDGER_LEDGER_H
