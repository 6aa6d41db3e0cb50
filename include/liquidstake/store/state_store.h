// LIQUIDSTAKE - State Store
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License
//
// Persists the pool, the host ledger and the simulated validator to a
// Database. Each commit is one atomic WriteBatch; every record starts with a
// version byte.

#ifndef LIQUIDSTAKE_STORE_STATE_STORE_H
#define LIQUIDSTAKE_STORE_STATE_STORE_H

#include "liquidstake/db/database.h"
#include "liquidstake/ledger/ledger.h"
#include "liquidstake/staking/liquid_staking.h"
#include "liquidstake/staking/validator_service.h"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace liquidstake {
namespace store {

/// Everything written by one commit
struct PersistedState {
    staking::ServiceSnapshot service;
    std::vector<ledger::BalanceRecord> balances;
    std::vector<std::pair<Address, asset::TokenKind>> frozen;
    std::vector<staking::DelegationRecord> delegations;
};

class StateStore {
public:
    /// Version byte written in front of every record
    static constexpr uint8_t RECORD_VERSION = 1;

    explicit StateStore(db::Database& db);

    /// Replace all persisted state with state, atomically
    db::Status Write(const PersistedState& state);

    /**
     * Read persisted state.
     * @return NotFound if nothing was ever written, Corruption on
     *         truncated records or unknown versions
     */
    db::Status Read(PersistedState* state);

    /// True if a previous commit exists
    bool HasState();

    /// Capture the live objects and write them
    db::Status Commit(const staking::LiquidStakingService& service,
                      const ledger::InMemoryLedger& ledger,
                      const staking::SimulatedValidator& validator);

    /// Read persisted state into freshly constructed objects.
    /// NotFound (nothing stored) leaves them untouched.
    db::Status Load(staking::LiquidStakingService& service,
                    ledger::InMemoryLedger& ledger,
                    staking::SimulatedValidator& validator);

    uint64_t CommitCount() const { return commits_; }

private:
    /// Append the keys of all records under one prefix
    db::Status KeysWithPrefix(char prefix, std::vector<std::string>* keys);

    db::Database& db_;
    uint64_t commits_{0};
};

} // namespace store
} // namespace liquidstake

#endif // LIQUIDSTAKE_STORE_STATE_STORE_H
