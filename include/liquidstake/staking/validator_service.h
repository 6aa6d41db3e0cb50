// LIQUIDSTAKE - Validator Service
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License
//
// Delegation, undelegation and reward claims against a validator. The pool
// treats every call as a synchronous, fallible sub-call: a failure aborts
// the enclosing operation.

#ifndef LIQUIDSTAKE_STAKING_VALIDATOR_SERVICE_H
#define LIQUIDSTAKE_STAKING_VALIDATOR_SERVICE_H

#include "liquidstake/asset/fungible_asset.h"
#include "liquidstake/core/status.h"
#include "liquidstake/core/types.h"

#include <map>
#include <mutex>
#include <vector>

namespace liquidstake {

namespace ledger {
class ILedger;
}

namespace staking {

using asset::FungibleAsset;

// ============================================================================
// Validator Service Interface
// ============================================================================

class IValidatorService {
public:
    virtual ~IValidatorService() = default;

    /**
     * Delegate a base-token value to a validator on behalf of staker.
     * The value is consumed only on success; on failure it is left with the
     * caller unchanged.
     */
    virtual Status Delegate(const Address& staker, FungibleAsset&& value,
                            const ValidatorId& validator) = 0;

    /**
     * Undelegate amount base units from a validator.
     *
     * @param[out] out Receives the released base-token value on success
     */
    virtual Status Undelegate(const Address& staker, const ValidatorId& validator,
                              Amount amount, FungibleAsset* out) = 0;

    /// Pay the validator's accrued rewards to claimer's base-token account
    virtual Status ClaimReward(const Address& claimer, const ValidatorId& validator) = 0;

    /**
     * Hand back a claimed reward that could not be distributed. The value
     * becomes pending on the validator again and is consumed only on success.
     */
    virtual Status ReturnReward(const ValidatorId& validator, FungibleAsset&& value) = 0;
};

// ============================================================================
// Simulated Validator
// ============================================================================

/// Persisted state of one validator
struct DelegationRecord {
    ValidatorId validator;
    Amount delegated{0};
    Amount pendingRewards{0};
};

/**
 * Host-side validator simulation. Delegated value is parked in a custody
 * account per validator on the ledger; rewards are paid out of a reserve
 * account that the host funds.
 */
class SimulatedValidator : public IValidatorService {
public:
    SimulatedValidator(ledger::ILedger& ledger, const Address& reserveAccount);

    Status Delegate(const Address& staker, FungibleAsset&& value,
                    const ValidatorId& validator) override;
    Status Undelegate(const Address& staker, const ValidatorId& validator,
                      Amount amount, FungibleAsset* out) override;
    Status ClaimReward(const Address& claimer, const ValidatorId& validator) override;
    Status ReturnReward(const ValidatorId& validator, FungibleAsset&& value) override;

    /// Record rewards earned by a validator; paid from the reserve on claim
    Status AccrueRewards(const ValidatorId& validator, Amount amount);

    Amount Delegated(const ValidatorId& validator) const;
    Amount PendingRewards(const ValidatorId& validator) const;

    const Address& ReserveAccount() const { return reserve_; }

    /// Ledger account holding value delegated to a validator
    static Address CustodyAccount(const ValidatorId& validator);

    /// Reserve account used when none is configured
    static Address DefaultReserveAccount();

    std::vector<DelegationRecord> Snapshot() const;
    void Restore(const std::vector<DelegationRecord>& records);

private:
    ledger::ILedger& ledger_;
    Address reserve_;

    mutable std::mutex mutex_;
    std::map<ValidatorId, DelegationRecord> records_;
};

} // namespace staking
} // namespace liquidstake

#endif // LIQUIDSTAKE_STAKING_VALIDATOR_SERVICE_H
