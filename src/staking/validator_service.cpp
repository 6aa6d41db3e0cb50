// LIQUIDSTAKE - Simulated Validator Implementation
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License

#include "liquidstake/staking/validator_service.h"
#include "liquidstake/core/arith.h"
#include "liquidstake/crypto/hash.h"
#include "liquidstake/ledger/ledger.h"
#include "liquidstake/util/logging.h"

#include <stdexcept>
#include <string>

namespace liquidstake {
namespace staking {

namespace {

Address HashToAddress(const std::string& tag, const Byte* data, size_t len) {
    SHA256 hasher;
    hasher.Write(tag);
    if (len > 0) {
        hasher.Write(data, len);
    }
    Byte digest[SHA256::OUTPUT_SIZE];
    hasher.Finalize(digest);
    return Address(digest, Address::SIZE);
}

} // namespace

SimulatedValidator::SimulatedValidator(ledger::ILedger& ledger, const Address& reserveAccount)
    : ledger_(ledger), reserve_(reserveAccount) {}

Address SimulatedValidator::CustodyAccount(const ValidatorId& validator) {
    return HashToAddress("liquidstake/validator-custody", validator.data(), validator.size());
}

Address SimulatedValidator::DefaultReserveAccount() {
    return HashToAddress("liquidstake/validator-reserve", nullptr, 0);
}

Status SimulatedValidator::Delegate(const Address& staker, FungibleAsset&& value,
                                    const ValidatorId& validator) {
    if (value.Kind() != asset::TokenKind::Base) {
        return Status::Error(StakingError::TOKEN_KIND_MISMATCH,
                             "only base tokens can be delegated");
    }
    if (value.IsZero()) {
        return Status::Error(StakingError::ZERO_AMOUNT, "nothing to delegate");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    DelegationRecord& record = records_[validator];
    record.validator = validator;
    auto updated = CheckedAdd(record.delegated, value.Value());
    if (!updated) {
        return Status::Error(StakingError::STAKE_OVERFLOW, "delegation overflow");
    }

    Amount amount = value.Value();
    Status status = ledger_.Deposit(CustodyAccount(validator), std::move(value));
    if (!status.ok()) {
        return Status::Error(StakingError::VALIDATOR_CALL_FAILED,
                             "delegate: " + status.ToString());
    }
    record.delegated = *updated;

    LOG_DEBUG(util::LogCategory::VALIDATOR) << "Delegated " << amount << " from "
                                            << staker.ToHex() << " to " << validator.ToHex();
    return Status::Ok();
}

Status SimulatedValidator::Undelegate(const Address& staker, const ValidatorId& validator,
                                      Amount amount, FungibleAsset* out) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = records_.find(validator);
    Amount delegated = it == records_.end() ? 0 : it->second.delegated;
    if (amount > delegated) {
        return Status::Error(StakingError::VALIDATOR_CALL_FAILED,
                             "undelegate: validator " + validator.ToHex() + " holds " +
                             std::to_string(delegated) + ", requested " +
                             std::to_string(amount));
    }

    Status status = ledger_.Withdraw(CustodyAccount(validator), asset::TokenKind::Base,
                                     amount, out);
    if (!status.ok()) {
        return Status::Error(StakingError::VALIDATOR_CALL_FAILED,
                             "undelegate: " + status.ToString());
    }
    if (it != records_.end()) {
        it->second.delegated -= amount;
    }

    LOG_DEBUG(util::LogCategory::VALIDATOR) << "Undelegated " << amount << " for "
                                            << staker.ToHex() << " from " << validator.ToHex();
    return Status::Ok();
}

Status SimulatedValidator::ClaimReward(const Address& claimer, const ValidatorId& validator) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = records_.find(validator);
    if (it == records_.end() || it->second.pendingRewards == 0) {
        LOG_DEBUG(util::LogCategory::VALIDATOR) << "No rewards pending for " << validator.ToHex();
        return Status::Ok();
    }

    Amount pending = it->second.pendingRewards;
    FungibleAsset reward;
    Status status = ledger_.Withdraw(reserve_, asset::TokenKind::Base, pending, &reward);
    if (!status.ok()) {
        return Status::Error(StakingError::VALIDATOR_CALL_FAILED,
                             "claim_reward: reserve cannot pay " + std::to_string(pending) +
                             ": " + status.ToString());
    }

    status = ledger_.Deposit(claimer, std::move(reward));
    if (!status.ok()) {
        Status restore = ledger_.Deposit(reserve_, std::move(reward));
        if (!restore.ok()) {
            throw std::logic_error("claim_reward: cannot return reward to reserve: " +
                                   restore.ToString());
        }
        return Status::Error(StakingError::VALIDATOR_CALL_FAILED,
                             "claim_reward: " + status.ToString());
    }
    it->second.pendingRewards = 0;

    LOG_INFO(util::LogCategory::VALIDATOR) << "Paid " << pending << " reward from "
                                           << validator.ToHex() << " to " << claimer.ToHex();
    return Status::Ok();
}

Status SimulatedValidator::ReturnReward(const ValidatorId& validator, FungibleAsset&& value) {
    if (value.Kind() != asset::TokenKind::Base) {
        return Status::Error(StakingError::TOKEN_KIND_MISMATCH,
                             "only base tokens can be returned as reward");
    }
    if (value.IsZero()) {
        return FungibleAsset::DestroyZero(std::move(value));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    DelegationRecord& record = records_[validator];
    record.validator = validator;
    auto updated = CheckedAdd(record.pendingRewards, value.Value());
    if (!updated) {
        return Status::Error(StakingError::STAKE_OVERFLOW, "pending reward overflow");
    }

    Amount amount = value.Value();
    Status status = ledger_.Deposit(reserve_, std::move(value));
    if (!status.ok()) {
        return Status::Error(StakingError::VALIDATOR_CALL_FAILED,
                             "return_reward: " + status.ToString());
    }
    record.pendingRewards = *updated;

    LOG_INFO(util::LogCategory::VALIDATOR) << "Returned " << amount << " undistributed reward to "
                                           << validator.ToHex();
    return Status::Ok();
}

Status SimulatedValidator::AccrueRewards(const ValidatorId& validator, Amount amount) {
    if (amount == 0) {
        return Status::Error(StakingError::ZERO_AMOUNT);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    DelegationRecord& record = records_[validator];
    record.validator = validator;
    auto updated = CheckedAdd(record.pendingRewards, amount);
    if (!updated) {
        return Status::Error(StakingError::STAKE_OVERFLOW, "pending reward overflow");
    }
    record.pendingRewards = *updated;

    LOG_DEBUG(util::LogCategory::VALIDATOR) << "Accrued " << amount << " reward on "
                                            << validator.ToHex();
    return Status::Ok();
}

Amount SimulatedValidator::Delegated(const ValidatorId& validator) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(validator);
    return it == records_.end() ? 0 : it->second.delegated;
}

Amount SimulatedValidator::PendingRewards(const ValidatorId& validator) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(validator);
    return it == records_.end() ? 0 : it->second.pendingRewards;
}

std::vector<DelegationRecord> SimulatedValidator::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DelegationRecord> records;
    records.reserve(records_.size());
    for (const auto& entry : records_) {
        records.push_back(entry.second);
    }
    return records;
}

void SimulatedValidator::Restore(const std::vector<DelegationRecord>& records) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
    for (const auto& record : records) {
        records_[record.validator] = record;
    }
}

} // namespace staking
} // namespace liquidstake
