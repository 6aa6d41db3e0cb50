// LIQUIDSTAKE - State Store Implementation
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License

#include "liquidstake/store/state_store.h"
#include "liquidstake/core/serialize.h"
#include "liquidstake/util/logging.h"

#include <ios>
#include <string>
#include <tuple>
#include <utility>

namespace liquidstake {
namespace store {

using asset::TokenKind;

namespace {

// ============================================================================
// Record Encoding
// ============================================================================

ByteWriter BeginRecord() {
    ByteWriter out;
    out << StateStore::RECORD_VERSION;
    return out;
}

/// Open a record for reading; throws on an unknown version
ByteReader OpenRecord(const std::string& value, const std::string& key) {
    ByteReader in(value);
    uint8_t version = 0;
    in >> version;
    if (version != StateStore::RECORD_VERSION) {
        throw std::ios_base::failure("record '" + key.substr(0, 1) + "' has unknown version " +
                                     std::to_string(version));
    }
    return in;
}

std::string AddressKey(char prefix, const Address& address) {
    return db::MakeKey(prefix, std::string(reinterpret_cast<const char*>(address.data()),
                                           address.size()));
}

std::string AccountKey(char prefix, const Address& owner, TokenKind kind) {
    std::string key = AddressKey(prefix, owner);
    key.push_back(static_cast<char>(kind));
    return key;
}

Address AddressFromKey(const std::string& key) {
    if (key.size() < 1 + Address::SIZE) {
        throw std::ios_base::failure("key too short for an address");
    }
    return Address(reinterpret_cast<const Byte*>(key.data() + 1), Address::SIZE);
}

TokenKind KindFromKey(const std::string& key) {
    if (key.size() != 2 + Address::SIZE) {
        throw std::ios_base::failure("malformed account key");
    }
    uint8_t raw = static_cast<uint8_t>(key[1 + Address::SIZE]);
    if (raw > static_cast<uint8_t>(TokenKind::Staked)) {
        throw std::ios_base::failure("unknown token kind " + std::to_string(raw));
    }
    return static_cast<TokenKind>(raw);
}

std::string EncodePool(const staking::PoolState& pool) {
    ByteWriter out = BeginRecord();
    out << pool.admin << pool.validator << pool.validatorOperator
        << pool.lastRewardClaim << pool.rewardClaimInterval
        << pool.mevRecipient << pool.treasury << pool.lpRewardVault;
    return out.Buffer();
}

staking::PoolState DecodePool(const std::string& value) {
    ByteReader in = OpenRecord(value, "p");
    staking::PoolState pool;
    in >> pool.admin >> pool.validator >> pool.validatorOperator
       >> pool.lastRewardClaim >> pool.rewardClaimInterval
       >> pool.mevRecipient >> pool.treasury >> pool.lpRewardVault;
    pool.phase = staking::ClaimPhase::Idle;
    return pool;
}

std::string EncodeRates(const staking::ExchangeRateState& rates) {
    ByteWriter out = BeginRecord();
    out << rates.totalStaked << rates.totalDelegation << rates.exchangeRate;
    return out.Buffer();
}

staking::ExchangeRateState DecodeRates(const std::string& value) {
    ByteReader in = OpenRecord(value, "r");
    staking::ExchangeRateState rates;
    in >> rates.totalStaked >> rates.totalDelegation >> rates.exchangeRate;
    if (rates.exchangeRate == 0) {
        throw std::ios_base::failure("stored exchange rate is zero");
    }
    return rates;
}

std::string EncodeAmounts(Amount first, Amount second) {
    ByteWriter out = BeginRecord();
    out << first << second;
    return out.Buffer();
}

std::pair<Amount, Amount> DecodeAmounts(const std::string& value, const std::string& key) {
    ByteReader in = OpenRecord(value, key);
    Amount first = 0;
    Amount second = 0;
    in >> first >> second;
    return {first, second};
}

std::string EncodeAmount(Amount amount) {
    ByteWriter out = BeginRecord();
    out << amount;
    return out.Buffer();
}

Amount DecodeAmount(const std::string& value, const std::string& key) {
    ByteReader in = OpenRecord(value, key);
    Amount amount = 0;
    in >> amount;
    return amount;
}

} // namespace

// ============================================================================
// StateStore
// ============================================================================

StateStore::StateStore(db::Database& db) : db_(db) {}

db::Status StateStore::KeysWithPrefix(char prefix, std::vector<std::string>* keys) {
    return db_.ScanPrefix(db::MakeKey(prefix), [keys](const std::string& key, const std::string&) {
        keys->push_back(key);
        return true;
    });
}

bool StateStore::HasState() {
    return db_.Exists(db::MakeKey(db::prefix::VERSION));
}

db::Status StateStore::Write(const PersistedState& state) {
    db::WriteBatch batch;

    // Keyed collections are rewritten from scratch
    std::vector<std::string> stale;
    for (char prefix : {db::prefix::LP_POSITION, db::prefix::BALANCE,
                        db::prefix::FROZEN, db::prefix::DELEGATION}) {
        db::Status scanned = KeysWithPrefix(prefix, &stale);
        if (!scanned.ok()) {
            return scanned;
        }
    }
    for (std::string& key : stale) {
        batch.Delete(std::move(key));
    }

    const staking::ServiceSnapshot& service = state.service;
    if (service.pool) {
        batch.Put(db::MakeKey(db::prefix::POOL), EncodePool(*service.pool));
    } else {
        batch.Delete(db::MakeKey(db::prefix::POOL));
    }
    batch.Put(db::MakeKey(db::prefix::RATES), EncodeRates(service.rates));
    batch.Put(db::MakeKey(db::prefix::SUPPLY),
              EncodeAmounts(service.baseSupply, service.stakedSupply));
    batch.Put(db::MakeKey(db::prefix::LP_CARRY), EncodeAmount(service.lpCarry));

    for (const auto& entry : service.lpPositions) {
        batch.Put(AddressKey(db::prefix::LP_POSITION, entry.first),
                  EncodeAmounts(entry.second.shares, entry.second.pending));
    }
    for (const auto& record : state.balances) {
        batch.Put(AccountKey(db::prefix::BALANCE, record.owner, record.kind),
                  EncodeAmount(record.amount));
    }
    for (const auto& account : state.frozen) {
        batch.Put(AccountKey(db::prefix::FROZEN, account.first, account.second),
                  BeginRecord().Buffer());
    }
    for (const auto& record : state.delegations) {
        batch.Put(AddressKey(db::prefix::DELEGATION, record.validator),
                  EncodeAmounts(record.delegated, record.pendingRewards));
    }

    std::string version(1, static_cast<char>(RECORD_VERSION));
    batch.Put(db::MakeKey(db::prefix::VERSION), version);

    db::Status status = db_.Write(batch, true);
    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "State commit failed: " << status.ToString();
        return status;
    }

    ++commits_;
    LOG_DEBUG(util::LogCategory::DB) << "Committed state (" << batch.Count() << " writes)";
    return status;
}

db::Status StateStore::Read(PersistedState* state) {
    std::string value;
    db::Status status = db_.Get(db::MakeKey(db::prefix::VERSION), &value);
    if (!status.ok()) {
        return status;
    }
    if (value.size() != 1 || static_cast<uint8_t>(value[0]) != RECORD_VERSION) {
        return db::Status::Corruption("unsupported state version");
    }

    PersistedState result;
    try {
        staking::ServiceSnapshot& service = result.service;

        status = db_.Get(db::MakeKey(db::prefix::POOL), &value);
        if (status.ok()) {
            service.pool = DecodePool(value);
        } else if (!status.IsNotFound()) {
            return status;
        }

        status = db_.Get(db::MakeKey(db::prefix::RATES), &value);
        if (!status.ok()) {
            return db::Status::Corruption("missing exchange-rate record: " + status.ToString());
        }
        service.rates = DecodeRates(value);

        status = db_.Get(db::MakeKey(db::prefix::SUPPLY), &value);
        if (!status.ok()) {
            return db::Status::Corruption("missing supply record: " + status.ToString());
        }
        std::tie(service.baseSupply, service.stakedSupply) = DecodeAmounts(value, "s");

        status = db_.Get(db::MakeKey(db::prefix::LP_CARRY), &value);
        if (!status.ok()) {
            return db::Status::Corruption("missing LP carry record: " + status.ToString());
        }
        service.lpCarry = DecodeAmount(value, "c");

        status = db_.ScanPrefix(
            db::MakeKey(db::prefix::LP_POSITION),
            [&service](const std::string& key, const std::string& record) {
                staking::LpPosition position;
                std::tie(position.shares, position.pending) = DecodeAmounts(record, key);
                service.lpPositions[AddressFromKey(key)] = position;
                return true;
            });
        if (!status.ok()) {
            return status;
        }

        status = db_.ScanPrefix(
            db::MakeKey(db::prefix::BALANCE),
            [&result](const std::string& key, const std::string& record) {
                result.balances.push_back(ledger::BalanceRecord{
                    AddressFromKey(key), KindFromKey(key), DecodeAmount(record, key)});
                return true;
            });
        if (!status.ok()) {
            return status;
        }

        status = db_.ScanPrefix(
            db::MakeKey(db::prefix::FROZEN),
            [&result](const std::string& key, const std::string& record) {
                OpenRecord(record, key);
                result.frozen.emplace_back(AddressFromKey(key), KindFromKey(key));
                return true;
            });
        if (!status.ok()) {
            return status;
        }

        status = db_.ScanPrefix(
            db::MakeKey(db::prefix::DELEGATION),
            [&result](const std::string& key, const std::string& record) {
                staking::DelegationRecord delegation;
                delegation.validator = AddressFromKey(key);
                std::tie(delegation.delegated, delegation.pendingRewards) =
                    DecodeAmounts(record, key);
                result.delegations.push_back(delegation);
                return true;
            });
        if (!status.ok()) {
            return status;
        }
    } catch (const std::ios_base::failure& e) {
        return db::Status::Corruption(e.what());
    }

    *state = std::move(result);
    return db::Status::Ok();
}

db::Status StateStore::Commit(const staking::LiquidStakingService& service,
                              const ledger::InMemoryLedger& ledger,
                              const staking::SimulatedValidator& validator) {
    PersistedState state;
    state.service = service.Snapshot();
    state.balances = ledger.SnapshotBalances();
    state.frozen = ledger.SnapshotFrozen();
    state.delegations = validator.Snapshot();
    return Write(state);
}

db::Status StateStore::Load(staking::LiquidStakingService& service,
                            ledger::InMemoryLedger& ledger,
                            staking::SimulatedValidator& validator) {
    PersistedState state;
    db::Status status = Read(&state);
    if (!status.ok()) {
        return status;
    }

    Status restored = service.Restore(state.service);
    if (!restored.ok()) {
        return db::Status::InvalidArgument("cannot restore pool: " + restored.ToString());
    }
    ledger.Restore(state.balances, state.frozen);
    validator.Restore(state.delegations);

    LOG_INFO(util::LogCategory::DB) << "Loaded state: " << state.balances.size()
                                    << " balances, " << state.delegations.size()
                                    << " delegations";
    return db::Status::Ok();
}

} // namespace store
} // namespace liquidstake
