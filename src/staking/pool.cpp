// LIQUIDSTAKE - Pool State Implementation
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License

#include "liquidstake/staking/pool.h"
#include "liquidstake/crypto/hash.h"

#include <string>

namespace liquidstake {
namespace staking {

const char* ClaimPhaseToString(ClaimPhase phase) {
    switch (phase) {
        case ClaimPhase::Idle:         return "idle";
        case ClaimPhase::Claiming:     return "claiming";
        case ClaimPhase::Distributing: return "distributing";
    }
    return "unknown";
}

Address DerivePoolAccount(const Address& admin, const char* purpose) {
    SHA256 hasher;
    hasher.Write(std::string("liquidstake/"));
    hasher.Write(std::string(purpose));
    hasher.Write(admin.data(), admin.size());

    Byte digest[SHA256::OUTPUT_SIZE];
    hasher.Finalize(digest);
    return Address(digest, Address::SIZE);
}

} // namespace staking
} // namespace liquidstake
