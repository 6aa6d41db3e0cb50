// LIQUIDSTAKE - Hashing and Key Derivation
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License
//
// Thin wrappers over OpenSSL libcrypto: SHA-256, PBKDF2-HMAC-SHA512 and
// constant-time comparison.

#ifndef LIQUIDSTAKE_CRYPTO_HASH_H
#define LIQUIDSTAKE_CRYPTO_HASH_H

#include <cstdint>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "liquidstake/core/types.h"

namespace liquidstake {

/// Incremental SHA-256 hasher
class SHA256 {
public:
    static constexpr size_t OUTPUT_SIZE = 32;

    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    /// @return Reference to this hasher (for chaining)
    SHA256& Write(const Byte* data, size_t len);
    SHA256& Write(const std::string& data);

    /// Finalize and write OUTPUT_SIZE bytes to hash
    void Finalize(Byte hash[OUTPUT_SIZE]);

    SHA256& Reset();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// One-shot SHA-256
Hash256 SHA256Hash(const Byte* data, size_t len);

inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

inline Hash256 SHA256Hash(const std::string& data) {
    return SHA256Hash(reinterpret_cast<const Byte*>(data.data()), data.size());
}

/// PBKDF2 with HMAC-SHA512
/// @param password Password bytes (UTF-8)
/// @param salt Salt bytes
/// @param iterations Iteration count (must be > 0)
/// @param keyLen Output length
/// @throws std::invalid_argument on zero iterations
/// @throws std::runtime_error if the derivation fails
std::vector<Byte> PBKDF2_SHA512(const std::string& password,
                                const std::string& salt,
                                uint32_t iterations,
                                size_t keyLen);

/// Compare two strings in time independent of where they differ
bool ConstantTimeCompare(const std::string& a, const std::string& b);

/// Fill a buffer with cryptographically secure random bytes
/// @throws std::runtime_error if the generator fails
std::vector<Byte> GetRandomBytes(size_t count);

} // namespace liquidstake

#endif // LIQUIDSTAKE_CRYPTO_HASH_H
