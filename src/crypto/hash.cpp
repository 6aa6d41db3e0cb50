// LIQUIDSTAKE - Hashing and Key Derivation Implementation
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License

#include "liquidstake/crypto/hash.h"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <stdexcept>

namespace liquidstake {

// ============================================================================
// SHA256
// ============================================================================

struct SHA256::Impl {
    EVP_MD_CTX* ctx{nullptr};

    Impl() {
        ctx = EVP_MD_CTX_new();
        if (!ctx || EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
            if (ctx) EVP_MD_CTX_free(ctx);
            throw std::runtime_error("SHA256: failed to initialize digest context");
        }
    }

    ~Impl() {
        EVP_MD_CTX_free(ctx);
    }
};

SHA256::SHA256() : impl_(std::make_unique<Impl>()) {}

SHA256::~SHA256() = default;

SHA256& SHA256::Write(const Byte* data, size_t len) {
    if (len > 0 && EVP_DigestUpdate(impl_->ctx, data, len) != 1) {
        throw std::runtime_error("SHA256: digest update failed");
    }
    return *this;
}

SHA256& SHA256::Write(const std::string& data) {
    return Write(reinterpret_cast<const Byte*>(data.data()), data.size());
}

void SHA256::Finalize(Byte hash[OUTPUT_SIZE]) {
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(impl_->ctx, hash, &len) != 1 || len != OUTPUT_SIZE) {
        throw std::runtime_error("SHA256: digest finalization failed");
    }
    Reset();
}

SHA256& SHA256::Reset() {
    if (EVP_DigestInit_ex(impl_->ctx, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA256: digest reset failed");
    }
    return *this;
}

Hash256 SHA256Hash(const Byte* data, size_t len) {
    Byte out[SHA256::OUTPUT_SIZE];
    SHA256 hasher;
    hasher.Write(data, len).Finalize(out);
    return Hash256(out, SHA256::OUTPUT_SIZE);
}

// ============================================================================
// PBKDF2
// ============================================================================

std::vector<Byte> PBKDF2_SHA512(const std::string& password,
                                const std::string& salt,
                                uint32_t iterations,
                                size_t keyLen) {
    if (iterations == 0) {
        throw std::invalid_argument("PBKDF2 iterations must be > 0");
    }

    std::vector<Byte> key(keyLen);
    int rc = PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                               reinterpret_cast<const unsigned char*>(salt.data()),
                               static_cast<int>(salt.size()),
                               static_cast<int>(iterations), EVP_sha512(),
                               static_cast<int>(keyLen), key.data());
    if (rc != 1) {
        throw std::runtime_error("PBKDF2-HMAC-SHA512 derivation failed");
    }
    return key;
}

// ============================================================================
// Comparison and Randomness
// ============================================================================

bool ConstantTimeCompare(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::vector<Byte> GetRandomBytes(size_t count) {
    std::vector<Byte> buffer(count);
    if (count > 0 && RAND_bytes(buffer.data(), static_cast<int>(count)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return buffer;
}

} // namespace liquidstake
