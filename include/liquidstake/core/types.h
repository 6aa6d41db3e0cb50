// LIQUIDSTAKE - Core Types Header
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License
//
// Fundamental value types shared by every module: amounts, timestamps,
// fixed-width hashes and account addresses.

#ifndef LIQUIDSTAKE_CORE_TYPES_H
#define LIQUIDSTAKE_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <string>
#include <stdexcept>
#include <cstring>

namespace liquidstake {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Token amount in base units. Pool counters are unsigned and never negative.
using Amount = uint64_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

/// Duration in seconds
using Duration = int64_t;

/// One whole token in base units
constexpr Amount COIN = 100000000ULL;

// ============================================================================
// Hash Templates
// ============================================================================

/// Fixed-width opaque byte string
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    /// Default constructor - creates null hash
    BaseHash() noexcept {
        data_.fill(0);
    }

    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Copies up to SIZE bytes; shorter input is zero padded
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, len < SIZE ? len : SIZE);
        }
    }

    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    void SetNull() noexcept { data_.fill(0); }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    const Byte* begin() const noexcept { return data_.data(); }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const BaseHash& other) const noexcept {
        return data_ < other.data_;
    }

    /// Lowercase hex, in storage byte order
    std::string ToHex() const;

    /// Parse from hex; an optional "0x" prefix is accepted.
    /// @throws std::invalid_argument on bad length or characters
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// Specific Hash Types
// ============================================================================

/// 256-bit hash (32 bytes)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    Hash256() = default;
    Hash256(const BaseHash<256>& base) : BaseHash<256>(base) {}

    static Hash256 FromHex(const std::string& hex) {
        return Hash256(BaseHash<256>::FromHex(hex));
    }
};

/// 160-bit hash (20 bytes)
class Hash160 : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
    Hash160() = default;
    Hash160(const BaseHash<160>& base) : BaseHash<160>(base) {}

    static Hash160 FromHex(const std::string& hex) {
        return Hash160(BaseHash<160>::FromHex(hex));
    }
};

/// Account principal on the host ledger
using Address = Hash160;

/// Validator identifier
using ValidatorId = Hash160;

} // namespace liquidstake

#endif // LIQUIDSTAKE_CORE_TYPES_H
