// LIQUIDSTAKE - Fungible Asset Values
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License
//
// A FungibleAsset is a bearer value: it owns a quantity of one token kind.
// It can be moved but never copied, and it must end up deposited, burned,
// merged or destroyed while zero. Destroying a non-zero value is reported
// through the log and counted in DroppedValueCount().

#ifndef LIQUIDSTAKE_ASSET_FUNGIBLE_ASSET_H
#define LIQUIDSTAKE_ASSET_FUNGIBLE_ASSET_H

#include "liquidstake/core/status.h"
#include "liquidstake/core/types.h"

#include <cstdint>
#include <optional>
#include <string>

namespace liquidstake {

namespace ledger {
class ILedger;
}

namespace asset {

class TokenIssuer;

// ============================================================================
// Token Kinds
// ============================================================================

enum class TokenKind : uint8_t {
    Base = 0,     // Underlying token that is delegated
    Staked = 1,   // Derivative token representing a pool share
};

const char* TokenKindToString(TokenKind kind);

/// Parse "base" / "staked" (case-insensitive)
std::optional<TokenKind> TokenKindFromString(const std::string& str);

// ============================================================================
// FungibleAsset
// ============================================================================

class FungibleAsset {
public:
    /// Zero value of the given kind
    explicit FungibleAsset(TokenKind kind = TokenKind::Base) noexcept
        : kind_(kind), amount_(0) {}

    ~FungibleAsset();

    FungibleAsset(const FungibleAsset&) = delete;
    FungibleAsset& operator=(const FungibleAsset&) = delete;

    /// Moving leaves the source as a zero value of the same kind
    FungibleAsset(FungibleAsset&& other) noexcept;
    FungibleAsset& operator=(FungibleAsset&& other) noexcept;

    TokenKind Kind() const noexcept { return kind_; }
    Amount Value() const noexcept { return amount_; }
    bool IsZero() const noexcept { return amount_ == 0; }

    /// Split amount off into a new value of the same kind.
    /// Returns nullopt if this value holds less than amount.
    std::optional<FungibleAsset> Extract(Amount amount);

    /// Absorb other into this value. On error other is left untouched.
    Status Merge(FungibleAsset&& other);

    /// Consume a zero value; fails with NON_ZERO_DESTROY otherwise
    static Status DestroyZero(FungibleAsset&& asset);

    /// Number of non-zero values destroyed without being consumed
    static uint64_t DroppedValueCount();

    std::string ToString() const;

private:
    FungibleAsset(TokenKind kind, Amount amount) noexcept
        : kind_(kind), amount_(amount) {}

    /// Empty this value and return what it held
    Amount Release() noexcept;

    void ReportDrop() const noexcept;

    friend class TokenIssuer;
    friend class ledger::ILedger;

    TokenKind kind_;
    Amount amount_;
};

} // namespace asset
} // namespace liquidstake

#endif // LIQUIDSTAKE_ASSET_FUNGIBLE_ASSET_H
