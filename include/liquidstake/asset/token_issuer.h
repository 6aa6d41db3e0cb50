// LIQUIDSTAKE - Token Issuer
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License
//
// Mints and burns base and staked token values. Every privileged call takes
// a capability handle that only the issuer can create; capabilities are
// handed out exactly once, by Initialize().

#ifndef LIQUIDSTAKE_ASSET_TOKEN_ISSUER_H
#define LIQUIDSTAKE_ASSET_TOKEN_ISSUER_H

#include "liquidstake/asset/fungible_asset.h"
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
// Capabilities
// ============================================================================

/// Opaque, non-copyable permission to perform one action on one token kind
template<typename Tag>
class Capability {
public:
    Capability(const Capability&) = delete;
    Capability& operator=(const Capability&) = delete;
    Capability(Capability&&) noexcept = default;
    Capability& operator=(Capability&&) noexcept = default;

    TokenKind Kind() const noexcept { return kind_; }

private:
    Capability(const TokenIssuer* issuer, TokenKind kind) noexcept
        : issuer_(issuer), kind_(kind) {}

    friend class TokenIssuer;

    const TokenIssuer* issuer_;
    TokenKind kind_;
};

struct MintTag {};
struct BurnTag {};
struct FreezeTag {};

using MintCapability = Capability<MintTag>;
using BurnCapability = Capability<BurnTag>;
using FreezeCapability = Capability<FreezeTag>;

/// The three capabilities of one token kind
struct CapabilitySet {
    MintCapability mint;
    BurnCapability burn;
    FreezeCapability freeze;
};

struct IssuerCapabilities {
    CapabilitySet base;
    CapabilitySet staked;
};

// ============================================================================
// Token Metadata
// ============================================================================

struct TokenMetadata {
    TokenKind kind;
    std::string name;
    std::string symbol;
    uint8_t decimals;
};

// ============================================================================
// TokenIssuer
// ============================================================================

class TokenIssuer {
public:
    TokenIssuer() = default;

    TokenIssuer(const TokenIssuer&) = delete;
    TokenIssuer& operator=(const TokenIssuer&) = delete;

    /// Create both capability sets. Succeeds once; later calls return nullopt.
    std::optional<IssuerCapabilities> Initialize();

    bool IsInitialized() const { return initialized_; }

    /**
     * Mint exactly amount units of the capability's kind. Zero is legal and
     * yields a zero value.
     *
     * @throws std::logic_error if the capability belongs to another issuer
     *         or the supply would overflow
     */
    FungibleAsset Mint(const MintCapability& cap, Amount amount);

    /**
     * Burn a value. On TOKEN_KIND_MISMATCH the value is not consumed.
     *
     * @throws std::logic_error if the capability belongs to another issuer
     */
    Status Burn(const BurnCapability& cap, FungibleAsset&& asset);

    /// Freeze or thaw an account's balance of the capability's kind
    Status SetFrozen(const FreezeCapability& cap, ledger::ILedger& ledger,
                     const Address& account, bool frozen);

    static TokenMetadata GetMetadata(TokenKind kind);

    /// Outstanding minted-minus-burned amount
    Amount Supply(TokenKind kind) const;

    /// Reload a persisted supply counter
    void RestoreSupply(TokenKind kind, Amount supply);

private:
    template<typename Tag>
    void CheckOwnership(const Capability<Tag>& cap, const char* action) const;

    bool initialized_{false};
    Amount baseSupply_{0};
    Amount stakedSupply_{0};
};

} // namespace asset
} // namespace liquidstake

#endif // LIQUIDSTAKE_ASSET_TOKEN_ISSUER_H
