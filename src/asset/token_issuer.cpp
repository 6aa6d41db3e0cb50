// LIQUIDSTAKE - Token Issuer Implementation
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License

#include "liquidstake/asset/token_issuer.h"
#include "liquidstake/core/arith.h"
#include "liquidstake/ledger/ledger.h"
#include "liquidstake/util/logging.h"

#include <stdexcept>

namespace liquidstake {
namespace asset {

template<typename Tag>
void TokenIssuer::CheckOwnership(const Capability<Tag>& cap, const char* action) const {
    if (!initialized_ || cap.issuer_ != this) {
        throw std::logic_error(std::string(action) +
                               ": capability was not issued by this token issuer");
    }
}

std::optional<IssuerCapabilities> TokenIssuer::Initialize() {
    if (initialized_) {
        return std::nullopt;
    }
    initialized_ = true;

    LOG_INFO(util::LogCategory::ISSUER) << "Created mint/burn/freeze capabilities for "
                                        << GetMetadata(TokenKind::Base).symbol << " and "
                                        << GetMetadata(TokenKind::Staked).symbol;

    return IssuerCapabilities{
        CapabilitySet{MintCapability(this, TokenKind::Base),
                      BurnCapability(this, TokenKind::Base),
                      FreezeCapability(this, TokenKind::Base)},
        CapabilitySet{MintCapability(this, TokenKind::Staked),
                      BurnCapability(this, TokenKind::Staked),
                      FreezeCapability(this, TokenKind::Staked)}};
}

FungibleAsset TokenIssuer::Mint(const MintCapability& cap, Amount amount) {
    CheckOwnership(cap, "mint");

    Amount& supply = cap.Kind() == TokenKind::Base ? baseSupply_ : stakedSupply_;
    auto newSupply = CheckedAdd(supply, amount);
    if (!newSupply) {
        throw std::logic_error("mint: supply overflow");
    }
    supply = *newSupply;

    LOG_DEBUG(util::LogCategory::ISSUER) << "Minted " << amount << " "
                                         << TokenKindToString(cap.Kind());
    return FungibleAsset(cap.Kind(), amount);
}

Status TokenIssuer::Burn(const BurnCapability& cap, FungibleAsset&& asset) {
    CheckOwnership(cap, "burn");

    if (asset.Kind() != cap.Kind()) {
        return Status::Error(StakingError::TOKEN_KIND_MISMATCH,
                             std::string("burn capability for ") + TokenKindToString(cap.Kind()) +
                             " cannot burn " + TokenKindToString(asset.Kind()));
    }

    Amount& supply = cap.Kind() == TokenKind::Base ? baseSupply_ : stakedSupply_;
    auto newSupply = CheckedSub(supply, asset.Value());
    if (!newSupply) {
        throw std::logic_error("burn: value exceeds outstanding supply");
    }
    supply = *newSupply;

    Amount burned = asset.Release();
    LOG_DEBUG(util::LogCategory::ISSUER) << "Burned " << burned << " "
                                         << TokenKindToString(cap.Kind());
    return Status::Ok();
}

Status TokenIssuer::SetFrozen(const FreezeCapability& cap, ledger::ILedger& ledger,
                              const Address& account, bool frozen) {
    CheckOwnership(cap, "freeze");

    ledger.SetFrozen(account, cap.Kind(), frozen);
    LOG_INFO(util::LogCategory::ISSUER) << (frozen ? "Froze " : "Unfroze ")
                                        << TokenKindToString(cap.Kind())
                                        << " balance of " << account.ToHex();
    return Status::Ok();
}

TokenMetadata TokenIssuer::GetMetadata(TokenKind kind) {
    if (kind == TokenKind::Staked) {
        return TokenMetadata{kind, "Liquid Staked Token", "stBASE", 8};
    }
    return TokenMetadata{kind, "Base Token", "BASE", 8};
}

Amount TokenIssuer::Supply(TokenKind kind) const {
    return kind == TokenKind::Base ? baseSupply_ : stakedSupply_;
}

void TokenIssuer::RestoreSupply(TokenKind kind, Amount supply) {
    if (kind == TokenKind::Base) {
        baseSupply_ = supply;
    } else {
        stakedSupply_ = supply;
    }
}

} // namespace asset
} // namespace liquidstake
