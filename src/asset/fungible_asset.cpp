// LIQUIDSTAKE - Fungible Asset Implementation
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License

#include "liquidstake/asset/fungible_asset.h"
#include "liquidstake/core/arith.h"
#include "liquidstake/util/logging.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <exception>

namespace liquidstake {
namespace asset {

namespace {
    std::atomic<uint64_t> g_droppedValues{0};
}

const char* TokenKindToString(TokenKind kind) {
    switch (kind) {
        case TokenKind::Base: return "base";
        case TokenKind::Staked: return "staked";
        default: return "unknown";
    }
}

std::optional<TokenKind> TokenKindFromString(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "base") return TokenKind::Base;
    if (lower == "staked") return TokenKind::Staked;
    return std::nullopt;
}

// ============================================================================
// FungibleAsset
// ============================================================================

FungibleAsset::~FungibleAsset() {
    if (amount_ != 0) {
        ReportDrop();
    }
}

FungibleAsset::FungibleAsset(FungibleAsset&& other) noexcept
    : kind_(other.kind_), amount_(other.Release()) {}

FungibleAsset& FungibleAsset::operator=(FungibleAsset&& other) noexcept {
    if (this != &other) {
        if (amount_ != 0) {
            ReportDrop();
        }
        kind_ = other.kind_;
        amount_ = other.Release();
    }
    return *this;
}

std::optional<FungibleAsset> FungibleAsset::Extract(Amount amount) {
    if (amount > amount_) {
        return std::nullopt;
    }
    amount_ -= amount;
    return FungibleAsset(kind_, amount);
}

Status FungibleAsset::Merge(FungibleAsset&& other) {
    if (other.kind_ != kind_) {
        return Status::Error(StakingError::TOKEN_KIND_MISMATCH,
                             std::string("cannot merge ") + TokenKindToString(other.kind_) +
                             " into " + TokenKindToString(kind_));
    }
    auto total = CheckedAdd(amount_, other.amount_);
    if (!total) {
        return Status::Error(StakingError::STAKE_OVERFLOW, "merged value overflows");
    }
    amount_ = *total;
    other.amount_ = 0;
    return Status::Ok();
}

Status FungibleAsset::DestroyZero(FungibleAsset&& asset) {
    if (!asset.IsZero()) {
        return Status::Error(StakingError::NON_ZERO_DESTROY, asset.ToString());
    }
    return Status::Ok();
}

uint64_t FungibleAsset::DroppedValueCount() {
    return g_droppedValues.load();
}

std::string FungibleAsset::ToString() const {
    return std::to_string(amount_) + " " + TokenKindToString(kind_);
}

Amount FungibleAsset::Release() noexcept {
    Amount held = amount_;
    amount_ = 0;
    return held;
}

void FungibleAsset::ReportDrop() const noexcept {
    g_droppedValues.fetch_add(1);
    try {
        LOG_ERROR(util::LogCategory::ISSUER) << "Dropped unconsumed asset value: " << ToString();
    } catch (const std::exception& e) {
        // Reached from the destructor: the count above still records the drop
        std::fprintf(stderr, "liquidstake: dropped %llu unconsumed units, log failed: %s\n",
                     static_cast<unsigned long long>(amount_), e.what());
    }
}

} // namespace asset
} // namespace liquidstake
