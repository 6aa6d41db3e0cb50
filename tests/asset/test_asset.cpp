// LIQUIDSTAKE - Fungible Asset and Token Issuer Tests
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License

#include <gtest/gtest.h>

#include "liquidstake/asset/fungible_asset.h"
#include "liquidstake/asset/token_issuer.h"
#include "liquidstake/ledger/ledger.h"
#include "liquidstake/util/logging.h"

#include <memory>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace liquidstake {
namespace asset {
namespace test {

class TokenIssuerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto caps = issuer_.Initialize();
        ASSERT_TRUE(caps.has_value());
        caps_.emplace(std::move(*caps));
        droppedBefore_ = FungibleAsset::DroppedValueCount();
    }

    void TearDown() override {
        EXPECT_EQ(FungibleAsset::DroppedValueCount(), droppedBefore_);
    }

    TokenIssuer issuer_;
    std::optional<IssuerCapabilities> caps_;
    uint64_t droppedBefore_{0};
};

// ============================================================================
// Token Kinds
// ============================================================================

TEST(TokenKindTest, StringConversion) {
    EXPECT_STREQ(TokenKindToString(TokenKind::Base), "base");
    EXPECT_STREQ(TokenKindToString(TokenKind::Staked), "staked");
    EXPECT_EQ(TokenKindFromString("STAKED"), TokenKind::Staked);
    EXPECT_EQ(TokenKindFromString("base"), TokenKind::Base);
    EXPECT_FALSE(TokenKindFromString("lp").has_value());
}

TEST(TokenMetadataTest, BothKindsDescribed) {
    TokenMetadata base = TokenIssuer::GetMetadata(TokenKind::Base);
    TokenMetadata staked = TokenIssuer::GetMetadata(TokenKind::Staked);

    EXPECT_EQ(base.kind, TokenKind::Base);
    EXPECT_EQ(staked.kind, TokenKind::Staked);
    EXPECT_NE(base.symbol, staked.symbol);
    EXPECT_EQ(base.decimals, 8);
    EXPECT_EQ(staked.decimals, 8);
}

// ============================================================================
// Issuer
// ============================================================================

TEST_F(TokenIssuerTest, InitializeOnlyOnce) {
    EXPECT_TRUE(issuer_.IsInitialized());
    EXPECT_FALSE(issuer_.Initialize().has_value());
    EXPECT_EQ(caps_->base.mint.Kind(), TokenKind::Base);
    EXPECT_EQ(caps_->staked.burn.Kind(), TokenKind::Staked);
}

TEST_F(TokenIssuerTest, MintAndBurnTrackSupply) {
    FungibleAsset staked = issuer_.Mint(caps_->staked.mint, 1000);
    EXPECT_EQ(staked.Kind(), TokenKind::Staked);
    EXPECT_EQ(staked.Value(), 1000u);
    EXPECT_EQ(issuer_.Supply(TokenKind::Staked), 1000u);
    EXPECT_EQ(issuer_.Supply(TokenKind::Base), 0u);

    auto part = staked.Extract(400);
    ASSERT_TRUE(part.has_value());
    EXPECT_TRUE(issuer_.Burn(caps_->staked.burn, std::move(*part)).ok());
    EXPECT_EQ(issuer_.Supply(TokenKind::Staked), 600u);

    EXPECT_TRUE(issuer_.Burn(caps_->staked.burn, std::move(staked)).ok());
    EXPECT_EQ(issuer_.Supply(TokenKind::Staked), 0u);
}

TEST_F(TokenIssuerTest, MintZeroIsLegal) {
    FungibleAsset zero = issuer_.Mint(caps_->base.mint, 0);
    EXPECT_TRUE(zero.IsZero());
    EXPECT_TRUE(FungibleAsset::DestroyZero(std::move(zero)).ok());
}

TEST_F(TokenIssuerTest, BurnWrongKindLeavesValue) {
    FungibleAsset base = issuer_.Mint(caps_->base.mint, 50);

    Status status = issuer_.Burn(caps_->staked.burn, std::move(base));
    EXPECT_EQ(status.code(), StakingError::TOKEN_KIND_MISMATCH);
    EXPECT_EQ(base.Value(), 50u);
    EXPECT_EQ(issuer_.Supply(TokenKind::Base), 50u);

    EXPECT_TRUE(issuer_.Burn(caps_->base.burn, std::move(base)).ok());
}

TEST_F(TokenIssuerTest, ForeignCapabilityRejected) {
    TokenIssuer other;
    auto otherCaps = other.Initialize();
    ASSERT_TRUE(otherCaps.has_value());

    EXPECT_THROW(issuer_.Mint(otherCaps->base.mint, 1), std::logic_error);
    EXPECT_EQ(issuer_.Supply(TokenKind::Base), 0u);
}

TEST_F(TokenIssuerTest, FreezeCapabilityUpdatesLedger) {
    ledger::InMemoryLedger ledger;
    Byte raw = 0x42;
    Address holder(&raw, 1);

    EXPECT_TRUE(issuer_.SetFrozen(caps_->staked.freeze, ledger, holder, true).ok());
    EXPECT_TRUE(ledger.IsFrozen(holder, TokenKind::Staked));
    EXPECT_FALSE(ledger.IsFrozen(holder, TokenKind::Base));

    EXPECT_TRUE(issuer_.SetFrozen(caps_->staked.freeze, ledger, holder, false).ok());
    EXPECT_FALSE(ledger.IsFrozen(holder, TokenKind::Staked));
}

TEST_F(TokenIssuerTest, RestoreSupply) {
    issuer_.RestoreSupply(TokenKind::Staked, 12345);
    EXPECT_EQ(issuer_.Supply(TokenKind::Staked), 12345u);
    EXPECT_EQ(issuer_.Supply(TokenKind::Base), 0u);
}

// ============================================================================
// Value Handling
// ============================================================================

TEST_F(TokenIssuerTest, ExtractAndMerge) {
    FungibleAsset value = issuer_.Mint(caps_->base.mint, 100);

    EXPECT_FALSE(value.Extract(101).has_value());
    EXPECT_EQ(value.Value(), 100u);

    auto piece = value.Extract(30);
    ASSERT_TRUE(piece.has_value());
    EXPECT_EQ(piece->Value(), 30u);
    EXPECT_EQ(value.Value(), 70u);

    EXPECT_TRUE(value.Merge(std::move(*piece)).ok());
    EXPECT_EQ(value.Value(), 100u);
    EXPECT_TRUE(piece->IsZero());

    FungibleAsset staked = issuer_.Mint(caps_->staked.mint, 5);
    EXPECT_EQ(value.Merge(std::move(staked)).code(), StakingError::TOKEN_KIND_MISMATCH);
    EXPECT_EQ(staked.Value(), 5u);

    EXPECT_TRUE(issuer_.Burn(caps_->staked.burn, std::move(staked)).ok());
    EXPECT_TRUE(issuer_.Burn(caps_->base.burn, std::move(value)).ok());
}

TEST_F(TokenIssuerTest, DestroyZeroRejectsValue) {
    FungibleAsset value = issuer_.Mint(caps_->base.mint, 9);
    Status status = FungibleAsset::DestroyZero(std::move(value));
    EXPECT_EQ(status.code(), StakingError::NON_ZERO_DESTROY);
    EXPECT_EQ(value.Value(), 9u);
    EXPECT_EQ(value.ToString(), "9 base");

    EXPECT_TRUE(issuer_.Burn(caps_->base.burn, std::move(value)).ok());
}

TEST_F(TokenIssuerTest, MoveTransfersOwnership) {
    FungibleAsset source = issuer_.Mint(caps_->base.mint, 77);
    FungibleAsset target(std::move(source));
    EXPECT_TRUE(source.IsZero());
    EXPECT_EQ(target.Value(), 77u);

    FungibleAsset assigned(TokenKind::Base);
    assigned = std::move(target);
    EXPECT_EQ(assigned.Value(), 77u);

    EXPECT_TRUE(issuer_.Burn(caps_->base.burn, std::move(assigned)).ok());
}

TEST(FungibleAssetTest, DroppingNonZeroValueIsCounted) {
    TokenIssuer issuer;
    auto caps = issuer.Initialize();
    ASSERT_TRUE(caps.has_value());

    uint64_t before = FungibleAsset::DroppedValueCount();
    {
        FungibleAsset leaked = issuer.Mint(caps->base.mint, 3);
        EXPECT_EQ(leaked.Value(), 3u);
    }
    EXPECT_EQ(FungibleAsset::DroppedValueCount(), before + 1);

    {
        FungibleAsset empty(TokenKind::Staked);
    }
    EXPECT_EQ(FungibleAsset::DroppedValueCount(), before + 1);
}

TEST(FungibleAssetTest, DropSurvivesFailingLogSink) {
    static_assert(std::is_nothrow_destructible<FungibleAsset>::value,
                  "dropping a value must not throw");

    TokenIssuer issuer;
    auto caps = issuer.Initialize();
    ASSERT_TRUE(caps.has_value());

    FungibleAsset leaked = issuer.Mint(caps->base.mint, 7);
    FungibleAsset target = issuer.Mint(caps->staked.mint, 2);
    FungibleAsset empty = issuer.Mint(caps->staked.mint, 0);
    uint64_t before = FungibleAsset::DroppedValueCount();

    auto& logger = util::Logger::Instance();
    logger.ClearSinks();
    logger.EnableAllCategories();
    logger.SetLevel(util::LogLevel::Info);
    logger.AddSink(std::make_shared<util::CallbackSink>(
        [](const util::LogEntry&) { throw std::runtime_error("sink unavailable"); }));

    target = std::move(empty);
    EXPECT_TRUE(target.IsZero());
    {
        FungibleAsset dropped = std::move(leaked);
    }
    logger.ClearSinks();

    EXPECT_EQ(FungibleAsset::DroppedValueCount(), before + 2);
}

} // namespace test
} // namespace asset
} // namespace liquidstake
