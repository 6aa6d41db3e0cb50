// LIQUIDSTAKE - Core Types Tests
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License

#include <gtest/gtest.h>
#include "liquidstake/core/types.h"
#include "liquidstake/core/hex.h"

#include <map>
#include <stdexcept>

namespace liquidstake {
namespace test {

// ============================================================================
// Hash Types
// ============================================================================

TEST(Hash256Test, DefaultConstructorCreatesNullHash) {
    Hash256 h;
    EXPECT_TRUE(h.IsNull());
    EXPECT_EQ(Hash256::SIZE, 32u);
    EXPECT_EQ(h.ToHex(), std::string(64, '0'));
}

TEST(Hash160Test, AddressIsTwentyBytes) {
    EXPECT_EQ(Address::SIZE, 20u);
    Address a;
    EXPECT_EQ(a.size(), 20u);
    EXPECT_TRUE(a.IsNull());
}

TEST(Hash160Test, ShortInputIsZeroPadded) {
    Byte raw[3] = {0xaa, 0xbb, 0xcc};
    Address a(raw, sizeof(raw));
    EXPECT_EQ(a.ToHex(), "aabbcc" + std::string(34, '0'));
    EXPECT_FALSE(a.IsNull());

    a.SetNull();
    EXPECT_TRUE(a.IsNull());
}

TEST(Hash160Test, LongInputIsTruncated) {
    Byte raw[32];
    for (size_t i = 0; i < sizeof(raw); ++i) {
        raw[i] = static_cast<Byte>(i);
    }
    Address a(raw, sizeof(raw));
    EXPECT_EQ(a[19], 19);
    EXPECT_EQ(a.ToHex(), BytesToHex(raw, 20));
}

TEST(Hash160Test, FromHexAcceptsPrefix) {
    std::string hex = "00112233445566778899aabbccddeeff00112233";
    Address plain = Address::FromHex(hex);
    Address prefixed = Address::FromHex("0x" + hex);

    EXPECT_EQ(plain, prefixed);
    EXPECT_EQ(plain.ToHex(), hex);
    EXPECT_EQ(Address::FromHex("00112233445566778899AABBCCDDEEFF00112233"), plain);
}

TEST(Hash160Test, FromHexRejectsBadInput) {
    EXPECT_THROW(Address::FromHex("0011"), std::invalid_argument);
    EXPECT_THROW(Address::FromHex(std::string(40, 'g')), std::invalid_argument);
    EXPECT_THROW(Address::FromHex(std::string(39, '0')), std::invalid_argument);
    EXPECT_THROW(Hash256::FromHex(std::string(40, '0')), std::invalid_argument);
}

TEST(Hash160Test, OrderingUsableAsMapKey) {
    Byte one = 1;
    Byte two = 2;
    Address a(&one, 1);
    Address b(&two, 1);

    EXPECT_TRUE(a < b);
    EXPECT_FALSE(b < a);
    EXPECT_NE(a, b);

    std::map<Address, int> balances;
    balances[b] = 2;
    balances[a] = 1;
    EXPECT_EQ(balances.begin()->first, a);
}

TEST(AmountTest, CoinHasEightDecimals) {
    EXPECT_EQ(COIN, 100000000ULL);
}

// ============================================================================
// Hex Helpers
// ============================================================================

TEST(HexTest, BytesToHexIsLowercase) {
    std::vector<uint8_t> data = {0x00, 0x0f, 0xab, 0xff};
    EXPECT_EQ(BytesToHex(data), "000fabff");
    EXPECT_EQ(BytesToHex(std::vector<uint8_t>()), "");
}

TEST(HexTest, HexToBytesParsesBothCases) {
    std::vector<uint8_t> expected = {0xde, 0xad, 0xbe, 0xef};
    EXPECT_EQ(HexToBytes("deadbeef"), expected);
    EXPECT_EQ(HexToBytes("0xDEADBEEF"), expected);
    EXPECT_TRUE(HexToBytes("").empty());
}

TEST(HexTest, HexToBytesRejectsMalformed) {
    EXPECT_THROW(HexToBytes("abc"), std::invalid_argument);
    EXPECT_THROW(HexToBytes("zz"), std::invalid_argument);
}

TEST(HexTest, IsValidHex) {
    EXPECT_TRUE(IsValidHex("00ff"));
    EXPECT_TRUE(IsValidHex("0xABcd"));
    EXPECT_FALSE(IsValidHex(""));
    EXPECT_FALSE(IsValidHex("0x"));
    EXPECT_FALSE(IsValidHex("123"));
    EXPECT_FALSE(IsValidHex("12g4"));
}

TEST(HexTest, StringToHex) {
    EXPECT_EQ(StringToHex("stake"), "7374616b65");
}

} // namespace test
} // namespace liquidstake
