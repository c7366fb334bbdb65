// Satchel - Core Types Tests
// Copyright (c) 2024 Satchel Developers
// MIT License

#include <gtest/gtest.h>
#include "satchel/core/types.h"
#include "satchel/core/hex.h"

#include <string>
#include <vector>

namespace satchel {
namespace test {

// ============================================================================
// Hex
// ============================================================================

TEST(HexTest, BytesToHexLowercase) {
    std::vector<uint8_t> data = {0x00, 0x0f, 0xab, 0xff};
    EXPECT_EQ(BytesToHex(data), "000fabff");
}

TEST(HexTest, HexToBytesAcceptsUppercase) {
    auto bytes = HexToBytes("DEADbeef");
    ASSERT_EQ(bytes.size(), 4u);
    EXPECT_EQ(bytes[0], 0xde);
    EXPECT_EQ(bytes[3], 0xef);
}

TEST(HexTest, TryHexToBytesRejectsMalformed) {
    EXPECT_FALSE(TryHexToBytes("abc").has_value());
    EXPECT_FALSE(TryHexToBytes("zz").has_value());
    EXPECT_TRUE(TryHexToBytes("").has_value());
}

TEST(HexTest, HexToBytesThrowsOnBadCharacter) {
    EXPECT_THROW(HexToBytes("0g"), std::invalid_argument);
}

TEST(HexTest, IsValidHex) {
    EXPECT_TRUE(IsValidHex("00ff"));
    EXPECT_FALSE(IsValidHex("0"));
    EXPECT_FALSE(IsValidHex("0x00"));
}

TEST(HexTest, ReverseBytes) {
    uint8_t data[] = {1, 2, 3};
    auto rev = ReverseBytes(data, 3);
    EXPECT_EQ(rev, (std::vector<uint8_t>{3, 2, 1}));
}

// ============================================================================
// Hashes
// ============================================================================

TEST(HashTest, DefaultIsNull) {
    Hash256 h;
    EXPECT_TRUE(h.IsNull());
    EXPECT_EQ(h.size(), 32u);
}

TEST(HashTest, ToHexIsDisplayOrder) {
    Hash256 h;
    h[0] = 0x01;
    h[31] = 0xff;
    EXPECT_EQ(h.GetHex().substr(0, 2), "01");
    EXPECT_EQ(h.ToHex().substr(0, 2), "ff");
}

TEST(HashTest, FromHexRoundTripsDisplayOrder) {
    const std::string txid =
        "4a5e1e4baab89f3a32518a88c31bc87f618f76673e2cc77ab2127b7afdeda33b";
    TxHash h = TxHash::FromHex(txid);
    EXPECT_EQ(h.ToHex(), txid);
    EXPECT_EQ(h[0], 0x3b);
}

TEST(HashTest, FromHexRejectsWrongLength) {
    EXPECT_THROW(Hash256::FromHex("00"), std::invalid_argument);
}

TEST(HashTest, Equality) {
    Hash160 a, b;
    EXPECT_EQ(a, b);
    b[5] = 1;
    EXPECT_NE(a, b);
}

TEST(CompactSizeTest, Sizes) {
    EXPECT_EQ(GetCompactSizeSize(0), 1u);
    EXPECT_EQ(GetCompactSizeSize(252), 1u);
    EXPECT_EQ(GetCompactSizeSize(253), 3u);
    EXPECT_EQ(GetCompactSizeSize(0x10000), 5u);
    EXPECT_EQ(GetCompactSizeSize(0x100000000ULL), 9u);
}

} // namespace test
} // namespace satchel
