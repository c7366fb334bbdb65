// Satchel - Coin Amount Formatting Tests
// Copyright (c) 2024 Satchel Developers
// MIT License

#include <gtest/gtest.h>

#include <satchel/wallet/amount.h>

#include <limits>
#include <string>

namespace satchel {
namespace wallet {
namespace {

Amount Parsed(const std::string& text) {
    auto value = ParseAmount(text);
    EXPECT_TRUE(value.has_value()) << text;
    return value.value_or(0);
}

// ============================================================================
// FormatAmount
// ============================================================================

TEST(FormatAmountTest, FullPrecision) {
    EXPECT_EQ(FormatAmount(0), "0.00000000");
    EXPECT_EQ(FormatAmount(1), "0.00000001");
    EXPECT_EQ(FormatAmount(COIN), "1.00000000");
    EXPECT_EQ(FormatAmount(2100000000000000ULL), "21000000.00000000");
    EXPECT_EQ(FormatAmount(std::numeric_limits<Amount>::max()), "184467440737.09551615");
}

TEST(FormatAmountTest, FewerDecimalsRoundHalfUp) {
    EXPECT_EQ(FormatAmount(123456789, 2), "1.23");
    EXPECT_EQ(FormatAmount(125000000, 1), "1.3");
    EXPECT_EQ(FormatAmount(149999999, 0), "1");
    EXPECT_EQ(FormatAmount(150000000, 0), "2");
    EXPECT_EQ(FormatAmount(199999999, 4), "2.0000");
}

TEST(FormatAmountTest, DecimalsAreClamped) {
    EXPECT_EQ(FormatAmount(1, 12), "0.00000001");
    EXPECT_EQ(FormatAmount(250000000, -3), "3");
}

// ============================================================================
// ParseAmount
// ============================================================================

TEST(ParseAmountTest, ExactValues) {
    EXPECT_EQ(Parsed("1"), COIN);
    EXPECT_EQ(Parsed("0.00000001"), 1u);
    EXPECT_EQ(Parsed("0.1"), 10000000u);
    EXPECT_EQ(Parsed(".5"), 50000000u);
    EXPECT_EQ(Parsed("3."), 3 * COIN);
    EXPECT_EQ(Parsed("0.29"), 29000000u);
    EXPECT_EQ(Parsed("1.100000000000"), 110000000u);
}

TEST(ParseAmountTest, NoFloatRounding) {
    // 0.1 + 0.2 style values stay exact
    EXPECT_EQ(Parsed("0.30000000"), 30000000u);
    EXPECT_EQ(Parsed("20999999.99999999"), 2099999999999999u);
}

TEST(ParseAmountTest, Limits) {
    EXPECT_EQ(Parsed("184467440737.09551615"), std::numeric_limits<Amount>::max());
    EXPECT_FALSE(ParseAmount("184467440737.09551616").has_value());
    EXPECT_FALSE(ParseAmount("99999999999999999999").has_value());
}

TEST(ParseAmountTest, RejectsMalformed) {
    const char* bad[] = {"", ".", "-1", "+1", "1,000", " 1", "1 ", "1e8", "0x10",
                         "1.2.3", "0.000000001", "abc"};
    for (const char* text : bad) {
        EXPECT_FALSE(ParseAmount(text).has_value()) << text;
    }
}

TEST(ParseAmountTest, ReadsWhatFormatWrites) {
    for (Amount value : {Amount(0), Amount(546), Amount(98080), COIN + 1}) {
        EXPECT_EQ(Parsed(FormatAmount(value)), value);
    }
}

} // namespace
} // namespace wallet
} // namespace satchel
