#include <gtest/gtest.h>

#include "amount.hpp"

using supply::Amount;

TEST(ParseHexAmount, ZeroEncodings)
{
    EXPECT_EQ(supply::parse_hex_amount("0x"), Amount(0));
    EXPECT_EQ(supply::parse_hex_amount("0x0"), Amount(0));
    EXPECT_EQ(supply::parse_hex_amount("0x00"), Amount(0));
    EXPECT_EQ(supply::parse_hex_amount("0x" + std::string(64, '0')), Amount(0));
}

TEST(ParseHexAmount, BigEndianWords)
{
    EXPECT_EQ(supply::parse_hex_amount("0x3e8"), Amount(1000));
    EXPECT_EQ(supply::parse_hex_amount("0x00000000000000000000000000000000000000000000000000000000000f4240"), Amount(1000000));

    // wider than 64 bits
    auto big = supply::parse_hex_amount("0x0000000000000000000000000000000000000000033b2e3c9fd0803ce8000000");
    ASSERT_TRUE(big);
    EXPECT_EQ(big->str(), "1000000000000000000000000000");

    // wider than 256 bits
    auto huge = supply::parse_hex_amount("0x1" + std::string(64, '0'));
    ASSERT_TRUE(huge);
    EXPECT_EQ(*huge, Amount(Amount(1) << 256));
}

TEST(ParseHexAmount, RejectsGarbage)
{
    EXPECT_FALSE(supply::parse_hex_amount("not-hex"));
    EXPECT_FALSE(supply::parse_hex_amount(""));
    EXPECT_FALSE(supply::parse_hex_amount("0x12g4"));
    EXPECT_FALSE(supply::parse_hex_amount("0x 12"));
}

TEST(FormatScaled, Decimals)
{
    EXPECT_EQ(supply::format_scaled(Amount(1234567), 6), "1.234567");
    EXPECT_EQ(supply::format_scaled(Amount(1000000), 6), "1");
    EXPECT_EQ(supply::format_scaled(Amount(1500000), 6), "1.5");
    EXPECT_EQ(supply::format_scaled(Amount(42), 6), "0.000042");
    EXPECT_EQ(supply::format_scaled(Amount(0), 18), "0");
    EXPECT_EQ(supply::format_scaled(Amount(1000), 0), "1000");
}

TEST(FormatScaled, EighteenDecimalsIsExact)
{
    auto raw = supply::parse_hex_amount("0x033b2e3c9fd0803ce8000001");
    ASSERT_TRUE(raw);
    EXPECT_EQ(supply::format_scaled(*raw, 18), "1000000000.000000000000000001");
}
