// FORESIGHT - Core Types Tests
// Copyright (c) 2024 FORESIGHT Developers
// MIT License

#include <gtest/gtest.h>
#include "foresight/core/types.h"
#include "foresight/core/arith.h"
#include "foresight/core/hex.h"
#include <limits>
#include <optional>
#include <vector>
#include <stdexcept>

using namespace foresight;

// ============================================================================
// Amount Tests
// ============================================================================

TEST(AmountTest, MoneyRange) {
    EXPECT_TRUE(MoneyRange(0));
    EXPECT_TRUE(MoneyRange(COIN));
    EXPECT_TRUE(MoneyRange(MAX_MONEY));
    EXPECT_FALSE(MoneyRange(-1));
    EXPECT_FALSE(MoneyRange(MAX_MONEY + 1));
}

// ============================================================================
// Hash Tests
// ============================================================================

TEST(Hash256Test, DefaultConstructorCreatesZeroHash) {
    Hash256 hash;
    EXPECT_TRUE(hash.IsNull());
    EXPECT_EQ(hash.size(), 32u);
    EXPECT_EQ(hash.ToHex(), std::string(64, '0'));
}

TEST(Hash256Test, ConstructFromShortBytesPadsWithZero) {
    const Byte bytes[] = {0xab, 0xcd};
    Hash256 hash(bytes, sizeof(bytes));
    EXPECT_FALSE(hash.IsNull());
    EXPECT_EQ(hash[0], 0xab);
    EXPECT_EQ(hash[1], 0xcd);
    EXPECT_EQ(hash[2], 0x00);
}

TEST(Hash256Test, ConstructFromLongBytesTruncates) {
    std::vector<Byte> bytes(40, 0x11);
    Hash256 hash(bytes.data(), bytes.size());
    EXPECT_EQ(hash.ToHex(), std::string(64, '1'));
}

TEST(Hash256Test, LessThanIsLexicographic) {
    Hash256 a, b;
    a[0] = 0x01;
    b[0] = 0x01;
    b[31] = 0x01;
    EXPECT_TRUE(a < b);
    EXPECT_FALSE(b < a);

    Hash256 c;
    c[0] = 0x02;
    EXPECT_TRUE(b < c);
}

TEST(Hash160Test, HexRoundTrip) {
    const std::string hex = "00112233445566778899aabbccddeeff01234567";
    Hash160 principal = Hash160::FromHex(hex);
    EXPECT_EQ(principal[0], 0x00);
    EXPECT_EQ(principal[1], 0x11);
    EXPECT_EQ(principal[19], 0x67);
    EXPECT_EQ(principal.ToHex(), hex);
}

TEST(Hash160Test, FromHexRejectsBadInput) {
    EXPECT_THROW(Hash160::FromHex("0011"), std::invalid_argument);
    EXPECT_THROW(Hash160::FromHex(std::string(40, 'z')), std::invalid_argument);
    EXPECT_THROW(Hash256::FromHex(std::string(40, '0')), std::invalid_argument);
}

// ============================================================================
// Hex Tests
// ============================================================================

TEST(HexTest, EncodeDecode) {
    std::vector<uint8_t> bytes = {0x00, 0x7f, 0x80, 0xff};
    EXPECT_EQ(HexStr(bytes), "007f80ff");
    EXPECT_EQ(ParseHex("007F80FF"), std::optional<std::vector<uint8_t>>(bytes));
    EXPECT_EQ(ParseHex(""), std::optional<std::vector<uint8_t>>(std::vector<uint8_t>{}));
}

TEST(HexTest, ParseRejectsMalformed) {
    EXPECT_FALSE(ParseHex("abc").has_value());
    EXPECT_FALSE(ParseHex("0g").has_value());
    EXPECT_FALSE(ParseHex("0x12").has_value());
}

TEST(Hash160Test, TryFromHexNamesPrincipals) {
    EXPECT_FALSE(Principal::TryFromHex("alice").has_value());
    EXPECT_FALSE(Principal::TryFromHex(std::string(40, 'g')).has_value());
    auto parsed = Principal::TryFromHex(std::string(38, '0') + "Ff");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ((*parsed)[19], 0xff);
}

// ============================================================================
// Checked Arithmetic Tests
// ============================================================================

TEST(ArithTest, MulDivFloorTruncates) {
    EXPECT_EQ(MulDivFloor(7, 10, 3), std::optional<uint64_t>(23));
    EXPECT_EQ(MulDivFloor(0, 10, 3), std::optional<uint64_t>(0));
}

TEST(ArithTest, MulDivFloorUsesWideIntermediate) {
    const uint64_t max = std::numeric_limits<uint64_t>::max();
    EXPECT_EQ(MulDivFloor(max, 100, 100), std::optional<uint64_t>(max));
    EXPECT_EQ(MulDivFloor(max, 2, 4), std::optional<uint64_t>(max / 2));
}

TEST(ArithTest, MulDivFloorRejectsZeroDivisorAndOverflow) {
    const uint64_t max = std::numeric_limits<uint64_t>::max();
    EXPECT_FALSE(MulDivFloor(1, 1, 0).has_value());
    EXPECT_FALSE(MulDivFloor(max, 3, 2).has_value());
}

TEST(ArithTest, CheckedAdd) {
    const uint64_t max = std::numeric_limits<uint64_t>::max();
    EXPECT_EQ(CheckedAdd(1, 2), std::optional<uint64_t>(3));
    EXPECT_EQ(CheckedAdd(max, 0), std::optional<uint64_t>(max));
    EXPECT_FALSE(CheckedAdd(max, 1).has_value());
}

TEST(ArithTest, AbsDiff) {
    EXPECT_EQ(AbsDiff(130, 120), 10u);
    EXPECT_EQ(AbsDiff(120, 130), 10u);
    EXPECT_EQ(AbsDiff(0, std::numeric_limits<uint64_t>::max()),
              std::numeric_limits<uint64_t>::max());
}
