// KEYSEAL - Hex Encoding Tests
// Copyright (c) 2024 KEYSEAL Developers
// MIT License

#include <gtest/gtest.h>
#include "keyseal/core/hex.h"

#include <array>
#include <stdexcept>
#include <string>
#include <vector>

using namespace keyseal;

// ============================================================================
// Encoding
// ============================================================================

TEST(HexTest, EncodeLowercase) {
    std::vector<uint8_t> data = {0x00, 0x0f, 0xab, 0xff};
    EXPECT_EQ(BytesToHex(data), "000fabff");
}

TEST(HexTest, EncodeEmpty) {
    EXPECT_EQ(BytesToHex(std::vector<uint8_t>{}), "");
    EXPECT_EQ(BytesToPrefixedHex(std::vector<uint8_t>{}), "0x");
}

TEST(HexTest, EncodeArray) {
    std::array<uint8_t, 3> data = {0xde, 0xad, 0x01};
    EXPECT_EQ(BytesToHex(data), "dead01");
}

TEST(HexTest, PrefixedEncoding) {
    std::vector<uint8_t> data = {0x12, 0x34};
    EXPECT_EQ(BytesToPrefixedHex(data), "0x1234");
}

// ============================================================================
// Decoding
// ============================================================================

TEST(HexTest, DecodeMixedCase) {
    std::vector<uint8_t> expected = {0xab, 0xcd, 0xef};
    EXPECT_EQ(HexToBytes("AbCdEF"), expected);
}

TEST(HexTest, DecodeWithPrefix) {
    std::vector<uint8_t> expected = {0x01, 0x02};
    EXPECT_EQ(HexToBytes("0x0102"), expected);
    EXPECT_EQ(HexToBytes("0X0102"), expected);
}

TEST(HexTest, DecodeEmpty) {
    EXPECT_TRUE(HexToBytes("").empty());
    EXPECT_TRUE(HexToBytes("0x").empty());
}

TEST(HexTest, DecodeOddLengthThrows) {
    EXPECT_THROW(HexToBytes("abc"), std::invalid_argument);
    EXPECT_THROW(HexToBytes("0x1"), std::invalid_argument);
}

TEST(HexTest, DecodeBadCharacterThrows) {
    EXPECT_THROW(HexToBytes("zz"), std::invalid_argument);
    EXPECT_THROW(HexToBytes("12 4"), std::invalid_argument);
}

TEST(HexTest, RoundTripAllByteValues) {
    std::vector<uint8_t> data(256);
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<uint8_t>(i);
    }
    EXPECT_EQ(HexToBytes(BytesToHex(data)), data);
}

// ============================================================================
// Validation
// ============================================================================

TEST(HexTest, IsValidHex) {
    EXPECT_TRUE(IsValidHex(""));
    EXPECT_TRUE(IsValidHex("00"));
    EXPECT_TRUE(IsValidHex("0xABcd"));
    EXPECT_FALSE(IsValidHex("0"));
    EXPECT_FALSE(IsValidHex("0xg0"));
    EXPECT_FALSE(IsValidHex("-1"));
}

TEST(HexTest, StripHexPrefix) {
    EXPECT_EQ(StripHexPrefix("0xabcd"), "abcd");
    EXPECT_EQ(StripHexPrefix("0Xabcd"), "abcd");
    EXPECT_EQ(StripHexPrefix("abcd"), "abcd");
    EXPECT_EQ(StripHexPrefix("0"), "0");
}
