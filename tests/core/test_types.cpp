// KEYSEAL - Core Types Tests
// Copyright (c) 2024 KEYSEAL Developers
// MIT License

#include <gtest/gtest.h>
#include "keyseal/core/types.h"
#include "keyseal/core/hex.h"

#include <array>
#include <stdexcept>
#include <vector>

namespace keyseal {
namespace test {

// ============================================================================
// Span Tests
// ============================================================================

TEST(SpanTest, DefaultIsEmpty) {
    ByteSpan span;
    EXPECT_TRUE(span.empty());
    EXPECT_EQ(span.size(), 0u);
    EXPECT_EQ(span.data(), nullptr);
}

TEST(SpanTest, FromVector) {
    std::vector<Byte> vec = {1, 2, 3, 4};
    ByteSpan span(vec);
    ASSERT_EQ(span.size(), 4u);
    EXPECT_EQ(span.data(), vec.data());
    EXPECT_EQ(span[2], 3);
}

TEST(SpanTest, FromArray) {
    std::array<Byte, 3> arr = {7, 8, 9};
    ByteSpan span(arr);
    EXPECT_EQ(span.size(), 3u);
    EXPECT_EQ(span[0], 7);
}

TEST(SpanTest, SubspanFirstLast) {
    std::vector<Byte> vec = {0, 1, 2, 3, 4, 5};
    ByteSpan span(vec);

    auto mid = span.subspan(2, 3);
    ASSERT_EQ(mid.size(), 3u);
    EXPECT_EQ(mid[0], 2);
    EXPECT_EQ(mid[2], 4);

    EXPECT_EQ(span.first(2)[1], 1);
    EXPECT_EQ(span.last(2)[0], 4);
}

TEST(SpanTest, IteratesInOrder) {
    std::vector<Byte> vec = {10, 20, 30};
    std::vector<Byte> seen;
    for (Byte b : ByteSpan(vec)) {
        seen.push_back(b);
    }
    EXPECT_EQ(seen, vec);
}

// ============================================================================
// Hash256 Tests
// ============================================================================

TEST(Hash256Test, DefaultConstructorCreatesZeroHash) {
    Hash256 h;
    EXPECT_TRUE(h.IsNull());
    EXPECT_EQ(h.size(), 32u);
}

TEST(Hash256Test, ShortInputIsZeroExtended) {
    Byte data[] = {0xaa, 0xbb};
    Hash256 h(data, sizeof(data));
    EXPECT_EQ(h[0], 0xaa);
    EXPECT_EQ(h[1], 0xbb);
    EXPECT_EQ(h[2], 0x00);
    EXPECT_FALSE(h.IsNull());
}

TEST(Hash256Test, HexIsNaturalOrder) {
    std::array<Byte, 32> raw{};
    raw[0] = 0x01;
    raw[31] = 0xff;
    Hash256 h(raw);

    std::string hex = h.ToHex();
    EXPECT_EQ(hex.size(), 64u);
    EXPECT_EQ(hex.substr(0, 2), "01");
    EXPECT_EQ(hex.substr(62, 2), "ff");
}

TEST(Hash256Test, FromHexAcceptsPrefix) {
    const std::string hex = "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470";
    Hash256 a = Hash256::FromHex(hex);
    Hash256 b = Hash256::FromHex("0x" + hex);
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.ToHex(), hex);
}

TEST(Hash256Test, FromHexRejectsWrongLength) {
    EXPECT_THROW(Hash256::FromHex("abcd"), std::invalid_argument);
    EXPECT_THROW(Hash256::FromHex(std::string(66, 'a')), std::invalid_argument);
}

TEST(Hash256Test, SetNullAndCompare) {
    Hash256 h = Hash256::FromHex(std::string(64, 'f'));
    Hash256 zero;
    EXPECT_NE(h, zero);
    h.SetNull();
    EXPECT_EQ(h, zero);
}

TEST(Hash256Test, ToBytesCopies) {
    Hash256 h = Hash256::FromHex(std::string(64, '1'));
    Bytes bytes = h.ToBytes();
    ASSERT_EQ(bytes.size(), 32u);
    EXPECT_EQ(bytes[0], 0x11);
}

} // namespace test
} // namespace keyseal
