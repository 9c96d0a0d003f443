// KEYSEAL - AES-128-CTR Tests
// Copyright (c) 2024 KEYSEAL Developers
// MIT License

#include <gtest/gtest.h>
#include "keyseal/crypto/aes.h"
#include "keyseal/core/errors.h"
#include "keyseal/core/hex.h"

#include <algorithm>
#include <vector>

namespace keyseal {
namespace test {

namespace {

// NIST SP 800-38A F.5.1
const char* const NIST_KEY = "2b7e151628aed2a6abf7158809cf4f3c";
const char* const NIST_COUNTER = "f0f1f2f3f4f5f6f7f8f9fafbfcfdfeff";
const char* const NIST_PLAINTEXT =
    "6bc1bee22e409f96e93d7e117393172aae2d8a571e03ac9c9eb76fac45af8e51";

} // namespace

// ============================================================================
// Known Vectors
// ============================================================================

TEST(AES128CTRTest, NistVector) {
    auto key = HexToBytes(NIST_KEY);
    auto iv = HexToBytes(NIST_COUNTER);
    auto pt = HexToBytes(NIST_PLAINTEXT);

    auto ct = AES128CTREncrypt(key, iv, pt);
    EXPECT_EQ(BytesToHex(ct),
              "874d6191b620e3261bef6864990db6ce9806f66b7970fdff8617187bb9fffdff");
}

TEST(AES128CTRTest, CounterWrapsAt128Bits) {
    auto key = HexToBytes(NIST_KEY);
    std::vector<Byte> iv(16, 0xff);
    auto pt = HexToBytes(NIST_PLAINTEXT);

    auto ct = AES128CTREncrypt(key, iv, pt);
    EXPECT_EQ(BytesToHex(ct),
              "e13338e36cb71962e00d020b4cedbd86d3dae15b04bb352fa0f59febfcb4da3e");
}

// ============================================================================
// Stream Properties
// ============================================================================

TEST(AES128CTRTest, DecryptInvertsEncrypt) {
    std::vector<Byte> key(16, 0x11);
    std::vector<Byte> iv(16, 0x22);
    std::vector<Byte> pt(37);
    for (size_t i = 0; i < pt.size(); ++i) {
        pt[i] = static_cast<Byte>(i);
    }

    auto ct = AES128CTREncrypt(key, iv, pt);
    EXPECT_EQ(ct.size(), pt.size());
    EXPECT_NE(ct, pt);
    EXPECT_EQ(AES128CTRDecrypt(key, iv, ct), pt);
}

TEST(AES128CTRTest, PrefixIsStable) {
    // A shorter plaintext yields a prefix of the longer ciphertext
    auto key = HexToBytes(NIST_KEY);
    auto iv = HexToBytes(NIST_COUNTER);
    auto pt = HexToBytes(NIST_PLAINTEXT);

    auto full = AES128CTREncrypt(key, iv, pt);
    std::vector<Byte> shortPt(pt.begin(), pt.begin() + 5);
    auto partial = AES128CTREncrypt(key, iv, shortPt);

    ASSERT_EQ(partial.size(), 5u);
    EXPECT_TRUE(std::equal(partial.begin(), partial.end(), full.begin()));
}

TEST(AES128CTRTest, EmptyInput) {
    std::vector<Byte> key(16, 0);
    std::vector<Byte> iv(16, 0);
    EXPECT_TRUE(AES128CTREncrypt(key, iv, ByteSpan()).empty());
}

// ============================================================================
// Argument Checks
// ============================================================================

TEST(AES128CTRTest, RejectsWrongKeyLength) {
    std::vector<Byte> iv(16, 0);
    std::vector<Byte> data(4, 0);
    EXPECT_THROW(AES128CTREncrypt(std::vector<Byte>(15, 0), iv, data), InputLengthError);
    EXPECT_THROW(AES128CTREncrypt(std::vector<Byte>(32, 0), iv, data), InputLengthError);
}

TEST(AES128CTRTest, RejectsWrongIvLength) {
    std::vector<Byte> key(16, 0);
    std::vector<Byte> data(4, 0);
    EXPECT_THROW(AES128CTREncrypt(key, std::vector<Byte>(12, 0), data), InputLengthError);
}

} // namespace test
} // namespace keyseal
