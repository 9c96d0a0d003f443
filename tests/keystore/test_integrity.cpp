// KEYSEAL - Key Splitting and MAC Tests
// Copyright (c) 2024 KEYSEAL Developers
// MIT License

#include <gtest/gtest.h>
#include "keyseal/keystore/integrity.h"
#include "keyseal/core/errors.h"
#include "keyseal/core/hex.h"

#include <string>
#include <vector>

namespace keyseal {
namespace keystore {
namespace test {

namespace {

const char* const DERIVED_KEY_HEX =
    "d0eeaa7f5099ab896fe30086b8b07af59ae8b91b9b17ae23c8d5e7f28e97878b";
const char* const CIPHERTEXT_HEX =
    "883d416f00104a06e765bbbff2d9a0d38d932f814af5fff0a0874a13ac900b";
const char* const MAC_HEX =
    "28c863f9bf79508d5e4b58481b4712344e0186a08076e019e69e29640088fd58";

} // namespace

// ============================================================================
// Key Splitting
// ============================================================================

TEST(SplitDerivedKeyTest, HalvesInOrder) {
    Bytes dk = HexToBytes(DERIVED_KEY_HEX);
    SplitKeys keys = SplitDerivedKey(dk);

    EXPECT_EQ(BytesToHex(keys.CipherKey().data(), keys.CipherKey().size()),
              "d0eeaa7f5099ab896fe30086b8b07af5");
    EXPECT_EQ(BytesToHex(keys.MacKey().data(), keys.MacKey().size()),
              "9ae8b91b9b17ae23c8d5e7f28e97878b");
}

TEST(SplitDerivedKeyTest, RejectsWrongLength) {
    EXPECT_THROW(SplitDerivedKey(Bytes(16, 0)), InputLengthError);
    EXPECT_THROW(SplitDerivedKey(Bytes(64, 0)), InputLengthError);
}

// ============================================================================
// MAC
// ============================================================================

TEST(MacTest, KnownVector) {
    Bytes macKey = HexToBytes("9ae8b91b9b17ae23c8d5e7f28e97878b");
    Bytes ciphertext = HexToBytes(CIPHERTEXT_HEX);
    EXPECT_EQ(ComputeMac(macKey, ciphertext).ToHex(), MAC_HEX);
}

TEST(MacTest, EmptyCiphertext) {
    Bytes macKey = HexToBytes("9ae8b91b9b17ae23c8d5e7f28e97878b");
    EXPECT_EQ(ComputeMac(macKey, ByteSpan()).ToHex(),
              "45f5d3e8653391cdbfd236020b45a56b6f4b4cdc385ab6d47c34468b198a7d90");
}

TEST(MacTest, RejectsWrongKeyLength) {
    Bytes ciphertext = HexToBytes(CIPHERTEXT_HEX);
    EXPECT_THROW(ComputeMac(Bytes(32, 0), ciphertext), InputLengthError);
}

TEST(MacTest, VerifyAcceptsMatch) {
    Bytes macKey = HexToBytes("9ae8b91b9b17ae23c8d5e7f28e97878b");
    Bytes ciphertext = HexToBytes(CIPHERTEXT_HEX);
    Bytes mac = HexToBytes(MAC_HEX);
    EXPECT_TRUE(VerifyMac(macKey, ciphertext, mac));
}

TEST(MacTest, VerifyRejectsAnyFlippedBit) {
    Bytes macKey = HexToBytes("9ae8b91b9b17ae23c8d5e7f28e97878b");
    Bytes ciphertext = HexToBytes(CIPHERTEXT_HEX);
    Bytes mac = HexToBytes(MAC_HEX);

    for (size_t i = 0; i < ciphertext.size(); ++i) {
        Bytes tampered = ciphertext;
        tampered[i] ^= 0x01;
        EXPECT_FALSE(VerifyMac(macKey, tampered, mac)) << "byte " << i;
    }

    Bytes badMac = mac;
    badMac[31] ^= 0x80;
    EXPECT_FALSE(VerifyMac(macKey, ciphertext, badMac));

    Bytes otherKey = macKey;
    otherKey[0] ^= 0x01;
    EXPECT_FALSE(VerifyMac(otherKey, ciphertext, mac));
}

TEST(MacTest, VerifyRejectsTruncatedMac) {
    Bytes macKey = HexToBytes("9ae8b91b9b17ae23c8d5e7f28e97878b");
    Bytes ciphertext = HexToBytes(CIPHERTEXT_HEX);
    Bytes mac = HexToBytes(MAC_HEX);
    mac.pop_back();
    EXPECT_FALSE(VerifyMac(macKey, ciphertext, mac));
}

} // namespace test
} // namespace keystore
} // namespace keyseal
