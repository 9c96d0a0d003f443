// KEYSEAL - Keystore Integrity
// Copyright (c) 2024 KEYSEAL Developers
// MIT License
//
// Splits the derived secret into cipher and MAC halves and computes or
// checks the record MAC: Keccak-256(macKey || ciphertext).

#ifndef KEYSEAL_KEYSTORE_INTEGRITY_H
#define KEYSEAL_KEYSTORE_INTEGRITY_H

#include "keyseal/core/secure.h"
#include "keyseal/core/types.h"

namespace keyseal {
namespace keystore {

/// Size of each half of the derived secret
constexpr size_t SPLIT_KEY_SIZE = 16;

/// Cipher and MAC keys taken from a 32-byte derived secret
struct SplitKeys {
    SecureArray<Byte, SPLIT_KEY_SIZE> cipherKey;   // bytes [0, 16)
    SecureArray<Byte, SPLIT_KEY_SIZE> macKey;      // bytes [16, 32)

    ByteSpan CipherKey() const { return ByteSpan(cipherKey.data(), cipherKey.size()); }
    ByteSpan MacKey() const { return ByteSpan(macKey.data(), macKey.size()); }
};

/**
 * Split a derived secret.
 * @throws InputLengthError if material is not 32 bytes
 */
SplitKeys SplitDerivedKey(ByteSpan material);

/**
 * Keccak-256 over macKey followed by ciphertext.
 * @throws InputLengthError if macKey is not 16 bytes
 */
Hash256 ComputeMac(ByteSpan macKey, ByteSpan ciphertext);

/**
 * Recompute the MAC and compare it with expected in constant time.
 * Returns false on mismatch, including an expected value of the wrong length.
 * @throws InputLengthError if macKey is not 16 bytes
 */
bool VerifyMac(ByteSpan macKey, ByteSpan ciphertext, ByteSpan expected);

} // namespace keystore
} // namespace keyseal

#endif // KEYSEAL_KEYSTORE_INTEGRITY_H
