// KEYSEAL - AES Symmetric Encryption
// Copyright (c) 2024 KEYSEAL Developers
// MIT License
//
// AES-128 in counter mode, backed by OpenSSL EVP.

#ifndef KEYSEAL_CRYPTO_AES_H
#define KEYSEAL_CRYPTO_AES_H

#include <cstdint>
#include <cstddef>
#include <vector>
#include "keyseal/core/types.h"

namespace keyseal {

// ============================================================================
// AES Constants
// ============================================================================

namespace aes {
    /// Block size is always 16 bytes for AES
    constexpr size_t BLOCK_SIZE = 16;

    /// AES-128 key size
    constexpr size_t KEY_SIZE_128 = 16;

    /// IV size (same as block size)
    constexpr size_t IV_SIZE = 16;
}

// ============================================================================
// AES-128-CTR
// ============================================================================

/**
 * Encrypt data with AES-128-CTR.
 *
 * The IV is the initial 128-bit big-endian counter block. CTR mode is a
 * stream transform: no padding, and the output has the same length as the
 * input (an empty input gives an empty output).
 *
 * @param key 16-byte key
 * @param iv 16-byte initial counter block
 * @param data Plaintext
 * @return Ciphertext (same length as input)
 * @throws InputLengthError if key or iv has the wrong length
 * @throws CipherError if OpenSSL fails
 */
std::vector<Byte> AES128CTREncrypt(ByteSpan key, ByteSpan iv, ByteSpan data);

/**
 * Decrypt data with AES-128-CTR.
 * CTR decryption is identical to encryption.
 */
inline std::vector<Byte> AES128CTRDecrypt(ByteSpan key, ByteSpan iv, ByteSpan data) {
    return AES128CTREncrypt(key, iv, data);  // CTR is symmetric
}

} // namespace keyseal

#endif // KEYSEAL_CRYPTO_AES_H
