// KEYSEAL - Password-Based Key Derivation
// Copyright (c) 2024 KEYSEAL Developers
// MIT License
//
// PBKDF2-HMAC-SHA256 (OpenSSL) and scrypt.

#ifndef KEYSEAL_CRYPTO_KDF_H
#define KEYSEAL_CRYPTO_KDF_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include "keyseal/core/types.h"

namespace keyseal {

namespace kdf {
    /// Largest output either KDF will produce in one call
    constexpr size_t MAX_DKLEN = 1024;

    /// Most working memory scrypt may use (1 GiB + 1 KiB); larger parameters are refused
    constexpr uint64_t MAX_SCRYPT_MEMORY = (1ULL << 30) + 1024;
}

/**
 * PBKDF2 with HMAC-SHA256 as the PRF (RFC 8018).
 *
 * @param password Password bytes (may be empty)
 * @param salt Salt (may be empty)
 * @param iterations Iteration count, at least 1
 * @param dkLen Output length in bytes
 * @throws KdfError on invalid parameters or OpenSSL failure
 */
std::vector<Byte> PBKDF2_HMAC_SHA256(const std::string& password,
                                     ByteSpan salt,
                                     uint32_t iterations,
                                     size_t dkLen);

/**
 * scrypt (RFC 7914).
 *
 * Any power-of-two N is accepted for any r, including N = 2^18 with
 * r = 1, as long as ScryptMemoryRequired(n, r, p) stays within
 * kdf::MAX_SCRYPT_MEMORY.
 *
 * @param password Password bytes (may be empty)
 * @param salt Salt (may be empty)
 * @param n CPU/memory cost, a power of two greater than 1
 * @param r Block size, at least 1
 * @param p Parallelisation, at least 1
 * @param dkLen Output length in bytes
 * @throws KdfError on invalid or oversized parameters, or OpenSSL failure
 */
std::vector<Byte> Scrypt(const std::string& password,
                         ByteSpan salt,
                         uint64_t n, uint32_t r, uint32_t p,
                         size_t dkLen);

/// Working memory scrypt(n, r, p) allocates, in bytes; saturates at UINT64_MAX
uint64_t ScryptMemoryRequired(uint64_t n, uint32_t r, uint32_t p);

} // namespace keyseal

#endif // KEYSEAL_CRYPTO_KDF_H
