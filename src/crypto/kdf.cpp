// KEYSEAL - Password-Based Key Derivation Implementation
// Copyright (c) 2024 KEYSEAL Developers
// MIT License
//
// PBKDF2 comes straight from OpenSSL. scrypt (RFC 7914) runs its outer
// PBKDF2 steps through OpenSSL and its ROMix mixing function here:
// OpenSSL enforces N < 2^(16r), which refuses the keystore default of
// N = 2^18 with r = 1 that the format uses.

#include "keyseal/crypto/kdf.h"
#include "keyseal/core/errors.h"
#include "keyseal/util/logging.h"

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <climits>
#include <cstring>
#include <limits>
#include <new>

namespace keyseal {

namespace {

// ============================================================================
// Salsa20/8 and BlockMix
// ============================================================================

inline uint32_t ROTL32(uint32_t x, int n) {
    return (x << n) | (x >> (32 - n));
}

inline uint32_t ReadLE32(const Byte* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

inline void WriteLE32(Byte* p, uint32_t v) {
    p[0] = static_cast<Byte>(v);
    p[1] = static_cast<Byte>(v >> 8);
    p[2] = static_cast<Byte>(v >> 16);
    p[3] = static_cast<Byte>(v >> 24);
}

/// Salsa20/8 core, in place on 16 words
void Salsa20_8(uint32_t b[16]) {
    uint32_t x[16];
    std::memcpy(x, b, sizeof(x));

    for (int i = 0; i < 8; i += 2) {
        // Columns
        x[ 4] ^= ROTL32(x[ 0] + x[12],  7);  x[ 8] ^= ROTL32(x[ 4] + x[ 0],  9);
        x[12] ^= ROTL32(x[ 8] + x[ 4], 13);  x[ 0] ^= ROTL32(x[12] + x[ 8], 18);
        x[ 9] ^= ROTL32(x[ 5] + x[ 1],  7);  x[13] ^= ROTL32(x[ 9] + x[ 5],  9);
        x[ 1] ^= ROTL32(x[13] + x[ 9], 13);  x[ 5] ^= ROTL32(x[ 1] + x[13], 18);
        x[14] ^= ROTL32(x[10] + x[ 6],  7);  x[ 2] ^= ROTL32(x[14] + x[10],  9);
        x[ 6] ^= ROTL32(x[ 2] + x[14], 13);  x[10] ^= ROTL32(x[ 6] + x[ 2], 18);
        x[ 3] ^= ROTL32(x[15] + x[11],  7);  x[ 7] ^= ROTL32(x[ 3] + x[15],  9);
        x[11] ^= ROTL32(x[ 7] + x[ 3], 13);  x[15] ^= ROTL32(x[11] + x[ 7], 18);

        // Rows
        x[ 1] ^= ROTL32(x[ 0] + x[ 3],  7);  x[ 2] ^= ROTL32(x[ 1] + x[ 0],  9);
        x[ 3] ^= ROTL32(x[ 2] + x[ 1], 13);  x[ 0] ^= ROTL32(x[ 3] + x[ 2], 18);
        x[ 6] ^= ROTL32(x[ 5] + x[ 4],  7);  x[ 7] ^= ROTL32(x[ 6] + x[ 5],  9);
        x[ 4] ^= ROTL32(x[ 7] + x[ 6], 13);  x[ 5] ^= ROTL32(x[ 4] + x[ 7], 18);
        x[11] ^= ROTL32(x[10] + x[ 9],  7);  x[ 8] ^= ROTL32(x[11] + x[10],  9);
        x[ 9] ^= ROTL32(x[ 8] + x[11], 13);  x[10] ^= ROTL32(x[ 9] + x[ 8], 18);
        x[12] ^= ROTL32(x[15] + x[14],  7);  x[13] ^= ROTL32(x[12] + x[15],  9);
        x[14] ^= ROTL32(x[13] + x[12], 13);  x[15] ^= ROTL32(x[14] + x[13], 18);
    }

    for (int i = 0; i < 16; ++i) {
        b[i] += x[i];
    }
}

/// scryptBlockMix over 2r 64-byte blocks (as 32r words); y is scratch
void BlockMix(uint32_t* b, uint32_t* y, uint32_t r) {
    uint32_t x[16];
    std::memcpy(x, &b[(2 * r - 1) * 16], sizeof(x));

    for (uint32_t i = 0; i < 2 * r; ++i) {
        for (int k = 0; k < 16; ++k) {
            x[k] ^= b[i * 16 + k];
        }
        Salsa20_8(x);
        // Even outputs fill the first half, odd outputs the second
        uint32_t dst = (i / 2 + (i % 2) * r) * 16;
        std::memcpy(&y[dst], x, sizeof(x));
    }

    std::memcpy(b, y, 32 * r * sizeof(uint32_t));
}

/// scryptROMix on one 128r-byte block, in place
void ROMix(Byte* block, uint64_t n, uint32_t r, std::vector<uint32_t>& v) {
    const size_t words = 32 * static_cast<size_t>(r);
    std::vector<uint32_t> x(words);
    std::vector<uint32_t> scratch(words);

    for (size_t k = 0; k < words; ++k) {
        x[k] = ReadLE32(block + 4 * k);
    }

    for (uint64_t i = 0; i < n; ++i) {
        std::memcpy(&v[i * words], x.data(), words * sizeof(uint32_t));
        BlockMix(x.data(), scratch.data(), r);
    }

    const size_t last = (2 * static_cast<size_t>(r) - 1) * 16;
    for (uint64_t i = 0; i < n; ++i) {
        // Integerify; n is a power of two so masking is mod n
        uint64_t j = (static_cast<uint64_t>(x[last]) |
                      (static_cast<uint64_t>(x[last + 1]) << 32)) & (n - 1);
        const uint32_t* vj = &v[j * words];
        for (size_t k = 0; k < words; ++k) {
            x[k] ^= vj[k];
        }
        BlockMix(x.data(), scratch.data(), r);
    }

    for (size_t k = 0; k < words; ++k) {
        WriteLE32(block + 4 * k, x[k]);
    }

    OPENSSL_cleanse(x.data(), words * sizeof(uint32_t));
    OPENSSL_cleanse(scratch.data(), words * sizeof(uint32_t));
}

void CheckOutputLength(size_t dkLen) {
    if (dkLen == 0 || dkLen > kdf::MAX_DKLEN) {
        throw KdfError("derived key length must be between 1 and " +
                       std::to_string(kdf::MAX_DKLEN));
    }
}

} // anonymous namespace

// ============================================================================
// PBKDF2
// ============================================================================

namespace {

void Pbkdf2Into(const std::string& password, ByteSpan salt, uint32_t iterations,
                Byte* out, size_t outLen) {
    if (password.size() > static_cast<size_t>(INT_MAX) ||
        salt.size() > static_cast<size_t>(INT_MAX) ||
        outLen > static_cast<size_t>(INT_MAX)) {
        throw KdfError("PBKDF2 input too large");
    }

    // OpenSSL rejects a null salt pointer even when its length is zero
    static const Byte EMPTY = 0;
    const Byte* saltPtr = salt.empty() ? &EMPTY : salt.data();

    if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                          saltPtr, static_cast<int>(salt.size()),
                          static_cast<int>(iterations),
                          EVP_sha256(),
                          static_cast<int>(outLen), out) != 1) {
        throw KdfError("PBKDF2-HMAC-SHA256 failed");
    }
}

} // anonymous namespace

std::vector<Byte> PBKDF2_HMAC_SHA256(const std::string& password,
                                     ByteSpan salt,
                                     uint32_t iterations,
                                     size_t dkLen) {
    if (iterations < 1 || iterations > static_cast<uint32_t>(INT_MAX)) {
        throw KdfError("PBKDF2 iteration count out of range");
    }
    CheckOutputLength(dkLen);

    std::vector<Byte> out(dkLen);
    Pbkdf2Into(password, salt, iterations, out.data(), out.size());
    return out;
}

// ============================================================================
// scrypt
// ============================================================================

uint64_t ScryptMemoryRequired(uint64_t n, uint32_t r, uint32_t p) {
    // V holds n blocks; B holds p blocks. Saturates instead of wrapping.
    constexpr uint64_t MAX = std::numeric_limits<uint64_t>::max();
    const uint64_t blockBytes = 128ULL * r;
    if (n > MAX - p) {
        return MAX;
    }
    const uint64_t blocks = n + p;
    if (blockBytes != 0 && blocks > MAX / blockBytes) {
        return MAX;
    }
    return blockBytes * blocks;
}

std::vector<Byte> Scrypt(const std::string& password,
                         ByteSpan salt,
                         uint64_t n, uint32_t r, uint32_t p,
                         size_t dkLen) {
    if (n < 2 || (n & (n - 1)) != 0) {
        throw KdfError("scrypt N must be a power of two greater than 1");
    }
    if (r == 0 || p == 0) {
        throw KdfError("scrypt r and p must be positive");
    }
    if (static_cast<uint64_t>(r) * p >= (1ULL << 30)) {
        throw KdfError("scrypt r * p too large");
    }
    CheckOutputLength(dkLen);

    const size_t blockBytes = 128 * static_cast<size_t>(r);
    const uint64_t maxBlocks = std::numeric_limits<size_t>::max() / blockBytes / 2;
    if (n > maxBlocks || n > (1ULL << 32)) {
        throw KdfError("scrypt N too large");
    }

    const uint64_t required = ScryptMemoryRequired(n, r, p);
    if (required > kdf::MAX_SCRYPT_MEMORY) {
        throw KdfError("scrypt parameters need " + std::to_string(required) +
                       " bytes, limit is " + std::to_string(kdf::MAX_SCRYPT_MEMORY));
    }

    LOG_TRACE(util::LogCategory::KDF) << "scrypt needs " << (required >> 20) << " MiB";

    std::vector<Byte> b(blockBytes * p);
    Pbkdf2Into(password, salt, 1, b.data(), b.size());

    std::vector<uint32_t> v;
    try {
        v.resize(static_cast<size_t>(n) * (blockBytes / 4));
    } catch (const std::bad_alloc&) {
        OPENSSL_cleanse(b.data(), b.size());
        throw KdfError("scrypt could not allocate " + std::to_string(required) + " bytes");
    }

    for (uint32_t i = 0; i < p; ++i) {
        ROMix(b.data() + i * blockBytes, n, r, v);
    }
    OPENSSL_cleanse(v.data(), v.size() * sizeof(uint32_t));

    // Final pass uses the password as key and the mixed blocks as salt
    std::vector<Byte> out(dkLen);
    Pbkdf2Into(password, ByteSpan(b), 1, out.data(), out.size());
    OPENSSL_cleanse(b.data(), b.size());
    return out;
}

} // namespace keyseal
