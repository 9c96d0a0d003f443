// KEYSEAL - Keccak-256 Implementation
// Copyright (c) 2024 KEYSEAL Developers
// MIT License
//
// Keccak-f[1600] sponge, rate 1088 bits, capacity 512 bits.
// Reference: The Keccak reference, version 3.0 (Bertoni et al.)

#include "keyseal/crypto/keccak.h"

#include <openssl/crypto.h>

#include <algorithm>
#include <cstring>

namespace keyseal {

// ============================================================================
// Keccak Constants
// ============================================================================

namespace {

constexpr int ROUNDS = 24;

constexpr uint64_t ROUND_CONSTANTS[ROUNDS] = {
    0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808AULL,
    0x8000000080008000ULL, 0x000000000000808BULL, 0x0000000080000001ULL,
    0x8000000080008081ULL, 0x8000000000008009ULL, 0x000000000000008AULL,
    0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000AULL,
    0x000000008000808BULL, 0x800000000000008BULL, 0x8000000000008089ULL,
    0x8000000000008003ULL, 0x8000000000008002ULL, 0x8000000000000080ULL,
    0x000000000000800AULL, 0x800000008000000AULL, 0x8000000080008081ULL,
    0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL
};

/// Rho rotation offsets along the pi orbit starting at lane (1, 0)
constexpr int RHO_OFFSETS[24] = {
     1,  3,  6, 10, 15, 21, 28, 36, 45, 55,  2, 14,
    27, 41, 56,  8, 25, 43, 62, 18, 39, 61, 20, 44
};

/// Lane visited at each step of the pi orbit
constexpr int PI_LANES[24] = {
    10,  7, 11, 17, 18,  3,  5, 16,  8, 21, 24,  4,
    15, 23, 19, 13, 12,  2, 20, 14, 22,  9,  6,  1
};

inline uint64_t ROTL64(uint64_t x, int n) {
    return (x << n) | (x >> (64 - n));
}

inline uint64_t ReadLE64(const Byte* p) {
    uint64_t v = 0;
    for (int i = 7; i >= 0; --i) {
        v = (v << 8) | p[i];
    }
    return v;
}

/// Keccak-f[1600] permutation, lanes indexed x + 5*y
void KeccakF1600(uint64_t st[25]) {
    for (int round = 0; round < ROUNDS; ++round) {
        // Theta
        uint64_t c[5];
        for (int x = 0; x < 5; ++x) {
            c[x] = st[x] ^ st[x + 5] ^ st[x + 10] ^ st[x + 15] ^ st[x + 20];
        }
        for (int x = 0; x < 5; ++x) {
            uint64_t d = c[(x + 4) % 5] ^ ROTL64(c[(x + 1) % 5], 1);
            for (int y = 0; y < 25; y += 5) {
                st[y + x] ^= d;
            }
        }

        // Rho and Pi
        uint64_t carry = st[1];
        for (int i = 0; i < 24; ++i) {
            int lane = PI_LANES[i];
            uint64_t next = st[lane];
            st[lane] = ROTL64(carry, RHO_OFFSETS[i]);
            carry = next;
        }

        // Chi
        for (int y = 0; y < 25; y += 5) {
            uint64_t row[5];
            for (int x = 0; x < 5; ++x) {
                row[x] = st[y + x];
            }
            for (int x = 0; x < 5; ++x) {
                st[y + x] = row[x] ^ ((~row[(x + 1) % 5]) & row[(x + 2) % 5]);
            }
        }

        // Iota
        st[0] ^= ROUND_CONSTANTS[round];
    }
}

} // anonymous namespace

// ============================================================================
// Keccak256 Implementation
// ============================================================================

Keccak256::Keccak256() {
    Reset();
}

Keccak256& Keccak256::Reset() {
    std::memset(state_, 0, sizeof(state_));
    std::memset(buffer_, 0, sizeof(buffer_));
    buffered_ = 0;
    return *this;
}

void Keccak256::AbsorbBlock(const Byte block[RATE]) {
    for (size_t i = 0; i < RATE / 8; ++i) {
        state_[i] ^= ReadLE64(block + i * 8);
    }
    KeccakF1600(state_);
}

Keccak256& Keccak256::Write(const Byte* data, size_t len) {
    if (len == 0) {
        return *this;  // data may be null
    }
    if (buffered_ > 0) {
        size_t take = std::min(len, RATE - buffered_);
        std::memcpy(buffer_ + buffered_, data, take);
        buffered_ += take;
        data += take;
        len -= take;
        if (buffered_ < RATE) {
            return *this;
        }
        AbsorbBlock(buffer_);
        buffered_ = 0;
    }

    while (len >= RATE) {
        AbsorbBlock(data);
        data += RATE;
        len -= RATE;
    }

    if (len > 0) {
        std::memcpy(buffer_, data, len);
        buffered_ = len;
    }
    return *this;
}

void Keccak256::Finalize(Byte hash[OUTPUT_SIZE]) {
    // Multi-rate padding; when only one byte is free both bits land in it
    std::memset(buffer_ + buffered_, 0, RATE - buffered_);
    buffer_[buffered_] ^= 0x01;
    buffer_[RATE - 1] ^= 0x80;
    AbsorbBlock(buffer_);

    for (size_t i = 0; i < OUTPUT_SIZE / 8; ++i) {
        for (size_t j = 0; j < 8; ++j) {
            hash[i * 8 + j] = static_cast<Byte>(state_[i] >> (8 * j));
        }
    }

    // The MAC key passes through this buffer
    OPENSSL_cleanse(buffer_, sizeof(buffer_));
    OPENSSL_cleanse(state_, sizeof(state_));
    buffered_ = 0;
}

// ============================================================================
// Convenience Functions
// ============================================================================

Hash256 Keccak256Hash(const Byte* data, size_t len) {
    Hash256 result;
    Keccak256().Write(data, len).Finalize(result.data());
    return result;
}

} // namespace keyseal
