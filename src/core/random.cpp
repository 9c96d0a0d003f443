// KEYSEAL - Secure Random Number Generation Implementation
// Copyright (c) 2024 KEYSEAL Developers
// MIT License

#include "keyseal/core/random.h"
#include "keyseal/core/hex.h"

#include <openssl/crypto.h>

#include <cstring>
#include <stdexcept>

// Platform-specific includes
#if defined(__linux__)
    #include <sys/random.h>
    #include <cerrno>
#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__)
    #include <stdlib.h>  // arc4random_buf
#else
    #include <fstream>
#endif

namespace keyseal {

namespace detail {

bool GetOSEntropy(uint8_t* buf, size_t len) {
    if (len == 0) return true;

#if defined(__linux__)
    // getrandom() may return short reads for large requests or on EINTR
    size_t done = 0;
    while (done < len) {
        ssize_t ret = getrandom(buf + done, len - done, 0);
        if (ret < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        done += static_cast<size_t>(ret);
    }
    return true;

#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__)
    // macOS/BSD: use arc4random_buf (always succeeds)
    arc4random_buf(buf, len);
    return true;

#else
    // Fallback: read from /dev/urandom
    std::ifstream urandom("/dev/urandom", std::ios::binary);
    if (!urandom) return false;
    urandom.read(reinterpret_cast<char*>(buf), len);
    return urandom.good();
#endif
}

} // namespace detail

// ============================================================================
// Core Random Functions
// ============================================================================

void GetRandBytes(uint8_t* buf, size_t len) {
    if (!detail::GetOSEntropy(buf, len)) {
        throw std::runtime_error("Failed to get random bytes from OS");
    }
}

Bytes GetRandBytes(size_t len) {
    Bytes result(len);
    GetRandBytes(result.data(), result.size());
    return result;
}

uint32_t GetRandUint32() {
    uint32_t result;
    GetRandBytes(reinterpret_cast<uint8_t*>(&result), sizeof(result));
    return result;
}

// ============================================================================
// Identifiers
// ============================================================================

std::string GenerateUUIDv4() {
    Byte raw[16];
    GetRandBytes(raw, sizeof(raw));

    raw[6] = static_cast<Byte>((raw[6] & 0x0F) | 0x40);  // version 4
    raw[8] = static_cast<Byte>((raw[8] & 0x3F) | 0x80);  // RFC 4122 variant

    std::string hex = BytesToHex(raw, sizeof(raw));
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) +
           "-" + hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

// ============================================================================
// Comparison
// ============================================================================

bool ConstantTimeEqual(const Byte* a, size_t aLen, const Byte* b, size_t bLen) {
    if (aLen != bLen) {
        return false;
    }
    if (aLen == 0) {
        return true;
    }
    return CRYPTO_memcmp(a, b, aLen) == 0;
}

} // namespace keyseal
