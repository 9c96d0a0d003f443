// KEYSEAL - Secure Random Number Generation Header
// Copyright (c) 2024 KEYSEAL Developers
// MIT License
//
// This file provides cryptographically secure random number generation
// using OS entropy sources. Salts, IVs and keystore ids all come from here.

#ifndef KEYSEAL_CORE_RANDOM_H
#define KEYSEAL_CORE_RANDOM_H

#include "keyseal/core/types.h"
#include <cstdint>
#include <cstddef>
#include <string>

namespace keyseal {

// ============================================================================
// Core Random Functions
// ============================================================================

/// Fill buffer with cryptographically secure random bytes
/// Uses OS entropy source (getrandom on Linux, arc4random on macOS/BSD)
/// @throws std::runtime_error if the OS source fails
void GetRandBytes(uint8_t* buf, size_t len);

/// Fill buffer with random bytes (Span version)
inline void GetRandBytes(Span<uint8_t> buf) {
    GetRandBytes(buf.data(), buf.size());
}

/// Return len fresh random bytes
Bytes GetRandBytes(size_t len);

/// Generate random 32-bit unsigned integer
uint32_t GetRandUint32();

// ============================================================================
// Identifiers
// ============================================================================

/// RFC 4122 version 4 UUID, lowercase 8-4-4-4-12 form
std::string GenerateUUIDv4();

// ============================================================================
// Comparison
// ============================================================================

/// Compare two byte strings without data-dependent timing.
/// Lengths are not secret; only the contents are compared in constant time.
bool ConstantTimeEqual(const Byte* a, size_t aLen, const Byte* b, size_t bLen);

inline bool ConstantTimeEqual(ByteSpan a, ByteSpan b) {
    return ConstantTimeEqual(a.data(), a.size(), b.data(), b.size());
}

// ============================================================================
// Internal Entropy Functions (Platform-Specific)
// ============================================================================

namespace detail {

/// Get entropy from OS - implementation is platform-specific
/// Returns true on success, false on failure
bool GetOSEntropy(uint8_t* buf, size_t len);

} // namespace detail

} // namespace keyseal

#endif // KEYSEAL_CORE_RANDOM_H
