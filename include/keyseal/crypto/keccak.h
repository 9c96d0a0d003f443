// KEYSEAL - Keccak-256 Hash Function
// Copyright (c) 2024 KEYSEAL Developers
// MIT License
//
// Keccak-256 as used by Web3 Secret Storage MACs: the original Keccak
// submission with multi-rate padding 0x01...0x80, not NIST SHA3-256
// (which pads with 0x06). OpenSSL 3.0 does not expose this variant.

#ifndef KEYSEAL_CRYPTO_KECCAK_H
#define KEYSEAL_CRYPTO_KECCAK_H

#include <cstdint>
#include <cstddef>
#include "keyseal/core/types.h"

namespace keyseal {

/// Keccak-256 hasher class
/// Incremental interface mirroring the other hashers: Write, Finalize, Reset.
class Keccak256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    /// Sponge rate in bytes (1600 - 2*256 bits)
    static constexpr size_t RATE = 136;

    Keccak256();

    /// Absorb data
    /// @return Reference to this hasher (for chaining)
    Keccak256& Write(const Byte* data, size_t len);

    /// Pad, permute and write the digest
    /// @param hash Output buffer (must be at least OUTPUT_SIZE bytes)
    void Finalize(Byte hash[OUTPUT_SIZE]);

    /// Reset hasher to initial state
    Keccak256& Reset();

private:
    uint64_t state_[25];
    Byte buffer_[RATE];
    size_t buffered_;

    void AbsorbBlock(const Byte block[RATE]);
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Compute Keccak-256 of data in a single call
Hash256 Keccak256Hash(const Byte* data, size_t len);

inline Hash256 Keccak256Hash(const std::vector<Byte>& data) {
    return Keccak256Hash(data.data(), data.size());
}

} // namespace keyseal

#endif // KEYSEAL_CRYPTO_KECCAK_H
