// KEYSEAL - Password-Derived Keys
// Copyright (c) 2024 KEYSEAL Developers
// MIT License
//
// Turns a password into the 32-byte secret that protects a keystore
// record, using PBKDF2-HMAC-SHA256 or scrypt. Each DerivedKey carries the
// parameters it was made with, so a record can later be opened with the
// same password.

#ifndef KEYSEAL_KEYSTORE_DERIVEDKEY_H
#define KEYSEAL_KEYSTORE_DERIVEDKEY_H

#include "keyseal/core/secure.h"
#include "keyseal/core/types.h"
#include "keyseal/util/threadpool.h"

#include <array>
#include <cstdint>
#include <future>
#include <optional>
#include <ostream>
#include <string>
#include <variant>

namespace keyseal {
namespace keystore {

// ============================================================================
// Constants
// ============================================================================

/// Size of the derived secret (cipher key + MAC key)
constexpr size_t DERIVED_KEY_SIZE = 32;

/// AES-128-CTR initial counter size
constexpr size_t IV_SIZE = 16;

/// Salt size used when the caller supplies none
constexpr size_t DEFAULT_SALT_SIZE = 32;

/// Default PBKDF2 iteration count
constexpr uint32_t DEFAULT_PBKDF2_ITERATIONS = 262144;

/// Default scrypt cost
constexpr uint64_t DEFAULT_SCRYPT_N = 262144;

/// scrypt block size and parallelism written by this library
constexpr uint32_t SCRYPT_R = 1;
constexpr uint32_t SCRYPT_P = 8;

/// The only PBKDF2 PRF the format defines
constexpr const char* PBKDF2_PRF = "hmac-sha256";

// ============================================================================
// KDF Parameters
// ============================================================================

enum class KdfType {
    Pbkdf2,
    Scrypt
};

/// "pbkdf2" or "scrypt"
const char* KdfTypeToString(KdfType type);

/// Inverse of KdfTypeToString; nullopt for unknown names
std::optional<KdfType> KdfTypeFromString(const std::string& name);

struct Pbkdf2Params {
    uint32_t c{DEFAULT_PBKDF2_ITERATIONS};
    uint32_t dklen{static_cast<uint32_t>(DERIVED_KEY_SIZE)};
    std::string prf{PBKDF2_PRF};
    Bytes salt;

    bool operator==(const Pbkdf2Params& other) const {
        return c == other.c && dklen == other.dklen &&
               prf == other.prf && salt == other.salt;
    }
    bool operator!=(const Pbkdf2Params& other) const { return !(*this == other); }
};

struct ScryptParams {
    uint64_t n{DEFAULT_SCRYPT_N};
    uint32_t r{SCRYPT_R};
    uint32_t p{SCRYPT_P};
    uint32_t dklen{static_cast<uint32_t>(DERIVED_KEY_SIZE)};
    Bytes salt;

    bool operator==(const ScryptParams& other) const {
        return n == other.n && r == other.r && p == other.p &&
               dklen == other.dklen && salt == other.salt;
    }
    bool operator!=(const ScryptParams& other) const { return !(*this == other); }
};

using KdfParams = std::variant<Pbkdf2Params, ScryptParams>;

/// Which KDF a parameter set belongs to
KdfType GetKdfType(const KdfParams& params);

/// Salt recorded in a parameter set
const Bytes& GetSalt(const KdfParams& params);

using IV = std::array<Byte, IV_SIZE>;

/// Copy a 16-byte IV out of arbitrary bytes
/// @throws InputLengthError if iv is not 16 bytes
IV MakeIV(ByteSpan iv);

// ============================================================================
// Derived Key
// ============================================================================

/**
 * A password-derived secret together with the KDF parameters and IV that
 * belong with it.
 *
 * Immutable once created and move-only. The secret lives in a SecureArray
 * and never appears in ToString() or stream output.
 */
class DerivedKey {
public:
    /**
     * Wrap existing material.
     * @throws InputLengthError if material is not 32 bytes
     */
    DerivedKey(KdfParams params, const IV& iv, ByteSpan material);

    DerivedKey(DerivedKey&&) = default;
    DerivedKey& operator=(DerivedKey&&) = default;
    DerivedKey(const DerivedKey&) = delete;
    DerivedKey& operator=(const DerivedKey&) = delete;

    KdfType Kdf() const { return GetKdfType(params_); }
    const KdfParams& Params() const { return params_; }
    const IV& Iv() const { return iv_; }

    /// The 32-byte secret
    ByteSpan Material() const { return ByteSpan(material_.data(), material_.size()); }

    /// Parameters and IV only
    std::string ToString() const;

private:
    KdfParams params_;
    IV iv_;
    SecureArray<Byte, DERIVED_KEY_SIZE> material_;
};

std::ostream& operator<<(std::ostream& os, const DerivedKey& key);

// ============================================================================
// Derivation
// ============================================================================

struct Pbkdf2Options {
    std::string password;
    std::optional<Bytes> salt;      // 32 random bytes if absent
    uint32_t iterations{DEFAULT_PBKDF2_ITERATIONS};
    std::optional<Bytes> iv;        // 16 random bytes if absent
};

struct ScryptOptions {
    std::string password;
    std::optional<Bytes> salt;      // 32 random bytes if absent
    uint64_t n{DEFAULT_SCRYPT_N};
    std::optional<Bytes> iv;        // 16 random bytes if absent
};

/**
 * Derive a key from fully specified parameters. Every other derivation
 * function ends up here.
 *
 * @throws InputLengthError if dklen is not 32
 * @throws KdfError on an unsupported PRF or invalid cost parameters
 */
DerivedKey DeriveKey(const KdfParams& params, const std::string& password, const IV& iv);

/// PBKDF2-HMAC-SHA256 derivation
/// @throws InputLengthError if a supplied iv is not 16 bytes
DerivedKey DeriveKeyPbkdf2(const Pbkdf2Options& options);

/// scrypt derivation with r = 1, p = 8
/// @throws InputLengthError if a supplied iv is not 16 bytes
DerivedKey DeriveKeyScrypt(const ScryptOptions& options);

/// DeriveKeyPbkdf2 on a worker thread; errors surface from future::get()
std::future<DerivedKey> DeriveKeyPbkdf2Async(Pbkdf2Options options,
                                             util::ThreadPool& pool = util::GetGlobalThreadPool());

/// DeriveKeyScrypt on a worker thread; errors surface from future::get()
std::future<DerivedKey> DeriveKeyScryptAsync(ScryptOptions options,
                                             util::ThreadPool& pool = util::GetGlobalThreadPool());

} // namespace keystore
} // namespace keyseal

#endif // KEYSEAL_KEYSTORE_DERIVEDKEY_H
