// KEYSEAL - Keystore Records
// Copyright (c) 2024 KEYSEAL Developers
// MIT License
//
// Web3 Secret Storage (version 3) records:
// - Encrypt a private key under a DerivedKey (AES-128-CTR + Keccak-256 MAC)
// - Decrypt after verifying the MAC
// - JSON encoding with strict validation on the way in
// - Record files on disk

#ifndef KEYSEAL_KEYSTORE_KEYSTORE_H
#define KEYSEAL_KEYSTORE_KEYSTORE_H

#include "keyseal/core/types.h"
#include "keyseal/keystore/derivedkey.h"
#include "keyseal/util/json.h"
#include "keyseal/util/threadpool.h"

#include <future>
#include <optional>
#include <string>
#include <variant>

namespace keyseal {
namespace keystore {

// ============================================================================
// Constants
// ============================================================================

/// Record format version
constexpr int KEYSTORE_VERSION = 3;

/// The only cipher the format defines
constexpr const char* CIPHER_NAME = "aes-128-ctr";

/// MAC size (Keccak-256)
constexpr size_t MAC_SIZE = 32;

// ============================================================================
// Record Structures
// ============================================================================

struct CipherParams {
    IV iv{};

    bool operator==(const CipherParams& other) const { return iv == other.iv; }
};

/// The "crypto" section of a record
struct CryptoSection {
    std::string cipher{CIPHER_NAME};
    Bytes ciphertext;
    CipherParams cipherparams;
    KdfParams kdfparams;        // The alternative held is the record's "kdf"
    Hash256 mac;

    KdfType Kdf() const { return GetKdfType(kdfparams); }

    bool operator==(const CryptoSection& other) const {
        return cipher == other.cipher && ciphertext == other.ciphertext &&
               cipherparams == other.cipherparams &&
               kdfparams == other.kdfparams && mac == other.mac;
    }
};

/// An encrypted private key record
struct Keystore {
    CryptoSection crypto;
    std::string id;
    int version{KEYSTORE_VERSION};

    bool operator==(const Keystore& other) const {
        return crypto == other.crypto && id == other.id && version == other.version;
    }
    bool operator!=(const Keystore& other) const { return !(*this == other); }
};

// ============================================================================
// Encryption / Decryption
// ============================================================================

/**
 * Encrypt a private key.
 *
 * The record copies the key's KDF parameters and IV. The MAC is
 * Keccak-256(macKey || ciphertext).
 *
 * @param privateKey Secret to protect (any length, usually 32 bytes)
 * @param key Derived key; its IV becomes the record's IV
 * @param id Record id; a random UUIDv4 if absent
 */
Keystore Encrypt(ByteSpan privateKey, const DerivedKey& key,
                 const std::optional<std::string>& id = std::nullopt);

/**
 * Decrypt a record.
 *
 * The MAC is checked first; nothing is decrypted if it does not match.
 * Decryption uses the IV held by the key, which equals the record's IV
 * when the key came from DeriveKeyForKeystore.
 *
 * @throws CorruptKeystoreError on MAC mismatch (wrong password or tampering)
 */
Bytes Decrypt(const Keystore& keystore, const DerivedKey& key);

/// Decrypt and return "0x"-prefixed lowercase hex
std::string DecryptToHex(const Keystore& keystore, const DerivedKey& key);

enum class OutputFormat {
    Bytes,
    Hex
};

/// Raw bytes or "0x" hex, depending on format
using DecryptResult = std::variant<Bytes, std::string>;

DecryptResult Decrypt(const Keystore& keystore, const DerivedKey& key, OutputFormat format);

// ============================================================================
// Re-deriving a Record's Key
// ============================================================================

/**
 * Derive the key for an existing record from its own kdf, kdfparams and iv.
 * @throws KdfError or InputLengthError if the record's parameters are unusable
 */
DerivedKey DeriveKeyForKeystore(const Keystore& keystore, const std::string& password);

/// DeriveKeyForKeystore on a worker thread
std::future<DerivedKey> DeriveKeyForKeystoreAsync(Keystore keystore, std::string password,
                                                  util::ThreadPool& pool = util::GetGlobalThreadPool());

// ============================================================================
// JSON Encoding
// ============================================================================

/// Field-exact record object (hex without 0x)
util::JSONValue KeystoreToJSON(const Keystore& keystore);

/**
 * Validate and decode a record object.
 * @throws MalformedRecordError naming the first offending field
 */
Keystore KeystoreFromJSON(const util::JSONValue& json);

/// KeystoreToJSON as text
std::string SerializeKeystore(const Keystore& keystore, bool pretty = false);

/**
 * Parse record text.
 * @throws MalformedRecordError on invalid JSON or an invalid record
 */
Keystore ParseKeystore(const std::string& json);

// ============================================================================
// Files
// ============================================================================

/**
 * Load a record file.
 * @throws KeystoreError if the file cannot be read
 * @throws MalformedRecordError if its content is not a valid record
 */
Keystore LoadKeystoreFile(const std::string& path);

/**
 * Write a record file with owner-only permissions.
 * @throws KeystoreError if the file exists (and overwrite is false) or
 *         cannot be written
 */
void SaveKeystoreFile(const std::string& path, const Keystore& keystore,
                      bool overwrite = false);

} // namespace keystore
} // namespace keyseal

#endif // KEYSEAL_KEYSTORE_KEYSTORE_H
