// KEYSEAL - Keystore Records Implementation
// Copyright (c) 2024 KEYSEAL Developers
// MIT License

#include "keyseal/keystore/keystore.h"
#include "keyseal/core/errors.h"
#include "keyseal/core/hex.h"
#include "keyseal/core/random.h"
#include "keyseal/core/secure.h"
#include "keyseal/crypto/aes.h"
#include "keyseal/keystore/integrity.h"
#include "keyseal/util/fs.h"
#include "keyseal/util/logging.h"

#include <cstdint>
#include <limits>

namespace keyseal {
namespace keystore {

using util::JSONValue;

// ============================================================================
// Encryption / Decryption
// ============================================================================

Keystore Encrypt(ByteSpan privateKey, const DerivedKey& key,
                 const std::optional<std::string>& id) {
    SplitKeys keys = SplitDerivedKey(key.Material());

    Keystore ks;
    ks.crypto.ciphertext = AES128CTREncrypt(keys.CipherKey(), ByteSpan(key.Iv()), privateKey);
    ks.crypto.mac = ComputeMac(keys.MacKey(), ByteSpan(ks.crypto.ciphertext));
    ks.crypto.cipherparams.iv = key.Iv();
    ks.crypto.kdfparams = key.Params();
    ks.id = id ? *id : GenerateUUIDv4();
    ks.version = KEYSTORE_VERSION;

    LOG_DEBUG(util::LogCategory::KEYSTORE) << "Encrypted " << privateKey.size()
        << "-byte key into record " << ks.id << " (" << KdfTypeToString(ks.crypto.Kdf()) << ")";
    return ks;
}

Bytes Decrypt(const Keystore& keystore, const DerivedKey& key) {
    SplitKeys keys = SplitDerivedKey(key.Material());

    const CryptoSection& crypto = keystore.crypto;
    if (!VerifyMac(keys.MacKey(), ByteSpan(crypto.ciphertext),
                   ByteSpan(crypto.mac.data(), crypto.mac.size()))) {
        LOG_WARN(util::LogCategory::KEYSTORE) << "Record " << keystore.id
                                              << " failed MAC verification";
        throw CorruptKeystoreError();
    }

    return AES128CTRDecrypt(keys.CipherKey(), ByteSpan(key.Iv()), ByteSpan(crypto.ciphertext));
}

std::string DecryptToHex(const Keystore& keystore, const DerivedKey& key) {
    Bytes plaintext = Decrypt(keystore, key);
    std::string hex = BytesToPrefixedHex(plaintext);
    SecureZero(plaintext.data(), plaintext.size());
    return hex;
}

DecryptResult Decrypt(const Keystore& keystore, const DerivedKey& key, OutputFormat format) {
    if (format == OutputFormat::Hex) {
        return DecryptToHex(keystore, key);
    }
    return Decrypt(keystore, key);
}

// ============================================================================
// Re-deriving a Record's Key
// ============================================================================

DerivedKey DeriveKeyForKeystore(const Keystore& keystore, const std::string& password) {
    LOG_DEBUG(util::LogCategory::KEYSTORE) << "Deriving key for record " << keystore.id;
    return DeriveKey(keystore.crypto.kdfparams, password, keystore.crypto.cipherparams.iv);
}

std::future<DerivedKey> DeriveKeyForKeystoreAsync(Keystore keystore, std::string password,
                                                  util::ThreadPool& pool) {
    return util::AsyncOn(pool, [keystore = std::move(keystore),
                                password = std::move(password)]() {
        return DeriveKeyForKeystore(keystore, password);
    });
}

// ============================================================================
// JSON Encoding
// ============================================================================

JSONValue KeystoreToJSON(const Keystore& keystore) {
    const CryptoSection& crypto = keystore.crypto;

    JSONValue::Object kdfparams;
    if (const auto* pbkdf2 = std::get_if<Pbkdf2Params>(&crypto.kdfparams)) {
        kdfparams["c"] = JSONValue(pbkdf2->c);
        kdfparams["dklen"] = JSONValue(pbkdf2->dklen);
        kdfparams["prf"] = JSONValue(pbkdf2->prf);
        kdfparams["salt"] = JSONValue(BytesToHex(pbkdf2->salt));
    } else {
        const auto& scrypt = std::get<ScryptParams>(crypto.kdfparams);
        kdfparams["dklen"] = JSONValue(scrypt.dklen);
        kdfparams["n"] = JSONValue(scrypt.n);
        kdfparams["p"] = JSONValue(scrypt.p);
        kdfparams["r"] = JSONValue(scrypt.r);
        kdfparams["salt"] = JSONValue(BytesToHex(scrypt.salt));
    }

    JSONValue::Object cipherparams;
    cipherparams["iv"] = JSONValue(BytesToHex(crypto.cipherparams.iv));

    JSONValue::Object cryptoObj;
    cryptoObj["cipher"] = JSONValue(crypto.cipher);
    cryptoObj["ciphertext"] = JSONValue(BytesToHex(crypto.ciphertext));
    cryptoObj["cipherparams"] = JSONValue(std::move(cipherparams));
    cryptoObj["kdf"] = JSONValue(KdfTypeToString(crypto.Kdf()));
    cryptoObj["kdfparams"] = JSONValue(std::move(kdfparams));
    cryptoObj["mac"] = JSONValue(crypto.mac.ToHex());

    JSONValue::Object root;
    root["crypto"] = JSONValue(std::move(cryptoObj));
    root["id"] = JSONValue(keystore.id);
    root["version"] = JSONValue(keystore.version);
    return JSONValue(std::move(root));
}

namespace {

std::string FieldPath(const std::string& parent, const std::string& name) {
    return parent.empty() ? name : parent + "." + name;
}

const JSONValue& RequireField(const JSONValue& obj, const std::string& parent,
                              const std::string& name, JSONValue::Type type) {
    if (!obj.HasKey(name)) {
        throw MalformedRecordError("missing field " + FieldPath(parent, name));
    }
    const JSONValue& value = obj[name];
    if (value.GetType() != type) {
        throw MalformedRecordError(FieldPath(parent, name) + " must be " +
                                   JSONTypeName(type) + ", got " +
                                   JSONTypeName(value.GetType()));
    }
    return value;
}

const std::string& RequireString(const JSONValue& obj, const std::string& parent,
                                 const std::string& name) {
    return RequireField(obj, parent, name, JSONValue::Type::String).GetString();
}

Bytes RequireHex(const JSONValue& obj, const std::string& parent, const std::string& name,
                 std::optional<size_t> expectedSize = std::nullopt) {
    const std::string& text = RequireString(obj, parent, name);
    // KeystoreToJSON writes bare lowercase hex. A 0x prefix or uppercase
    // digits, as some other wallets write, are still read.
    if (!IsValidHex(text)) {
        throw MalformedRecordError(FieldPath(parent, name) + " is not valid hex");
    }
    Bytes bytes = HexToBytes(text);
    if (expectedSize && bytes.size() != *expectedSize) {
        throw MalformedRecordError(FieldPath(parent, name) + " must be " +
                                   std::to_string(*expectedSize) + " bytes, got " +
                                   std::to_string(bytes.size()));
    }
    return bytes;
}

uint64_t RequirePositive(const JSONValue& obj, const std::string& parent,
                         const std::string& name, uint64_t maxValue) {
    int64_t value = RequireField(obj, parent, name, JSONValue::Type::Int).GetInt();
    if (value <= 0 || static_cast<uint64_t>(value) > maxValue) {
        throw MalformedRecordError(FieldPath(parent, name) + " out of range: " +
                                   std::to_string(value));
    }
    return static_cast<uint64_t>(value);
}

void RequireDkLen(const JSONValue& obj, const std::string& parent) {
    uint64_t dklen = RequirePositive(obj, parent, "dklen",
                                     std::numeric_limits<uint32_t>::max());
    if (dklen != DERIVED_KEY_SIZE) {
        throw MalformedRecordError(FieldPath(parent, "dklen") + " must be " +
                                   std::to_string(DERIVED_KEY_SIZE));
    }
}

KdfParams ParseKdfParams(KdfType kdf, const JSONValue& obj) {
    const std::string parent = "crypto.kdfparams";
    const uint64_t maxU32 = std::numeric_limits<uint32_t>::max();

    RequireDkLen(obj, parent);

    if (kdf == KdfType::Pbkdf2) {
        Pbkdf2Params params;
        params.c = static_cast<uint32_t>(RequirePositive(obj, parent, "c", maxU32));
        params.prf = RequireString(obj, parent, "prf");
        if (params.prf != PBKDF2_PRF) {
            throw MalformedRecordError("unsupported prf: " + params.prf);
        }
        params.salt = RequireHex(obj, parent, "salt");
        return params;
    }

    ScryptParams params;
    params.n = RequirePositive(obj, parent, "n",
                               static_cast<uint64_t>(std::numeric_limits<int64_t>::max()));
    if (params.n < 2 || (params.n & (params.n - 1)) != 0) {
        throw MalformedRecordError(parent + ".n must be a power of two greater than 1");
    }
    params.r = static_cast<uint32_t>(RequirePositive(obj, parent, "r", maxU32));
    params.p = static_cast<uint32_t>(RequirePositive(obj, parent, "p", maxU32));
    params.salt = RequireHex(obj, parent, "salt");
    return params;
}

} // anonymous namespace

Keystore KeystoreFromJSON(const JSONValue& json) {
    if (!json.IsObject()) {
        throw MalformedRecordError(std::string("record must be object, got ") +
                                   JSONTypeName(json.GetType()));
    }

    // Some writers capitalise the section name
    const char* cryptoKey = (!json.HasKey("crypto") && json.HasKey("Crypto")) ? "Crypto" : "crypto";
    const JSONValue& cryptoObj = RequireField(json, "", cryptoKey, JSONValue::Type::Object);

    Keystore ks;

    const JSONValue& versionValue = RequireField(json, "", "version", JSONValue::Type::Int);
    if (versionValue.GetInt() != KEYSTORE_VERSION) {
        throw MalformedRecordError("unsupported version " +
                                   std::to_string(versionValue.GetInt()));
    }
    ks.version = KEYSTORE_VERSION;
    ks.id = RequireString(json, "", "id");

    CryptoSection& crypto = ks.crypto;
    crypto.cipher = RequireString(cryptoObj, "crypto", "cipher");
    if (crypto.cipher != CIPHER_NAME) {
        throw MalformedRecordError("unsupported cipher: " + crypto.cipher);
    }

    crypto.ciphertext = RequireHex(cryptoObj, "crypto", "ciphertext");

    const JSONValue& cipherparams =
        RequireField(cryptoObj, "crypto", "cipherparams", JSONValue::Type::Object);
    Bytes iv = RequireHex(cipherparams, "crypto.cipherparams", "iv", IV_SIZE);
    crypto.cipherparams.iv = MakeIV(ByteSpan(iv));

    const std::string& kdfName = RequireString(cryptoObj, "crypto", "kdf");
    auto kdf = KdfTypeFromString(kdfName);
    if (!kdf) {
        throw MalformedRecordError("unsupported kdf: " + kdfName);
    }
    crypto.kdfparams = ParseKdfParams(
        *kdf, RequireField(cryptoObj, "crypto", "kdfparams", JSONValue::Type::Object));

    Bytes mac = RequireHex(cryptoObj, "crypto", "mac", MAC_SIZE);
    crypto.mac = Hash256(mac.data(), mac.size());

    return ks;
}

std::string SerializeKeystore(const Keystore& keystore, bool pretty) {
    return KeystoreToJSON(keystore).ToJSON(pretty);
}

Keystore ParseKeystore(const std::string& json) {
    std::optional<JSONValue> value;
    try {
        value = JSONValue::Parse(json);
    } catch (const util::JSONError& e) {
        throw MalformedRecordError(std::string("invalid JSON: ") + e.what());
    }
    return KeystoreFromJSON(*value);
}

// ============================================================================
// Files
// ============================================================================

Keystore LoadKeystoreFile(const std::string& path) {
    auto content = util::fs::ReadFile(path);
    if (!content) {
        throw KeystoreError("cannot read keystore file: " + path);
    }

    Keystore ks = ParseKeystore(*content);
    LOG_DEBUG(util::LogCategory::KEYSTORE) << "Loaded record " << ks.id << " from " << path;
    return ks;
}

void SaveKeystoreFile(const std::string& path, const Keystore& keystore, bool overwrite) {
    if (!overwrite && util::fs::Exists(path)) {
        throw KeystoreError("keystore file already exists: " + path);
    }

    std::string content = SerializeKeystore(keystore, true) + "\n";
    if (!util::fs::SecureWriteFile(path, content, overwrite)) {
        throw KeystoreError("cannot write keystore file: " + path);
    }
    LOG_INFO(util::LogCategory::KEYSTORE) << "Wrote record " << keystore.id << " to " << path;
}

} // namespace keystore
} // namespace keyseal
