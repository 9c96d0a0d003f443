// KEYSEAL - Password-Derived Keys Implementation
// Copyright (c) 2024 KEYSEAL Developers
// MIT License

#include "keyseal/keystore/derivedkey.h"
#include "keyseal/core/errors.h"
#include "keyseal/core/hex.h"
#include "keyseal/core/random.h"
#include "keyseal/crypto/kdf.h"
#include "keyseal/util/logging.h"

#include <algorithm>
#include <sstream>

namespace keyseal {
namespace keystore {

// ============================================================================
// KDF Parameters
// ============================================================================

const char* KdfTypeToString(KdfType type) {
    switch (type) {
        case KdfType::Pbkdf2: return "pbkdf2";
        case KdfType::Scrypt: return "scrypt";
    }
    return "unknown";
}

std::optional<KdfType> KdfTypeFromString(const std::string& name) {
    if (name == "pbkdf2") return KdfType::Pbkdf2;
    if (name == "scrypt") return KdfType::Scrypt;
    return std::nullopt;
}

KdfType GetKdfType(const KdfParams& params) {
    return std::holds_alternative<ScryptParams>(params) ? KdfType::Scrypt : KdfType::Pbkdf2;
}

const Bytes& GetSalt(const KdfParams& params) {
    if (const auto* scrypt = std::get_if<ScryptParams>(&params)) {
        return scrypt->salt;
    }
    return std::get<Pbkdf2Params>(params).salt;
}

IV MakeIV(ByteSpan iv) {
    if (iv.size() != IV_SIZE) {
        throw InputLengthError("iv", IV_SIZE, iv.size());
    }
    IV out;
    std::copy(iv.begin(), iv.end(), out.begin());
    return out;
}

// ============================================================================
// DerivedKey
// ============================================================================

DerivedKey::DerivedKey(KdfParams params, const IV& iv, ByteSpan material)
    : params_(std::move(params))
    , iv_(iv) {
    if (material.size() != DERIVED_KEY_SIZE) {
        throw InputLengthError("derived key", DERIVED_KEY_SIZE, material.size());
    }
    std::copy(material.begin(), material.end(), material_.begin());
}

std::string DerivedKey::ToString() const {
    std::ostringstream oss;
    oss << "DerivedKey(kdf=" << KdfTypeToString(Kdf());

    if (const auto* pbkdf2 = std::get_if<Pbkdf2Params>(&params_)) {
        oss << ", c=" << pbkdf2->c << ", prf=" << pbkdf2->prf
            << ", dklen=" << pbkdf2->dklen;
    } else {
        const auto& scrypt = std::get<ScryptParams>(params_);
        oss << ", n=" << scrypt.n << ", r=" << scrypt.r << ", p=" << scrypt.p
            << ", dklen=" << scrypt.dklen;
    }

    oss << ", salt=" << BytesToHex(GetSalt(params_))
        << ", iv=" << BytesToHex(iv_) << ")";
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const DerivedKey& key) {
    return os << key.ToString();
}

// ============================================================================
// Derivation
// ============================================================================

namespace {

Bytes SaltOrRandom(const std::optional<Bytes>& salt) {
    if (salt) {
        return *salt;
    }
    return GetRandBytes(DEFAULT_SALT_SIZE);
}

IV IVOrRandom(const std::optional<Bytes>& iv) {
    if (iv) {
        return MakeIV(*iv);
    }
    IV out;
    GetRandBytes(out.data(), out.size());
    return out;
}

} // anonymous namespace

DerivedKey DeriveKey(const KdfParams& params, const std::string& password, const IV& iv) {
    std::vector<Byte> material;

    if (const auto* pbkdf2 = std::get_if<Pbkdf2Params>(&params)) {
        if (pbkdf2->dklen != DERIVED_KEY_SIZE) {
            throw InputLengthError("dklen", DERIVED_KEY_SIZE, pbkdf2->dklen);
        }
        if (pbkdf2->prf != PBKDF2_PRF) {
            throw KdfError("unsupported PBKDF2 prf: " + pbkdf2->prf);
        }

        util::ScopedLogTimer timer(util::LogCategory::KDF,
                                   "pbkdf2 c=" + std::to_string(pbkdf2->c));
        material = PBKDF2_HMAC_SHA256(password, ByteSpan(pbkdf2->salt),
                                      pbkdf2->c, DERIVED_KEY_SIZE);
    } else {
        const auto& scrypt = std::get<ScryptParams>(params);
        if (scrypt.dklen != DERIVED_KEY_SIZE) {
            throw InputLengthError("dklen", DERIVED_KEY_SIZE, scrypt.dklen);
        }

        util::ScopedLogTimer timer(util::LogCategory::KDF,
                                   "scrypt n=" + std::to_string(scrypt.n) +
                                   " r=" + std::to_string(scrypt.r) +
                                   " p=" + std::to_string(scrypt.p));
        material = Scrypt(password, ByteSpan(scrypt.salt),
                          scrypt.n, scrypt.r, scrypt.p, DERIVED_KEY_SIZE);
    }

    DerivedKey key(params, iv, ByteSpan(material));
    SecureZero(material.data(), material.size());
    return key;
}

DerivedKey DeriveKeyPbkdf2(const Pbkdf2Options& options) {
    IV iv = IVOrRandom(options.iv);

    Pbkdf2Params params;
    params.c = options.iterations;
    params.salt = SaltOrRandom(options.salt);

    return DeriveKey(params, options.password, iv);
}

DerivedKey DeriveKeyScrypt(const ScryptOptions& options) {
    IV iv = IVOrRandom(options.iv);

    ScryptParams params;
    params.n = options.n;
    params.salt = SaltOrRandom(options.salt);

    return DeriveKey(params, options.password, iv);
}

std::future<DerivedKey> DeriveKeyPbkdf2Async(Pbkdf2Options options, util::ThreadPool& pool) {
    return util::AsyncOn(pool, [options = std::move(options)]() {
        return DeriveKeyPbkdf2(options);
    });
}

std::future<DerivedKey> DeriveKeyScryptAsync(ScryptOptions options, util::ThreadPool& pool) {
    return util::AsyncOn(pool, [options = std::move(options)]() {
        return DeriveKeyScrypt(options);
    });
}

} // namespace keystore
} // namespace keyseal
