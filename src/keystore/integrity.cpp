// KEYSEAL - Keystore Integrity Implementation
// Copyright (c) 2024 KEYSEAL Developers
// MIT License

#include "keyseal/keystore/integrity.h"
#include "keyseal/core/errors.h"
#include "keyseal/core/random.h"
#include "keyseal/crypto/keccak.h"
#include "keyseal/util/logging.h"

#include <algorithm>

namespace keyseal {
namespace keystore {

SplitKeys SplitDerivedKey(ByteSpan material) {
    if (material.size() != 2 * SPLIT_KEY_SIZE) {
        throw InputLengthError("derived key", 2 * SPLIT_KEY_SIZE, material.size());
    }

    SplitKeys keys;
    std::copy(material.begin(), material.begin() + SPLIT_KEY_SIZE, keys.cipherKey.begin());
    std::copy(material.begin() + SPLIT_KEY_SIZE, material.end(), keys.macKey.begin());
    return keys;
}

Hash256 ComputeMac(ByteSpan macKey, ByteSpan ciphertext) {
    if (macKey.size() != SPLIT_KEY_SIZE) {
        throw InputLengthError("mac key", SPLIT_KEY_SIZE, macKey.size());
    }

    Hash256 mac;
    Keccak256()
        .Write(macKey.data(), macKey.size())
        .Write(ciphertext.data(), ciphertext.size())
        .Finalize(mac.data());
    return mac;
}

bool VerifyMac(ByteSpan macKey, ByteSpan ciphertext, ByteSpan expected) {
    Hash256 actual = ComputeMac(macKey, ciphertext);
    if (!ConstantTimeEqual(ByteSpan(actual.data(), actual.size()), expected)) {
        LOG_DEBUG(util::LogCategory::CRYPTO) << "MAC mismatch over "
                                              << ciphertext.size() << "-byte ciphertext";
        return false;
    }
    return true;
}

} // namespace keystore
} // namespace keyseal
