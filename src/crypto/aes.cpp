// KEYSEAL - AES Implementation
// Copyright (c) 2024 KEYSEAL Developers
// MIT License
//
// AES-128-CTR through OpenSSL EVP.

#include "keyseal/crypto/aes.h"
#include "keyseal/core/errors.h"
#include "keyseal/util/logging.h"

#include <openssl/evp.h>

#include <climits>

namespace keyseal {

std::vector<Byte> AES128CTREncrypt(ByteSpan key, ByteSpan iv, ByteSpan data) {
    if (key.size() != aes::KEY_SIZE_128) {
        throw InputLengthError("AES-128 key", aes::KEY_SIZE_128, key.size());
    }
    if (iv.size() != aes::IV_SIZE) {
        throw InputLengthError("AES-CTR iv", aes::IV_SIZE, iv.size());
    }
    if (data.size() > static_cast<size_t>(INT_MAX)) {
        throw CipherError("AES-CTR input too large");
    }

    std::vector<Byte> output(data.size());
    if (data.empty()) {
        return output;
    }

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
        throw CipherError("Failed to create cipher context");
    }

    if (EVP_EncryptInit_ex(ctx, EVP_aes_128_ctr(), nullptr, key.data(), iv.data()) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        throw CipherError("Failed to initialize AES-128-CTR");
    }
    EVP_CIPHER_CTX_set_padding(ctx, 0);

    int len = 0;
    if (EVP_EncryptUpdate(ctx, output.data(), &len, data.data(),
                          static_cast<int>(data.size())) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        throw CipherError("AES-128-CTR update failed");
    }
    int total = len;

    if (EVP_EncryptFinal_ex(ctx, output.data() + total, &len) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        throw CipherError("AES-128-CTR finalize failed");
    }
    total += len;
    EVP_CIPHER_CTX_free(ctx);

    if (static_cast<size_t>(total) != data.size()) {
        throw CipherError("AES-128-CTR produced unexpected output length");
    }

    LOG_TRACE(util::LogCategory::CRYPTO) << "AES-128-CTR transformed " << data.size() << " bytes";
    return output;
}

} // namespace keyseal
