// KEYSEAL - Secure Memory Implementation
// Copyright (c) 2024 KEYSEAL Developers
// MIT License

#include "keyseal/core/secure.h"

#include <openssl/crypto.h>

#ifdef _WIN32
#include <windows.h>
#else
#include <sys/mman.h>
#endif

namespace keyseal {

void SecureZero(void* ptr, size_t size) {
    if (ptr != nullptr && size > 0) {
        OPENSSL_cleanse(ptr, size);
    }
}

bool LockMemory(void* ptr, size_t size) {
#ifdef _WIN32
    return VirtualLock(ptr, size) != 0;
#else
    return mlock(ptr, size) == 0;
#endif
}

bool UnlockMemory(void* ptr, size_t size) {
#ifdef _WIN32
    return VirtualUnlock(ptr, size) != 0;
#else
    return munlock(ptr, size) == 0;
#endif
}

} // namespace keyseal
