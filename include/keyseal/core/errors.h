// KEYSEAL - Error Types
// Copyright (c) 2024 KEYSEAL Developers
// MIT License
//
// Exception hierarchy thrown by the keystore and the primitives under it.
// Every type derives from KeystoreError, which is a std::runtime_error.

#ifndef KEYSEAL_CORE_ERRORS_H
#define KEYSEAL_CORE_ERRORS_H

#include <stdexcept>
#include <string>

namespace keyseal {

/// Base class for all keystore failures
class KeystoreError : public std::runtime_error {
public:
    explicit KeystoreError(const std::string& what) : std::runtime_error(what) {}
};

/// MAC verification failed: wrong password, wrong parameters or tampering
class CorruptKeystoreError : public KeystoreError {
public:
    CorruptKeystoreError() : KeystoreError("corrupt keystore") {}
};

/// A keystore record failed structural validation
class MalformedRecordError : public KeystoreError {
public:
    explicit MalformedRecordError(const std::string& what)
        : KeystoreError("malformed keystore record: " + what) {}
};

/// A fixed-length byte argument had the wrong length
class InputLengthError : public KeystoreError {
public:
    InputLengthError(const std::string& name, size_t expected, size_t actual)
        : KeystoreError(name + " must be " + std::to_string(expected) +
                        " bytes, got " + std::to_string(actual)) {}
};

/// Key derivation failed or was given invalid cost parameters
class KdfError : public KeystoreError {
public:
    explicit KdfError(const std::string& what) : KeystoreError(what) {}
};

/// The symmetric cipher failed
class CipherError : public KeystoreError {
public:
    explicit CipherError(const std::string& what) : KeystoreError(what) {}
};

} // namespace keyseal

#endif // KEYSEAL_CORE_ERRORS_H
