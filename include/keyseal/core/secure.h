// KEYSEAL - Secure Memory
// Copyright (c) 2024 KEYSEAL Developers
// MIT License
//
// Wiping and page-locking helpers for secret material.

#ifndef KEYSEAL_CORE_SECURE_H
#define KEYSEAL_CORE_SECURE_H

#include <array>
#include <cstddef>
#include <cstdint>

namespace keyseal {

/// Zero memory in a way the compiler cannot elide
void SecureZero(void* ptr, size_t size);

/// Lock memory pages (prevent swapping). Returns false if the OS refused.
bool LockMemory(void* ptr, size_t size);

/// Unlock memory pages
bool UnlockMemory(void* ptr, size_t size);

// ============================================================================
// Secure Memory Container
// ============================================================================

/**
 * RAII container for sensitive data that:
 * - Locks memory to prevent swapping (best effort)
 * - Securely zeros memory on destruction and after being moved from
 */
template<typename T, size_t N>
class SecureArray {
public:
    SecureArray() {
        locked_ = LockMemory(data_.data(), sizeof(data_));
        data_.fill(0);
    }

    ~SecureArray() {
        SecureZero(data_.data(), sizeof(data_));
        if (locked_) {
            UnlockMemory(data_.data(), sizeof(data_));
        }
    }

    // Non-copyable
    SecureArray(const SecureArray&) = delete;
    SecureArray& operator=(const SecureArray&) = delete;

    // Move only
    SecureArray(SecureArray&& other) noexcept : SecureArray() {
        data_ = other.data_;
        SecureZero(other.data_.data(), sizeof(other.data_));
    }

    SecureArray& operator=(SecureArray&& other) noexcept {
        if (this != &other) {
            data_ = other.data_;
            SecureZero(other.data_.data(), sizeof(other.data_));
        }
        return *this;
    }

    T* data() { return data_.data(); }
    const T* data() const { return data_.data(); }
    constexpr size_t size() const { return N; }

    T& operator[](size_t i) { return data_[i]; }
    const T& operator[](size_t i) const { return data_[i]; }

    auto begin() { return data_.begin(); }
    auto end() { return data_.end(); }
    auto begin() const { return data_.begin(); }
    auto end() const { return data_.end(); }

    bool IsLocked() const { return locked_; }

private:
    std::array<T, N> data_;
    bool locked_{false};
};

} // namespace keyseal

#endif // KEYSEAL_CORE_SECURE_H
