// KEYSEAL - Core Types Header
// Copyright (c) 2024 KEYSEAL Developers
// MIT License
//
// Byte strings, the non-owning Span view and the 32-byte digest type
// shared by the crypto and keystore layers.

#ifndef KEYSEAL_CORE_TYPES_H
#define KEYSEAL_CORE_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>
#include <vector>

namespace keyseal {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Owned, variable-length byte string
using Bytes = std::vector<Byte>;

// ============================================================================
// Span - Non-owning view of contiguous memory
// ============================================================================

template<typename T>
class Span {
public:
    using value_type = T;
    using pointer = T*;
    using reference = T&;
    using iterator = pointer;
    using size_type = std::size_t;

    constexpr Span() noexcept : data_(nullptr), size_(0) {}

    constexpr Span(pointer data, size_type size) noexcept
        : data_(data), size_(size) {}

    template<size_t N>
    constexpr Span(std::array<std::remove_const_t<T>, N>& arr) noexcept
        : data_(arr.data()), size_(N) {}

    template<size_t N>
    constexpr Span(const std::array<std::remove_const_t<T>, N>& arr) noexcept
        : data_(arr.data()), size_(N) {}

    Span(std::vector<std::remove_const_t<T>>& vec) noexcept
        : data_(vec.data()), size_(vec.size()) {}

    Span(const std::vector<std::remove_const_t<T>>& vec) noexcept
        : data_(vec.data()), size_(vec.size()) {}

    constexpr pointer data() const noexcept { return data_; }
    constexpr size_type size() const noexcept { return size_; }
    constexpr bool empty() const noexcept { return size_ == 0; }

    constexpr reference operator[](size_type idx) const { return data_[idx]; }

    constexpr iterator begin() const noexcept { return data_; }
    constexpr iterator end() const noexcept { return data_ + size_; }

    /// No bounds checks; callers slice within size()
    constexpr Span subspan(size_type offset, size_type count) const {
        return Span(data_ + offset, count);
    }
    constexpr Span first(size_type count) const { return Span(data_, count); }
    constexpr Span last(size_type count) const { return Span(data_ + size_ - count, count); }

private:
    pointer data_;
    size_type size_;
};

/// Read-only byte view; every crypto entry point takes one
using ByteSpan = Span<const Byte>;

// ============================================================================
// Hash256
// ============================================================================

/**
 * 256-bit digest, held in output order (byte 0 is the first byte the
 * hash function emits). Used for Keccak-256 results and keystore MACs.
 */
class Hash256 {
public:
    static constexpr size_t SIZE = 32;

    Hash256() noexcept : data_{} {}

    explicit Hash256(const std::array<Byte, SIZE>& data) noexcept : data_(data) {}

    /// Copies min(len, SIZE) bytes; the rest stays zero
    Hash256(const Byte* data, size_t len) noexcept;

    /// True when every byte is zero
    bool IsNull() const noexcept;
    void SetNull() noexcept { data_.fill(0); }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    const Byte* begin() const noexcept { return data_.data(); }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const Hash256& other) const noexcept { return data_ == other.data_; }
    bool operator!=(const Hash256& other) const noexcept { return data_ != other.data_; }

    Bytes ToBytes() const { return Bytes(data_.begin(), data_.end()); }

    /// 64 lowercase hex digits, no prefix
    std::string ToHex() const;

    /// Parse exactly 64 hex digits, optionally 0x-prefixed
    /// @throws std::invalid_argument on bad length or digits
    static Hash256 FromHex(const std::string& hex);

private:
    std::array<Byte, SIZE> data_;
};

} // namespace keyseal

#endif // KEYSEAL_CORE_TYPES_H
