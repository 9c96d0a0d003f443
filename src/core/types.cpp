// KEYSEAL - Core Types Implementation
// Copyright (c) 2024 KEYSEAL Developers
// MIT License

#include "keyseal/core/types.h"
#include "keyseal/core/hex.h"

#include <algorithm>
#include <stdexcept>

namespace keyseal {

Hash256::Hash256(const Byte* data, size_t len) noexcept : data_{} {
    if (data != nullptr) {
        std::copy(data, data + std::min(len, SIZE), data_.begin());
    }
}

bool Hash256::IsNull() const noexcept {
    return std::all_of(data_.begin(), data_.end(), [](Byte b) { return b == 0; });
}

std::string Hash256::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

Hash256 Hash256::FromHex(const std::string& hex) {
    const std::string digits = StripHexPrefix(hex);
    if (digits.length() != SIZE * 2) {
        throw std::invalid_argument("hash hex must be " + std::to_string(SIZE * 2) +
                                    " digits, got " + std::to_string(digits.length()));
    }
    Bytes raw = HexToBytes(digits);
    return Hash256(raw.data(), raw.size());
}

} // namespace keyseal
