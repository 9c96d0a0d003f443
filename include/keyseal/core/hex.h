// KEYSEAL - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 KEYSEAL Developers
// MIT License

#ifndef KEYSEAL_CORE_HEX_H
#define KEYSEAL_CORE_HEX_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <array>
#include <stdexcept>

namespace keyseal {

// Use uint8_t directly to avoid circular dependency with types.h
using HexByte = uint8_t;

/// Convert bytes to lowercase hex string (no prefix)
std::string BytesToHex(const HexByte* data, size_t len);
std::string BytesToHex(const std::vector<HexByte>& data);

template<size_t N>
std::string BytesToHex(const std::array<HexByte, N>& data) {
    return BytesToHex(data.data(), N);
}

/// Convert bytes to "0x"-prefixed lowercase hex string
std::string BytesToPrefixedHex(const HexByte* data, size_t len);
std::string BytesToPrefixedHex(const std::vector<HexByte>& data);

/// Convert hex string to bytes.
/// Accepts an optional 0x/0X prefix and either digit case.
/// @throws std::invalid_argument on odd length or a non-hex digit
std::vector<HexByte> HexToBytes(const std::string& hex);

/// Check if string is valid hex (optional prefix, even length, may be empty)
bool IsValidHex(const std::string& str);

/// Return str without a leading 0x/0X
std::string StripHexPrefix(const std::string& str);

} // namespace keyseal

#endif // KEYSEAL_CORE_HEX_H
