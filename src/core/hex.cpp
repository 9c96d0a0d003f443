// KEYSEAL - Hex Encoding/Decoding Implementation
// Copyright (c) 2024 KEYSEAL Developers
// MIT License

#include "keyseal/core/hex.h"

namespace keyseal {

namespace {
    constexpr char HEX_CHARS[] = "0123456789abcdef";

    inline int HexCharToNibble(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    inline bool HasHexPrefix(const std::string& str) {
        return str.size() >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X');
    }
}

std::string BytesToHex(const HexByte* data, size_t len) {
    std::string result;
    result.reserve(len * 2);

    for (size_t i = 0; i < len; ++i) {
        result.push_back(HEX_CHARS[data[i] >> 4]);
        result.push_back(HEX_CHARS[data[i] & 0x0F]);
    }

    return result;
}

std::string BytesToHex(const std::vector<HexByte>& data) {
    return BytesToHex(data.data(), data.size());
}

std::string BytesToPrefixedHex(const HexByte* data, size_t len) {
    return "0x" + BytesToHex(data, len);
}

std::string BytesToPrefixedHex(const std::vector<HexByte>& data) {
    return BytesToPrefixedHex(data.data(), data.size());
}

std::string StripHexPrefix(const std::string& str) {
    return HasHexPrefix(str) ? str.substr(2) : str;
}

std::vector<HexByte> HexToBytes(const std::string& hex) {
    const size_t start = HasHexPrefix(hex) ? 2 : 0;
    const size_t digits = hex.length() - start;

    if (digits % 2 != 0) {
        throw std::invalid_argument("Hex string must have even length");
    }

    std::vector<HexByte> result;
    result.reserve(digits / 2);

    for (size_t i = start; i < hex.length(); i += 2) {
        int high = HexCharToNibble(hex[i]);
        int low = HexCharToNibble(hex[i + 1]);

        if (high < 0 || low < 0) {
            throw std::invalid_argument("Invalid hex character");
        }

        result.push_back(static_cast<HexByte>((high << 4) | low));
    }

    return result;
}

bool IsValidHex(const std::string& str) {
    const size_t start = HasHexPrefix(str) ? 2 : 0;
    if ((str.length() - start) % 2 != 0) {
        return false;
    }

    for (size_t i = start; i < str.length(); ++i) {
        if (HexCharToNibble(str[i]) < 0) {
            return false;
        }
    }

    return true;
}

} // namespace keyseal
