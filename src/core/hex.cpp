// LIQUIDSTAKE - Hex Encoding/Decoding Implementation
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License

#include "liquidstake/core/hex.h"

#include <stdexcept>

namespace liquidstake {

namespace {
    constexpr char HEX_CHARS[] = "0123456789abcdef";

    inline int NibbleOf(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    inline size_t PrefixLength(const std::string& hex) {
        if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
            return 2;
        }
        return 0;
    }
}

std::string BytesToHex(const uint8_t* data, size_t len) {
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        result.push_back(HEX_CHARS[data[i] >> 4]);
        result.push_back(HEX_CHARS[data[i] & 0x0F]);
    }
    return result;
}

std::string BytesToHex(const std::vector<uint8_t>& data) {
    return BytesToHex(data.data(), data.size());
}

std::vector<uint8_t> HexToBytes(const std::string& hex) {
    size_t start = PrefixLength(hex);
    if ((hex.length() - start) % 2 != 0) {
        throw std::invalid_argument("Hex string must have even length");
    }

    std::vector<uint8_t> result;
    result.reserve((hex.length() - start) / 2);
    for (size_t i = start; i < hex.length(); i += 2) {
        int high = NibbleOf(hex[i]);
        int low = NibbleOf(hex[i + 1]);
        if (high < 0 || low < 0) {
            throw std::invalid_argument("Invalid hex character");
        }
        result.push_back(static_cast<uint8_t>((high << 4) | low));
    }
    return result;
}

bool IsValidHex(const std::string& str) {
    size_t start = PrefixLength(str);
    if (str.length() == start || (str.length() - start) % 2 != 0) {
        return false;
    }
    for (size_t i = start; i < str.length(); ++i) {
        if (NibbleOf(str[i]) < 0) {
            return false;
        }
    }
    return true;
}

std::string StringToHex(const std::string& str) {
    return BytesToHex(reinterpret_cast<const uint8_t*>(str.data()), str.size());
}

} // namespace liquidstake
