// CHIEFTALLY - Hex Encoding/Decoding Implementation
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License

#include "chieftally/core/hex.h"

namespace chieftally {

namespace {
    constexpr char HEX_CHARS[] = "0123456789abcdef";

    inline int HexCharToNibble(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
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

std::string BytesToHexPrefixed(const std::vector<HexByte>& data) {
    return "0x" + BytesToHex(data);
}

std::string StripHexPrefix(const std::string& hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        return hex.substr(2);
    }
    return hex;
}

std::vector<HexByte> HexToBytes(const std::string& input) {
    std::string hex = StripHexPrefix(input);
    if (hex.length() % 2 != 0) {
        throw std::invalid_argument("Hex string must have even length");
    }

    std::vector<HexByte> result;
    result.reserve(hex.length() / 2);

    for (size_t i = 0; i < hex.length(); i += 2) {
        int high = HexCharToNibble(hex[i]);
        int low = HexCharToNibble(hex[i + 1]);

        if (high < 0 || low < 0) {
            throw std::invalid_argument("Invalid hex character");
        }

        result.push_back(static_cast<HexByte>((high << 4) | low));
    }

    return result;
}

bool IsValidHex(const std::string& input) {
    if (input.empty()) {
        return false;
    }
    std::string str = StripHexPrefix(input);
    if (str.length() % 2 != 0) {
        return false;
    }

    for (char c : str) {
        if (HexCharToNibble(c) < 0) {
            return false;
        }
    }

    return true;
}

uint64_t ParseHexQuantity(const std::string& input) {
    std::string hex = StripHexPrefix(input);
    if (hex.empty() || hex.size() > 16) {
        throw std::invalid_argument("Invalid hex quantity: " + input);
    }

    uint64_t value = 0;
    for (char c : hex) {
        int nibble = HexCharToNibble(c);
        if (nibble < 0) {
            throw std::invalid_argument("Invalid hex quantity: " + input);
        }
        value = (value << 4) | static_cast<uint64_t>(nibble);
    }
    return value;
}

std::string ToHexQuantity(uint64_t value) {
    if (value == 0) {
        return "0x0";
    }
    std::string digits;
    while (value > 0) {
        digits.push_back(HEX_CHARS[value & 0x0F]);
        value >>= 4;
    }
    return "0x" + std::string(digits.rbegin(), digits.rend());
}

} // namespace chieftally
