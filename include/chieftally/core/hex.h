// CHIEFTALLY - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License

#ifndef CHIEFTALLY_CORE_HEX_H
#define CHIEFTALLY_CORE_HEX_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <array>
#include <stdexcept>

namespace chieftally {

// Use uint8_t directly to avoid circular dependency with types.h
using HexByte = uint8_t;

/// Convert bytes to lowercase hex string (no prefix)
std::string BytesToHex(const HexByte* data, size_t len);
std::string BytesToHex(const std::vector<HexByte>& data);

template<size_t N>
std::string BytesToHex(const std::array<HexByte, N>& data) {
    return BytesToHex(data.data(), N);
}

/// Convert bytes to a 0x-prefixed hex string, the form JSON-RPC expects
std::string BytesToHexPrefixed(const std::vector<HexByte>& data);

/// Convert hex string to bytes; a leading 0x is accepted
std::vector<HexByte> HexToBytes(const std::string& hex);

/// Check if string is valid hex (0x prefix allowed, "0x" alone is valid)
bool IsValidHex(const std::string& str);

/// Remove a leading 0x/0X if present
std::string StripHexPrefix(const std::string& hex);

/// Parse a JSON-RPC quantity ("0x1a") into an integer
uint64_t ParseHexQuantity(const std::string& hex);

/// Encode an integer as a JSON-RPC quantity
std::string ToHexQuantity(uint64_t value);

} // namespace chieftally

#endif // CHIEFTALLY_CORE_HEX_H
