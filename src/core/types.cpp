// CHIEFTALLY - Core Types Implementation
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License

#include "chieftally/core/types.h"
#include "chieftally/core/hex.h"
#include "chieftally/crypto/keccak.h"

#include <cctype>

namespace chieftally {

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    return "0x" + BytesToHex(data_.data(), SIZE);
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& input) {
    std::string hex = StripHexPrefix(input);
    if (hex.length() != SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length for " +
                                    std::to_string(SIZE) + "-byte value");
    }

    std::vector<Byte> bytes = HexToBytes(hex);
    return BaseHash(bytes.data(), bytes.size());
}

// Explicit template instantiations
template class BaseHash<256>;
template class BaseHash<160>;

// ============================================================================
// Address Implementation
// ============================================================================

std::string Address::ToChecksumHex() const {
    std::string lower = BytesToHex(data_.data(), SIZE);
    Hash256 digest = Keccak256Hash(
        reinterpret_cast<const Byte*>(lower.data()), lower.size());

    std::string result = "0x";
    result.reserve(2 + lower.size());
    for (size_t i = 0; i < lower.size(); ++i) {
        char c = lower[i];
        Byte nibble = (i % 2 == 0) ? (digest[i / 2] >> 4) : (digest[i / 2] & 0x0F);
        if (std::isalpha(static_cast<unsigned char>(c)) && nibble >= 8) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        result.push_back(c);
    }
    return result;
}

} // namespace chieftally
