// CHIEFTALLY - Core Types Header
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License
//
// This file defines fundamental types used throughout CHIEFTALLY.
// Ethereum byte strings are kept in natural (big-endian) order.

#ifndef CHIEFTALLY_CORE_TYPES_H
#define CHIEFTALLY_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <algorithm>
#include <stdexcept>
#include <cstring>
#include <functional>

namespace chieftally {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Arbitrary-length byte string (calldata, return data, log data)
using Bytes = std::vector<Byte>;

// ============================================================================
// Fixed-Length Byte Strings
// ============================================================================

/// Generic fixed-size byte string
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    /// Default constructor - creates null value
    BaseHash() noexcept {
        data_.fill(0);
    }

    /// Construct from byte array
    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes (short input is zero-padded on the right)
    BaseHash(const Byte* data, size_t len) noexcept {
        if (len >= SIZE) {
            std::memcpy(data_.data(), data, SIZE);
        } else {
            data_.fill(0);
            if (data && len > 0) {
                std::memcpy(data_.data(), data, len);
            }
        }
    }

    /// Check if all bytes are zero
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    /// Set to all zeros
    void SetNull() noexcept {
        data_.fill(0);
    }

    /// Size in bytes
    constexpr size_t size() const noexcept { return SIZE; }

    /// Element access
    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    /// Raw data access
    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    /// Iterators
    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    /// Comparison operators (lexicographic over the bytes)
    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const BaseHash& other) const noexcept {
        return data_ < other.data_;
    }

    /// Lowercase hex with 0x prefix
    std::string ToHex() const;

    /// Parse from hex (0x prefix optional, exact length required)
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// Specific Types
// ============================================================================

/// 256-bit word (topics, slate hashes, keccak digests)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    Hash256() = default;
    Hash256(const BaseHash<256>& base) : BaseHash<256>(base) {}

    static Hash256 FromHex(const std::string& hex) {
        return Hash256(BaseHash<256>::FromHex(hex));
    }
};

/// 160-bit Ethereum account or contract address
class Address : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
    Address() = default;
    Address(const BaseHash<160>& base) : BaseHash<160>(base) {}

    static Address FromHex(const std::string& hex) {
        return Address(BaseHash<160>::FromHex(hex));
    }

    /// Address held in the low 20 bytes of a 32-byte word
    static Address FromWord(const Hash256& word) {
        return Address(word.data() + 12, SIZE);
    }

    /// Left-pad to a 32-byte word
    Hash256 ToWord() const {
        Hash256 word;
        std::memcpy(word.data() + 12, data_.data(), SIZE);
        return word;
    }

    /// EIP-55 mixed-case checksum encoding
    std::string ToChecksumHex() const;
};

} // namespace chieftally

namespace std {

template<>
struct hash<chieftally::Address> {
    size_t operator()(const chieftally::Address& a) const noexcept {
        size_t h;
        std::memcpy(&h, a.data(), sizeof(h));
        return h;
    }
};

template<>
struct hash<chieftally::Hash256> {
    size_t operator()(const chieftally::Hash256& a) const noexcept {
        size_t h;
        std::memcpy(&h, a.data(), sizeof(h));
        return h;
    }
};

} // namespace std

#endif // CHIEFTALLY_CORE_TYPES_H
