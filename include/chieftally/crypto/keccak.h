// CHIEFTALLY - Keccak-256 Hash Function
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License
//
// Keccak-256 as used by Ethereum (original Keccak padding, not FIPS 202
// SHA3-256). Used for function selectors, event topics and EIP-55
// address checksums.

#ifndef CHIEFTALLY_CRYPTO_KECCAK_H
#define CHIEFTALLY_CRYPTO_KECCAK_H

#include <cstdint>
#include <cstddef>
#include <string>
#include "chieftally/core/types.h"

namespace chieftally {

/// Keccak-256 hasher class
/// Incremental interface mirroring the other hashers: Write, Finalize, Reset
class Keccak256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    /// Sponge rate in bytes (1600 - 2 * 256 bits)
    static constexpr size_t RATE = 136;

    /// Default constructor - initializes to empty state
    Keccak256();

    /// Absorb data into the sponge
    /// @param data Pointer to input data
    /// @param len Length of input data
    /// @return Reference to this hasher (for chaining)
    Keccak256& Write(const Byte* data, size_t len);

    /// Pad, squeeze and write the digest
    /// @param hash Pointer to output buffer (must be at least OUTPUT_SIZE bytes)
    void Finalize(Byte hash[OUTPUT_SIZE]);

    /// Reset hasher to initial state
    /// @return Reference to this hasher (for chaining)
    Keccak256& Reset();

private:
    /// Sponge state (25 x 64-bit lanes)
    uint64_t state_[25];

    /// Bytes absorbed into the current block
    size_t offset_;

    /// Keccak-f[1600] permutation
    void Permute();
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Compute Keccak-256 of data in a single call
Hash256 Keccak256Hash(const Byte* data, size_t len);

/// Compute Keccak-256 of a byte vector
inline Hash256 Keccak256Hash(const Bytes& data) {
    return Keccak256Hash(data.data(), data.size());
}

/// Compute Keccak-256 of a string's bytes (e.g. a canonical signature)
inline Hash256 Keccak256Hash(const std::string& text) {
    return Keccak256Hash(reinterpret_cast<const Byte*>(text.data()), text.size());
}

} // namespace chieftally

#endif // CHIEFTALLY_CRYPTO_KECCAK_H
