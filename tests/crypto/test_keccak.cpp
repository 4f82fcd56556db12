// CHIEFTALLY - Keccak-256 Tests
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License

#include <gtest/gtest.h>
#include "chieftally/crypto/keccak.h"
#include "chieftally/core/types.h"
#include "chieftally/core/hex.h"

#include <string>

namespace chieftally {
namespace test {

// ============================================================================
// Helper Functions
// ============================================================================

std::string DigestHex(const std::string& input) {
    return Keccak256Hash(input).ToHex().substr(2);
}

std::string SelectorHex(const std::string& signature) {
    Hash256 h = Keccak256Hash(signature);
    return BytesToHex(h.data(), 4);
}

// ============================================================================
// Known Vectors
// ============================================================================

TEST(KeccakTest, EmptyInput) {
    EXPECT_EQ(DigestHex(""), "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
}

TEST(KeccakTest, ShortInput) {
    EXPECT_EQ(DigestHex("abc"), "4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45");
}

TEST(KeccakTest, FunctionSelectors) {
    EXPECT_EQ(SelectorHex("vote(address[])"), "ed081329");
    EXPECT_EQ(SelectorHex("vote(bytes32)"), "a69beaba");
    EXPECT_EQ(SelectorHex("slates(bytes32,uint256)"), "c2ffc7bb");
    EXPECT_EQ(SelectorHex("hat()"), "fe95a5ce");
    EXPECT_EQ(SelectorHex("setFee(uint256)"), "69fe0e2d");
}

TEST(KeccakTest, EventTopic) {
    EXPECT_EQ(DigestHex("Etch(bytes32)"),
              "4f0892983790f53eea39a7a496f6cb40e8811b313871337b6a761efc6c67bb1f");
}

// ============================================================================
// Block Boundaries
// ============================================================================

TEST(KeccakTest, RateBoundaries) {
    // One byte short of a block, then exactly one block
    EXPECT_EQ(DigestHex(std::string(135, 'a')),
              "34367dc248bbd832f4e3e69dfaac2f92638bd0bbd18f2912ba4ef454919cf446");
    EXPECT_EQ(DigestHex(std::string(136, 'a')),
              "a6c4d403279fe3e0af03729caada8374b5ca54d8065329a3ebcaeb4b60aa386e");
}

// ============================================================================
// Incremental Hashing
// ============================================================================

TEST(KeccakTest, IncrementalMatchesOneShot) {
    std::string input(500, 'x');
    for (size_t i = 0; i < input.size(); ++i) {
        input[i] = static_cast<char>('a' + i % 26);
    }

    Keccak256 hasher;
    const Byte* data = reinterpret_cast<const Byte*>(input.data());
    hasher.Write(data, 1).Write(data + 1, 135).Write(data + 136, 200).Write(data + 336, 164);

    Byte out[Keccak256::OUTPUT_SIZE];
    hasher.Finalize(out);
    EXPECT_EQ(Hash256(out, sizeof(out)), Keccak256Hash(input));
}

TEST(KeccakTest, Reset) {
    Keccak256 hasher;
    const std::string junk = "junk";
    hasher.Write(reinterpret_cast<const Byte*>(junk.data()), junk.size());
    hasher.Reset();

    Byte out[Keccak256::OUTPUT_SIZE];
    hasher.Finalize(out);
    EXPECT_EQ(Hash256(out, sizeof(out)), Keccak256Hash(std::string()));
}

TEST(KeccakTest, BytesOverload) {
    Bytes data = {'a', 'b', 'c'};
    EXPECT_EQ(Keccak256Hash(data), Keccak256Hash(std::string("abc")));
}

} // namespace test
} // namespace chieftally
