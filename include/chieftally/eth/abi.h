// CHIEFTALLY - Contract ABI
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License
//
// Solidity ABI support: selectors and topics, call encoding for the
// fixed-size arguments used against the chief, a decoder for return data
// and calldata, and a contract interface parsed from ABI JSON.

#ifndef CHIEFTALLY_ETH_ABI_H
#define CHIEFTALLY_ETH_ABI_H

#include "chieftally/core/bignum.h"
#include "chieftally/core/types.h"
#include "chieftally/eth/result.h"
#include "chieftally/rpc/json.h"

#include <array>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace chieftally {
namespace eth {

/// ABI word size in bytes
constexpr size_t WORD_SIZE = 32;

/// 4-byte function selector
using Selector = std::array<Byte, 4>;

// ============================================================================
// Selectors and Topics
// ============================================================================

/// First four bytes of keccak256(signature)
Selector FunctionSelector(const std::string& signature);

/// keccak256(signature), the topic0 of a regular event
Hash256 EventTopic(const std::string& signature);

/// ds-note topic: the selector left-aligned in a zero-padded word
Hash256 NoteTopic(const std::string& signature);

// ============================================================================
// Encoding
// ============================================================================

/// Big-endian uint256 word
Hash256 UintWord(uint64_t value);

/// Selector followed by static argument words
Bytes EncodeCall(const std::string& signature, std::initializer_list<Hash256> args = {});

// ============================================================================
// Decoded Values
// ============================================================================

/**
 * A decoded ABI value.
 *
 * Supported types: address, bool, uintN, intN, bytesN, bytes, string and
 * dynamic arrays T[] of any supported T.
 */
class AbiValue {
public:
    enum class Kind {
        Address,
        Bool,
        Uint,
        Int,
        FixedBytes,
        Bytes,
        String,
        Array,
    };

    static AbiValue MakeAddress(const chieftally::Address& addr);
    static AbiValue MakeBool(bool value);
    static AbiValue MakeUint(const BigNum& value);
    /// Signed integer as sign and magnitude
    static AbiValue MakeInt(const BigNum& magnitude, bool negative);
    static AbiValue MakeFixedBytes(const chieftally::Bytes& value);
    static AbiValue MakeBytes(const chieftally::Bytes& value);
    static AbiValue MakeString(const std::string& value);
    static AbiValue MakeArray(std::vector<AbiValue> items);

    Kind GetKind() const { return kind_; }

    const chieftally::Address& GetAddress() const { return address_; }
    bool GetBool() const { return bool_; }
    /// Magnitude for Uint and Int
    const BigNum& GetNumber() const { return number_; }
    bool IsNegative() const { return negative_; }
    const chieftally::Bytes& GetBytes() const { return bytes_; }
    const std::string& GetString() const { return text_; }
    const std::vector<AbiValue>& GetItems() const { return items_; }

    /// Integers render as JSON numbers when they fit int64, else as
    /// decimal strings; addresses use EIP-55; byte strings use 0x hex
    rpc::JSONValue ToJSON() const;

    /// Human-readable form used in text reports
    std::string ToString() const;

private:
    Kind kind_{Kind::Bool};
    chieftally::Address address_;
    bool bool_{false};
    BigNum number_;
    bool negative_{false};
    chieftally::Bytes bytes_;
    std::string text_;
    std::vector<AbiValue> items_;
};

// ============================================================================
// Decoding
// ============================================================================

/**
 * Decode a head/tail encoded tuple of the given canonical types.
 * Fails with ErrorKind::Decode on truncated data, out-of-range offsets,
 * dirty padding in address/bool words, or an unsupported type.
 */
Result<std::vector<AbiValue>> DecodeParams(const std::vector<std::string>& types,
                                           const Byte* data, size_t len);

inline Result<std::vector<AbiValue>> DecodeParams(const std::vector<std::string>& types,
                                                  const chieftally::Bytes& data) {
    return DecodeParams(types, data.data(), data.size());
}

/// Return-data helpers for single-value functions
Result<chieftally::Address> DecodeAddress(const chieftally::Bytes& data);
Result<BigNum> DecodeUint(const chieftally::Bytes& data);
Result<chieftally::Bytes> DecodeDynamicBytes(const chieftally::Bytes& data);

// ============================================================================
// Contract Interface
// ============================================================================

struct AbiParam {
    std::string name;
    std::string type;   // Canonical type, e.g. "uint256", "address[]"
};

struct AbiFunction {
    std::string name;
    std::vector<AbiParam> inputs;
    std::vector<AbiParam> outputs;

    /// name(type1,type2,...)
    std::string Signature() const;
    Selector GetSelector() const { return FunctionSelector(Signature()); }
};

struct AbiEvent {
    std::string name;
    std::vector<AbiParam> inputs;

    std::string Signature() const;
};

/// Function call recovered from calldata
struct DecodedCall {
    std::string name;
    std::string signature;
    std::vector<std::pair<std::string, AbiValue>> args;

    /// Argument by name, or nullptr
    const AbiValue* Find(const std::string& argName) const;
};

/**
 * Functions and events a contract declares, parsed from ABI JSON.
 */
class ContractInterface {
public:
    ContractInterface() = default;

    /// Parse an ABI JSON array; fails with ErrorKind::Decode
    static Result<ContractInterface> FromJSON(const std::string& abiJson);

    const std::vector<AbiFunction>& GetFunctions() const { return functions_; }
    const std::vector<AbiEvent>& GetEvents() const { return events_; }

    /// True if a function with exactly this signature is declared
    bool HasFunction(const std::string& signature) const;

    bool HasEvent(const std::string& signature) const;

    const AbiFunction* FindBySelector(const Selector& selector) const;

    /**
     * Match the selector of calldata against the declared functions and
     * decode its arguments.
     * Fails with InterfaceMismatch when no function matches, and with
     * Decode when the arguments are malformed.
     */
    Result<DecodedCall> DecodeFunctionInput(const chieftally::Bytes& calldata) const;

    /// Original ABI JSON
    const std::string& GetSource() const { return source_; }

private:
    std::vector<AbiFunction> functions_;
    std::vector<AbiEvent> events_;
    std::string source_;
};

} // namespace eth
} // namespace chieftally

#endif // CHIEFTALLY_ETH_ABI_H
