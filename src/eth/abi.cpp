// CHIEFTALLY - Contract ABI Implementation
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License

#include "chieftally/eth/abi.h"
#include "chieftally/core/hex.h"
#include "chieftally/crypto/keccak.h"
#include "chieftally/util/logging.h"

#include <cstring>
#include <limits>

namespace chieftally {
namespace eth {

// ============================================================================
// Selectors and Topics
// ============================================================================

Selector FunctionSelector(const std::string& signature) {
    Hash256 digest = Keccak256Hash(signature);
    Selector sel;
    std::memcpy(sel.data(), digest.data(), sel.size());
    return sel;
}

Hash256 EventTopic(const std::string& signature) {
    return Keccak256Hash(signature);
}

Hash256 NoteTopic(const std::string& signature) {
    Selector sel = FunctionSelector(signature);
    Hash256 topic;
    std::memcpy(topic.data(), sel.data(), sel.size());
    return topic;
}

// ============================================================================
// Encoding
// ============================================================================

Hash256 UintWord(uint64_t value) {
    Hash256 word;
    for (int i = 0; i < 8; ++i) {
        word[WORD_SIZE - 1 - i] = static_cast<Byte>(value >> (8 * i));
    }
    return word;
}

Bytes EncodeCall(const std::string& signature, std::initializer_list<Hash256> args) {
    Selector sel = FunctionSelector(signature);
    Bytes out(sel.begin(), sel.end());
    out.reserve(sel.size() + args.size() * WORD_SIZE);
    for (const auto& word : args) {
        out.insert(out.end(), word.begin(), word.end());
    }
    return out;
}

// ============================================================================
// AbiValue
// ============================================================================

AbiValue AbiValue::MakeAddress(const chieftally::Address& addr) {
    AbiValue v;
    v.kind_ = Kind::Address;
    v.address_ = addr;
    return v;
}

AbiValue AbiValue::MakeBool(bool value) {
    AbiValue v;
    v.kind_ = Kind::Bool;
    v.bool_ = value;
    return v;
}

AbiValue AbiValue::MakeUint(const BigNum& value) {
    AbiValue v;
    v.kind_ = Kind::Uint;
    v.number_ = value;
    return v;
}

AbiValue AbiValue::MakeInt(const BigNum& magnitude, bool negative) {
    AbiValue v;
    v.kind_ = Kind::Int;
    v.number_ = magnitude;
    v.negative_ = negative && !magnitude.IsZero();
    return v;
}

AbiValue AbiValue::MakeFixedBytes(const chieftally::Bytes& value) {
    AbiValue v;
    v.kind_ = Kind::FixedBytes;
    v.bytes_ = value;
    return v;
}

AbiValue AbiValue::MakeBytes(const chieftally::Bytes& value) {
    AbiValue v;
    v.kind_ = Kind::Bytes;
    v.bytes_ = value;
    return v;
}

AbiValue AbiValue::MakeString(const std::string& value) {
    AbiValue v;
    v.kind_ = Kind::String;
    v.text_ = value;
    return v;
}

AbiValue AbiValue::MakeArray(std::vector<AbiValue> items) {
    AbiValue v;
    v.kind_ = Kind::Array;
    v.items_ = std::move(items);
    return v;
}

namespace {

/// int64 if the signed value fits, else nullopt
std::optional<int64_t> FitInt64(const BigNum& magnitude, bool negative) {
    auto small = magnitude.ToUint64();
    if (!small) return std::nullopt;
    constexpr uint64_t maxPositive = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    if (!negative) {
        if (*small > maxPositive) return std::nullopt;
        return static_cast<int64_t>(*small);
    }
    if (*small > maxPositive + 1) return std::nullopt;
    if (*small == maxPositive + 1) return std::numeric_limits<int64_t>::min();
    return -static_cast<int64_t>(*small);
}

} // namespace

rpc::JSONValue AbiValue::ToJSON() const {
    switch (kind_) {
        case Kind::Address:
            return rpc::JSONValue(address_.ToChecksumHex());
        case Kind::Bool:
            return rpc::JSONValue(bool_);
        case Kind::Uint:
        case Kind::Int: {
            auto fit = FitInt64(number_, negative_);
            if (fit) return rpc::JSONValue(*fit);
            return rpc::JSONValue((negative_ ? "-" : "") + number_.ToDecimal());
        }
        case Kind::FixedBytes:
        case Kind::Bytes:
            return rpc::JSONValue(BytesToHexPrefixed(bytes_));
        case Kind::String:
            return rpc::JSONValue(text_);
        case Kind::Array: {
            rpc::JSONValue arr{rpc::JSONValue::Array{}};
            for (const auto& item : items_) {
                arr.Push(item.ToJSON());
            }
            return arr;
        }
    }
    return rpc::JSONValue();
}

std::string AbiValue::ToString() const {
    switch (kind_) {
        case Kind::Address:
            return address_.ToChecksumHex();
        case Kind::Bool:
            return bool_ ? "true" : "false";
        case Kind::Uint:
        case Kind::Int:
            return (negative_ ? "-" : "") + number_.ToDecimal();
        case Kind::FixedBytes:
        case Kind::Bytes:
            return BytesToHexPrefixed(bytes_);
        case Kind::String:
            return rpc::QuoteJSONString(text_);
        case Kind::Array: {
            std::string out = "[";
            for (size_t i = 0; i < items_.size(); ++i) {
                if (i > 0) out += ", ";
                out += items_[i].ToString();
            }
            return out + "]";
        }
    }
    return "";
}

// ============================================================================
// Decoding
// ============================================================================

namespace {

Error DecodeFailure(const std::string& what) {
    return Error{ErrorKind::Decode, what};
}

bool IsArrayType(const std::string& type) {
    return type.size() > 2 && type.compare(type.size() - 2, 2, "[]") == 0;
}

bool IsDynamicType(const std::string& type) {
    return type == "bytes" || type == "string" || IsArrayType(type);
}

/// Parse the N of uintN / intN / bytesN; 0 on failure
unsigned TypeWidth(const std::string& type, size_t prefixLen, unsigned defaultWidth) {
    if (type.size() == prefixLen) return defaultWidth;
    unsigned width = 0;
    for (size_t i = prefixLen; i < type.size(); ++i) {
        char c = type[i];
        if (c < '0' || c > '9' || width > 1000) return 0;
        width = width * 10 + static_cast<unsigned>(c - '0');
    }
    return width;
}

/// Read the word at data[pos, pos+32)
bool ReadWord(const Byte* data, size_t len, size_t pos, const Byte*& word) {
    if (pos > len || len - pos < WORD_SIZE) return false;
    word = data + pos;
    return true;
}

/// Word as a size_t offset or length, bounded by limit
bool WordToSize(const Byte* word, size_t limit, size_t& out) {
    for (size_t i = 0; i < WORD_SIZE - 8; ++i) {
        if (word[i] != 0) return false;
    }
    uint64_t v = 0;
    for (size_t i = WORD_SIZE - 8; i < WORD_SIZE; ++i) {
        v = (v << 8) | word[i];
    }
    if (v > limit) return false;
    out = static_cast<size_t>(v);
    return true;
}

bool LeadingZero(const Byte* word, size_t count) {
    for (size_t i = 0; i < count; ++i) {
        if (word[i] != 0) return false;
    }
    return true;
}

Result<AbiValue> DecodeStatic(const std::string& type, const Byte* word) {
    if (type == "address") {
        if (!LeadingZero(word, 12)) return DecodeFailure("dirty address padding");
        return AbiValue::MakeAddress(chieftally::Address(word + 12, 20));
    }
    if (type == "bool") {
        if (!LeadingZero(word, WORD_SIZE - 1) || word[WORD_SIZE - 1] > 1) {
            return DecodeFailure("invalid bool");
        }
        return AbiValue::MakeBool(word[WORD_SIZE - 1] == 1);
    }
    if (type.compare(0, 4, "uint") == 0) {
        unsigned bits = TypeWidth(type, 4, 256);
        if (bits == 0 || bits > 256 || bits % 8 != 0) return DecodeFailure("unsupported type " + type);
        if (!LeadingZero(word, (256 - bits) / 8)) return DecodeFailure(type + " out of range");
        return AbiValue::MakeUint(BigNum::FromBytes(word, WORD_SIZE));
    }
    if (type.compare(0, 3, "int") == 0) {
        unsigned bits = TypeWidth(type, 3, 256);
        if (bits == 0 || bits > 256 || bits % 8 != 0) return DecodeFailure("unsupported type " + type);
        BigNum raw = BigNum::FromBytes(word, WORD_SIZE);
        if ((word[0] & 0x80) == 0) {
            return AbiValue::MakeInt(raw, false);
        }
        Byte modulus[WORD_SIZE + 1] = {1};
        return AbiValue::MakeInt(BigNum::FromBytes(modulus, sizeof(modulus)) - raw, true);
    }
    if (type.compare(0, 5, "bytes") == 0) {
        unsigned size = TypeWidth(type, 5, 0);
        if (size == 0 || size > WORD_SIZE) return DecodeFailure("unsupported type " + type);
        return AbiValue::MakeFixedBytes(chieftally::Bytes(word, word + size));
    }
    return DecodeFailure("unsupported type " + type);
}

/**
 * Decode the value whose head sits at frame[headPos]. Offsets of dynamic
 * values are relative to the start of the frame.
 */
Result<AbiValue> DecodeAt(const std::string& type, const Byte* frame, size_t frameLen,
                          size_t headPos) {
    const Byte* head = nullptr;
    if (!ReadWord(frame, frameLen, headPos, head)) {
        return DecodeFailure("truncated head for " + type);
    }
    if (!IsDynamicType(type)) {
        return DecodeStatic(type, head);
    }

    size_t offset = 0;
    if (!WordToSize(head, frameLen, offset)) {
        return DecodeFailure("offset out of range for " + type);
    }
    const Byte* tail = frame + offset;
    size_t tailLen = frameLen - offset;

    const Byte* lengthWord = nullptr;
    size_t count = 0;
    if (!ReadWord(tail, tailLen, 0, lengthWord) ||
        !WordToSize(lengthWord, tailLen - WORD_SIZE, count)) {
        return DecodeFailure("length out of range for " + type);
    }
    const Byte* body = tail + WORD_SIZE;
    size_t bodyLen = tailLen - WORD_SIZE;

    if (type == "bytes") {
        return AbiValue::MakeBytes(chieftally::Bytes(body, body + count));
    }
    if (type == "string") {
        return AbiValue::MakeString(std::string(reinterpret_cast<const char*>(body), count));
    }

    std::string element = type.substr(0, type.size() - 2);
    if (count > bodyLen / WORD_SIZE) {
        return DecodeFailure("array length out of range for " + type);
    }
    std::vector<AbiValue> items;
    items.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        auto item = DecodeAt(element, body, bodyLen, i * WORD_SIZE);
        if (!item) return item.GetError();
        items.push_back(std::move(item.Value()));
    }
    return AbiValue::MakeArray(std::move(items));
}

} // namespace

Result<std::vector<AbiValue>> DecodeParams(const std::vector<std::string>& types,
                                           const Byte* data, size_t len) {
    std::vector<AbiValue> values;
    values.reserve(types.size());
    for (size_t i = 0; i < types.size(); ++i) {
        auto value = DecodeAt(types[i], data, len, i * WORD_SIZE);
        if (!value) return value.GetError();
        values.push_back(std::move(value.Value()));
    }
    return values;
}

Result<chieftally::Address> DecodeAddress(const chieftally::Bytes& data) {
    auto values = DecodeParams({"address"}, data);
    if (!values) return values.GetError();
    return values.Value()[0].GetAddress();
}

Result<BigNum> DecodeUint(const chieftally::Bytes& data) {
    auto values = DecodeParams({"uint256"}, data);
    if (!values) return values.GetError();
    return values.Value()[0].GetNumber();
}

Result<chieftally::Bytes> DecodeDynamicBytes(const chieftally::Bytes& data) {
    auto values = DecodeParams({"bytes"}, data);
    if (!values) return values.GetError();
    return values.Value()[0].GetBytes();
}

// ============================================================================
// Contract Interface
// ============================================================================

namespace {

/// Canonical type of an ABI JSON parameter, expanding tuples
std::string CanonicalType(const rpc::JSONValue& param) {
    std::string type = param["type"].GetString();
    if (type.compare(0, 5, "tuple") != 0) {
        if (type == "uint") return "uint256";
        if (type == "int") return "int256";
        return type;
    }
    std::string inner = "(";
    const rpc::JSONValue& components = param["components"];
    for (size_t i = 0; i < components.Size(); ++i) {
        if (i > 0) inner += ",";
        inner += CanonicalType(components[i]);
    }
    inner += ")";
    return inner + type.substr(5);
}

std::vector<AbiParam> ParseParams(const rpc::JSONValue& list) {
    std::vector<AbiParam> params;
    if (!list.IsArray()) return params;
    for (size_t i = 0; i < list.Size(); ++i) {
        params.push_back(AbiParam{list[i]["name"].GetString(), CanonicalType(list[i])});
    }
    return params;
}

std::string JoinSignature(const std::string& name, const std::vector<AbiParam>& inputs) {
    std::string sig = name + "(";
    for (size_t i = 0; i < inputs.size(); ++i) {
        if (i > 0) sig += ",";
        sig += inputs[i].type;
    }
    return sig + ")";
}

} // namespace

std::string AbiFunction::Signature() const {
    return JoinSignature(name, inputs);
}

std::string AbiEvent::Signature() const {
    return JoinSignature(name, inputs);
}

const AbiValue* DecodedCall::Find(const std::string& argName) const {
    for (const auto& [key, value] : args) {
        if (key == argName) return &value;
    }
    return nullptr;
}

Result<ContractInterface> ContractInterface::FromJSON(const std::string& abiJson) {
    auto parsed = rpc::JSONValue::TryParse(abiJson);
    if (!parsed || !parsed->IsArray()) {
        return Result<ContractInterface>::Fail(ErrorKind::Decode, "ABI is not a JSON array");
    }

    ContractInterface iface;
    iface.source_ = abiJson;
    for (size_t i = 0; i < parsed->Size(); ++i) {
        const rpc::JSONValue& entry = (*parsed)[i];
        if (!entry.IsObject()) continue;
        // Entries without a type are functions
        std::string kind = entry.HasKey("type") ? entry["type"].GetString() : "function";
        if (kind == "function") {
            AbiFunction fn;
            fn.name = entry["name"].GetString();
            fn.inputs = ParseParams(entry["inputs"]);
            fn.outputs = ParseParams(entry["outputs"]);
            iface.functions_.push_back(std::move(fn));
        } else if (kind == "event") {
            AbiEvent ev;
            ev.name = entry["name"].GetString();
            ev.inputs = ParseParams(entry["inputs"]);
            iface.events_.push_back(std::move(ev));
        }
    }
    LOG_TRACE(util::LogCategory::ABI) << "Parsed interface with " << iface.functions_.size()
                                      << " functions and " << iface.events_.size() << " events";
    return iface;
}

bool ContractInterface::HasFunction(const std::string& signature) const {
    for (const auto& fn : functions_) {
        if (fn.Signature() == signature) return true;
    }
    return false;
}

bool ContractInterface::HasEvent(const std::string& signature) const {
    for (const auto& ev : events_) {
        if (ev.Signature() == signature) return true;
    }
    return false;
}

const AbiFunction* ContractInterface::FindBySelector(const Selector& selector) const {
    for (const auto& fn : functions_) {
        if (fn.GetSelector() == selector) return &fn;
    }
    return nullptr;
}

Result<DecodedCall> ContractInterface::DecodeFunctionInput(const chieftally::Bytes& calldata) const {
    if (calldata.size() < 4) {
        return Result<DecodedCall>::Fail(ErrorKind::Decode, "calldata shorter than a selector");
    }
    Selector selector;
    std::memcpy(selector.data(), calldata.data(), selector.size());

    const AbiFunction* fn = FindBySelector(selector);
    if (!fn) {
        return Result<DecodedCall>::Fail(ErrorKind::InterfaceMismatch,
            "no function with selector " + BytesToHex(selector.data(), selector.size()));
    }

    std::vector<std::string> types;
    types.reserve(fn->inputs.size());
    for (const auto& param : fn->inputs) {
        types.push_back(param.type);
    }

    auto values = DecodeParams(types, calldata.data() + 4, calldata.size() - 4);
    if (!values) {
        return Result<DecodedCall>::Fail(ErrorKind::Decode,
            fn->Signature() + ": " + values.GetError().message);
    }

    DecodedCall call;
    call.name = fn->name;
    call.signature = fn->Signature();
    for (size_t i = 0; i < fn->inputs.size(); ++i) {
        call.args.emplace_back(fn->inputs[i].name, std::move(values.Value()[i]));
    }
    return call;
}

} // namespace eth
} // namespace chieftally
