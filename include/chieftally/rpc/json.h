// CHIEFTALLY - JSON Value
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License
//
// Minimal JSON document model used for JSON-RPC traffic, explorer replies,
// contract ABI descriptions and the tally report. Objects keep insertion
// order so that rendered reports list proposals in ranked order.

#ifndef CHIEFTALLY_RPC_JSON_H
#define CHIEFTALLY_RPC_JSON_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace chieftally {
namespace rpc {

class JSONValue;

// ============================================================================
// JSON Object - insertion-ordered key/value list
// ============================================================================

class JSONObject {
public:
    using Entry = std::pair<std::string, JSONValue>;
    using Storage = std::vector<Entry>;
    using iterator = Storage::iterator;
    using const_iterator = Storage::const_iterator;

    JSONObject();
    JSONObject(const JSONObject& other);
    JSONObject(JSONObject&& other) noexcept;
    JSONObject& operator=(const JSONObject& other);
    JSONObject& operator=(JSONObject&& other) noexcept;
    ~JSONObject();

    /// Find or append a key
    JSONValue& operator[](const std::string& key);

    /// Lookup without inserting
    const JSONValue* Find(const std::string& key) const;

    size_t count(const std::string& key) const { return Find(key) ? 1 : 0; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    void clear() { entries_.clear(); }

    iterator begin() { return entries_.begin(); }
    iterator end() { return entries_.end(); }
    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

private:
    Storage entries_;
};

// ============================================================================
// JSON Value - Simple JSON representation
// ============================================================================

/**
 * Represents a JSON value.
 * Supports: null, bool, int64, double, string, array, object
 */
class JSONValue {
public:
    enum class Type {
        Null,
        Bool,
        Int,
        Double,
        String,
        Array,
        Object
    };

    using Array = std::vector<JSONValue>;
    using Object = JSONObject;

    // Constructors
    JSONValue() : type_(Type::Null) {}
    JSONValue(std::nullptr_t) : type_(Type::Null) {}
    JSONValue(bool value) : type_(Type::Bool), boolValue_(value) {}
    JSONValue(int value) : type_(Type::Int), intValue_(value) {}
    JSONValue(int64_t value) : type_(Type::Int), intValue_(value) {}
    JSONValue(double value) : type_(Type::Double), doubleValue_(value) {}
    JSONValue(const char* value) : type_(Type::String), stringValue_(value) {}
    JSONValue(const std::string& value) : type_(Type::String), stringValue_(value) {}
    JSONValue(std::string&& value) : type_(Type::String), stringValue_(std::move(value)) {}
    JSONValue(const Array& value) : type_(Type::Array), arrayValue_(value) {}
    JSONValue(Array&& value) : type_(Type::Array), arrayValue_(std::move(value)) {}
    JSONValue(const Object& value) : type_(Type::Object), objectValue_(value) {}
    JSONValue(Object&& value) : type_(Type::Object), objectValue_(std::move(value)) {}

    // Type checking
    Type GetType() const { return type_; }
    bool IsNull() const { return type_ == Type::Null; }
    bool IsBool() const { return type_ == Type::Bool; }
    bool IsInt() const { return type_ == Type::Int; }
    bool IsDouble() const { return type_ == Type::Double; }
    bool IsNumber() const { return type_ == Type::Int || type_ == Type::Double; }
    bool IsString() const { return type_ == Type::String; }
    bool IsArray() const { return type_ == Type::Array; }
    bool IsObject() const { return type_ == Type::Object; }

    // Value getters (with defaults)
    bool GetBool(bool defaultValue = false) const;
    int64_t GetInt(int64_t defaultValue = 0) const;
    double GetDouble(double defaultValue = 0.0) const;
    const std::string& GetString(const std::string& defaultValue = "") const;
    const Array& GetArray() const;
    const Object& GetObject() const;

    // Object access
    bool HasKey(const std::string& key) const;
    const JSONValue& operator[](const std::string& key) const;
    JSONValue& operator[](const std::string& key);
    const JSONValue& operator[](const char* key) const { return (*this)[std::string(key)]; }
    JSONValue& operator[](const char* key) { return (*this)[std::string(key)]; }

    // Array access
    size_t Size() const;
    const JSONValue& operator[](size_t index) const;
    JSONValue& operator[](size_t index);
    void Push(const JSONValue& value);
    void Push(JSONValue&& value);

    // Serialization
    std::string ToJSON(bool pretty = false, int indent = 0) const;
    static JSONValue Parse(const std::string& json);
    static std::optional<JSONValue> TryParse(const std::string& json);

    /// Get a null value reference (for returning from accessors)
    static const JSONValue& Null();

private:
    Type type_;
    bool boolValue_{false};
    int64_t intValue_{0};
    double doubleValue_{0.0};
    std::string stringValue_;
    Array arrayValue_;
    Object objectValue_;
};

/// Escape and quote a string for JSON output
std::string QuoteJSONString(const std::string& str);

} // namespace rpc
} // namespace chieftally

#endif // CHIEFTALLY_RPC_JSON_H
