// CHIEFTALLY - External Call Results
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License
//
// Every call to the node or the explorer returns a Result carrying either
// a value or a classified Error.

#ifndef CHIEFTALLY_ETH_RESULT_H
#define CHIEFTALLY_ETH_RESULT_H

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace chieftally {
namespace eth {

// ============================================================================
// Error Taxonomy
// ============================================================================

enum class ErrorKind {
    Network,            // Node or explorer unreachable, or malformed reply
    Decode,             // Payload does not match any known signature
    Range,              // Call reverted; ends indexed lookups
    InterfaceMismatch,  // Declared ABI lacks the expected function
};

const char* ErrorKindToString(ErrorKind kind);

struct Error {
    ErrorKind kind{ErrorKind::Network};
    std::string message;

    std::string ToString() const {
        return std::string(ErrorKindToString(kind)) + ": " + message;
    }
};

// ============================================================================
// Result
// ============================================================================

/**
 * Value or Error.
 */
template<typename T>
class Result {
public:
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}
    Result(const Error& error) : data_(error) {}
    Result(Error&& error) : data_(std::move(error)) {}

    static Result Fail(ErrorKind kind, const std::string& message) {
        return Result(Error{kind, message});
    }

    bool IsOk() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return IsOk(); }

    /// Throws std::logic_error when holding an error
    const T& Value() const {
        if (!IsOk()) throw std::logic_error("Result holds " + GetError().ToString());
        return std::get<T>(data_);
    }
    T& Value() {
        if (!IsOk()) throw std::logic_error("Result holds " + GetError().ToString());
        return std::get<T>(data_);
    }

    const T& operator*() const { return Value(); }
    const T* operator->() const { return &Value(); }

    /// Only valid when !IsOk()
    const Error& GetError() const { return std::get<Error>(data_); }

    bool Is(ErrorKind kind) const { return !IsOk() && GetError().kind == kind; }

private:
    std::variant<T, Error> data_;
};

} // namespace eth
} // namespace chieftally

#endif // CHIEFTALLY_ETH_RESULT_H
