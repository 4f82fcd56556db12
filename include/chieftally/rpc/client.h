// CHIEFTALLY - RPC Client
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License
//
// Plain HTTP transport plus a JSON-RPC 2.0 client used to talk to an
// Ethereum node and to an Etherscan-compatible explorer.
//
// Each request opens its own connection (Connection: close), so one
// client may be shared by every worker of a fan-out phase.

#ifndef CHIEFTALLY_RPC_CLIENT_H
#define CHIEFTALLY_RPC_CLIENT_H

#include "chieftally/rpc/json.h"

#include <atomic>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace chieftally {
namespace rpc {

// ============================================================================
// RPC Error Codes (JSON-RPC 2.0 standard + transport)
// ============================================================================

namespace ErrorCode {
    // Standard JSON-RPC 2.0 errors
    constexpr int PARSE_ERROR = -32700;
    constexpr int INVALID_REQUEST = -32600;
    constexpr int METHOD_NOT_FOUND = -32601;
    constexpr int INVALID_PARAMS = -32602;
    constexpr int INTERNAL_ERROR = -32603;

    // Server errors (-32000 to -32099); nodes report failed eth_call here
    constexpr int SERVER_ERROR = -32000;

    // EIP-1474 execution reverted
    constexpr int EXECUTION_REVERTED = 3;

    // Client-side transport failures
    constexpr int NETWORK_ERROR = -10;
    constexpr int HTTP_ERROR = -11;
}

// ============================================================================
// URL
// ============================================================================

/// Components of an http:// URL
struct ParsedUrl {
    std::string host;
    uint16_t port{80};
    std::string path{"/"};   // Includes the query string
};

/// Parse an http:// URL; returns nullopt for other schemes or bad input
std::optional<ParsedUrl> ParseUrl(const std::string& url);

/// Percent-encode a query component
std::string UrlEncode(const std::string& value);

// ============================================================================
// HTTP Transport
// ============================================================================

/// Raised by HttpClient on connection, send or receive failure
class HttpError : public std::runtime_error {
public:
    explicit HttpError(const std::string& what) : std::runtime_error(what) {}
};

/// Decoded HTTP response
struct HttpResponse {
    int statusCode{0};
    std::string body;
};

/**
 * Minimal blocking HTTP/1.1 client over POSIX sockets.
 */
class HttpClient {
public:
    /// Configuration
    struct Config {
        int timeoutSeconds{0};   // Socket send/receive timeout; 0 = none
    };

    HttpClient() = default;
    explicit HttpClient(const Config& config) : config_(config) {}

    /// POST a body; throws HttpError on transport failure
    HttpResponse Post(const std::string& url, const std::string& body,
                      const std::string& contentType = "application/json") const;

    /// GET a resource; throws HttpError on transport failure
    HttpResponse Get(const std::string& url) const;

    const Config& GetConfig() const { return config_; }

    /// Build a raw HTTP request
    static std::string BuildHTTPRequest(const std::string& method, const ParsedUrl& url,
                                        const std::string& body,
                                        const std::string& contentType);

    /// Parse a raw HTTP response (handles chunked encoding)
    static bool ParseHTTPResponse(const std::string& raw, std::string& body, int& statusCode);

private:
    Config config_;

    HttpResponse Send(const std::string& method, const std::string& url,
                      const std::string& body, const std::string& contentType) const;

    /// Connect, send request, read until the response is complete
    std::string Exchange(const ParsedUrl& url, const std::string& request) const;
};

// ============================================================================
// RPC Request
// ============================================================================

/**
 * Represents a JSON-RPC 2.0 request.
 */
class RPCRequest {
public:
    RPCRequest() = default;
    RPCRequest(const std::string& method, const JSONValue& params = JSONValue(),
               const JSONValue& id = JSONValue());

    /// Get the method name
    const std::string& GetMethod() const { return method_; }

    /// Get parameters
    const JSONValue& GetParams() const { return params_; }

    /// Get request ID
    const JSONValue& GetId() const { return id_; }

    /// Serialize to JSON
    std::string ToJSON() const;

private:
    std::string method_;
    JSONValue params_;
    JSONValue id_;
};

// ============================================================================
// RPC Response
// ============================================================================

/**
 * Represents a JSON-RPC 2.0 response.
 */
class RPCResponse {
public:
    /// Create success response
    static RPCResponse Success(const JSONValue& result, const JSONValue& id);

    /// Create error response
    static RPCResponse Error(int code, const std::string& message,
                            const JSONValue& id, const JSONValue& data = JSONValue());

    /// Check if response is an error
    bool IsError() const { return isError_; }

    /// True if the failure happened before the node answered
    bool IsTransportError() const {
        return isError_ && (errorCode_ == ErrorCode::NETWORK_ERROR ||
                            errorCode_ == ErrorCode::HTTP_ERROR);
    }

    /// Get result (for success responses)
    const JSONValue& GetResult() const { return result_; }

    /// Get error code
    int GetErrorCode() const { return errorCode_; }

    /// Get error message
    const std::string& GetErrorMessage() const { return errorMessage_; }

    /// Get error data
    const JSONValue& GetErrorData() const { return errorData_; }

    /// Get response ID
    const JSONValue& GetId() const { return id_; }

    /// Parse a response body
    static RPCResponse FromJSON(const JSONValue& parsed);

private:
    bool isError_{false};
    JSONValue result_;
    int errorCode_{0};
    std::string errorMessage_;
    JSONValue errorData_;
    JSONValue id_;
};

// ============================================================================
// RPC Client Configuration
// ============================================================================

/**
 * RPC client configuration.
 */
struct RPCClientConfig {
    /// Endpoint, e.g. http://127.0.0.1:8545
    std::string url{"http://127.0.0.1:8545"};

    /// Socket timeout (seconds); 0 = none
    int timeoutSeconds{0};

    /// Extra attempts after a transport failure; 0 = none
    int retries{0};
};

// ============================================================================
// RPC Client
// ============================================================================

/**
 * JSON-RPC 2.0 client.
 */
class RPCClient {
public:
    RPCClient();
    explicit RPCClient(const RPCClientConfig& config);

    // Non-copyable
    RPCClient(const RPCClient&) = delete;
    RPCClient& operator=(const RPCClient&) = delete;

    /// Get configuration
    const RPCClientConfig& GetConfig() const { return config_; }

    /// Call an RPC method; transport and protocol failures come back as
    /// error responses
    RPCResponse Call(const std::string& method, const JSONValue& params = JSONValue());

    /// Get total calls made
    uint64_t GetTotalCalls() const { return totalCalls_.load(); }

    /// Get total errors
    uint64_t GetTotalErrors() const { return totalErrors_.load(); }

private:
    RPCClientConfig config_;
    HttpClient http_;

    std::atomic<int64_t> nextId_{1};
    std::atomic<uint64_t> totalCalls_{0};
    std::atomic<uint64_t> totalErrors_{0};

    /// Single attempt
    RPCResponse CallOnce(const RPCRequest& req);
};

} // namespace rpc
} // namespace chieftally

#endif // CHIEFTALLY_RPC_CLIENT_H
