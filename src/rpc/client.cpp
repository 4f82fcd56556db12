// CHIEFTALLY - RPC Client Implementation
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License

#include "chieftally/rpc/client.h"
#include "chieftally/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <sstream>

#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace chieftally {
namespace rpc {

namespace {

/// Closes a socket on scope exit
class SocketHolder {
public:
    explicit SocketHolder(int fd) : fd_(fd) {}
    ~SocketHolder() {
        if (fd_ >= 0) {
            close(fd_);
        }
    }
    SocketHolder(const SocketHolder&) = delete;
    SocketHolder& operator=(const SocketHolder&) = delete;

    int Get() const { return fd_; }

private:
    int fd_;
};

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    return s;
}

/// True once the buffered response holds the full body
bool ResponseComplete(const std::string& response) {
    size_t headerEnd = response.find("\r\n\r\n");
    if (headerEnd == std::string::npos) {
        return false;
    }

    std::string lowerHeaders = ToLower(response.substr(0, headerEnd));
    size_t bodyStart = headerEnd + 4;

    if (lowerHeaders.find("transfer-encoding: chunked") != std::string::npos) {
        // Final chunk is "0\r\n" followed by optional trailers and "\r\n"
        std::string body = response.substr(bodyStart);
        return body.compare(0, 5, "0\r\n\r\n") == 0 ||
               body.find("\r\n0\r\n\r\n") != std::string::npos;
    }

    size_t clPos = lowerHeaders.find("content-length:");
    if (clPos == std::string::npos) {
        // Read until the peer closes
        return false;
    }
    size_t clEnd = lowerHeaders.find("\r\n", clPos);
    std::string clStr = lowerHeaders.substr(clPos + 15, clEnd - clPos - 15);
    try {
        size_t contentLength = std::stoul(clStr);
        return response.size() >= bodyStart + contentLength;
    } catch (const std::exception&) {
        return false;
    }
}

} // anonymous namespace

// ============================================================================
// URL Helpers
// ============================================================================

std::optional<ParsedUrl> ParseUrl(const std::string& url) {
    const std::string scheme = "http://";
    if (ToLower(url.substr(0, scheme.size())) != scheme) {
        return std::nullopt;
    }

    std::string rest = url.substr(scheme.size());
    size_t pathStart = rest.find_first_of("/?");
    std::string authority = rest.substr(0, pathStart);

    ParsedUrl parsed;
    if (pathStart != std::string::npos) {
        parsed.path = rest.substr(pathStart);
        if (parsed.path[0] == '?') {
            parsed.path = "/" + parsed.path;
        }
    }

    size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
        std::string portStr = authority.substr(colon + 1);
        if (portStr.empty() || portStr.size() > 5 ||
            !std::all_of(portStr.begin(), portStr.end(), ::isdigit)) {
            return std::nullopt;
        }
        unsigned long port = std::stoul(portStr);
        if (port == 0 || port > 65535) {
            return std::nullopt;
        }
        parsed.port = static_cast<uint16_t>(port);
        authority = authority.substr(0, colon);
    }

    if (authority.empty()) {
        return std::nullopt;
    }
    parsed.host = authority;
    return parsed;
}

std::string UrlEncode(const std::string& value) {
    static const char hex[] = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

// ============================================================================
// HttpClient Implementation
// ============================================================================

HttpResponse HttpClient::Post(const std::string& url, const std::string& body,
                              const std::string& contentType) const {
    return Send("POST", url, body, contentType);
}

HttpResponse HttpClient::Get(const std::string& url) const {
    return Send("GET", url, "", "");
}

HttpResponse HttpClient::Send(const std::string& method, const std::string& url,
                              const std::string& body, const std::string& contentType) const {
    auto parsed = ParseUrl(url);
    if (!parsed) {
        throw HttpError("Unsupported URL (http:// only): " + url);
    }

    std::string raw = Exchange(*parsed, BuildHTTPRequest(method, *parsed, body, contentType));

    HttpResponse response;
    if (!ParseHTTPResponse(raw, response.body, response.statusCode)) {
        throw HttpError("Invalid HTTP response from " + parsed->host);
    }
    return response;
}

std::string HttpClient::Exchange(const ParsedUrl& url, const std::string& request) const {
    struct addrinfo hints, *result;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    std::string portStr = std::to_string(url.port);

    int status = getaddrinfo(url.host.c_str(), portStr.c_str(), &hints, &result);
    if (status != 0) {
        throw HttpError("Failed to resolve host: " + url.host);
    }

    int fd = -1;
    for (struct addrinfo* p = result; p != nullptr; p = p->ai_next) {
        fd = socket(p->ai_family, p->ai_socktype, p->ai_protocol);
        if (fd < 0) continue;

        if (config_.timeoutSeconds > 0) {
            struct timeval tv;
            tv.tv_sec = config_.timeoutSeconds;
            tv.tv_usec = 0;
            setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
            setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
        }

        if (connect(fd, p->ai_addr, p->ai_addrlen) == 0) {
            break;
        }

        close(fd);
        fd = -1;
    }
    freeaddrinfo(result);

    if (fd < 0) {
        throw HttpError("Failed to connect to " + url.host + ":" + portStr);
    }
    SocketHolder sock(fd);

    size_t totalSent = 0;
    while (totalSent < request.size()) {
        ssize_t sent = send(sock.Get(), request.data() + totalSent,
                            request.size() - totalSent, MSG_NOSIGNAL);
        if (sent <= 0) {
            throw HttpError("Send failed to " + url.host);
        }
        totalSent += static_cast<size_t>(sent);
    }

    std::string response;
    char buffer[8192];
    while (true) {
        ssize_t received = recv(sock.Get(), buffer, sizeof(buffer), 0);
        if (received < 0) {
            throw HttpError("Receive failed from " + url.host);
        }
        if (received == 0) break;

        response.append(buffer, static_cast<size_t>(received));
        if (ResponseComplete(response)) {
            break;
        }
    }

    return response;
}

std::string HttpClient::BuildHTTPRequest(const std::string& method, const ParsedUrl& url,
                                         const std::string& body,
                                         const std::string& contentType) {
    std::ostringstream ss;

    ss << method << " " << url.path << " HTTP/1.1\r\n";
    ss << "Host: " << url.host;
    if (url.port != 80) {
        ss << ":" << url.port;
    }
    ss << "\r\n";
    ss << "User-Agent: chief-tally\r\n";
    ss << "Accept: application/json\r\n";
    if (!contentType.empty()) {
        ss << "Content-Type: " << contentType << "\r\n";
    }
    if (method != "GET" || !body.empty()) {
        ss << "Content-Length: " << body.size() << "\r\n";
    }
    ss << "Connection: close\r\n";
    ss << "\r\n";
    ss << body;

    return ss.str();
}

bool HttpClient::ParseHTTPResponse(const std::string& raw, std::string& body, int& statusCode) {
    size_t statusEnd = raw.find("\r\n");
    if (statusEnd == std::string::npos) return false;

    // e.g. "HTTP/1.1 200 OK"
    std::string statusLine = raw.substr(0, statusEnd);
    size_t codeStart = statusLine.find(' ');
    if (codeStart == std::string::npos || codeStart + 4 > statusLine.size()) return false;

    try {
        statusCode = std::stoi(statusLine.substr(codeStart + 1, 3));
    } catch (const std::exception&) {
        return false;
    }

    size_t headersEnd = raw.find("\r\n\r\n");
    if (headersEnd == std::string::npos) return false;
    size_t bodyStart = headersEnd + 4;

    std::string lowerHeaders = ToLower(raw.substr(0, headersEnd));

    if (lowerHeaders.find("transfer-encoding: chunked") == std::string::npos) {
        body = raw.substr(bodyStart);
        return true;
    }

    body.clear();
    std::string rawBody = raw.substr(bodyStart);
    size_t pos = 0;

    while (pos < rawBody.size()) {
        size_t lineEnd = rawBody.find("\r\n", pos);
        if (lineEnd == std::string::npos) return false;

        std::string sizeStr = rawBody.substr(pos, lineEnd - pos);
        size_t extPos = sizeStr.find(';');
        if (extPos != std::string::npos) {
            sizeStr = sizeStr.substr(0, extPos);
        }

        size_t chunkSize;
        try {
            chunkSize = std::stoul(sizeStr, nullptr, 16);
        } catch (const std::exception&) {
            return false;
        }

        if (chunkSize == 0) {
            return true;
        }

        pos = lineEnd + 2;
        if (pos + chunkSize > rawBody.size()) return false;
        body += rawBody.substr(pos, chunkSize);
        pos += chunkSize;

        if (rawBody.compare(pos, 2, "\r\n") == 0) {
            pos += 2;
        }
    }

    // Connection closed before the terminating chunk
    return false;
}

// ============================================================================
// RPCRequest Implementation
// ============================================================================

RPCRequest::RPCRequest(const std::string& method, const JSONValue& params,
                       const JSONValue& id)
    : method_(method), params_(params), id_(id) {}

std::string RPCRequest::ToJSON() const {
    JSONValue::Object obj;
    obj["jsonrpc"] = "2.0";
    obj["method"] = method_;
    obj["params"] = params_.IsNull() ? JSONValue(JSONValue::Array{}) : params_;
    obj["id"] = id_;
    return JSONValue(obj).ToJSON();
}

// ============================================================================
// RPCResponse Implementation
// ============================================================================

RPCResponse RPCResponse::Success(const JSONValue& result, const JSONValue& id) {
    RPCResponse resp;
    resp.isError_ = false;
    resp.result_ = result;
    resp.id_ = id;
    return resp;
}

RPCResponse RPCResponse::Error(int code, const std::string& message,
                               const JSONValue& id, const JSONValue& data) {
    RPCResponse resp;
    resp.isError_ = true;
    resp.errorCode_ = code;
    resp.errorMessage_ = message;
    resp.errorData_ = data;
    resp.id_ = id;
    return resp;
}

RPCResponse RPCResponse::FromJSON(const JSONValue& parsed) {
    if (!parsed.IsObject()) {
        return Error(ErrorCode::PARSE_ERROR, "Response is not an object", JSONValue());
    }
    if (parsed.HasKey("error") && !parsed["error"].IsNull()) {
        const auto& err = parsed["error"];
        return Error(static_cast<int>(err["code"].GetInt(ErrorCode::INTERNAL_ERROR)),
                     err["message"].GetString("Unknown error"),
                     parsed["id"], err["data"]);
    }
    if (!parsed.HasKey("result")) {
        return Error(ErrorCode::INVALID_REQUEST, "Response has neither result nor error",
                     parsed["id"]);
    }
    return Success(parsed["result"], parsed["id"]);
}

// ============================================================================
// RPCClient Implementation
// ============================================================================

RPCClient::RPCClient() : RPCClient(RPCClientConfig{}) {}

RPCClient::RPCClient(const RPCClientConfig& config)
    : config_(config), http_(HttpClient::Config{config.timeoutSeconds}) {}

RPCResponse RPCClient::Call(const std::string& method, const JSONValue& params) {
    RPCRequest req(method, params, JSONValue(nextId_.fetch_add(1)));

    RPCResponse resp = CallOnce(req);
    for (int attempt = 0; attempt < config_.retries && resp.IsTransportError(); ++attempt) {
        LOG_DEBUG(util::LogCategory::RPC) << "Retrying " << method << " after: "
                                          << resp.GetErrorMessage();
        resp = CallOnce(req);
    }
    return resp;
}

RPCResponse RPCClient::CallOnce(const RPCRequest& req) {
    ++totalCalls_;
    LOG_TRACE(util::LogCategory::RPC) << "-> " << req.GetMethod() << " "
                                      << req.GetParams().ToJSON();

    HttpResponse http;
    try {
        http = http_.Post(config_.url, req.ToJSON());
    } catch (const HttpError& e) {
        ++totalErrors_;
        return RPCResponse::Error(ErrorCode::NETWORK_ERROR, e.what(), req.GetId());
    }

    // Nodes return JSON-RPC errors with HTTP 200; other statuses may still
    // carry a JSON-RPC body
    auto parsed = JSONValue::TryParse(http.body);
    if (!parsed) {
        ++totalErrors_;
        if (http.statusCode != 200) {
            return RPCResponse::Error(ErrorCode::HTTP_ERROR,
                                      "HTTP status " + std::to_string(http.statusCode),
                                      req.GetId());
        }
        return RPCResponse::Error(ErrorCode::PARSE_ERROR, "Invalid JSON response", req.GetId());
    }

    RPCResponse resp = RPCResponse::FromJSON(*parsed);
    if (resp.IsError()) {
        ++totalErrors_;
        LOG_TRACE(util::LogCategory::RPC) << "<- " << req.GetMethod() << " error "
                                          << resp.GetErrorCode() << ": "
                                          << resp.GetErrorMessage();
    }
    return resp;
}

} // namespace rpc
} // namespace chieftally
