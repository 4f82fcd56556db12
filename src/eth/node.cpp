// CHIEFTALLY - Ethereum Node Client Implementation
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License

#include "chieftally/eth/node.h"
#include "chieftally/core/hex.h"
#include "chieftally/util/logging.h"

#include <algorithm>
#include <cctype>

namespace chieftally {
namespace eth {

namespace {

std::string Lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

Error NetworkFailure(const std::string& what) {
    return Error{ErrorKind::Network, what};
}

} // namespace

// ============================================================================
// LogFilter
// ============================================================================

rpc::JSONValue LogFilter::ToJSON() const {
    rpc::JSONValue obj{rpc::JSONValue::Object{}};
    obj["address"] = address.ToHex();

    rpc::JSONValue topicList{rpc::JSONValue::Array{}};
    for (const auto& position : topics) {
        if (position.empty()) {
            topicList.Push(rpc::JSONValue());
            continue;
        }
        rpc::JSONValue alternatives{rpc::JSONValue::Array{}};
        for (const auto& topic : position) {
            alternatives.Push(topic.ToHex());
        }
        topicList.Push(std::move(alternatives));
    }
    obj["topics"] = std::move(topicList);

    obj["fromBlock"] = ToHexQuantity(fromBlock);
    obj["toBlock"] = toBlock ? ToHexQuantity(*toBlock) : std::string("latest");
    return obj;
}

// ============================================================================
// RPCNodeClient
// ============================================================================

RPCNodeClient::RPCNodeClient(rpc::RPCClient& client) : client_(client) {}

Result<LogEntry> RPCNodeClient::ParseLog(const rpc::JSONValue& entry) {
    if (!entry.IsObject()) {
        return NetworkFailure("log entry is not an object");
    }
    try {
        LogEntry log;
        log.address = Address::FromHex(entry["address"].GetString());
        const rpc::JSONValue& topics = entry["topics"];
        for (size_t i = 0; i < topics.Size(); ++i) {
            log.topics.push_back(Hash256::FromHex(topics[i].GetString()));
        }
        log.data = HexToBytes(entry["data"].GetString());
        log.blockNumber = ParseHexQuantity(entry["blockNumber"].GetString());
        log.logIndex = ParseHexQuantity(entry["logIndex"].GetString());
        if (entry.HasKey("transactionHash") && entry["transactionHash"].IsString()) {
            log.transactionHash = Hash256::FromHex(entry["transactionHash"].GetString());
        }
        return log;
    } catch (const std::invalid_argument& e) {
        return NetworkFailure(std::string("malformed log entry: ") + e.what());
    }
}

Result<std::vector<LogEntry>> RPCNodeClient::GetLogs(const LogFilter& filter) {
    rpc::JSONValue params{rpc::JSONValue::Array{}};
    params.Push(filter.ToJSON());

    rpc::RPCResponse response = client_.Call("eth_getLogs", params);
    if (response.IsError()) {
        return NetworkFailure("eth_getLogs: " + response.GetErrorMessage());
    }
    const rpc::JSONValue& result = response.GetResult();
    if (!result.IsArray()) {
        return NetworkFailure("eth_getLogs: result is not an array");
    }

    std::vector<LogEntry> logs;
    logs.reserve(result.Size());
    for (size_t i = 0; i < result.Size(); ++i) {
        auto log = ParseLog(result[i]);
        if (!log) return log.GetError();
        logs.push_back(std::move(log.Value()));
    }
    LOG_DEBUG(util::LogCategory::RPC) << "eth_getLogs returned " << logs.size() << " entries";
    return logs;
}

Error RPCNodeClient::ClassifyCallError(const rpc::RPCResponse& response) {
    if (response.IsTransportError()) {
        return NetworkFailure("eth_call: " + response.GetErrorMessage());
    }
    int code = response.GetErrorCode();
    std::string message = Lowercase(response.GetErrorMessage());
    // A call cut short by the node says nothing about the contract
    if (message.find("timeout") != std::string::npos ||
        message.find("execution aborted") != std::string::npos) {
        return NetworkFailure("eth_call: " + response.GetErrorMessage());
    }
    if (code == rpc::ErrorCode::EXECUTION_REVERTED ||
        message.find("revert") != std::string::npos ||
        message.find("invalid opcode") != std::string::npos) {
        return Error{ErrorKind::Range, "eth_call reverted: " + response.GetErrorMessage()};
    }
    return NetworkFailure("eth_call: " + response.GetErrorMessage());
}

Result<Bytes> RPCNodeClient::Call(const Address& to, const Bytes& data) {
    rpc::JSONValue tx{rpc::JSONValue::Object{}};
    tx["to"] = to.ToHex();
    tx["data"] = BytesToHexPrefixed(data);

    rpc::JSONValue params{rpc::JSONValue::Array{}};
    params.Push(std::move(tx));
    params.Push(rpc::JSONValue("latest"));

    rpc::RPCResponse response = client_.Call("eth_call", params);
    if (response.IsError()) {
        return ClassifyCallError(response);
    }
    const rpc::JSONValue& result = response.GetResult();
    if (!result.IsString()) {
        return NetworkFailure("eth_call: result is not a string");
    }

    Bytes out;
    try {
        out = HexToBytes(result.GetString());
    } catch (const std::invalid_argument& e) {
        return NetworkFailure(std::string("eth_call: ") + e.what());
    }
    if (out.empty()) {
        return Result<Bytes>::Fail(ErrorKind::Range, "eth_call returned no data");
    }
    return out;
}

Result<uint64_t> RPCNodeClient::BlockNumber() {
    rpc::RPCResponse response = client_.Call("eth_blockNumber", rpc::JSONValue(rpc::JSONValue::Array{}));
    if (response.IsError()) {
        return NetworkFailure("eth_blockNumber: " + response.GetErrorMessage());
    }
    try {
        return ParseHexQuantity(response.GetResult().GetString());
    } catch (const std::invalid_argument& e) {
        return NetworkFailure(std::string("eth_blockNumber: ") + e.what());
    }
}

} // namespace eth
} // namespace chieftally
