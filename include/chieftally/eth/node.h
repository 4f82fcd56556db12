// CHIEFTALLY - Ethereum Node Client
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License
//
// Read-only view of an Ethereum node: filtered log queries and eth_call.
// The pipeline depends only on the abstract NodeClient; RPCNodeClient talks
// JSON-RPC to a real node.

#ifndef CHIEFTALLY_ETH_NODE_H
#define CHIEFTALLY_ETH_NODE_H

#include "chieftally/core/types.h"
#include "chieftally/eth/result.h"
#include "chieftally/rpc/client.h"
#include "chieftally/rpc/json.h"

#include <cstdint>
#include <optional>
#include <vector>

namespace chieftally {
namespace eth {

// ============================================================================
// Logs
// ============================================================================

/// One entry returned by eth_getLogs
struct LogEntry {
    Address address;
    std::vector<Hash256> topics;
    Bytes data;
    uint64_t blockNumber{0};
    uint64_t logIndex{0};
    Hash256 transactionHash;

    /// Position in the chain's total order of logs
    bool operator<(const LogEntry& other) const {
        if (blockNumber != other.blockNumber) return blockNumber < other.blockNumber;
        return logIndex < other.logIndex;
    }
};

/// eth_getLogs filter
struct LogFilter {
    Address address;

    /// Per position, the set of accepted topics; an empty set matches any
    std::vector<std::vector<Hash256>> topics;

    uint64_t fromBlock{0};

    /// nullopt means "latest"
    std::optional<uint64_t> toBlock;

    /// JSON params object for eth_getLogs
    rpc::JSONValue ToJSON() const;
};

// ============================================================================
// Node Client Interface
// ============================================================================

/**
 * Abstract read-only node. Implementations must be safe to call from
 * several worker threads at once.
 */
class NodeClient {
public:
    virtual ~NodeClient() = default;

    /// Logs matching the filter, in node order
    virtual Result<std::vector<LogEntry>> GetLogs(const LogFilter& filter) = 0;

    /**
     * eth_call against the latest block.
     * A reverted call or an empty return is ErrorKind::Range.
     */
    virtual Result<Bytes> Call(const Address& to, const Bytes& data) = 0;

    /// Latest block number
    virtual Result<uint64_t> BlockNumber() = 0;
};

// ============================================================================
// JSON-RPC Node Client
// ============================================================================

class RPCNodeClient : public NodeClient {
public:
    /// The client must outlive this object
    explicit RPCNodeClient(rpc::RPCClient& client);

    Result<std::vector<LogEntry>> GetLogs(const LogFilter& filter) override;
    Result<Bytes> Call(const Address& to, const Bytes& data) override;
    Result<uint64_t> BlockNumber() override;

    /// Parse one eth_getLogs result entry
    static Result<LogEntry> ParseLog(const rpc::JSONValue& entry);

    /// Classify a failed eth_call response: Range for a revert, Network
    /// for transport failures and aborted or timed-out execution
    static Error ClassifyCallError(const rpc::RPCResponse& response);

private:
    rpc::RPCClient& client_;
};

} // namespace eth
} // namespace chieftally

#endif // CHIEFTALLY_ETH_NODE_H
