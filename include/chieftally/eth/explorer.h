// CHIEFTALLY - Contract Interface Source
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License
//
// Fetches verified contract ABIs from an Etherscan-compatible explorer and
// keeps them in a persistent cache keyed by address.

#ifndef CHIEFTALLY_ETH_EXPLORER_H
#define CHIEFTALLY_ETH_EXPLORER_H

#include "chieftally/core/types.h"
#include "chieftally/db/database.h"
#include "chieftally/eth/abi.h"
#include "chieftally/eth/result.h"
#include "chieftally/rpc/client.h"

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace chieftally {
namespace eth {

// ============================================================================
// ABI Fetcher
// ============================================================================

/**
 * Source of ABI JSON for a contract address.
 */
class AbiFetcher {
public:
    virtual ~AbiFetcher() = default;

    /// ABI JSON array text; ErrorKind::Network when unavailable
    virtual Result<std::string> FetchAbi(const Address& address) = 0;
};

/**
 * Etherscan `module=contract&action=getabi&format=raw`.
 */
class EtherscanFetcher : public AbiFetcher {
public:
    struct Config {
        std::string url{"http://api.etherscan.io/api"};
        std::string apiKey;
        int timeoutSeconds{0};
        int retries{0};
    };

    explicit EtherscanFetcher(const Config& config);

    Result<std::string> FetchAbi(const Address& address) override;

    /// Request URL for an address
    std::string BuildRequestUrl(const Address& address) const;

private:
    Config config_;
    rpc::HttpClient http_;
};

// ============================================================================
// Interface Cache
// ============================================================================

/**
 * Address -> ContractInterface, populated on miss from the fetcher and
 * persisted in the database. Thread-safe.
 */
class InterfaceCache {
public:
    /// Both collaborators must outlive the cache
    InterfaceCache(db::Database& db, AbiFetcher& fetcher);

    InterfaceCache(const InterfaceCache&) = delete;
    InterfaceCache& operator=(const InterfaceCache&) = delete;

    /**
     * Interface of a contract.
     * Fails with Network if the explorer has no usable ABI and with Decode
     * if the stored ABI cannot be parsed.
     */
    Result<std::shared_ptr<const ContractInterface>> GetInterface(const Address& address);

    /// Fetches served from the explorer so far
    size_t GetFetchCount() const;

private:
    db::Database& db_;
    AbiFetcher& fetcher_;

    mutable std::mutex mutex_;
    std::map<Address, std::shared_ptr<const ContractInterface>> loaded_;
    size_t fetches_{0};

    static std::string MakeCacheKey(const Address& address);
};

} // namespace eth
} // namespace chieftally

#endif // CHIEFTALLY_ETH_EXPLORER_H
