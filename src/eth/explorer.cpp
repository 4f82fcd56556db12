// CHIEFTALLY - Contract Interface Source Implementation
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License

#include "chieftally/eth/explorer.h"
#include "chieftally/rpc/json.h"
#include "chieftally/util/logging.h"

namespace chieftally {
namespace eth {

// ============================================================================
// EtherscanFetcher
// ============================================================================

EtherscanFetcher::EtherscanFetcher(const Config& config)
    : config_(config), http_(rpc::HttpClient::Config{config.timeoutSeconds}) {}

std::string EtherscanFetcher::BuildRequestUrl(const Address& address) const {
    std::string url = config_.url;
    url += (url.find('?') == std::string::npos) ? "?" : "&";
    url += "module=contract&action=getabi&format=raw&address=" + address.ToHex();
    if (!config_.apiKey.empty()) {
        url += "&apikey=" + rpc::UrlEncode(config_.apiKey);
    }
    return url;
}

Result<std::string> EtherscanFetcher::FetchAbi(const Address& address) {
    const std::string url = BuildRequestUrl(address);
    rpc::HttpResponse response;
    for (int attempt = 0; ; ++attempt) {
        try {
            response = http_.Get(url);
            break;
        } catch (const rpc::HttpError& e) {
            if (attempt >= config_.retries) {
                return Result<std::string>::Fail(ErrorKind::Network,
                    "explorer unreachable: " + std::string(e.what()));
            }
            LOG_DEBUG(util::LogCategory::ABI) << "Retrying getabi for " << address.ToHex()
                                              << " after: " << e.what();
        }
    }

    // Unverified contracts come back as a status object or plain text
    auto parsed = rpc::JSONValue::TryParse(response.body);
    if (response.statusCode != 200 || !parsed || !parsed->IsArray()) {
        return Result<std::string>::Fail(ErrorKind::Network,
            "no interface for " + address.ToChecksumHex());
    }
    LOG_DEBUG(util::LogCategory::ABI) << "Fetched interface for " << address.ToChecksumHex();
    return response.body;
}

// ============================================================================
// InterfaceCache
// ============================================================================

InterfaceCache::InterfaceCache(db::Database& db, AbiFetcher& fetcher)
    : db_(db), fetcher_(fetcher) {}

std::string InterfaceCache::MakeCacheKey(const Address& address) {
    return db::MakeKey(db::prefix::INTERFACE, address.data(), address.size());
}

size_t InterfaceCache::GetFetchCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fetches_;
}

Result<std::shared_ptr<const ContractInterface>> InterfaceCache::GetInterface(const Address& address) {
    using IfaceResult = Result<std::shared_ptr<const ContractInterface>>;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = loaded_.find(address);
        if (it != loaded_.end()) {
            return it->second;
        }
    }

    const std::string key = MakeCacheKey(address);
    std::string abiJson;
    db::Status status = db_.Get(key, &abiJson);
    bool fromStore = status.ok();
    if (!fromStore) {
        if (!status.IsNotFound()) {
            LOG_WARN(util::LogCategory::DB) << "Interface cache read failed: " << status.ToString();
        }
        auto fetched = fetcher_.FetchAbi(address);
        if (!fetched) {
            return fetched.GetError();
        }
        abiJson = fetched.Value();
    }

    auto iface = ContractInterface::FromJSON(abiJson);
    if (!iface) {
        return IfaceResult::Fail(iface.GetError().kind,
            address.ToChecksumHex() + ": " + iface.GetError().message);
    }

    if (!fromStore) {
        db::Status put = db_.Put(key, abiJson);
        if (!put.ok()) {
            LOG_WARN(util::LogCategory::DB) << "Interface cache write failed: " << put.ToString();
        }
    }

    auto shared = std::make_shared<const ContractInterface>(std::move(iface.Value()));
    std::lock_guard<std::mutex> lock(mutex_);
    if (!fromStore) ++fetches_;
    auto inserted = loaded_.emplace(address, shared);
    LOG_TRACE(util::LogCategory::ABI) << "Interface for " << address.ToChecksumHex()
                                      << (fromStore ? " loaded from cache" : " fetched");
    return inserted.first->second;
}

} // namespace eth
} // namespace chieftally
