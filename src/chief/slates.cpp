// CHIEFTALLY - Slate Resolution Implementation
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License

#include "chieftally/chief/slates.h"
#include "chieftally/util/logging.h"

namespace chieftally {
namespace chief {

// ============================================================================
// SlateCache
// ============================================================================

SlateCache::SlateCache(db::Database& store) : store_(store) {}

std::string SlateCache::Serialize(const std::vector<Proposal>& members) {
    std::string out;
    out.reserve(members.size() * Proposal::SIZE);
    for (const auto& member : members) {
        out.append(reinterpret_cast<const char*>(member.data()), member.size());
    }
    return out;
}

std::optional<std::vector<Proposal>> SlateCache::Deserialize(const std::string& value) {
    if (value.size() % Proposal::SIZE != 0) {
        return std::nullopt;
    }
    std::vector<Proposal> members;
    members.reserve(value.size() / Proposal::SIZE);
    for (size_t pos = 0; pos < value.size(); pos += Proposal::SIZE) {
        members.emplace_back(reinterpret_cast<const Byte*>(value.data() + pos), Proposal::SIZE);
    }
    return members;
}

std::optional<std::vector<Proposal>> SlateCache::Get(const Hash256& slate) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = memory_.find(slate);
        if (it != memory_.end()) return it->second;
    }

    std::string value;
    db::Status status = store_.Get(db::MakeKey(db::prefix::SLATE, slate.data(), slate.size()), &value);
    if (!status.ok()) {
        if (!status.IsNotFound()) {
            LOG_WARN(util::LogCategory::DB) << "Slate cache read failed: " << status.ToString();
        }
        return std::nullopt;
    }
    auto members = Deserialize(value);
    if (!members) {
        LOG_WARN(util::LogCategory::DB) << "Ignoring corrupt slate cache entry " << slate.ToHex();
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    memory_.emplace(slate, *members);
    return members;
}

void SlateCache::Put(const Hash256& slate, const std::vector<Proposal>& members) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        memory_[slate] = members;
    }
    if (members.empty()) return;

    db::Status status = store_.Put(db::MakeKey(db::prefix::SLATE, slate.data(), slate.size()),
                                   Serialize(members));
    if (!status.ok()) {
        LOG_WARN(util::LogCategory::DB) << "Slate cache write failed: " << status.ToString();
    }
}

size_t SlateCache::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return memory_.size();
}

// ============================================================================
// SlateResolver
// ============================================================================

SlateResolver::SlateResolver(ChiefContract& chief, SlateCache& cache)
    : chief_(chief), cache_(cache) {}

eth::Result<std::vector<Proposal>> SlateResolver::Resolve(const Hash256& slate) {
    if (auto cached = cache_.Get(slate)) {
        return *cached;
    }

    std::vector<Proposal> members;
    for (uint64_t index = 0; ; ++index) {
        auto member = chief_.SlateMember(slate, index);
        if (member.Is(eth::ErrorKind::Range)) {
            break;
        }
        if (!member) {
            return member.GetError();
        }
        if (member.Value().IsNull()) {
            break;
        }
        members.push_back(member.Value());
    }

    LOG_TRACE(util::LogCategory::SLATES) << "Slate " << slate.ToHex() << " has "
                                         << members.size() << " members";
    cache_.Put(slate, members);
    return members;
}

std::vector<Proposal> SlateResolver::ResolveOrEmpty(const Hash256& slate) {
    auto members = Resolve(slate);
    if (!members) {
        LOG_WARN(util::LogCategory::SLATES) << "Treating slate " << slate.ToHex()
                                            << " as empty: " << members.GetError().ToString();
        return {};
    }
    return members.Value();
}

SlateMap SlateResolver::ResolveAll(const std::vector<Hash256>& slates, util::ThreadPool& pool) {
    CHIEFTALLY_LOG_TIMER(util::LogCategory::SLATES, "resolve slates");

    auto results = util::ParallelMap(pool, slates,
        [this](const Hash256& slate) { return Resolve(slate); });

    SlateMap resolved;
    size_t failures = 0;
    std::string lastError;
    for (size_t i = 0; i < slates.size(); ++i) {
        if (results[i]) {
            resolved[slates[i]] = std::move(results[i].Value());
            continue;
        }
        ++failures;
        lastError = results[i].GetError().ToString();
        LOG_WARN(util::LogCategory::SLATES) << "Treating slate " << slates[i].ToHex()
                                            << " as empty: " << lastError;
        resolved[slates[i]] = {};
    }

    if (!slates.empty() && failures == slates.size()) {
        throw ChiefError(eth::ErrorKind::Network,
                         "all " + std::to_string(failures) + " slates failed to resolve, last: " + lastError);
    }
    LOG_DEBUG(util::LogCategory::SLATES) << "Resolved " << (slates.size() - failures) << " of "
                                         << slates.size() << " slates";
    return resolved;
}

} // namespace chief
} // namespace chieftally
