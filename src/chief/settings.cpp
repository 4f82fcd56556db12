// CHIEFTALLY - Run Settings Implementation
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License

#include "chieftally/chief/settings.h"
#include "chieftally/chief/contract.h"

#include <stdexcept>

namespace chieftally {
namespace chief {

namespace {

int64_t RequireInt(const util::ConfigManager& config, const char* key, int64_t min) {
    auto raw = config.TryGetString(key);
    auto value = config.TryGetInt(key);
    if (!value || *value < min) {
        throw std::invalid_argument(std::string("Invalid value for ") + key + ": " +
                                    raw.value_or(""));
    }
    return *value;
}

} // namespace

void RegisterSettings(util::ConfigManager& config) {
    using namespace util::ConfigKeys;
    for (const char* key : {CONF, RPCURL, EXPLORERURL, EXPLORERKEY, CHIEF, FROMBLOCK, WORKERS,
                            CACHEDIR, TIMEOUT, RETRIES, MAXSPELLS, JSON, COLOR, DEBUG, QUIET,
                            LOGFILE}) {
        config.AllowKey(key);
    }

    config.SetDefault(RPCURL, "http://127.0.0.1:8545");
    config.SetDefault(EXPLORERURL, "http://api.etherscan.io/api");
    config.SetDefault(CHIEF, DEFAULT_CHIEF_ADDRESS);
    config.SetDefault(FROMBLOCK, std::to_string(DEFAULT_CHIEF_BLOCK));
    config.SetDefault(WORKERS, "10");
    config.SetDefault(CACHEDIR, util::ConfigManager::GetDefaultDataDir() + "/cache");
    config.SetDefault(TIMEOUT, "0");
    config.SetDefault(RETRIES, "0");
    config.SetDefault(MAXSPELLS, "0");
}

Settings LoadSettings(const util::ConfigManager& config) {
    using namespace util::ConfigKeys;

    std::vector<std::string> errors = config.Validate();
    if (!errors.empty()) {
        throw std::invalid_argument(errors.front());
    }

    Settings s;
    s.rpcUrl = config.GetString(RPCURL, "");
    s.explorerUrl = config.GetString(EXPLORERURL, "");
    s.explorerKey = config.GetString(EXPLORERKEY, "");

    std::string chief = config.GetString(CHIEF, "");
    try {
        s.chief = Address::FromHex(chief);
    } catch (const std::invalid_argument&) {
        throw std::invalid_argument("Invalid chief address: " + chief);
    }

    s.fromBlock = static_cast<uint64_t>(RequireInt(config, FROMBLOCK, 0));
    s.workers = static_cast<size_t>(RequireInt(config, WORKERS, 1));
    s.cacheDir = config.GetPath(CACHEDIR);
    s.timeoutSeconds = static_cast<int>(RequireInt(config, TIMEOUT, 0));
    s.retries = static_cast<int>(RequireInt(config, RETRIES, 0));
    s.maxSpells = static_cast<size_t>(RequireInt(config, MAXSPELLS, 0));

    s.json = config.GetBool(JSON, false);
    s.color = config.TryGetBool(COLOR);
    s.debug = config.GetBool(DEBUG, false);
    s.quiet = config.GetBool(QUIET, false);
    s.logFile = config.GetPath(LOGFILE);
    return s;
}

} // namespace chief
} // namespace chieftally
