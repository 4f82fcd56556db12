// CHIEFTALLY - Run Settings
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License
//
// Typed view of the configuration used by one tally run.

#ifndef CHIEFTALLY_CHIEF_SETTINGS_H
#define CHIEFTALLY_CHIEF_SETTINGS_H

#include "chieftally/core/types.h"
#include "chieftally/util/config.h"

#include <cstdint>
#include <optional>
#include <string>

namespace chieftally {
namespace chief {

struct Settings {
    std::string rpcUrl;
    std::string explorerUrl;
    std::string explorerKey;
    Address chief;
    uint64_t fromBlock{0};

    /// Pool size for each fan-out phase
    size_t workers{10};

    /// LevelDB cache directory; empty disables persistence
    std::string cacheDir;

    /// 0 means none
    int timeoutSeconds{0};
    int retries{0};

    /// Spells decoded for the top N proposals; 0 means all
    size_t maxSpells{0};

    bool json{false};

    /// nullopt means "if stdout is a terminal"
    std::optional<bool> color;

    bool debug{false};
    bool quiet{false};
    std::string logFile;
};

/// Allow every known key and register built-in defaults
void RegisterSettings(util::ConfigManager& config);

/**
 * Build settings from a populated config.
 * Throws std::invalid_argument on unknown keys or invalid values.
 */
Settings LoadSettings(const util::ConfigManager& config);

} // namespace chief
} // namespace chieftally

#endif // CHIEFTALLY_CHIEF_SETTINGS_H
