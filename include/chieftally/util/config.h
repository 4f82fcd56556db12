// CHIEFTALLY - Configuration File Parser
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License
//
// INI-style configuration for chief-tally:
// - Lines starting with # or ; are comments
// - key=value pairs, values optionally quoted
// - A bare "key" means key=true and "nokey" means key=false
// - [section] headers prefix the following keys as "section.key"
// - A trailing backslash continues the line
// - ${VAR} expands from the environment

#ifndef CHIEFTALLY_UTIL_CONFIG_H
#define CHIEFTALLY_UTIL_CONFIG_H

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace chieftally {
namespace util {

/// Default data directory name, under $HOME
constexpr const char* DEFAULT_DATADIR_NAME = ".chieftally";

constexpr const char* DEFAULT_CONFIG_FILENAME = "chieftally.conf";

constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;
constexpr size_t MAX_LINE_LENGTH = 4096;

struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};

    static ConfigParseResult Success() { return {true, "", "", 0}; }

    static ConfigParseResult Error(const std::string& msg, const std::string& file = "",
                                   int line = 0) {
        return {false, msg, file, line};
    }
};

/**
 * Layered key-value configuration.
 *
 * Priority order (highest to lowest):
 * 1. Command-line values (Set)
 * 2. Config file values (ParseFile, ParseString)
 * 3. Built-in defaults (SetDefault)
 */
class ConfigManager {
public:
    ConfigParseResult ParseFile(const std::string& filePath);
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    std::optional<std::string> TryGetString(const std::string& key) const;
    std::string GetString(const std::string& key, const std::string& defaultValue) const;

    /// nullopt if absent or not a whole decimal integer
    std::optional<int64_t> TryGetInt(const std::string& key) const;

    /// Accepts true/false, yes/no, on/off, 1/0; nullopt otherwise
    std::optional<bool> TryGetBool(const std::string& key) const;
    bool GetBool(const std::string& key, bool defaultValue) const;

    /// String value with ~ and ${VAR} expanded; empty if absent
    std::string GetPath(const std::string& key) const;

    void Set(const std::string& key, const std::string& value);
    void SetDefault(const std::string& key, const std::string& value);

    /// Once any key is allowed, Validate reports every other key
    void AllowKey(const std::string& key);
    std::vector<std::string> Validate() const;

    /// ~/.chieftally
    static std::string GetDefaultDataDir();

    static std::string ExpandEnvVars(const std::string& value);
    static std::string ExpandTilde(const std::string& path);

private:
    enum class Layer { Default, File, CommandLine };

    struct Entry {
        std::string value;
        Layer layer{Layer::Default};
        std::string source;
        int line{0};
    };

    ConfigParseResult ParseStream(std::istream& stream, const std::string& source);
    void Store(const std::string& key, const std::string& value, Layer layer,
               const std::string& source, int line);

    std::map<std::string, Entry> entries_;
    std::set<std::string> allowedKeys_;
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    constexpr const char* CONF = "conf";

    // Endpoints
    constexpr const char* RPCURL = "rpcurl";
    constexpr const char* EXPLORERURL = "explorerurl";
    constexpr const char* EXPLORERKEY = "explorerkey";

    // Contract
    constexpr const char* CHIEF = "chief";
    constexpr const char* FROMBLOCK = "fromblock";

    // Execution
    constexpr const char* WORKERS = "workers";
    constexpr const char* CACHEDIR = "cachedir";
    constexpr const char* TIMEOUT = "timeout";
    constexpr const char* RETRIES = "retries";
    constexpr const char* MAXSPELLS = "maxspells";

    // Output
    constexpr const char* JSON = "json";
    constexpr const char* COLOR = "color";
    constexpr const char* DEBUG = "debug";
    constexpr const char* QUIET = "quiet";
    constexpr const char* LOGFILE = "logfile";
}

} // namespace util
} // namespace chieftally

#endif // CHIEFTALLY_UTIL_CONFIG_H
