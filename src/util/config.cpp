// CHIEFTALLY - Configuration File Parser Implementation
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License

#include "chieftally/util/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <pwd.h>
#include <unistd.h>

namespace chieftally {
namespace util {

namespace {

std::string Trim(const std::string& str) {
    const char* whitespace = " \t\r\n";
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    return str.substr(start, str.find_last_not_of(whitespace) - start + 1);
}

/// Strip matching quotes; double quotes also honor \n \t \\ \"
std::string Unquote(const std::string& str) {
    if (str.size() < 2 || str.front() != str.back() ||
        (str.front() != '"' && str.front() != '\'')) {
        return str;
    }
    std::string inner = str.substr(1, str.size() - 2);
    if (str.front() == '\'') {
        return inner;
    }

    std::string out;
    out.reserve(inner.size());
    for (size_t i = 0; i < inner.size(); ++i) {
        if (inner[i] != '\\' || i + 1 == inner.size()) {
            out += inner[i];
            continue;
        }
        switch (inner[i + 1]) {
            case 'n': out += '\n'; ++i; break;
            case 't': out += '\t'; ++i; break;
            case '\\': out += '\\'; ++i; break;
            case '"': out += '"'; ++i; break;
            default: out += inner[i]; break;
        }
    }
    return out;
}

bool IsValidKey(const std::string& key) {
    return !key.empty() && std::all_of(key.begin(), key.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
    });
}

} // namespace

// ============================================================================
// Expansion
// ============================================================================

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string result;
    size_t pos = 0;
    for (;;) {
        size_t open = value.find("${", pos);
        size_t close = open == std::string::npos ? open : value.find('}', open + 2);
        if (close == std::string::npos) {
            return result + value.substr(pos);
        }
        result += value.substr(pos, open - pos);
        const char* env = std::getenv(value.substr(open + 2, close - open - 2).c_str());
        if (env) {
            result += env;
        }
        pos = close + 1;
    }
}

std::string ConfigManager::ExpandTilde(const std::string& path) {
    if (path.empty() || path[0] != '~' || (path.size() > 1 && path[1] != '/')) {
        return path;
    }
    const char* home = std::getenv("HOME");
    if (!home) {
        struct passwd* pw = getpwuid(getuid());
        home = pw ? pw->pw_dir : nullptr;
    }
    return home ? std::string(home) + path.substr(1) : path;
}

std::string ConfigManager::GetDefaultDataDir() {
    return ExpandTilde(std::string("~/") + DEFAULT_DATADIR_NAME);
}

// ============================================================================
// Parsing
// ============================================================================

void ConfigManager::Store(const std::string& key, const std::string& value, Layer layer,
                          const std::string& source, int line) {
    auto it = entries_.find(key);
    if (it != entries_.end() && it->second.layer > layer) {
        return;
    }
    entries_[key] = Entry{value, layer, source, line};
}

ConfigParseResult ConfigManager::ParseStream(std::istream& stream, const std::string& source) {
    std::string section;
    std::string pending;
    std::string raw;
    int lineNum = 0;
    int startLine = 0;

    auto parseLine = [&](const std::string& text, int at) -> ConfigParseResult {
        std::string line = Trim(text);
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            return ConfigParseResult::Success();
        }
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end == std::string::npos) {
                return ConfigParseResult::Error("Missing closing bracket in section header",
                                                source, at);
            }
            section = Trim(line.substr(1, end - 1));
            return ConfigParseResult::Success();
        }

        std::string key;
        std::string value;
        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            key = line;
            value = "true";
            if (key.size() > 2 && key.compare(0, 2, "no") == 0 &&
                std::islower(static_cast<unsigned char>(key[2]))) {
                key = key.substr(2);
                value = "false";
            }
        } else {
            key = Trim(line.substr(0, eq));
            value = ExpandEnvVars(Unquote(Trim(line.substr(eq + 1))));
        }
        if (!IsValidKey(key)) {
            return ConfigParseResult::Error(key.empty() ? "Empty key" : "Invalid key: " + key,
                                            source, at);
        }

        Store(section.empty() ? key : section + "." + key, value, Layer::File, source, at);
        return ConfigParseResult::Success();
    };

    while (std::getline(stream, raw)) {
        ++lineNum;
        if (raw.size() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line too long (max " + std::to_string(MAX_LINE_LENGTH) + " characters)",
                source, lineNum);
        }
        if (pending.empty()) {
            startLine = lineNum;
        }
        if (!raw.empty() && raw.back() == '\\') {
            pending += raw.substr(0, raw.size() - 1);
            continue;
        }
        ConfigParseResult result = parseLine(pending + raw, startLine);
        pending.clear();
        if (!result.success) {
            return result;
        }
    }
    if (!pending.empty()) {
        return parseLine(pending, startLine);
    }
    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath) {
    std::string path = ExpandEnvVars(ExpandTilde(filePath));
    std::ifstream file(path);
    if (!file.is_open()) {
        return ConfigParseResult::Error("Cannot open file: " + path);
    }

    file.seekg(0, std::ios::end);
    if (file.tellg() > static_cast<std::streampos>(MAX_CONFIG_SIZE)) {
        return ConfigParseResult::Error(
            "Config file too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)", path);
    }
    file.seekg(0, std::ios::beg);
    return ParseStream(file, path);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName) {
    std::istringstream stream(content);
    return ParseStream(stream, sourceName);
}

// ============================================================================
// Values
// ============================================================================

std::optional<std::string> ConfigManager::TryGetString(const std::string& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.value;
}

std::string ConfigManager::GetString(const std::string& key, const std::string& defaultValue) const {
    return TryGetString(key).value_or(defaultValue);
}

std::optional<int64_t> ConfigManager::TryGetInt(const std::string& key) const {
    auto value = TryGetString(key);
    if (!value || value->empty()) {
        return std::nullopt;
    }
    try {
        size_t used = 0;
        int64_t result = std::stoll(*value, &used);
        if (used != value->size()) {
            return std::nullopt;
        }
        return result;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key) const {
    auto value = TryGetString(key);
    if (!value) {
        return std::nullopt;
    }
    std::string lower = *value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") return true;
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") return false;
    return std::nullopt;
}

bool ConfigManager::GetBool(const std::string& key, bool defaultValue) const {
    return TryGetBool(key).value_or(defaultValue);
}

std::string ConfigManager::GetPath(const std::string& key) const {
    return ExpandEnvVars(ExpandTilde(GetString(key, "")));
}

void ConfigManager::Set(const std::string& key, const std::string& value) {
    Store(key, value, Layer::CommandLine, "<command-line>", 0);
}

void ConfigManager::SetDefault(const std::string& key, const std::string& value) {
    Store(key, value, Layer::Default, "<default>", 0);
}

// ============================================================================
// Validation
// ============================================================================

void ConfigManager::AllowKey(const std::string& key) {
    allowedKeys_.insert(key);
}

std::vector<std::string> ConfigManager::Validate() const {
    std::vector<std::string> errors;
    if (allowedKeys_.empty()) {
        return errors;
    }
    for (const auto& [key, entry] : entries_) {
        if (allowedKeys_.count(key)) {
            continue;
        }
        std::string where = entry.source;
        if (entry.line > 0) {
            where += ":" + std::to_string(entry.line);
        }
        errors.push_back("Unknown key: " + key + " (defined in " + where + ")");
    }
    return errors;
}

} // namespace util
} // namespace chieftally
