// CHIEFTALLY - Logging System
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License
//
// Diagnostic log shared by every pipeline stage. Entries carry a level
// and a category and fan out to the registered sinks. The logger starts
// with no sinks; the CLI installs them.
//
// stdout is reserved for the tally report, so the console sink writes to
// stderr.

#ifndef CHIEFTALLY_UTIL_LOGGING_H
#define CHIEFTALLY_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace chieftally {
namespace util {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace = 0,   // Per-call RPC detail
    Debug = 1,   // Decisions and phase timings
    Info = 2,    // Pipeline progress
    Warn = 3,    // Recovered failures
    Error = 4,   // Fatal to the run
};

const char* LogLevelToString(LogLevel level);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* CHIEF = "chief";
    constexpr const char* SLATES = "slates";
    constexpr const char* VOTERS = "voters";
    constexpr const char* TALLY = "tally";
    constexpr const char* SPELL = "spell";
    constexpr const char* RPC = "rpc";
    constexpr const char* ABI = "abi";
    constexpr const char* DB = "db";
    constexpr const char* BENCH = "bench";
}

// ============================================================================
// Sinks
// ============================================================================

struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    std::string file;
    int line{0};
    std::chrono::system_clock::time_point timestamp;
    std::thread::id threadId;
};

class ILogSink {
public:
    virtual ~ILogSink() = default;

    /// Called for every entry that passes the logger's level; sinks
    /// filter further on their own level
    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;

    virtual LogLevel GetLevel() const = 0;
};

/// Writes "[LEVEL] [category] message" lines to stderr, colored on a TTY
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool showCategory{true};
        LogLevel level{LogLevel::Info};
    };

    ConsoleSink() = default;
    explicit ConsoleSink(const Config& config) : config_(config) {}

    void Write(const LogEntry& entry) override;
    void Flush() override;
    LogLevel GetLevel() const override { return config_.level; }

private:
    Config config_;
    std::mutex mutex_;
};

/// Appends timestamped entries with thread id and source location
class FileSink : public ILogSink {
public:
    explicit FileSink(const std::string& path, LogLevel level = LogLevel::Debug);

    bool IsOpen() const { return file_.is_open(); }

    void Write(const LogEntry& entry) override;
    void Flush() override;
    LogLevel GetLevel() const override { return level_; }

private:
    std::ofstream file_;
    std::mutex mutex_;
    LogLevel level_;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& Instance();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void ClearSinks();
    size_t SinkCount() const;

    /// Global minimum level, checked before a message is formatted
    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    bool WillLog(LogLevel level) const { return level >= level_.load(); }

    void Log(LogLevel level, const std::string& category, const std::string& message,
             const char* file = nullptr, int line = 0);

    void Flush();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;
    std::atomic<LogLevel> level_{LogLevel::Info};
};

// ============================================================================
// Log Stream
// ============================================================================

/// Collects one message and hands it to the logger on destruction
class LogStream {
public:
    LogStream(LogLevel level, const char* category, const char* file, int line)
        : level_(level), category_(category), file_(file), line_(line) {}
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    std::ostringstream stream_;
    LogLevel level_;
    const char* category_;
    const char* file_;
    int line_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define CHIEFTALLY_LOGGER ::chieftally::util::Logger::Instance()

#define CHIEFTALLY_LOG(level, category) \
    if (CHIEFTALLY_LOGGER.WillLog(::chieftally::util::LogLevel::level)) \
        ::chieftally::util::LogStream(::chieftally::util::LogLevel::level, category, __FILE__, __LINE__)

#define LOG_TRACE(category)   CHIEFTALLY_LOG(Trace, category)
#define LOG_DEBUG(category)   CHIEFTALLY_LOG(Debug, category)
#define LOG_INFO(category)    CHIEFTALLY_LOG(Info, category)
#define LOG_WARN(category)    CHIEFTALLY_LOG(Warn, category)
#define LOG_ERROR(category)   CHIEFTALLY_LOG(Error, category)

// ============================================================================
// Scoped Log Timer
// ============================================================================

/// Logs "Starting: op" and "Completed: op in Nms" at Debug
class ScopedLogTimer {
public:
    ScopedLogTimer(const char* category, std::string operation);
    ~ScopedLogTimer();

private:
    const char* category_;
    std::string operation_;
    std::chrono::steady_clock::time_point start_;
};

#define CHIEFTALLY_CONCAT_INNER(a, b) a##b
#define CHIEFTALLY_CONCAT(a, b) CHIEFTALLY_CONCAT_INNER(a, b)

#define CHIEFTALLY_LOG_TIMER(category, operation) \
    ::chieftally::util::ScopedLogTimer CHIEFTALLY_CONCAT(_chieftally_timer_, __LINE__)(category, operation)

} // namespace util
} // namespace chieftally

#endif // CHIEFTALLY_UTIL_LOGGING_H
