// KEYSEAL - Logging System
// Copyright (c) 2024 KEYSEAL Developers
// MIT License
//
// Process-wide logger used by the keystore, the KDFs and the tool.
// Entries carry a level and a category; sinks decide where they go.
// Async derivations log from pool workers, so every sink locks.
//
// Nothing secret (passwords, derived material, plaintext keys) is ever
// passed to the logger.

#ifndef KEYSEAL_UTIL_LOGGING_H
#define KEYSEAL_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace keyseal {
namespace util {

// ============================================================================
// Levels and Categories
// ============================================================================

enum class LogLevel {
    Trace = 0,
    Debug = 1,   // Cost parameters, timings
    Info = 2,
    Warn = 3,    // MAC failures, suspicious input
    Error = 4,
    Fatal = 5,
    Off = 6
};

const char* LogLevelToString(LogLevel level);

/// Case-insensitive; "warning" and "none" are accepted, unknown names give Info
LogLevel LogLevelFromString(const std::string& str);

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* KEYSTORE = "keystore";
    constexpr const char* KDF = "kdf";
    constexpr const char* CRYPTO = "crypto";
    constexpr const char* TOOL = "tool";
}

struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    std::string file;
    int line{0};
    std::chrono::system_clock::time_point timestamp;
    std::thread::id threadId;
};

// ============================================================================
// Sinks
// ============================================================================

/// Abstract base class for log output destinations
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;
    virtual void SetLevel(LogLevel level) = 0;
    virtual LogLevel GetLevel() const = 0;
};

/// Writes to the terminal. The tool prints records and keys on stdout,
/// so log lines go to stderr unless useStderr is cleared.
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};           // Only honoured on a tty
        bool useStderr{true};
        bool showTimestamp{true};
        bool showCategory{true};        // "default" is never shown
        LogLevel level{LogLevel::Info};
    };

    ConsoleSink() = default;
    explicit ConsoleSink(const Config& config) : config_(config) {}

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

    /// Render an entry as a single line (no trailing newline)
    std::string Format(const LogEntry& entry) const;

private:
    Config config_;
    std::mutex mutex_;
};

/// Appends to a file with thread id and source location on every line
class FileSink : public ILogSink {
public:
    struct Config {
        std::string path;
        bool append{true};
        LogLevel level{LogLevel::Debug};
    };

    explicit FileSink(const Config& config) : config_(config) {}

    /// Open config.path; false if it cannot be opened
    bool Open();

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

private:
    Config config_;
    std::ofstream file_;
    std::mutex mutex_;
};

/// Forwards entries to a callback (used by tests)
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Info)
        : callback_(std::move(callback)), level_(level) {}

    void Write(const LogEntry& entry) override;
    void Flush() override {}
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

private:
    Callback callback_;
    LogLevel level_;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& Instance();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// Once any category is enabled, only enabled categories are logged
    void EnableCategory(const std::string& category);
    bool IsCategoryEnabled(const std::string& category) const;
    void EnableAllCategories();
    void DisableAllCategories();

    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0);

    bool WillLog(LogLevel level, const std::string& category) const;

    void Flush();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::atomic<bool> filterCategories_{false};
    std::set<std::string> enabledCategories_;
    mutable std::mutex categoriesMutex_;
};

// ============================================================================
// Stream Logging
// ============================================================================

/// Collects a message with operator<< and hands it to the Logger on destruction
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

// The level check happens before any operand of << is evaluated
#define KEYSEAL_LOG(level, category) \
    if (!::keyseal::util::Logger::Instance().WillLog( \
            ::keyseal::util::LogLevel::level, category)) {} else \
        ::keyseal::util::LogStream(::keyseal::util::LogLevel::level, category, \
                                   __FILE__, __LINE__)

#define LOG_TRACE(category)   KEYSEAL_LOG(Trace, category)
#define LOG_DEBUG(category)   KEYSEAL_LOG(Debug, category)
#define LOG_INFO(category)    KEYSEAL_LOG(Info, category)
#define LOG_WARN(category)    KEYSEAL_LOG(Warn, category)
#define LOG_ERROR(category)   KEYSEAL_LOG(Error, category)
#define LOG_FATAL(category)   KEYSEAL_LOG(Fatal, category)

/// Logs "Starting: <op>" and "Completed: <op> in Nms" at Debug
class ScopedLogTimer {
public:
    ScopedLogTimer(const std::string& category, const std::string& operation);
    ~ScopedLogTimer();

    int64_t ElapsedMillis() const;

private:
    std::string category_;
    std::string operation_;
    std::chrono::steady_clock::time_point start_;
};

// ============================================================================
// Setup
// ============================================================================

/// Logging setup as read from the config file and command line
struct LogSettings {
    LogLevel level{LogLevel::Warn};
    bool printToConsole{true};
    std::string logFile;                    // Empty: no file sink
    std::vector<std::string> categories;    // Empty: all categories
};

/// Replace the logger's sinks and filters with the given settings.
/// @return false if logFile was set but could not be opened
bool ConfigureLogging(const LogSettings& settings);

/// Pad or cut to exactly width characters
std::string FixedWidth(const std::string& str, size_t width, char pad = ' ');

std::string GetBasename(const std::string& path);

} // namespace util
} // namespace keyseal

#endif // KEYSEAL_UTIL_LOGGING_H
