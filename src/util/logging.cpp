// KEYSEAL - Logging Implementation
// Copyright (c) 2024 KEYSEAL Developers
// MIT License

#include "keyseal/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>

#include <unistd.h>

namespace keyseal {
namespace util {

namespace {

constexpr const char* COLOR_RESET = "\033[0m";

const char* ColorFor(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        case LogLevel::Fatal: return "\033[35;1m";
        default:              return "";
    }
}

/// "2024-05-01 12:00:00.123" in local time
void AppendTimestamp(std::ostringstream& oss, std::chrono::system_clock::time_point tp) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis << std::setfill(' ') << ' ';
}

void AppendLevel(std::ostringstream& oss, LogLevel level) {
    oss << '[' << FixedWidth(LogLevelToString(level), 5) << "] ";
}

} // anonymous namespace

// ============================================================================
// Levels
// ============================================================================

const char* LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

LogLevel LogLevelFromString(const std::string& str) {
    std::string name;
    name.reserve(str.size());
    for (unsigned char c : str) {
        name += static_cast<char>(std::tolower(c));
    }

    if (name == "trace") return LogLevel::Trace;
    if (name == "debug") return LogLevel::Debug;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "fatal") return LogLevel::Fatal;
    if (name == "off" || name == "none") return LogLevel::Off;
    return LogLevel::Info;
}

std::string FixedWidth(const std::string& str, size_t width, char pad) {
    std::string out = str.substr(0, width);
    out.resize(width, pad);
    return out;
}

std::string GetBasename(const std::string& path) {
    size_t slash = path.find_last_of("/\\");
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

// ============================================================================
// ConsoleSink
// ============================================================================

std::string ConsoleSink::Format(const LogEntry& entry) const {
    std::ostringstream oss;
    if (config_.showTimestamp) {
        AppendTimestamp(oss, entry.timestamp);
    }
    AppendLevel(oss, entry.level);
    if (config_.showCategory && !entry.category.empty() &&
        entry.category != LogCategory::DEFAULT) {
        oss << '[' << entry.category << "] ";
    }
    oss << entry.message;
    return oss.str();
}

void ConsoleSink::Write(const LogEntry& entry) {
    if (entry.level < config_.level) {
        return;
    }
    const std::string line = Format(entry);

    std::lock_guard<std::mutex> lock(mutex_);
    FILE* out = config_.useStderr ? stderr : stdout;
    const char* color = ColorFor(entry.level);
    if (config_.useColors && *color != '\0' && isatty(fileno(out))) {
        std::fprintf(out, "%s%s%s\n", color, line.c_str(), COLOR_RESET);
    } else {
        std::fprintf(out, "%s\n", line.c_str());
    }
}

void ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(config_.useStderr ? stderr : stdout);
}

// ============================================================================
// FileSink
// ============================================================================

bool FileSink::Open() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
    file_.open(config_.path, config_.append ? (std::ios::out | std::ios::app) : std::ios::out);
    return file_.is_open();
}

void FileSink::Write(const LogEntry& entry) {
    if (entry.level < config_.level) {
        return;
    }

    std::ostringstream oss;
    AppendTimestamp(oss, entry.timestamp);
    AppendLevel(oss, entry.level);
    oss << '[' << entry.category << "] [" << entry.threadId << "] ";
    if (!entry.file.empty()) {
        oss << GetBasename(entry.file) << ':' << entry.line << ' ';
    }
    oss << entry.message << '\n';

    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_ << oss.str();
        file_.flush();
    }
}

void FileSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

void CallbackSink::Write(const LogEntry& entry) {
    if (callback_ && entry.level >= level_) {
        callback_(entry);
    }
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    Flush();
}

void Logger::AddSink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::RemoveSink(const std::shared_ptr<ILogSink>& sink) {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void Logger::ClearSinks() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.clear();
}

size_t Logger::SinkCount() const {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    return sinks_.size();
}

void Logger::EnableCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    enabledCategories_.insert(category);
    filterCategories_.store(true);
}

bool Logger::IsCategoryEnabled(const std::string& category) const {
    if (!filterCategories_.load()) {
        return true;
    }
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    return enabledCategories_.count(category) > 0;
}

void Logger::EnableAllCategories() {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    enabledCategories_.clear();
    filterCategories_.store(false);
}

void Logger::DisableAllCategories() {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    enabledCategories_.clear();
    filterCategories_.store(true);
}

bool Logger::WillLog(LogLevel level, const std::string& category) const {
    return level != LogLevel::Off && level >= level_.load() && IsCategoryEnabled(category);
}

void Logger::Log(LogLevel level, const std::string& category,
                 const std::string& message, const char* file, int line) {
    if (!WillLog(level, category)) {
        return;
    }

    LogEntry entry;
    entry.level = level;
    entry.category = category;
    entry.message = message;
    entry.file = file ? file : "";
    entry.line = line;
    entry.timestamp = std::chrono::system_clock::now();
    entry.threadId = std::this_thread::get_id();

    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Write(entry);
    }
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Flush();
    }
}

LogStream::~LogStream() {
    Logger::Instance().Log(level_, category_, stream_.str(), file_, line_);
}

// ============================================================================
// ScopedLogTimer
// ============================================================================

ScopedLogTimer::ScopedLogTimer(const std::string& category, const std::string& operation)
    : category_(category)
    , operation_(operation)
    , start_(std::chrono::steady_clock::now()) {
    Logger::Instance().Log(LogLevel::Debug, category_, "Starting: " + operation_);
}

ScopedLogTimer::~ScopedLogTimer() {
    Logger& logger = Logger::Instance();
    if (logger.WillLog(LogLevel::Debug, category_)) {
        logger.Log(LogLevel::Debug, category_,
                   "Completed: " + operation_ + " in " + std::to_string(ElapsedMillis()) + "ms");
    }
}

int64_t ScopedLogTimer::ElapsedMillis() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_).count();
}

// ============================================================================
// Setup
// ============================================================================

bool ConfigureLogging(const LogSettings& settings) {
    Logger& logger = Logger::Instance();

    logger.Flush();
    logger.ClearSinks();
    logger.SetLevel(settings.level);

    logger.EnableAllCategories();
    for (const auto& category : settings.categories) {
        logger.EnableCategory(category);
    }

    if (settings.printToConsole) {
        ConsoleSink::Config console;
        console.level = settings.level;
        logger.AddSink(std::make_shared<ConsoleSink>(console));
    }

    if (!settings.logFile.empty()) {
        FileSink::Config fileConfig;
        fileConfig.path = settings.logFile;
        fileConfig.level = settings.level;
        auto sink = std::make_shared<FileSink>(fileConfig);
        if (!sink->Open()) {
            return false;
        }
        logger.AddSink(std::move(sink));
    }

    return true;
}

} // namespace util
} // namespace keyseal
