// SPECTRE - Logging System
// Copyright (c) 2024 SPECTRE Developers
// MIT License
//
// Leveled, categorized logging shared by the daemon, the CLI and the tests:
// - Levels TRACE..FATAL plus OFF
// - Per-subsystem categories with an allow-list filter
// - Console, file and callback sinks
// - Stream-style and printf-style macros
//
// Private keys, blindings and assembled circuit inputs must never be passed
// to the logger.

#ifndef SPECTRE_UTIL_LOGGING_H
#define SPECTRE_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace spectre {
namespace util {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6
};

/// Convert log level to string
const char* LogLevelToString(LogLevel level);

/// Parse log level from string (case-insensitive); Info if unrecognized
LogLevel LogLevelFromString(const std::string& str);

/// Parse log level from string; std::nullopt if unrecognized
std::optional<LogLevel> TryParseLogLevel(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* HASHER = "hasher";
    constexpr const char* CIRCUITS = "circuits";
    constexpr const char* PROVER = "prover";
    constexpr const char* SHIELD = "shield";
    constexpr const char* WITHDRAW = "withdraw";
    constexpr const char* HTTP = "http";
    constexpr const char* CONFIG = "config";
    constexpr const char* BENCH = "bench";
}

// ============================================================================
// Log Entry
// ============================================================================

struct LogEntry {
    LogLevel level;
    std::string category;
    std::string message;
    std::string file;
    int line;
    std::chrono::system_clock::time_point timestamp;
    std::thread::id threadId;

    LogEntry() : level(LogLevel::Info), line(0) {}
};

// ============================================================================
// Log Sinks
// ============================================================================

/// Destination for formatted log entries
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;
    virtual void SetLevel(LogLevel level) = 0;
    virtual LogLevel GetLevel() const = 0;
};

/// Writes to stdout, or stderr for errors when configured
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};
        bool useStderr{true};
        bool showTimestamp{true};
        bool showCategory{true};
        bool showThread{false};
        LogLevel level{LogLevel::Info};
    };

    ConsoleSink();
    explicit ConsoleSink(const Config& config);

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { level_.store(level); }
    LogLevel GetLevel() const override { return level_.load(); }

private:
    Config config_;
    std::atomic<LogLevel> level_;
    std::mutex mutex_;

    std::string Format(const LogEntry& entry) const;
    static const char* GetColorCode(LogLevel level);
};

/// Appends to a file
class FileSink : public ILogSink {
public:
    struct Config {
        std::string path;
        bool append{true};
        bool autoFlush{false};
        LogLevel level{LogLevel::Debug};
    };

    explicit FileSink(const Config& config);
    ~FileSink() override;

    /// True once the file was opened successfully
    bool IsOpen() const;

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { level_.store(level); }
    LogLevel GetLevel() const override { return level_.load(); }

private:
    Config config_;
    std::atomic<LogLevel> level_;
    std::ofstream file_;
    mutable std::mutex mutex_;

    std::string Format(const LogEntry& entry) const;
};

/// Hands entries to a callback (used by tests to capture output)
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Trace);

    void Write(const LogEntry& entry) override;
    void Flush() override {}
    void SetLevel(LogLevel level) override { level_.store(level); }
    LogLevel GetLevel() const override { return level_.load(); }

private:
    Callback callback_;
    std::atomic<LogLevel> level_;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& Instance();

    /// Install a default console sink once
    void Initialize();

    /// Flush and drop all sinks
    void Shutdown();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// Restrict output to the enabled categories
    void EnableCategory(const std::string& category);
    void DisableCategory(const std::string& category);
    bool IsCategoryEnabled(const std::string& category) const;
    void EnableAllCategories();

    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0);

    void LogF(LogLevel level, const std::string& category,
              const char* file, int line, const char* format, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 6, 7)))
#endif
        ;

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
    std::unordered_set<std::string> enabledCategories_;
    mutable std::mutex categoriesMutex_;
    std::atomic<bool> allCategoriesEnabled_{true};

    std::atomic<bool> initialized_{false};
};

// ============================================================================
// Log Stream
// ============================================================================

/// Collects a message and emits it on destruction
class LogStream {
public:
    LogStream(LogLevel level, const std::string& category, const char* file, int line);
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
    std::string category_;
    const char* file_;
    int line_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define SPECTRE_LOGGER ::spectre::util::Logger::Instance()

#define SPECTRE_LOG_ENABLED(level, category) \
    SPECTRE_LOGGER.WillLog(::spectre::util::LogLevel::level, category)

#define SPECTRE_LOG(level, category) \
    if (!SPECTRE_LOG_ENABLED(level, category)) {} else \
        ::spectre::util::LogStream(::spectre::util::LogLevel::level, category, \
                                   __FILE__, __LINE__)

#define LOG_TRACE(category)   SPECTRE_LOG(Trace, category)
#define LOG_DEBUG(category)   SPECTRE_LOG(Debug, category)
#define LOG_INFO(category)    SPECTRE_LOG(Info, category)
#define LOG_WARN(category)    SPECTRE_LOG(Warn, category)
#define LOG_ERROR(category)   SPECTRE_LOG(Error, category)
#define LOG_FATAL(category)   SPECTRE_LOG(Fatal, category)

#define SPECTRE_LOGF(level, category, ...) \
    do { \
        if (SPECTRE_LOG_ENABLED(level, category)) { \
            SPECTRE_LOGGER.LogF(::spectre::util::LogLevel::level, category, \
                                __FILE__, __LINE__, __VA_ARGS__); \
        } \
    } while (0)

#define LogTraceF(category, ...)  SPECTRE_LOGF(Trace, category, __VA_ARGS__)
#define LogDebugF(category, ...)  SPECTRE_LOGF(Debug, category, __VA_ARGS__)
#define LogInfoF(category, ...)   SPECTRE_LOGF(Info, category, __VA_ARGS__)
#define LogWarnF(category, ...)   SPECTRE_LOGF(Warn, category, __VA_ARGS__)
#define LogErrorF(category, ...)  SPECTRE_LOGF(Error, category, __VA_ARGS__)

// ============================================================================
// Scoped Log Timer
// ============================================================================

/// Logs the duration of a scope at Info level ("<operation> took N ms")
class ScopedLogTimer {
public:
    ScopedLogTimer(const std::string& category, const std::string& operation);
    ~ScopedLogTimer();

    ScopedLogTimer(const ScopedLogTimer&) = delete;
    ScopedLogTimer& operator=(const ScopedLogTimer&) = delete;

    /// Milliseconds since construction
    int64_t ElapsedMs() const;

private:
    std::string category_;
    std::string operation_;
    std::chrono::steady_clock::time_point start_;
};

#define SPECTRE_CONCAT_INNER(a, b) a##b
#define SPECTRE_CONCAT(a, b) SPECTRE_CONCAT_INNER(a, b)

#define SPECTRE_LOG_TIMER(category, operation) \
    ::spectre::util::ScopedLogTimer SPECTRE_CONCAT(spectre_timer_, __LINE__)(category, operation)

// ============================================================================
// Utility Functions
// ============================================================================

/// "YYYY-MM-DD HH:MM:SS.mmm" in local time
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// File name without directories
std::string GetBasename(const std::string& path);

} // namespace util
} // namespace spectre

#endif // SPECTRE_UTIL_LOGGING_H
