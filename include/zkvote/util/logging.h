// ZKVOTE - Logging System
// Copyright (c) 2024 ZKVOTE Developers
// MIT License
//
// Provides a flexible logging system with:
// - Multiple log levels (TRACE, DEBUG, INFO, WARN, ERROR, FATAL)
// - Log categories for filtering
// - Console, file and callback sinks
// - Thread-safe logging
// - Printf-style and stream-style interfaces

#ifndef ZKVOTE_UTIL_LOGGING_H
#define ZKVOTE_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace zkvote {
namespace util {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace = 0,   // Very detailed debugging
    Debug = 1,   // Rejections and internal decisions
    Info = 2,    // Committed operations
    Warn = 3,    // Unsafe configuration
    Error = 4,   // Store and verifier failures
    Fatal = 5,   // Unrecoverable startup errors
    Off = 6      // Disable logging
};

const char* LogLevelToString(LogLevel level);

/// Parse log level from string (case-insensitive, defaults to Info)
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* BALLOT = "ballot";
    constexpr const char* REGISTRY = "registry";
    constexpr const char* LEDGER = "ledger";
    constexpr const char* TALLY = "tally";
    constexpr const char* VERIFY = "verify";
    constexpr const char* DB = "db";
    constexpr const char* CONFIG = "config";
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
    std::string function;
    std::chrono::system_clock::time_point timestamp;
    std::thread::id threadId;

    LogEntry() : level(LogLevel::Info), line(0) {}
};

// ============================================================================
// Log Sink Interface
// ============================================================================

class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;

    virtual void Flush() = 0;

    virtual void SetLevel(LogLevel level) = 0;

    virtual LogLevel GetLevel() const = 0;
};

// ============================================================================
// Console Sink
// ============================================================================

/// Log sink that writes to stdout, or stderr for errors if configured
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};           // ANSI colors when attached to a tty
        bool useStderr{true};           // Errors go to stderr
        bool showTimestamp{true};
        bool showLevel{true};
        bool showCategory{true};
        LogLevel level{LogLevel::Info};
    };

    ConsoleSink();
    explicit ConsoleSink(const Config& config);

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

private:
    Config config_;
    std::mutex mutex_;

    std::string Format(const LogEntry& entry) const;
    const char* GetColorCode(LogLevel level) const;
};

// ============================================================================
// File Sink
// ============================================================================

/// Log sink that appends to a file, rotating it by size
class FileSink : public ILogSink {
public:
    struct Config {
        std::string path;
        bool autoFlush{false};
        size_t maxSize{10 * 1024 * 1024}; // Rotate after 10 MB
        size_t maxFiles{5};               // Rotated files kept
        LogLevel level{LogLevel::Debug};
    };

    explicit FileSink(const Config& config);
    ~FileSink() override;

    bool IsOpen() const;

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

private:
    Config config_;
    std::ofstream file_;
    mutable std::mutex mutex_;
    size_t currentSize_{0};

    std::string Format(const LogEntry& entry) const;
    void Rotate();
};

// ============================================================================
// Callback Sink
// ============================================================================

/// Log sink that forwards entries to a callback
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Info);

    void Write(const LogEntry& entry) override;
    void Flush() override {}
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

private:
    Callback callback_;
    LogLevel level_{LogLevel::Info};
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

    void SetLevel(LogLevel level);
    LogLevel GetLevel() const { return level_.load(); }

    /// Restrict logging to the enabled categories
    void EnableCategory(const std::string& category);
    void DisableCategory(const std::string& category);
    bool IsCategoryEnabled(const std::string& category) const;
    void EnableAllCategories();

    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0,
             const char* function = nullptr);

    void LogF(LogLevel level, const std::string& category,
              const char* file, int line, const char* function,
              const char* format, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 7, 8)))
#endif
        ;

    bool WillLog(LogLevel level, const std::string& category) const;

    void Flush();

private:
    Logger();
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

/// Stream-style logging helper; emits on destruction
class LogStream {
public:
    LogStream(LogLevel level, const std::string& category,
              const char* file, int line, const char* function);
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        if (active_) {
            stream_ << value;
        }
        return *this;
    }

private:
    std::ostringstream stream_;
    LogLevel level_;
    std::string category_;
    const char* file_;
    int line_;
    const char* function_;
    bool active_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define ZKVOTE_LOGGER ::zkvote::util::Logger::Instance()

#define ZKVOTE_LOG_ENABLED(level, category) \
    ZKVOTE_LOGGER.WillLog(::zkvote::util::LogLevel::level, category)

#define ZKVOTE_LOG(level, category) \
    if (!ZKVOTE_LOG_ENABLED(level, category)) {} else \
        ::zkvote::util::LogStream(::zkvote::util::LogLevel::level, category, \
                                  __FILE__, __LINE__, __func__)

#define LOG_TRACE(category)   ZKVOTE_LOG(Trace, category)
#define LOG_DEBUG(category)   ZKVOTE_LOG(Debug, category)
#define LOG_INFO(category)    ZKVOTE_LOG(Info, category)
#define LOG_WARN(category)    ZKVOTE_LOG(Warn, category)
#define LOG_ERROR(category)   ZKVOTE_LOG(Error, category)
#define LOG_FATAL(category)   ZKVOTE_LOG(Fatal, category)

#define ZKVOTE_LOGF(level, category, ...) \
    do { \
        if (ZKVOTE_LOG_ENABLED(level, category)) { \
            ZKVOTE_LOGGER.LogF(::zkvote::util::LogLevel::level, category, \
                               __FILE__, __LINE__, __func__, __VA_ARGS__); \
        } \
    } while(0)

#define LogTraceF(category, ...)  ZKVOTE_LOGF(Trace, category, __VA_ARGS__)
#define LogDebugF(category, ...)  ZKVOTE_LOGF(Debug, category, __VA_ARGS__)
#define LogInfoF(category, ...)   ZKVOTE_LOGF(Info, category, __VA_ARGS__)
#define LogWarnF(category, ...)   ZKVOTE_LOGF(Warn, category, __VA_ARGS__)
#define LogErrorF(category, ...)  ZKVOTE_LOGF(Error, category, __VA_ARGS__)

// ============================================================================
// Scoped Log Timer
// ============================================================================

/// RAII timer that logs elapsed time at Debug level
class ScopedLogTimer {
public:
    ScopedLogTimer(const std::string& category, const std::string& operation);
    ~ScopedLogTimer();

private:
    std::string category_;
    std::string operation_;
    std::chrono::steady_clock::time_point start_;
};

#define ZKVOTE_LOG_TIMER_CAT2(a, b) a##b
#define ZKVOTE_LOG_TIMER_CAT(a, b) ZKVOTE_LOG_TIMER_CAT2(a, b)
#define ZKVOTE_LOG_TIMER(category, operation) \
    ::zkvote::util::ScopedLogTimer ZKVOTE_LOG_TIMER_CAT(_zkvote_timer_, __LINE__)(category, operation)

// ============================================================================
// Utility Functions
// ============================================================================

/// Format timestamp for logging (e.g., "2024-01-15 10:30:00.123")
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Get basename from file path
std::string GetBasename(const std::string& path);

/**
 * Configure the global logger from the parsed configuration:
 * level, categories, console output and the log file.
 */
class ConfigManager;
void InitLoggingFromConfig(const ConfigManager& config);

} // namespace util
} // namespace zkvote

#endif // ZKVOTE_UTIL_LOGGING_H
