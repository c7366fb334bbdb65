// Satchel - Logging System
// Copyright (c) 2024 Satchel Developers
// MIT License
//
// Leveled, categorized logging with pluggable sinks. The library never
// installs a sink on its own; applications call Logger::Initialize() or add
// sinks explicitly. Secrets (seeds, mnemonics, private keys) must never be
// passed to the logger.

#ifndef SATCHEL_UTIL_LOGGING_H
#define SATCHEL_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace satchel {
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

/// Parse log level from string (case-insensitive, Info on unknown input)
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* WALLET = "wallet";
    constexpr const char* KEYS = "keys";
    constexpr const char* TX = "tx";
    constexpr const char* SELECT = "select";
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

/// "2024-01-01 12:00:00.000 [INFO ] [wallet] message"
std::string FormatLogEntry(const LogEntry& entry, bool showTimestamp = true,
                           bool showLocation = false);

// ============================================================================
// Log Sinks
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

/// Writes formatted entries to stderr (CLI output stays on stdout)
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};
        bool showTimestamp{true};
        bool showLocation{false};
        LogLevel level{LogLevel::Info};
    };

    ConsoleSink() = default;
    explicit ConsoleSink(const Config& config) : config_(config) {}

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

private:
    Config config_;
    std::mutex mutex_;
};

/// Forwards entries to a callback (used by tests to capture output)
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    CallbackSink() = default;
    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Info)
        : callback_(std::move(callback)), level_(level) {}

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

    /// Install a default ConsoleSink (idempotent)
    void Initialize(LogLevel level = LogLevel::Info);

    /// Flush and remove every sink
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
             const char* file = nullptr, int line = 0,
             const char* function = nullptr);

    void LogF(LogLevel level, const std::string& category,
              const char* file, int line, const char* function,
              const char* format, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 7, 8)))
#endif
        ;

    /// False when no sink is installed, the level is filtered or the
    /// category is disabled
    bool WillLog(LogLevel level, const std::string& category) const;

    void Flush();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;
    std::atomic<size_t> sinkCount_{0};

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::unordered_set<std::string> enabledCategories_;
    mutable std::mutex categoriesMutex_;
    std::atomic<bool> allCategoriesEnabled_{true};

    std::atomic<bool> initialized_{false};
};

// ============================================================================
// Log Stream
// ============================================================================

/// Collects a streamed message and emits it on destruction
class LogStream {
public:
    LogStream(LogLevel level, const std::string& category,
              const char* file, int line, const char* function);
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
    const char* function_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define SATCHEL_LOGGER ::satchel::util::Logger::Instance()

#define SATCHEL_LOG_ENABLED(level, category) \
    SATCHEL_LOGGER.WillLog(::satchel::util::LogLevel::level, category)

#define SATCHEL_LOG(level, category) \
    if (!SATCHEL_LOG_ENABLED(level, category)) {} else \
        ::satchel::util::LogStream(::satchel::util::LogLevel::level, category, \
                                   __FILE__, __LINE__, __func__)

#define LOG_TRACE(category)   SATCHEL_LOG(Trace, category)
#define LOG_DEBUG(category)   SATCHEL_LOG(Debug, category)
#define LOG_INFO(category)    SATCHEL_LOG(Info, category)
#define LOG_WARN(category)    SATCHEL_LOG(Warn, category)
#define LOG_ERROR(category)   SATCHEL_LOG(Error, category)

#define SATCHEL_LOGF(level, category, ...) \
    do { \
        if (SATCHEL_LOG_ENABLED(level, category)) { \
            SATCHEL_LOGGER.LogF(::satchel::util::LogLevel::level, category, \
                                __FILE__, __LINE__, __func__, __VA_ARGS__); \
        } \
    } while (0)

#define LogDebugF(category, ...)  SATCHEL_LOGF(Debug, category, __VA_ARGS__)
#define LogInfoF(category, ...)   SATCHEL_LOGF(Info, category, __VA_ARGS__)
#define LogWarnF(category, ...)   SATCHEL_LOGF(Warn, category, __VA_ARGS__)
#define LogErrorF(category, ...)  SATCHEL_LOGF(Error, category, __VA_ARGS__)

// ============================================================================
// Scoped Log Timer
// ============================================================================

/// Logs the duration of a scope at Debug level
class ScopedLogTimer {
public:
    ScopedLogTimer(const char* category, std::string operation);
    ~ScopedLogTimer();

private:
    const char* category_;
    std::string operation_;
    std::chrono::steady_clock::time_point start_;
};

#define SATCHEL_LOG_TIMER_CAT2(a, b) a##b
#define SATCHEL_LOG_TIMER_CAT(a, b) SATCHEL_LOG_TIMER_CAT2(a, b)
#define SATCHEL_LOG_TIMER(category, operation) \
    ::satchel::util::ScopedLogTimer SATCHEL_LOG_TIMER_CAT(satchel_timer_, __LINE__)(category, operation)

} // namespace util
} // namespace satchel

#endif // SATCHEL_UTIL_LOGGING_H
