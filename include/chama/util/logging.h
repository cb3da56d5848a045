// CHAMA - Logging System
// Copyright (c) 2024 CHAMA Developers
// MIT License
//
// Process-wide logger used by the group engine, registry, journal and CLI:
// one category per engine concern, console/file/callback sinks, and stream
// macros that skip formatting when the entry would be dropped.

#ifndef CHAMA_UTIL_LOGGING_H
#define CHAMA_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>

namespace chama {
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

/// Parse log level from string (case-insensitive, defaults to Info)
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* GROUP = "group";
    constexpr const char* CONTRIB = "contrib";
    constexpr const char* PUNISH = "punish";
    constexpr const char* GOV = "gov";
    constexpr const char* PAYOUT = "payout";
    constexpr const char* REGISTRY = "registry";
    constexpr const char* JOURNAL = "journal";
    constexpr const char* DB = "db";
    constexpr const char* CLI = "cli";
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

    LogEntry() : level(LogLevel::Info), line(0) {}
};

// ============================================================================
// Log Sink Interface
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

// ============================================================================
// Console Sink
// ============================================================================

class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};
        bool useStderr{true};           // WARN and above go to stderr
        bool showTimestamp{true};
        bool showCategory{true};
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

// ============================================================================
// File Sink
// ============================================================================

/// Appends entries to path. Warnings and errors are flushed immediately so an
/// aborted scenario still leaves its rejections on disk.
class FileSink : public ILogSink {
public:
    explicit FileSink(const std::string& path, LogLevel level = LogLevel::Debug);

    bool IsOpen() const;

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

private:
    std::ofstream file_;
    LogLevel level_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Callback Sink
// ============================================================================

/// Hands every entry to a function; used by tests to capture output
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

    /// Restrict output to the enabled categories
    void EnableCategory(const std::string& category);
    void DisableCategory(const std::string& category);
    bool IsCategoryEnabled(const std::string& category) const;
    void EnableAllCategories();
    void DisableAllCategories();

    void Log(LogLevel level, const std::string& category, const std::string& message,
             const char* file = nullptr, int line = 0, const char* function = nullptr);

    void LogF(LogLevel level, const std::string& category,
              const char* file, int line, const char* function,
              const char* format, ...);

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
};

// ============================================================================
// Log Stream
// ============================================================================

/// Collects a message and hands it to the logger on destruction
class LogStream {
public:
    LogStream(LogLevel level, const std::string& category,
              const char* file, int line, const char* function);
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;
    LogStream(LogStream&& other) noexcept;
    LogStream& operator=(LogStream&& other) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        if (active_) {
            stream_ << value;
        }
        return *this;
    }

    LogStream& operator<<(std::ostream& (*manip)(std::ostream&)) {
        if (active_) {
            manip(stream_);
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

#define CHAMA_LOG(level, category) \
    if (::chama::util::Logger::Instance().WillLog(::chama::util::LogLevel::level, category)) \
        ::chama::util::LogStream(::chama::util::LogLevel::level, category, \
                                 __FILE__, __LINE__, __func__)

#define LOG_DEBUG(category)   CHAMA_LOG(Debug, category)
#define LOG_INFO(category)    CHAMA_LOG(Info, category)
#define LOG_WARN(category)    CHAMA_LOG(Warn, category)
#define LOG_ERROR(category)   CHAMA_LOG(Error, category)

#define LogInfoF(category, ...) \
    ::chama::util::Logger::Instance().LogF(::chama::util::LogLevel::Info, category, \
                                           __FILE__, __LINE__, __func__, __VA_ARGS__)

// ============================================================================
// Utility Functions
// ============================================================================

/// Truncate or pad string to fixed width
std::string FixedWidth(const std::string& str, size_t width, char pad = ' ');

std::string GetBasename(const std::string& path);

} // namespace util
} // namespace chama

#endif // CHAMA_UTIL_LOGGING_H
