// CHAMA - Logging Implementation
// Copyright (c) 2024 CHAMA Developers
// MIT License

#include "chama/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>

#include <unistd.h>

namespace chama {
namespace util {

// ============================================================================
// Log Level Functions
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
        default:              return "UNKNOWN";
    }
}

LogLevel LogLevelFromString(const std::string& str) {
    std::string upper = str;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE") return LogLevel::Trace;
    if (upper == "DEBUG") return LogLevel::Debug;
    if (upper == "INFO")  return LogLevel::Info;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::Warn;
    if (upper == "ERROR") return LogLevel::Error;
    if (upper == "FATAL") return LogLevel::Fatal;
    if (upper == "OFF" || upper == "NONE") return LogLevel::Off;

    return LogLevel::Info;
}

// ============================================================================
// Formatting
// ============================================================================

std::string FixedWidth(const std::string& str, size_t width, char pad) {
    if (str.length() >= width) {
        return str.substr(0, width);
    }
    return str + std::string(width - str.length(), pad);
}

std::string GetBasename(const std::string& path) {
    size_t pos = path.find_last_of("/\\");
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

namespace {

/// UTC with milliseconds, matching the ISO-8601 form used in event output
std::string FormatEntryTime(std::chrono::system_clock::time_point tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm tm_buf;
    gmtime_r(&time, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

/// "[LEVEL] [category] message", the part shared by every sink
std::string FormatBody(const LogEntry& entry, bool showCategory) {
    std::ostringstream oss;
    oss << "[" << FixedWidth(LogLevelToString(entry.level), 5) << "] ";
    if (showCategory && !entry.category.empty() && entry.category != LogCategory::DEFAULT) {
        oss << "[" << entry.category << "] ";
    }
    oss << entry.message;
    return oss.str();
}

const char* ColorFor(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info:  return "\033[32m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        case LogLevel::Fatal: return "\033[35;1m";
        default:              return "\033[90m";
    }
}

} // namespace

// ============================================================================
// ConsoleSink
// ============================================================================

void ConsoleSink::Write(const LogEntry& entry) {
    if (entry.level < config_.level) {
        return;
    }

    std::string line = FormatBody(entry, config_.showCategory);
    if (config_.showTimestamp) {
        line = FormatEntryTime(entry.timestamp) + " " + line;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    FILE* stream = (config_.useStderr && entry.level >= LogLevel::Warn) ? stderr : stdout;
    if (config_.useColors && isatty(fileno(stream))) {
        fprintf(stream, "%s%s\033[0m\n", ColorFor(entry.level), line.c_str());
    } else {
        fprintf(stream, "%s\n", line.c_str());
    }
}

void ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    fflush(stdout);
    fflush(stderr);
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const std::string& path, LogLevel level)
    : file_(path, std::ios::out | std::ios::app), level_(level) {}

bool FileSink::IsOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_.is_open();
}

void FileSink::Write(const LogEntry& entry) {
    if (entry.level < level_) {
        return;
    }

    std::string line = FormatEntryTime(entry.timestamp) + " " + FormatBody(entry, true);
    if (!entry.file.empty()) {
        line += " (" + GetBasename(entry.file) + ":" + std::to_string(entry.line) + ")";
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_.is_open()) {
        return;
    }
    file_ << line << '\n';
    if (entry.level >= LogLevel::Warn) {
        file_.flush();
    }
}

void FileSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    file_.flush();
}

// ============================================================================
// CallbackSink
// ============================================================================

void CallbackSink::Write(const LogEntry& entry) {
    if (entry.level >= level_ && callback_) {
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
    allCategoriesEnabled_ = false;
}

void Logger::DisableCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    enabledCategories_.erase(category);
}

bool Logger::IsCategoryEnabled(const std::string& category) const {
    if (allCategoriesEnabled_) {
        return true;
    }
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    return enabledCategories_.count(category) > 0;
}

void Logger::EnableAllCategories() {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    allCategoriesEnabled_ = true;
}

void Logger::DisableAllCategories() {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    allCategoriesEnabled_ = false;
    enabledCategories_.clear();
}

bool Logger::WillLog(LogLevel level, const std::string& category) const {
    if (level == LogLevel::Off || level < level_.load()) {
        return false;
    }
    return IsCategoryEnabled(category);
}

void Logger::Log(LogLevel level, const std::string& category, const std::string& message,
                 const char* file, int line, const char* function) {
    if (!WillLog(level, category)) {
        return;
    }

    LogEntry entry;
    entry.level = level;
    entry.category = category;
    entry.message = message;
    entry.file = file ? file : "";
    entry.line = line;
    entry.function = function ? function : "";
    entry.timestamp = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Write(entry);
    }
}

void Logger::LogF(LogLevel level, const std::string& category,
                  const char* file, int line, const char* function,
                  const char* format, ...) {
    if (!WillLog(level, category)) {
        return;
    }

    char buffer[1024];
    va_list args;
    va_start(args, format);
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    Log(level, category, buffer, file, line, function);
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Flush();
    }
}

// ============================================================================
// LogStream
// ============================================================================

LogStream::LogStream(LogLevel level, const std::string& category,
                     const char* file, int line, const char* function)
    : level_(level)
    , category_(category)
    , file_(file)
    , line_(line)
    , function_(function)
    , active_(Logger::Instance().WillLog(level, category)) {}

LogStream::~LogStream() {
    if (active_) {
        Logger::Instance().Log(level_, category_, stream_.str(), file_, line_, function_);
    }
}

LogStream::LogStream(LogStream&& other) noexcept
    : stream_(std::move(other.stream_))
    , level_(other.level_)
    , category_(std::move(other.category_))
    , file_(other.file_)
    , line_(other.line_)
    , function_(other.function_)
    , active_(other.active_) {
    other.active_ = false;
}

} // namespace util
} // namespace chama
