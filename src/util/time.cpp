// CHAMA - Time Utilities Implementation
// Copyright (c) 2024 CHAMA Developers
// MIT License

#include "chama/util/time.h"

#include <atomic>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <limits>
#include <mutex>
#include <sstream>

namespace chama {
namespace util {

// ============================================================================
// Mock Time State
// ============================================================================

namespace {
    std::atomic<bool> g_mockTimeEnabled{false};
    std::atomic<int64_t> g_mockTime{0};
    std::mutex g_mockTimeMutex;

    int64_t RealTime() {
        return std::chrono::duration_cast<Seconds>(
            SystemClock::now().time_since_epoch()).count();
    }
}

// ============================================================================
// Unix Timestamps
// ============================================================================

int64_t GetTime() {
    if (g_mockTimeEnabled.load()) {
        return g_mockTime.load();
    }
    return RealTime();
}

SystemTimePoint GetSystemTime() {
    if (g_mockTimeEnabled.load()) {
        return FromUnixTime(g_mockTime.load());
    }
    return SystemClock::now();
}

SystemTimePoint FromUnixTime(int64_t timestamp) {
    return SystemTimePoint{Seconds{timestamp}};
}

int64_t ToUnixTime(SystemTimePoint tp) {
    return std::chrono::duration_cast<Seconds>(tp.time_since_epoch()).count();
}

// ============================================================================
// Formatting and Parsing
// ============================================================================

std::string FormatISO8601(int64_t timestamp) {
    std::time_t time = static_cast<std::time_t>(timestamp);
    std::tm tm_buf;
    gmtime_r(&time, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::optional<int64_t> ParseISO8601(const std::string& str) {
    const char* formats[] = {
        "%Y-%m-%dT%H:%M:%S",
        "%Y-%m-%d %H:%M:%S",
        "%Y-%m-%d",
    };

    for (const auto* fmt : formats) {
        std::tm tm_buf = {};
        std::istringstream iss(str);
        iss >> std::get_time(&tm_buf, fmt);
        if (iss.fail()) {
            continue;
        }

        // Only a trailing 'Z' may follow
        std::string rest;
        std::getline(iss, rest);
        if (!rest.empty() && rest != "Z") {
            continue;
        }

        auto time = timegm(&tm_buf);
        if (time == -1) {
            return std::nullopt;
        }
        return static_cast<int64_t>(time);
    }
    return std::nullopt;
}

std::string FormatDuration(int64_t total) {
    if (total < 0) {
        return "-" + FormatDuration(-total);
    }
    if (total == 0) {
        return "0s";
    }

    int64_t days = total / SECONDS_PER_DAY;
    total %= SECONDS_PER_DAY;
    int64_t hours = total / SECONDS_PER_HOUR;
    total %= SECONDS_PER_HOUR;
    int64_t minutes = total / SECONDS_PER_MINUTE;
    int64_t seconds = total % SECONDS_PER_MINUTE;

    std::ostringstream oss;
    if (days > 0) oss << days << "d ";
    if (hours > 0) oss << hours << "h ";
    if (minutes > 0) oss << minutes << "m ";
    if (seconds > 0) oss << seconds << "s";

    std::string result = oss.str();
    while (!result.empty() && result.back() == ' ') {
        result.pop_back();
    }
    return result;
}

std::optional<int64_t> ParseDuration(const std::string& str) {
    if (str.empty()) {
        return std::nullopt;
    }

    std::string digits = str;
    int64_t multiplier = 1;
    char suffix = static_cast<char>(std::tolower(static_cast<unsigned char>(str.back())));
    if (!std::isdigit(static_cast<unsigned char>(suffix))) {
        switch (suffix) {
            case 's': multiplier = 1; break;
            case 'm': multiplier = SECONDS_PER_MINUTE; break;
            case 'h': multiplier = SECONDS_PER_HOUR; break;
            case 'd': multiplier = SECONDS_PER_DAY; break;
            case 'w': multiplier = SECONDS_PER_WEEK; break;
            default: return std::nullopt;
        }
        digits.pop_back();
    }

    if (digits.empty()) {
        return std::nullopt;
    }
    int64_t value = 0;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        if (value > (std::numeric_limits<int64_t>::max() - (c - '0')) / 10) {
            return std::nullopt;
        }
        value = value * 10 + (c - '0');
    }
    if (value > std::numeric_limits<int64_t>::max() / multiplier) {
        return std::nullopt;
    }
    return value * multiplier;
}

// ============================================================================
// Mock Time
// ============================================================================

void EnableMockTime() {
    std::lock_guard<std::mutex> lock(g_mockTimeMutex);
    if (g_mockTime.load() == 0) {
        g_mockTime.store(RealTime());
    }
    g_mockTimeEnabled.store(true);
}

void DisableMockTime() {
    std::lock_guard<std::mutex> lock(g_mockTimeMutex);
    g_mockTimeEnabled.store(false);
}

bool IsMockTimeEnabled() {
    return g_mockTimeEnabled.load();
}

void SetMockTime(int64_t timestamp) {
    g_mockTime.store(timestamp);
}

void AdvanceMockTime(int64_t seconds) {
    g_mockTime.fetch_add(seconds);
}

int64_t GetMockTime() {
    return g_mockTime.load();
}

} // namespace util
} // namespace chama
