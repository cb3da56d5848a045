// CHAMA - Time Utilities
// Copyright (c) 2024 CHAMA Developers
// MIT License
//
// Wall-clock access for the group engine:
// - Unix timestamps (seconds)
// - ISO 8601 formatting and parsing for group dates
// - Human duration formatting and parsing ("3d", "1w", "90m")
// - Mock time for deterministic tests and scenario replay

#ifndef CHAMA_UTIL_TIME_H
#define CHAMA_UTIL_TIME_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace chama {
namespace util {

// ============================================================================
// Type Aliases
// ============================================================================

using Seconds = std::chrono::seconds;
using SystemClock = std::chrono::system_clock;
using SystemTimePoint = std::chrono::system_clock::time_point;

// ============================================================================
// Constants
// ============================================================================

constexpr int64_t SECONDS_PER_MINUTE = 60;
constexpr int64_t SECONDS_PER_HOUR = 3600;
constexpr int64_t SECONDS_PER_DAY = 86400;
constexpr int64_t SECONDS_PER_WEEK = 604800;

// ============================================================================
// Unix Timestamps
// ============================================================================

/// Get current Unix timestamp in seconds (mock time when enabled)
int64_t GetTime();

/// Get system time point for current time (mock time when enabled)
SystemTimePoint GetSystemTime();

SystemTimePoint FromUnixTime(int64_t timestamp);
int64_t ToUnixTime(SystemTimePoint tp);

// ============================================================================
// Formatting and Parsing
// ============================================================================

/// Format Unix timestamp as ISO 8601 UTC (e.g., "2024-01-15T10:30:00Z")
std::string FormatISO8601(int64_t timestamp);

/// Parse "YYYY-MM-DD", "YYYY-MM-DDTHH:MM:SS[Z]" or "YYYY-MM-DD HH:MM:SS" (UTC).
std::optional<int64_t> ParseISO8601(const std::string& str);

/// Format duration as human-readable string (e.g., "1d 2h 3m 4s")
std::string FormatDuration(int64_t seconds);

/// Parse a duration with an optional s/m/h/d/w suffix. Plain numbers are seconds.
std::optional<int64_t> ParseDuration(const std::string& str);

// ============================================================================
// Mock Time (for testing)
// ============================================================================

/// Enable mock time mode, seeded with the real clock if unset
void EnableMockTime();

void DisableMockTime();

bool IsMockTimeEnabled();

/// Set mock time (only observed while mock time is enabled)
void SetMockTime(int64_t timestamp);

/// Advance mock time by the given number of seconds
void AdvanceMockTime(int64_t seconds);

int64_t GetMockTime();

} // namespace util
} // namespace chama

#endif // CHAMA_UTIL_TIME_H
