// ZKVOTE - Time Utilities
// Copyright (c) 2024 ZKVOTE Developers
// MIT License
//
// Provides time-related utilities:
// - Unix timestamps
// - ISO 8601 and duration formatting
// - Mock time for testing

#ifndef ZKVOTE_UTIL_TIME_H
#define ZKVOTE_UTIL_TIME_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace zkvote {
namespace util {

using Seconds = std::chrono::seconds;
using SystemTimePoint = std::chrono::system_clock::time_point;

// ============================================================================
// Unix Timestamps
// ============================================================================

/// Current Unix timestamp in seconds (honours mock time)
int64_t GetTime();

/// Current Unix timestamp in milliseconds (honours mock time)
int64_t GetTimeMillis();

SystemTimePoint FromUnixTime(int64_t timestamp);

// ============================================================================
// Formatting and Parsing
// ============================================================================

/// Format Unix time as ISO 8601 UTC (e.g., "2024-01-15T10:30:00Z")
std::string FormatISO8601(int64_t timestamp);

/// Format a duration as e.g. "1d 2h 3m 4s"
std::string FormatDuration(Seconds duration);

/// Parse a duration: plain seconds or a number with s/m/h/d suffix
std::optional<int64_t> ParseDuration(const std::string& str);

// ============================================================================
// Mock Time (for testing)
// ============================================================================

/// Freeze GetTime() at the current mock time (initialised to now if unset)
void EnableMockTime();

void DisableMockTime();

bool IsMockTimeEnabled();

void SetMockTime(int64_t timestamp);

void AdvanceMockTime(Seconds duration);

} // namespace util
} // namespace zkvote

#endif // ZKVOTE_UTIL_TIME_H
