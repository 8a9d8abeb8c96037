// STAKEVOTE - Time Utilities
// Copyright (c) 2024 STAKEVOTE Developers
// MIT License
//
// Provides time-related utilities:
// - Unix timestamps
// - Formatting and parsing of timestamps and durations
// - Mock time for testing and simulation

#ifndef STAKEVOTE_UTIL_TIME_H
#define STAKEVOTE_UTIL_TIME_H

#include <cstdint>
#include <optional>
#include <string>

namespace stakevote {
namespace util {

// ============================================================================
// Time Constants
// ============================================================================

constexpr int64_t SECONDS_PER_MINUTE = 60;
constexpr int64_t SECONDS_PER_HOUR = 3600;
constexpr int64_t SECONDS_PER_DAY = 86400;
constexpr int64_t SECONDS_PER_WEEK = 604800;

// ============================================================================
// Unix Timestamps
// ============================================================================

/// Current Unix timestamp in seconds (the mock value when mock time is on)
int64_t GetTime();

// ============================================================================
// Mock Time
// ============================================================================

/// Freeze GetTime() at the current mock value (initialized to now if unset)
void EnableMockTime();

void DisableMockTime();

bool IsMockTimeEnabled();

void SetMockTime(int64_t timestamp);

void AdvanceMockTime(int64_t seconds);

int64_t GetMockTime();

// ============================================================================
// Formatting
// ============================================================================

/// "2024-01-15T10:30:00Z"
std::string FormatISO8601(int64_t timestamp);

/// "1d 2h 3m 4s", "0s" for zero
std::string FormatDuration(int64_t seconds);

// ============================================================================
// Parsing
// ============================================================================

/// Parse "YYYY-MM-DDTHH:MM:SS[Z]" or "YYYY-MM-DD HH:MM:SS" as UTC
std::optional<int64_t> ParseISO8601(const std::string& str);

/**
 * Parse a duration such as "90", "90s", "15m", "6h", "7d" or "2w".
 * A bare number is seconds. Negative values and overflow are rejected.
 */
std::optional<int64_t> ParseDuration(const std::string& str);

} // namespace util
} // namespace stakevote

#endif // STAKEVOTE_UTIL_TIME_H
