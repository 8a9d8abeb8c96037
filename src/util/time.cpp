// STAKEVOTE - Time Utilities Implementation
// Copyright (c) 2024 STAKEVOTE Developers
// MIT License

#include "stakevote/util/time.h"

#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <limits>
#include <mutex>
#include <sstream>

namespace stakevote {
namespace util {

namespace {
    std::atomic<bool> g_mockTimeEnabled{false};
    std::atomic<int64_t> g_mockTime{0};
    std::mutex g_mockTimeMutex;
}

// ============================================================================
// Unix Timestamps
// ============================================================================

int64_t GetTime() {
    if (g_mockTimeEnabled.load()) {
        return g_mockTime.load();
    }
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// ============================================================================
// Mock Time
// ============================================================================

void EnableMockTime() {
    std::lock_guard<std::mutex> lock(g_mockTimeMutex);
    if (g_mockTime.load() == 0) {
        g_mockTime.store(GetTime());
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

// ============================================================================
// Formatting
// ============================================================================

std::string FormatISO8601(int64_t timestamp) {
    std::time_t time = static_cast<std::time_t>(timestamp);
    std::tm tm_buf;
    if (gmtime_r(&time, &tm_buf) == nullptr) {
        return std::to_string(timestamp);
    }

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string FormatDuration(int64_t seconds) {
    if (seconds < 0) {
        if (seconds == std::numeric_limits<int64_t>::min()) {
            return "-" + std::to_string(seconds);
        }
        return "-" + FormatDuration(-seconds);
    }
    if (seconds == 0) {
        return "0s";
    }

    int64_t days = seconds / SECONDS_PER_DAY;
    int64_t hours = (seconds % SECONDS_PER_DAY) / SECONDS_PER_HOUR;
    int64_t minutes = (seconds % SECONDS_PER_HOUR) / SECONDS_PER_MINUTE;
    int64_t secs = seconds % SECONDS_PER_MINUTE;

    std::ostringstream oss;
    const char* sep = "";
    if (days > 0) { oss << days << "d"; sep = " "; }
    if (hours > 0) { oss << sep << hours << "h"; sep = " "; }
    if (minutes > 0) { oss << sep << minutes << "m"; sep = " "; }
    if (secs > 0) { oss << sep << secs << "s"; }
    return oss.str();
}

// ============================================================================
// Parsing
// ============================================================================

std::optional<int64_t> ParseISO8601(const std::string& str) {
    const char* formats[] = {"%Y-%m-%dT%H:%M:%S", "%Y-%m-%d %H:%M:%S"};

    for (const char* fmt : formats) {
        std::tm tm_buf = {};
        std::istringstream iss(str);
        iss >> std::get_time(&tm_buf, fmt);
        if (iss.fail()) {
            continue;
        }

        std::string rest;
        std::getline(iss, rest);
        if (!rest.empty() && rest != "Z") {
            continue;
        }

        std::time_t time = timegm(&tm_buf);
        if (time == static_cast<std::time_t>(-1)) {
            return std::nullopt;
        }
        return static_cast<int64_t>(time);
    }
    return std::nullopt;
}

std::optional<int64_t> ParseDuration(const std::string& str) {
    if (str.empty() || !std::isdigit(static_cast<unsigned char>(str[0]))) {
        return std::nullopt;
    }

    size_t pos = 0;
    int64_t value = 0;
    while (pos < str.size() && std::isdigit(static_cast<unsigned char>(str[pos]))) {
        int digit = str[pos] - '0';
        if (value > (std::numeric_limits<int64_t>::max() - digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digit;
        ++pos;
    }

    int64_t unit = 1;
    if (pos < str.size()) {
        if (pos + 1 != str.size()) {
            return std::nullopt;
        }
        switch (str[pos]) {
            case 's': unit = 1; break;
            case 'm': unit = SECONDS_PER_MINUTE; break;
            case 'h': unit = SECONDS_PER_HOUR; break;
            case 'd': unit = SECONDS_PER_DAY; break;
            case 'w': unit = SECONDS_PER_WEEK; break;
            default: return std::nullopt;
        }
    }

    if (value > std::numeric_limits<int64_t>::max() / unit) {
        return std::nullopt;
    }
    return value * unit;
}

} // namespace util
} // namespace stakevote
