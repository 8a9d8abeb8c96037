// STAKEVOTE - Logging System
// Copyright (c) 2024 STAKEVOTE Developers
// MIT License
//
// Leveled, categorized logging with pluggable sinks:
// - Levels TRACE through FATAL, plus OFF
// - Per-category filtering
// - Console, file and callback sinks
// - Stream-style macros (LOG_INFO(category) << ...)

#ifndef STAKEVOTE_UTIL_LOGGING_H
#define STAKEVOTE_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace stakevote {
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

/// Parse a level name (case-insensitive, "warning" accepted)
/// @return false if the name is not a level
bool ParseLogLevel(const std::string& str, LogLevel& level);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* VOTING = "voting";
    constexpr const char* LEDGER = "ledger";
    constexpr const char* DB = "db";
    constexpr const char* CONFIG = "config";
    constexpr const char* SIM = "sim";
}

// ============================================================================
// Log Entry
// ============================================================================

struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    std::string file;
    int line{0};
    std::chrono::system_clock::time_point timestamp;
    std::thread::id threadId;
};

/// Which fields a sink prints in front of the message
struct LogFormat {
    bool showTimestamp{true};
    bool showLevel{true};
    bool showCategory{true};
    bool showThread{false};
    bool showLocation{false};
};

/// Render an entry as a single line (no trailing newline)
std::string FormatLogEntry(const LogEntry& entry, const LogFormat& format);

// ============================================================================
// Log Sink Interface
// ============================================================================

class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

protected:
    explicit ILogSink(LogLevel level) : level_(level) {}

    bool Accepts(const LogEntry& entry) const { return entry.level >= level_.load(); }

private:
    std::atomic<LogLevel> level_;
};

// ============================================================================
// Console Sink
// ============================================================================

/// Writes to stdout, errors optionally to stderr
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};
        bool useStderr{true};
        LogFormat format;
        LogLevel level{LogLevel::Info};
    };

    ConsoleSink();
    explicit ConsoleSink(const Config& config);

    void Write(const LogEntry& entry) override;
    void Flush() override;

private:
    Config config_;
    std::mutex mutex_;
};

// ============================================================================
// File Sink
// ============================================================================

/// Appends to a log file, rotating it once it grows past maxSize
class FileSink : public ILogSink {
public:
    struct Config {
        std::string path;
        bool append{true};
        bool autoFlush{false};
        size_t maxSize{10 * 1024 * 1024};
        size_t maxFiles{3};
        LogFormat format{true, true, true, true, true};
        LogLevel level{LogLevel::Debug};
    };

    explicit FileSink(const Config& config);
    ~FileSink() override;

    bool IsOpen() const;

    void Write(const LogEntry& entry) override;
    void Flush() override;

private:
    Config config_;
    std::ofstream file_;
    mutable std::mutex mutex_;
    size_t currentSize_{0};

    bool OpenLocked();
    void RotateLocked();
};

// ============================================================================
// Callback Sink
// ============================================================================

class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Info);

    void Write(const LogEntry& entry) override;
    void Flush() override {}

private:
    Callback callback_;
};

// ============================================================================
// Logger
// ============================================================================

/// Process-wide logger
class Logger {
public:
    static Logger& Instance();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    /// Global minimum level
    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// Restrict output to explicitly enabled categories
    void EnableCategory(const std::string& category);
    void DisableCategory(const std::string& category);
    bool IsCategoryEnabled(const std::string& category) const;
    void EnableAllCategories();

    /// Enable the categories in a comma separated list ("all" or "" enables every one)
    void EnableCategories(const std::string& list);

    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0);

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

/// Collects one message and hands it to the Logger on destruction
class LogStream {
public:
    LogStream(LogLevel level, const char* category, const char* file, int line);
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
    const char* category_;
    const char* file_;
    int line_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define STAKEVOTE_LOGGER ::stakevote::util::Logger::Instance()

#define STAKEVOTE_LOG_ENABLED(level, category) \
    STAKEVOTE_LOGGER.WillLog(::stakevote::util::LogLevel::level, category)

/// The message expression is not evaluated when the entry would be dropped
#define STAKEVOTE_LOG(level, category) \
    if (!STAKEVOTE_LOG_ENABLED(level, category)) {} \
    else ::stakevote::util::LogStream(::stakevote::util::LogLevel::level, \
                                      category, __FILE__, __LINE__)

#define LOG_TRACE(category)   STAKEVOTE_LOG(Trace, category)
#define LOG_DEBUG(category)   STAKEVOTE_LOG(Debug, category)
#define LOG_INFO(category)    STAKEVOTE_LOG(Info, category)
#define LOG_WARN(category)    STAKEVOTE_LOG(Warn, category)
#define LOG_ERROR(category)   STAKEVOTE_LOG(Error, category)
#define LOG_FATAL(category)   STAKEVOTE_LOG(Fatal, category)

#define LogInfo()   LOG_INFO(::stakevote::util::LogCategory::DEFAULT)
#define LogWarn()   LOG_WARN(::stakevote::util::LogCategory::DEFAULT)
#define LogError()  LOG_ERROR(::stakevote::util::LogCategory::DEFAULT)

// ============================================================================
// Utility Functions
// ============================================================================

/// Local time with milliseconds, "YYYY-MM-DD HH:MM:SS.mmm"
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Get basename from file path
std::string GetBasename(const std::string& path);

} // namespace util
} // namespace stakevote

#endif // STAKEVOTE_UTIL_LOGGING_H
