// ZKDROP - Logging System
// Copyright (c) 2024 ZKDROP Developers
// MIT License
//
// Leveled, categorized logging with pluggable sinks:
// - Levels TRACE through FATAL
// - Categories for filtering (claim, registry, db, ...)
// - Console, rotating file and callback sinks
// - Printf-style and stream-style interfaces

#ifndef ZKDROP_UTIL_LOGGING_H
#define ZKDROP_UTIL_LOGGING_H

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

namespace zkdrop {
namespace util {

class ConfigManager;

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
    Off = 6      // Disable logging
};

const char* LogLevelToString(LogLevel level);

/// Parse log level from string (case-insensitive); unknown names give Info
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* AIRDROP = "airdrop";
    constexpr const char* CLAIM = "claim";
    constexpr const char* REGISTRY = "registry";
    constexpr const char* NULLIFIER = "nullifier";
    constexpr const char* TOKEN = "token";
    constexpr const char* DB = "db";
    constexpr const char* RPC = "rpc";
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

/// Which fields a sink renders in front of the message
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
    
    /// Minimum level this sink accepts
    virtual void SetLevel(LogLevel level) = 0;
    virtual LogLevel GetLevel() const = 0;
};

// ============================================================================
// Console Sink
// ============================================================================

/// Writes to stdout, errors optionally to stderr
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};           // ANSI colors when attached to a tty
        bool useStderr{false};          // Errors and above go to stderr
        LogFormat format;
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
};

// ============================================================================
// File Sink
// ============================================================================

/// Appends to a file, rotating it to path.1 ... path.N when it grows too big
class FileSink : public ILogSink {
public:
    struct Config {
        std::string path;
        bool append{true};
        bool autoFlush{false};
        size_t maxSize{10 * 1024 * 1024};
        size_t maxFiles{5};
        bool rotate{true};
        LogFormat format{true, true, true, true, true};
        LogLevel level{LogLevel::Debug};
    };
    
    explicit FileSink(const Config& config);
    ~FileSink() override;
    
    bool IsOpen() const;
    
    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }
    
    size_t GetCurrentSize() const { return currentSize_; }

private:
    Config config_;
    std::ofstream file_;
    mutable std::mutex mutex_;
    size_t currentSize_{0};
    
    void OpenLocked(std::ios::openmode mode);
    void Rotate();
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
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

private:
    Callback callback_;
    LogLevel level_;
};

// ============================================================================
// Logger
// ============================================================================

/// Process-wide logger. Messages below the global level or in a disabled
/// category are dropped before formatting.
class Logger {
public:
    static Logger& Instance();
    
    /// Install the default console sink once
    void Initialize();
    
    /// Flush and drop all sinks
    void Shutdown();
    
    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;
    
    void SetLevel(LogLevel level);
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
              const char* format, ...);
    
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

/**
 * Configure the global logger from configuration keys.
 * 
 * Reads "loglevel", "printtoconsole", "logfile" and "debug" (a list of
 * categories to restrict output to). Replaces any sinks already installed.
 */
void InitLogging(const ConfigManager& config);

// ============================================================================
// Log Stream
// ============================================================================

/// Collects a message with operator<< and logs it on destruction
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

#define ZKDROP_LOGGER ::zkdrop::util::Logger::Instance()

#define ZKDROP_LOG_ENABLED(level, category) \
    ZKDROP_LOGGER.WillLog(::zkdrop::util::LogLevel::level, category)

/// Stream-style logging; the message is not built when filtered out
#define ZKDROP_LOG(level, category) \
    if (!ZKDROP_LOG_ENABLED(level, category)) {} else \
        ::zkdrop::util::LogStream(::zkdrop::util::LogLevel::level, category, \
                                  __FILE__, __LINE__, __func__)

#define LOG_TRACE(category)   ZKDROP_LOG(Trace, category)
#define LOG_DEBUG(category)   ZKDROP_LOG(Debug, category)
#define LOG_INFO(category)    ZKDROP_LOG(Info, category)
#define LOG_WARN(category)    ZKDROP_LOG(Warn, category)
#define LOG_ERROR(category)   ZKDROP_LOG(Error, category)
#define LOG_FATAL(category)   ZKDROP_LOG(Fatal, category)

/// Printf-style logging
#define ZKDROP_LOGF(level, category, ...) \
    do { \
        if (ZKDROP_LOG_ENABLED(level, category)) { \
            ZKDROP_LOGGER.LogF(::zkdrop::util::LogLevel::level, category, \
                               __FILE__, __LINE__, __func__, __VA_ARGS__); \
        } \
    } while(0)

#define LogTraceF(category, ...)  ZKDROP_LOGF(Trace, category, __VA_ARGS__)
#define LogDebugF(category, ...)  ZKDROP_LOGF(Debug, category, __VA_ARGS__)
#define LogInfoF(category, ...)   ZKDROP_LOGF(Info, category, __VA_ARGS__)
#define LogWarnF(category, ...)   ZKDROP_LOGF(Warn, category, __VA_ARGS__)
#define LogErrorF(category, ...)  ZKDROP_LOGF(Error, category, __VA_ARGS__)

// ============================================================================
// Utility Functions
// ============================================================================

/// "YYYY-MM-DD HH:MM:SS.mmm" in local time
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Get basename from file path
std::string GetBasename(const std::string& path);

} // namespace util
} // namespace zkdrop

#endif // ZKDROP_UTIL_LOGGING_H
