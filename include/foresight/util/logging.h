// FORESIGHT - Logging System
// Copyright (c) 2024 FORESIGHT Developers
// MIT License
//
// Leveled, categorized logging for the market engine and its tools.
// Entries flow from the LOG_* macros through the process-wide Logger to
// any number of sinks, each with its own minimum level and line format.

#ifndef FORESIGHT_UTIL_LOGGING_H
#define FORESIGHT_UTIL_LOGGING_H

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

namespace foresight {
namespace util {

// ============================================================================
// Levels and Categories
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

const char* LogLevelToString(LogLevel level);

/// Case-insensitive; "warning" is accepted, "none" means Off, unknown names map to Info
LogLevel LogLevelFromString(const std::string& str);

/// Subsystem tags; each entry carries exactly one
namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* MARKET = "market";
    constexpr const char* SCORING = "scoring";
    constexpr const char* LEDGER = "ledger";
    constexpr const char* DB = "db";
    constexpr const char* CONFIG = "config";
    constexpr const char* JOURNAL = "journal";
    constexpr const char* REPLAY = "replay";
}

// ============================================================================
// Entries and Formatting
// ============================================================================

struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    std::string file;
    int line{0};
    std::string function;
    std::chrono::system_clock::time_point timestamp;
};

/// Which prefix fields a sink renders before the message
struct LogFormat {
    bool timestamp{true};
    bool level{true};
    bool category{true};
    bool location{false};
    bool function{false};
};

/**
 * Render one entry as a single line without the trailing newline:
 * "2024-05-01 12:00:00.123 [INFO ] [market] controller.cpp:88 message".
 * The default category is never printed.
 */
std::string FormatLogEntry(const LogEntry& entry, const LogFormat& format);

// ============================================================================
// Sinks
// ============================================================================

class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;
    virtual void SetLevel(LogLevel level) = 0;
    virtual LogLevel GetLevel() const = 0;
};

/// Writes to stdout; errors go to stderr when useStderr is set
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};
        bool useStderr{false};
        LogFormat format;
        LogLevel level{LogLevel::Info};
    };

    ConsoleSink() = default;
    explicit ConsoleSink(const Config& config) : config_(config) {}

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
    std::mutex mutex_;
};

/// Appends to a file, shifting it to path.1 .. path.maxFiles once maxSize is reached
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

    FileSink() = default;
    explicit FileSink(const Config& config);
    ~FileSink() override;

    /// Returns false if the file cannot be opened
    bool Open(const std::string& path);
    void Close();
    bool IsOpen() const;

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

    const Config& GetConfig() const { return config_; }
    size_t GetCurrentSize() const;

private:
    Config config_;
    std::ofstream file_;
    mutable std::mutex mutex_;
    size_t currentSize_{0};

    bool OpenLocked();
    void RotateLocked();
};

/// Forwards entries to a callback (used by tests and embedders)
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

    /// The first EnableCategory call switches from "all" to an allow-list
    void EnableCategory(const std::string& category);
    bool IsCategoryEnabled(const std::string& category) const;
    void EnableAllCategories();
    void DisableAllCategories();

    bool WillLog(LogLevel level, const std::string& category) const;

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

    void Flush();

    /// Flush and drop every sink
    void Shutdown();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::atomic<LogLevel> level_{LogLevel::Info};

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<ILogSink>> sinks_;
    std::unordered_set<std::string> enabledCategories_;
    bool allCategoriesEnabled_{true};
};

// ============================================================================
// Process Setup
// ============================================================================

/// Logging options read from -loglevel, -printtoconsole, -logfile and -debug
struct LogSettings {
    LogLevel level{LogLevel::Warn};
    bool printToConsole{true};
    std::string logFile;
    std::vector<std::string> categories;
};

/**
 * Replace the installed sinks with a stderr console sink and, when a log
 * file is named, a rotating file sink that records debug output.
 * Returns false if the log file could not be opened; console logging is
 * still installed in that case.
 */
bool ConfigureLogging(const LogSettings& settings);

// ============================================================================
// Stream Interface
// ============================================================================

/// Collects a streamed message and emits it on destruction
class LogStream {
public:
    LogStream(LogLevel level, const char* category,
              const char* file, int line, const char* function)
        : level_(level), category_(category), file_(file), line_(line), function_(function) {}
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
    const char* function_;
};

#define FORESIGHT_LOGGER ::foresight::util::Logger::Instance()

#define FORESIGHT_LOG_ENABLED(level, category) \
    FORESIGHT_LOGGER.WillLog(::foresight::util::LogLevel::level, category)

#define FORESIGHT_LOG(level, category) \
    if (!FORESIGHT_LOG_ENABLED(level, category)) {} else \
        ::foresight::util::LogStream(::foresight::util::LogLevel::level, category, \
                                     __FILE__, __LINE__, __func__)

#define LOG_TRACE(category)   FORESIGHT_LOG(Trace, category)
#define LOG_DEBUG(category)   FORESIGHT_LOG(Debug, category)
#define LOG_INFO(category)    FORESIGHT_LOG(Info, category)
#define LOG_WARN(category)    FORESIGHT_LOG(Warn, category)
#define LOG_ERROR(category)   FORESIGHT_LOG(Error, category)
#define LOG_FATAL(category)   FORESIGHT_LOG(Fatal, category)

#define FORESIGHT_LOGF(level, category, ...) \
    do { \
        if (FORESIGHT_LOG_ENABLED(level, category)) { \
            FORESIGHT_LOGGER.LogF(::foresight::util::LogLevel::level, category, \
                                  __FILE__, __LINE__, __func__, __VA_ARGS__); \
        } \
    } while (0)

#define LogDebugF(category, ...)  FORESIGHT_LOGF(Debug, category, __VA_ARGS__)
#define LogInfoF(category, ...)   FORESIGHT_LOGF(Info, category, __VA_ARGS__)
#define LogWarnF(category, ...)   FORESIGHT_LOGF(Warn, category, __VA_ARGS__)
#define LogErrorF(category, ...)  FORESIGHT_LOGF(Error, category, __VA_ARGS__)

/// Logs "Completed: <operation> in <N>ms" at debug level when the scope ends
class ScopedLogTimer {
public:
    ScopedLogTimer(const char* category, std::string operation)
        : category_(category), operation_(std::move(operation)),
          start_(std::chrono::steady_clock::now()) {}
    ~ScopedLogTimer();

private:
    const char* category_;
    std::string operation_;
    std::chrono::steady_clock::time_point start_;
};

// ============================================================================
// Helpers
// ============================================================================

/// Local time as "YYYY-MM-DD HH:MM:SS.mmm"
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Truncate or pad to exactly width characters
std::string FixedWidth(const std::string& str, size_t width, char pad = ' ');

std::string GetBasename(const std::string& path);

} // namespace util
} // namespace foresight

#endif // FORESIGHT_UTIL_LOGGING_H
