// FORESIGHT - Logging Implementation
// Copyright (c) 2024 FORESIGHT Developers
// MIT License

#include "foresight/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <filesystem>

#include <unistd.h>

namespace foresight {
namespace util {

// ============================================================================
// Levels
// ============================================================================

namespace {

struct LevelName {
    LogLevel level;
    const char* name;
    const char* color;
};

constexpr LevelName LEVEL_NAMES[] = {
    {LogLevel::Trace, "TRACE", "\033[90m"},
    {LogLevel::Debug, "DEBUG", "\033[36m"},
    {LogLevel::Info,  "INFO",  "\033[32m"},
    {LogLevel::Warn,  "WARN",  "\033[33m"},
    {LogLevel::Error, "ERROR", "\033[31m"},
    {LogLevel::Fatal, "FATAL", "\033[35;1m"},
    {LogLevel::Off,   "OFF",   "\033[0m"},
};

const LevelName* FindLevel(LogLevel level) {
    for (const auto& entry : LEVEL_NAMES) {
        if (entry.level == level) {
            return &entry;
        }
    }
    return nullptr;
}

} // namespace

const char* LogLevelToString(LogLevel level) {
    const LevelName* entry = FindLevel(level);
    return entry ? entry->name : "UNKNOWN";
}

LogLevel LogLevelFromString(const std::string& str) {
    std::string upper(str);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "WARNING") return LogLevel::Warn;
    if (upper == "NONE") return LogLevel::Off;
    for (const auto& entry : LEVEL_NAMES) {
        if (upper == entry.name) {
            return entry.level;
        }
    }
    return LogLevel::Info;
}

// ============================================================================
// Helpers
// ============================================================================

std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    const long millis = static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000);

    std::tm local{};
    localtime_r(&seconds, &local);

    char date[20];
    std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &local);

    char result[32];
    std::snprintf(result, sizeof(result), "%s.%03ld", date, millis);
    return result;
}

std::string FixedWidth(const std::string& str, size_t width, char pad) {
    std::string result = str.substr(0, width);
    result.resize(width, pad);
    return result;
}

std::string GetBasename(const std::string& path) {
    const size_t slash = path.find_last_of("/\\");
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string FormatLogEntry(const LogEntry& entry, const LogFormat& format) {
    std::string line;
    line.reserve(entry.message.size() + 64);

    if (format.timestamp) {
        line += FormatLogTimestamp(entry.timestamp);
        line += ' ';
    }
    if (format.level) {
        line += '[';
        line += FixedWidth(LogLevelToString(entry.level), 5);
        line += "] ";
    }
    if (format.category && !entry.category.empty() && entry.category != LogCategory::DEFAULT) {
        line += '[';
        line += entry.category;
        line += "] ";
    }
    if (format.location && !entry.file.empty()) {
        line += GetBasename(entry.file);
        line += ':';
        line += std::to_string(entry.line);
        if (format.function && !entry.function.empty()) {
            line += ' ';
            line += entry.function;
            line += "()";
        }
        line += ' ';
    }
    line += entry.message;
    return line;
}

// ============================================================================
// ConsoleSink
// ============================================================================

void ConsoleSink::Write(const LogEntry& entry) {
    if (entry.level < config_.level) {
        return;
    }
    const std::string line = FormatLogEntry(entry, config_.format);
    FILE* stream = (config_.useStderr && entry.level >= LogLevel::Error) ? stderr : stdout;

    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.useColors && isatty(fileno(stream))) {
        const LevelName* level = FindLevel(entry.level);
        std::fprintf(stream, "%s%s\033[0m\n", level ? level->color : "", line.c_str());
    } else {
        std::fprintf(stream, "%s\n", line.c_str());
    }
}

void ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(stdout);
    std::fflush(stderr);
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const Config& config) : config_(config) {
    if (!config_.path.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);
        OpenLocked();
    }
}

FileSink::~FileSink() {
    Close();
}

bool FileSink::Open(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    file_.close();
    config_.path = path;
    return OpenLocked();
}

bool FileSink::OpenLocked() {
    file_.clear();
    file_.open(config_.path, config_.append ? (std::ios::out | std::ios::app)
                                            : (std::ios::out | std::ios::trunc));
    currentSize_ = 0;
    if (!file_.is_open()) {
        return false;
    }
    std::error_code ec;
    const auto existing = std::filesystem::file_size(config_.path, ec);
    if (!ec) {
        currentSize_ = static_cast<size_t>(existing);
    }
    return true;
}

void FileSink::Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
}

bool FileSink::IsOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_.is_open();
}

size_t FileSink::GetCurrentSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return currentSize_;
}

void FileSink::Write(const LogEntry& entry) {
    if (entry.level < config_.level) {
        return;
    }
    std::string line = FormatLogEntry(entry, config_.format);
    line += '\n';

    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.rotate && currentSize_ >= config_.maxSize && file_.is_open()) {
        RotateLocked();
    }
    if (!file_.is_open()) {
        return;
    }

    file_ << line;
    currentSize_ += line.size();
    if (config_.autoFlush) {
        file_.flush();
    }
}

void FileSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

void FileSink::RotateLocked() {
    namespace fs = std::filesystem;
    file_.close();

    // Oldest first so no generation is overwritten: path.(N-1) -> path.N ... path -> path.1
    std::error_code ec;
    const auto generation = [this](size_t n) { return config_.path + "." + std::to_string(n); };
    if (config_.maxFiles > 0) {
        fs::remove(generation(config_.maxFiles), ec);
        for (size_t n = config_.maxFiles; n > 1; --n) {
            fs::rename(generation(n - 1), generation(n), ec);
        }
        fs::rename(config_.path, generation(1), ec);
    }

    file_.clear();
    file_.open(config_.path, std::ios::out | std::ios::trunc);
    currentSize_ = 0;
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
    Shutdown();
}

void Logger::AddSink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::RemoveSink(const std::shared_ptr<ILogSink>& sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void Logger::ClearSinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

size_t Logger::SinkCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sinks_.size();
}

void Logger::EnableCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(mutex_);
    enabledCategories_.insert(category);
    allCategoriesEnabled_ = false;
}

bool Logger::IsCategoryEnabled(const std::string& category) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return allCategoriesEnabled_ || enabledCategories_.count(category) > 0;
}

void Logger::EnableAllCategories() {
    std::lock_guard<std::mutex> lock(mutex_);
    allCategoriesEnabled_ = true;
}

void Logger::DisableAllCategories() {
    std::lock_guard<std::mutex> lock(mutex_);
    allCategoriesEnabled_ = false;
    enabledCategories_.clear();
}

bool Logger::WillLog(LogLevel level, const std::string& category) const {
    if (level == LogLevel::Off || level < level_.load()) {
        return false;
    }
    return IsCategoryEnabled(category);
}

void Logger::Log(LogLevel level, const std::string& category,
                 const std::string& message,
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

    std::lock_guard<std::mutex> lock(mutex_);
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

    va_list args;
    va_start(args, format);
    va_list sizing;
    va_copy(sizing, args);
    const int needed = std::vsnprintf(nullptr, 0, format, sizing);
    va_end(sizing);

    std::string message;
    if (needed > 0) {
        message.resize(static_cast<size_t>(needed) + 1);
        std::vsnprintf(&message[0], message.size(), format, args);
        message.resize(static_cast<size_t>(needed));
    }
    va_end(args);

    Log(level, category, message, file, line, function);
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        sink->Flush();
    }
}

void Logger::Shutdown() {
    Flush();
    ClearSinks();
}

// ============================================================================
// Process Setup
// ============================================================================

bool ConfigureLogging(const LogSettings& settings) {
    Logger& logger = Logger::Instance();
    logger.ClearSinks();
    logger.SetLevel(settings.level);

    logger.EnableAllCategories();
    for (const auto& category : settings.categories) {
        logger.EnableCategory(category);
    }

    if (settings.printToConsole) {
        ConsoleSink::Config console;
        console.useStderr = true;
        console.format.timestamp = false;
        console.level = settings.level;
        logger.AddSink(std::make_shared<ConsoleSink>(console));
    }

    if (settings.logFile.empty()) {
        return true;
    }

    FileSink::Config fileConfig;
    fileConfig.path = settings.logFile;
    fileConfig.level = std::min(settings.level, LogLevel::Debug);
    auto fileSink = std::make_shared<FileSink>(fileConfig);
    if (!fileSink->IsOpen()) {
        return false;
    }
    logger.AddSink(std::move(fileSink));
    return true;
}

// ============================================================================
// LogStream / ScopedLogTimer
// ============================================================================

LogStream::~LogStream() {
    Logger::Instance().Log(level_, category_, stream_.str(), file_, line_, function_);
}

ScopedLogTimer::~ScopedLogTimer() {
    Logger& logger = Logger::Instance();
    if (!logger.WillLog(LogLevel::Debug, category_)) {
        return;
    }
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_);
    logger.Log(LogLevel::Debug, category_,
               "Completed: " + operation_ + " in " + std::to_string(elapsed.count()) + "ms");
}

} // namespace util
} // namespace foresight
