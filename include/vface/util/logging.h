// VFACE - Logging System
// Copyright (c) 2024 VFACE Developers
// MIT License
//
// Leveled, categorized logging shared by every registry component.
// Entries go to any number of sinks (console, rotating file, callback).
//
// Fingerprints, request ids and keys are never logged in full: pass them
// through LogId(). Vectors, plaintexts and key material are never logged.

#ifndef VFACE_UTIL_LOGGING_H
#define VFACE_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace vface {
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

/// "warning" and "none" are accepted; anything unrecognized is Info
LogLevel LogLevelFromString(const std::string& str);

/// Subsystems selectable with -debug=<category>
namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* REGISTRY = "registry";
    constexpr const char* CHAIN = "chain";
    constexpr const char* CRYPTO = "crypto";
    constexpr const char* KEYSTORE = "keystore";
    constexpr const char* CONSENT = "consent";
    constexpr const char* MATCHER = "matcher";
    constexpr const char* DB = "db";
    constexpr const char* RPC = "rpc";
}

struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    /// Source location; file is reduced to its basename
    std::string file;
    int line{0};
    std::chrono::system_clock::time_point timestamp;
    std::thread::id threadId;
};

// ============================================================================
// Sinks
// ============================================================================

class ILogSink {
public:
    explicit ILogSink(LogLevel level) : level_(level) {}
    virtual ~ILogSink() = default;

    /// Called for entries at or above GetLevel()
    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() {}

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

private:
    std::atomic<LogLevel> level_;
};

/// stdout, or stderr when useStderr is set; colored on a TTY
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};
        bool useStderr{false};
        bool showThread{false};
        LogLevel level{LogLevel::Info};
    };

    ConsoleSink() : ConsoleSink(Config{}) {}
    explicit ConsoleSink(const Config& config);

    void Write(const LogEntry& entry) override;
    void Flush() override;

private:
    Config config_;
    std::mutex mutex_;
};

/// Appends to a file, shifting it to path.1 .. path.maxFiles by size
class FileSink : public ILogSink {
public:
    struct Config {
        std::string path;
        size_t maxSize{10 * 1024 * 1024};
        size_t maxFiles{5};
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

    void Rotate();
};

/// Hands every entry to a callback (tests use it to capture output)
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Info)
        : ILogSink(level), callback_(std::move(callback)) {}

    void Write(const LogEntry& entry) override {
        if (callback_) callback_(entry);
    }

private:
    Callback callback_;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& Instance();

    /// Install a default console sink if no sink is configured
    void Initialize();

    /// Flush and drop all sinks
    void Shutdown();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void ClearSinks();

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /**
     * Restrict Trace..Warn output to the given categories. An empty list,
     * or one containing "all", enables every category. Error and Fatal
     * are never filtered.
     */
    void SetCategories(const std::vector<std::string>& categories);

    bool WillLog(LogLevel level, const std::string& category) const;

    void Log(LogLevel level, const std::string& category, const std::string& message,
             const char* file = nullptr, int line = 0);

    void LogF(LogLevel level, const std::string& category, const char* file, int line,
              const char* format, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 6, 7)))
#endif
        ;

    void Flush();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::set<std::string> categories_;
    std::atomic<bool> allCategories_{true};
    mutable std::mutex categoriesMutex_;
};

/// Builds a message with operator<< and logs it when destroyed
class LogStream {
public:
    LogStream(LogLevel level, const char* category, const char* file, int line)
        : level_(level), category_(category), file_(file), line_(line) {}
    ~LogStream() {
        Logger::Instance().Log(level_, category_, stream_.str(), file_, line_);
    }

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

#define VFACE_LOGGER ::vface::util::Logger::Instance()

// The stream is only built when the entry will be written
#define VFACE_LOG(level, category) \
    if (!VFACE_LOGGER.WillLog(::vface::util::LogLevel::level, category)) {} \
    else ::vface::util::LogStream(::vface::util::LogLevel::level, category, __FILE__, __LINE__)

#define LOG_TRACE(category)   VFACE_LOG(Trace, category)
#define LOG_DEBUG(category)   VFACE_LOG(Debug, category)
#define LOG_INFO(category)    VFACE_LOG(Info, category)
#define LOG_WARN(category)    VFACE_LOG(Warn, category)
#define LOG_ERROR(category)   VFACE_LOG(Error, category)

#define VFACE_LOGF(level, category, ...) \
    do { \
        if (VFACE_LOGGER.WillLog(::vface::util::LogLevel::level, category)) { \
            VFACE_LOGGER.LogF(::vface::util::LogLevel::level, category, \
                              __FILE__, __LINE__, __VA_ARGS__); \
        } \
    } while (0)

#define LogDebugF(category, ...)  VFACE_LOGF(Debug, category, __VA_ARGS__)
#define LogInfoF(category, ...)   VFACE_LOGF(Info, category, __VA_ARGS__)

// ============================================================================
// Setup
// ============================================================================

struct LoggingOptions {
    LogLevel level{LogLevel::Info};
    std::vector<std::string> categories;
    bool printToConsole{true};
    /// Empty disables file output
    std::string logFile;
};

/**
 * Replace the logger's sinks and filters.
 * @return false if the log file could not be opened
 */
bool InitLogging(const LoggingOptions& options);

/// "YYYY-MM-DD HH:MM:SS.mmm", local time
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Shorten an identifier for log output ("3fa2c01b...")
std::string LogId(const std::string& id, size_t len = 8);

} // namespace util
} // namespace vface

#endif // VFACE_UTIL_LOGGING_H
