// VFACE - Logging Implementation
// Copyright (c) 2024 VFACE Developers
// MIT License

#include "vface/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>

#include <unistd.h>

namespace vface {
namespace util {

// ============================================================================
// Helpers
// ============================================================================

const char* LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

LogLevel LogLevelFromString(const std::string& str) {
    std::string name = str;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static const std::pair<const char*, LogLevel> names[] = {
        {"trace", LogLevel::Trace}, {"debug", LogLevel::Debug},
        {"info", LogLevel::Info},   {"warn", LogLevel::Warn},
        {"warning", LogLevel::Warn}, {"error", LogLevel::Error},
        {"fatal", LogLevel::Fatal}, {"off", LogLevel::Off},
        {"none", LogLevel::Off},
    };
    for (const auto& [text, level] : names) {
        if (name == text) return level;
    }
    return LogLevel::Info;
}

std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;

    std::tm local;
    localtime_r(&seconds, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis;
    return oss.str();
}

std::string LogId(const std::string& id, size_t len) {
    if (id.size() <= len) {
        return id;
    }
    return id.substr(0, len) + "...";
}

namespace {

/// "<time> [LEVEL] [category] [thread] file:line message"
std::string FormatEntry(const LogEntry& entry, bool showThread, bool showLocation) {
    std::ostringstream oss;
    oss << FormatLogTimestamp(entry.timestamp) << " ["
        << std::left << std::setw(5) << LogLevelToString(entry.level) << "] ";
    if (!entry.category.empty() && entry.category != LogCategory::DEFAULT) {
        oss << "[" << entry.category << "] ";
    }
    if (showThread) {
        oss << "[" << entry.threadId << "] ";
    }
    if (showLocation && !entry.file.empty()) {
        oss << entry.file << ":" << entry.line << " ";
    }
    oss << entry.message;
    return oss.str();
}

const char* ColorFor(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        case LogLevel::Fatal: return "\033[35;1m";
        default:              return "";
    }
}

} // namespace

// ============================================================================
// ConsoleSink
// ============================================================================

ConsoleSink::ConsoleSink(const Config& config)
    : ILogSink(config.level), config_(config) {}

void ConsoleSink::Write(const LogEntry& entry) {
    std::string line = FormatEntry(entry, config_.showThread, false);

    std::lock_guard<std::mutex> lock(mutex_);
    FILE* out = config_.useStderr ? stderr : stdout;
    const char* color = ColorFor(entry.level);
    if (config_.useColors && *color && isatty(fileno(out))) {
        std::fprintf(out, "%s%s\033[0m\n", color, line.c_str());
    } else {
        std::fprintf(out, "%s\n", line.c_str());
    }
}

void ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(config_.useStderr ? stderr : stdout);
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const Config& config)
    : ILogSink(config.level), config_(config) {
    file_.open(config_.path, std::ios::out | std::ios::app);
    if (file_.is_open()) {
        file_.seekp(0, std::ios::end);
        currentSize_ = static_cast<size_t>(file_.tellp());
    }
}

FileSink::~FileSink() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
}

bool FileSink::IsOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_.is_open();
}

void FileSink::Write(const LogEntry& entry) {
    std::string line = FormatEntry(entry, true, true);
    line += '\n';

    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_.is_open()) {
        return;
    }
    if (currentSize_ >= config_.maxSize) {
        Rotate();
    }
    file_ << line;
    currentSize_ += line.size();
    if (entry.level >= LogLevel::Warn) {
        file_.flush();
    }
}

void FileSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

void FileSink::Rotate() {
    file_.close();

    // path.maxFiles falls off the end, the rest shift up one generation
    auto generation = [this](size_t n) { return config_.path + "." + std::to_string(n); };
    std::remove(generation(config_.maxFiles).c_str());
    for (size_t n = config_.maxFiles; n > 1; --n) {
        std::rename(generation(n - 1).c_str(), generation(n).c_str());
    }
    std::rename(config_.path.c_str(), generation(1).c_str());

    file_.open(config_.path, std::ios::out | std::ios::trunc);
    currentSize_ = 0;
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

void Logger::Initialize() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    if (sinks_.empty()) {
        sinks_.push_back(std::make_shared<ConsoleSink>());
    }
}

void Logger::Shutdown() {
    Flush();
    ClearSinks();
}

void Logger::AddSink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::ClearSinks() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.clear();
}

void Logger::SetCategories(const std::vector<std::string>& categories) {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    categories_.clear();
    bool all = categories.empty() ||
               std::find(categories.begin(), categories.end(), "all") != categories.end();
    if (!all) {
        categories_.insert(categories.begin(), categories.end());
    }
    allCategories_.store(all);
}

bool Logger::WillLog(LogLevel level, const std::string& category) const {
    if (level < level_.load() || level == LogLevel::Off) {
        return false;
    }
    if (level >= LogLevel::Error || allCategories_.load()) {
        return true;
    }
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    return categories_.count(category) > 0;
}

void Logger::Log(LogLevel level, const std::string& category, const std::string& message,
                 const char* file, int line) {
    if (!WillLog(level, category)) {
        return;
    }

    LogEntry entry;
    entry.level = level;
    entry.category = category;
    entry.message = message;
    if (file) {
        std::string path(file);
        size_t slash = path.find_last_of('/');
        entry.file = slash == std::string::npos ? path : path.substr(slash + 1);
    }
    entry.line = line;
    entry.timestamp = std::chrono::system_clock::now();
    entry.threadId = std::this_thread::get_id();

    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        if (level >= sink->GetLevel()) {
            sink->Write(entry);
        }
    }
}

void Logger::LogF(LogLevel level, const std::string& category, const char* file, int line,
                  const char* format, ...) {
    char buffer[2048];
    va_list args;
    va_start(args, format);
    std::vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    Log(level, category, buffer, file, line);
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Flush();
    }
}

// ============================================================================
// Setup
// ============================================================================

bool InitLogging(const LoggingOptions& options) {
    Logger& logger = Logger::Instance();
    logger.ClearSinks();
    logger.SetLevel(options.level);
    logger.SetCategories(options.categories);

    if (options.printToConsole) {
        ConsoleSink::Config console;
        console.level = options.level;
        console.useStderr = true;
        logger.AddSink(std::make_shared<ConsoleSink>(console));
    }

    if (!options.logFile.empty()) {
        FileSink::Config file;
        file.path = options.logFile;
        file.level = options.level;
        auto sink = std::make_shared<FileSink>(file);
        if (!sink->IsOpen()) {
            return false;
        }
        logger.AddSink(std::move(sink));
    }
    return true;
}

} // namespace util
} // namespace vface
