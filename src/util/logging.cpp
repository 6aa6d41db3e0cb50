// LIQUIDSTAKE - Logging Implementation
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License

#include "liquidstake/util/logging.h"
#include "liquidstake/util/time.h"

#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <exception>

#include <unistd.h>

namespace liquidstake {
namespace util {

namespace {

struct LevelInfo {
    LogLevel level;
    const char* name;
    const char* color;
};

const LevelInfo LEVELS[] = {
    {LogLevel::Trace, "TRACE", "\033[90m"},
    {LogLevel::Debug, "DEBUG", "\033[36m"},
    {LogLevel::Info,  "INFO",  "\033[32m"},
    {LogLevel::Warn,  "WARN",  "\033[33m"},
    {LogLevel::Error, "ERROR", "\033[31m"},
    {LogLevel::Fatal, "FATAL", "\033[35;1m"},
    {LogLevel::Off,   "OFF",   ""},
};

const LevelInfo* Find(LogLevel level) {
    for (const LevelInfo& info : LEVELS) {
        if (info.level == level) return &info;
    }
    return nullptr;
}

std::string Upper(std::string text) {
    for (char& c : text) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return text;
}

} // namespace

const char* LogLevelToString(LogLevel level) {
    const LevelInfo* info = Find(level);
    return info ? info->name : "UNKNOWN";
}

LogLevel LogLevelFromString(const std::string& name) {
    std::string upper = Upper(name);
    if (upper == "WARNING") return LogLevel::Warn;
    if (upper == "NONE") return LogLevel::Off;
    for (const LevelInfo& info : LEVELS) {
        if (upper == info.name) return info.level;
    }
    return LogLevel::Info;
}

std::string FixedWidth(const std::string& text, size_t width, char pad) {
    std::string out = text.substr(0, width);
    out.resize(width, pad);
    return out;
}

std::string GetBasename(const std::string& path) {
    size_t slash = path.find_last_of("/\\");
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string FormatLogEntry(const LogEntry& entry, const LogFormatOptions& options) {
    std::string when = FormatISO8601Millis(entry.timestamp);
    std::string level = LogLevelToString(entry.level);

    if (options.format == LogFormat::Compact) {
        return "[" + when + "] " + level + ": " + entry.message;
    }

    std::string line = when + " [" + FixedWidth(level, 5) + "] ";
    if (!entry.category.empty() && entry.category != LogCategory::DEFAULT) {
        line += "[" + entry.category + "] ";
    }
    if (options.showLocation && !entry.file.empty()) {
        line += GetBasename(entry.file) + ":" + std::to_string(entry.line) + " ";
    }
    return line + entry.message;
}

// ============================================================================
// ConsoleSink
// ============================================================================

ConsoleSink::ConsoleSink() : ConsoleSink(Config()) {}

ConsoleSink::ConsoleSink(const Config& config) : ILogSink(config.level), config_(config) {}

void ConsoleSink::Emit(const LogEntry& entry) {
    std::string line = FormatLogEntry(entry, config_.layout);
    FILE* stream = config_.useStderr && entry.level >= LogLevel::Error ? stderr : stdout;

    std::lock_guard<std::mutex> lock(mutex_);
    const LevelInfo* info = Find(entry.level);
    if (config_.useColors && info != nullptr && isatty(fileno(stream))) {
        std::fprintf(stream, "%s%s\033[0m\n", info->color, line.c_str());
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

FileSink::FileSink(const Config& config) : ILogSink(config.level), config_(config) {
    out_.open(config_.path, config_.append ? std::ios::app : std::ios::trunc);
    if (out_.is_open()) {
        out_.seekp(0, std::ios::end);
        written_ = static_cast<size_t>(out_.tellp());
    }
}

bool FileSink::IsOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return out_.is_open();
}

void FileSink::Emit(const LogEntry& entry) {
    std::string line = FormatLogEntry(entry, config_.layout) + "\n";

    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.rotate && written_ >= config_.maxSize && out_.is_open()) {
        Rotate();
    }
    if (!out_.is_open()) {
        return;
    }
    out_ << line;
    out_.flush();
    written_ += line.size();
}

void FileSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (out_.is_open()) {
        out_.flush();
    }
}

void FileSink::Rotate() {
    out_.close();
    auto numbered = [this](size_t n) { return config_.path + "." + std::to_string(n); };

    std::remove(numbered(config_.maxFiles).c_str());
    for (size_t n = config_.maxFiles; n > 1; --n) {
        std::rename(numbered(n - 1).c_str(), numbered(n).c_str());
    }
    std::rename(config_.path.c_str(), numbered(1).c_str());

    out_.open(config_.path, std::ios::trunc);
    written_ = 0;
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

void Logger::AddSink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::ClearSinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::Shutdown() {
    Flush();
    ClearSinks();
}

void Logger::EnableCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(mutex_);
    categories_.insert(category);
}

void Logger::EnableAllCategories() {
    std::lock_guard<std::mutex> lock(mutex_);
    categories_.clear();
}

bool Logger::IsCategoryEnabled(const std::string& category) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return categories_.empty() || categories_.count(category) > 0;
}

bool Logger::WillLog(LogLevel level, const std::string& category) const {
    return level != LogLevel::Off && level >= level_.load() && IsCategoryEnabled(category);
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
    entry.file = file ? file : "";
    entry.line = line;
    entry.timestamp = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        try {
            sink->Write(entry);
        } catch (const std::exception& e) {
            std::fprintf(stderr, "log sink failed: %s; lost entry: %s\n", e.what(),
                         message.c_str());
        }
    }
}

void Logger::LogF(LogLevel level, const std::string& category, const char* file, int line,
                  const char* format, ...) {
    if (!WillLog(level, category)) {
        return;
    }

    va_list args;
    va_start(args, format);
    va_list sizing;
    va_copy(sizing, args);
    int length = std::vsnprintf(nullptr, 0, format, sizing);
    va_end(sizing);

    std::string message;
    if (length > 0) {
        message.resize(static_cast<size_t>(length) + 1);
        std::vsnprintf(&message[0], message.size(), format, args);
        message.resize(static_cast<size_t>(length));
    }
    va_end(args);

    Log(level, category, message, file, line);
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        sink->Flush();
    }
}

} // namespace util
} // namespace liquidstake
