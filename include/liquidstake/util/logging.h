// LIQUIDSTAKE - Logging
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License
//
// One process-wide Logger fans entries out to sinks. Each sink has its own
// threshold and line layout: the daemon writes the detailed layout, the
// reward claimer the compact "[ISO8601] LEVEL: message" one.

#ifndef LIQUIDSTAKE_UTIL_LOGGING_H
#define LIQUIDSTAKE_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace liquidstake {
namespace util {

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

/// Case-insensitive; "warning" and "none" are accepted, anything else is Info
LogLevel LogLevelFromString(const std::string& name);

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* STAKING = "staking";
    constexpr const char* REWARDS = "rewards";
    constexpr const char* ISSUER = "issuer";
    constexpr const char* LEDGER = "ledger";
    constexpr const char* VALIDATOR = "validator";
    constexpr const char* RPC = "rpc";
    constexpr const char* DB = "db";
    constexpr const char* CLAIMER = "claimer";
}

struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    /// Source location, empty when logged without one
    std::string file;
    int line{0};
    std::chrono::system_clock::time_point timestamp;
};

enum class LogFormat {
    /// 2024-01-15T10:30:00.123Z [INFO ] [staking] message
    Detailed,
    /// [2024-01-15T10:30:00.123Z] INFO: message
    Compact,
};

struct LogFormatOptions {
    LogFormat format{LogFormat::Detailed};
    /// Detailed only: prefix the message with file:line
    bool showLocation{false};
};

/// One line, without the newline
std::string FormatLogEntry(const LogEntry& entry, const LogFormatOptions& options);

// ============================================================================
// Sinks
// ============================================================================

/// Destination for entries at or above the sink's own level
class ILogSink {
public:
    explicit ILogSink(LogLevel level) : level_(level) {}
    virtual ~ILogSink() = default;

    /// Drops entries below GetLevel()
    void Write(const LogEntry& entry) {
        if (entry.level >= level_.load()) {
            Emit(entry);
        }
    }

    virtual void Flush() {}

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

protected:
    virtual void Emit(const LogEntry& entry) = 0;

private:
    std::atomic<LogLevel> level_;
};

class ConsoleSink : public ILogSink {
public:
    struct Config {
        /// ANSI colors, only when the stream is a terminal
        bool useColors{true};
        /// Send Error and Fatal to stderr
        bool useStderr{false};
        LogFormatOptions layout;
        LogLevel level{LogLevel::Info};
    };

    ConsoleSink();
    explicit ConsoleSink(const Config& config);

    void Flush() override;

protected:
    void Emit(const LogEntry& entry) override;

private:
    Config config_;
    std::mutex mutex_;
};

/// Appends to a file, rotating path -> path.1 -> ... -> path.maxFiles
class FileSink : public ILogSink {
public:
    struct Config {
        std::string path;
        bool append{true};
        bool rotate{true};
        size_t maxSize{10 * 1024 * 1024};
        size_t maxFiles{5};
        LogFormatOptions layout;
        LogLevel level{LogLevel::Debug};
    };

    /// Check IsOpen(); entries are dropped while the file is not open
    explicit FileSink(const Config& config);

    bool IsOpen() const;
    void Flush() override;

protected:
    void Emit(const LogEntry& entry) override;

private:
    void Rotate();

    Config config_;
    std::ofstream out_;
    size_t written_{0};
    mutable std::mutex mutex_;
};

class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Info)
        : ILogSink(level), callback_(std::move(callback)) {}

protected:
    void Emit(const LogEntry& entry) override {
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

    void AddSink(std::shared_ptr<ILogSink> sink);
    void ClearSinks();

    /// Flush, then drop every sink
    void Shutdown();

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// The first call narrows output to the named categories
    void EnableCategory(const std::string& category);
    void EnableAllCategories();
    bool IsCategoryEnabled(const std::string& category) const;

    bool WillLog(LogLevel level, const std::string& category) const;

    /// A sink that throws loses the entry; the others still receive it
    void Log(LogLevel level, const std::string& category, const std::string& message,
             const char* file = nullptr, int line = 0);

    /// printf-style; long messages are not truncated
    void LogF(LogLevel level, const std::string& category, const char* file, int line,
              const char* format, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 6, 7)))
#endif
        ;

    void Flush();

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::atomic<LogLevel> level_{LogLevel::Info};

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<ILogSink>> sinks_;
    /// Empty means every category
    std::set<std::string> categories_;
};

/// Accumulates operator<< output and hands it to the Logger when destroyed
class LogStream {
public:
    LogStream(LogLevel level, const char* category, const char* file, int line)
        : level_(level), category_(category), file_(file), line_(line) {}
    ~LogStream() {
        Logger::Instance().Log(level_, category_, text_.str(), file_, line_);
    }

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        text_ << value;
        return *this;
    }

private:
    LogLevel level_;
    const char* category_;
    const char* file_;
    int line_;
    std::ostringstream text_;
};

#define LIQUIDSTAKE_LOG(level, category)                                                  \
    if (!::liquidstake::util::Logger::Instance().WillLog(                                 \
            ::liquidstake::util::LogLevel::level, category)) {                            \
    } else                                                                                \
        ::liquidstake::util::LogStream(::liquidstake::util::LogLevel::level, category,    \
                                       __FILE__, __LINE__)

#define LOG_DEBUG(category) LIQUIDSTAKE_LOG(Debug, category)
#define LOG_INFO(category)  LIQUIDSTAKE_LOG(Info, category)
#define LOG_WARN(category)  LIQUIDSTAKE_LOG(Warn, category)
#define LOG_ERROR(category) LIQUIDSTAKE_LOG(Error, category)

#define LogInfoF(category, ...)                                                           \
    ::liquidstake::util::Logger::Instance().LogF(::liquidstake::util::LogLevel::Info,     \
                                                 category, __FILE__, __LINE__, __VA_ARGS__)

/// "INFO" padded or cut to width
std::string FixedWidth(const std::string& text, size_t width, char pad = ' ');

/// Last component of a '/' or '\\' separated path
std::string GetBasename(const std::string& path);

} // namespace util
} // namespace liquidstake

#endif // LIQUIDSTAKE_UTIL_LOGGING_H
