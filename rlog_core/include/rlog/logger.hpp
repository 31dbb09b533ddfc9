#pragma once
#include "log_level.hpp"
#include "log_record.hpp"
#include "log_context.hpp"
#include "logger_options.hpp"
#include "memory_usage.hpp"
#include "backend.hpp"
#include "sinks/console_sink.hpp"
#include "sinks/rotating_file_sink.hpp"
#include "sinks/sink_interface.hpp"

#include <atomic>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <fmt/format.h>

namespace rlog {

// Leveled logger writing to the console and/or a rotating log file.
//
// Constructed closed: nothing is written until Open(). Options can only be
// changed while closed. Log calls never throw and never wait for rotation;
// I/O failures on the file are handled in the background.
class Logger {
public:
    explicit Logger(const LoggerOptions& options = {}, LoggerRuntime runtime = {});
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // Nothing is applied if the level name is bad (InvalidConfigurationError)
    // or a filename is given after the file was opened (InvalidStateError).
    void Set(const LoggerOptions& options);
    void Set(std::string_view level);

    void SetLevel(std::string_view name);
    void SetLevel(LogLevel level);
    LogLevel Level() const;
    bool Enabled(LogLevel level) const;

    // Throws InvalidStateError once the file has been opened.
    void SetFile(const std::string& path);

    void AddSink(std::unique_ptr<ILogSink> sink);

    // Throws StreamOpenError.
    void Open();
    // Throws StreamCloseError; the logger is closed either way.
    void Close();
    bool IsOpen() const;

    std::future<std::optional<std::string>> Rotate();
    void Flush();

    // 无线程模式：手动执行后台任务（滚动、清理、重开）
    size_t Drain(size_t max_tasks = 64);

    template <typename... Args>
    void Error(fmt::format_string<Args...> fmt, Args&&... args) {
        LogFormatted(LogLevel::Error, {}, fmt, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void Warning(fmt::format_string<Args...> fmt, Args&&... args) {
        LogFormatted(LogLevel::Warning, {}, fmt, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void Info(fmt::format_string<Args...> fmt, Args&&... args) {
        LogFormatted(LogLevel::Info, {}, fmt, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void Debug(fmt::format_string<Args...> fmt, Args&&... args) {
        LogFormatted(LogLevel::Debug, {}, fmt, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void Spam(fmt::format_string<Args...> fmt, Args&&... args) {
        LogFormatted(LogLevel::Spam, {}, fmt, std::forward<Args>(args)...);
    }

    void Error(const ErrorPayload& err) { Log(LogLevel::Error, {}, err); }
    void Warning(const ErrorPayload& err) { Log(LogLevel::Warning, {}, err); }
    void Info(const ErrorPayload& err) { Log(LogLevel::Info, {}, err); }
    void Debug(const ErrorPayload& err) { Log(LogLevel::Debug, {}, err); }
    void Spam(const ErrorPayload& err) { Log(LogLevel::Spam, {}, err); }

    void Error(const std::exception& e) { Error(ErrorPayload::FromException(e)); }
    void Warning(const std::exception& e) { Warning(ErrorPayload::FromException(e)); }
    void Info(const std::exception& e) { Info(ErrorPayload::FromException(e)); }
    void Debug(const std::exception& e) { Debug(ErrorPayload::FromException(e)); }
    void Spam(const std::exception& e) { Spam(ErrorPayload::FromException(e)); }

    // Common entry point; applies the level threshold.
    void Log(LogLevel level, std::string_view module, const LogPayload& payload);

    // Core log method, template defined in header
    template <typename... Args>
    void LogFormatted(LogLevel level, std::string_view module,
                      fmt::format_string<Args...> fmt, Args&&... args);

    // Cached per module name; lives as long as the Logger.
    LoggerContext& Context(const std::string& module);

    MemoryUsage GetMemoryUsage() const;
    void Memory(std::string_view module = {});

    ConsoleSink& Console() { return *console_; }
    RotatingFileSink& FileSink() { return *file_sink_; }
    uint64_t DropCount() const;

private:
    LoggerBackend backend_;
    std::atomic<LogLevel> level_{LogLevel::None};
    std::atomic<bool> open_{false};
    std::atomic<bool> console_enabled_{true};

    std::mutex sinks_mutex_;
    std::unique_ptr<ConsoleSink> console_;
    std::vector<std::unique_ptr<ILogSink>> sinks_;
    std::unique_ptr<RotatingFileSink> file_sink_;

    std::mutex contexts_mutex_;
    std::unordered_map<std::string, std::unique_ptr<LoggerContext>> contexts_;

    void Emit(LogLevel level, std::string_view module, std::string_view message);
};

// ===== template implementation =====

template <typename... Args>
void Logger::LogFormatted(LogLevel level, std::string_view module,
                          fmt::format_string<Args...> fmt, Args&&... args) {
    if (!Enabled(level) || !open_.load(std::memory_order_acquire)) {
        return;
    }
    std::string message = fmt::format(fmt, std::forward<Args>(args)...);
    Emit(level, module, message);
}

template <typename... Args>
void LoggerContext::LogFormatted(LogLevel level, fmt::format_string<Args...> fmt,
                                 Args&&... args) {
    logger_->LogFormatted(level, module_, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void LoggerContext::Error(fmt::format_string<Args...> fmt, Args&&... args) {
    LogFormatted(LogLevel::Error, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void LoggerContext::Warning(fmt::format_string<Args...> fmt, Args&&... args) {
    LogFormatted(LogLevel::Warning, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void LoggerContext::Info(fmt::format_string<Args...> fmt, Args&&... args) {
    LogFormatted(LogLevel::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void LoggerContext::Debug(fmt::format_string<Args...> fmt, Args&&... args) {
    LogFormatted(LogLevel::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void LoggerContext::Spam(fmt::format_string<Args...> fmt, Args&&... args) {
    LogFormatted(LogLevel::Spam, fmt, std::forward<Args>(args)...);
}

} // namespace rlog

// ===== Logging macros =====
// Work on a Logger or a LoggerContext; levels above RLOG_ACTIVE_LEVEL compile away.

#define RLOG_LOG_CALL(logger, lvl, ...) \
    do { \
        constexpr auto _rlog_lvl = ::rlog::LogLevel::lvl; \
        if (static_cast<int>(_rlog_lvl) <= RLOG_ACTIVE_LEVEL) { \
            (logger).lvl(__VA_ARGS__); \
        } \
    } while (0)

#define RLOG_ERROR(logger, ...)   RLOG_LOG_CALL(logger, Error, __VA_ARGS__)
#define RLOG_WARNING(logger, ...) RLOG_LOG_CALL(logger, Warning, __VA_ARGS__)
#define RLOG_INFO(logger, ...)    RLOG_LOG_CALL(logger, Info, __VA_ARGS__)
#define RLOG_DEBUG(logger, ...)   RLOG_LOG_CALL(logger, Debug, __VA_ARGS__)
#define RLOG_SPAM(logger, ...)    RLOG_LOG_CALL(logger, Spam, __VA_ARGS__)
