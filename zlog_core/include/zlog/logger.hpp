#pragma once
#include "log_level.hpp"
#include "log_entry.hpp"
#include "source_location.hpp"
#include "platform.hpp"
#include "timestamp.hpp"
#include "sinks/sink_interface.hpp"

#include <atomic>
#include <cstdio>  // snprintf fallback
#include <memory>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#ifdef ZLOG_USE_FMTLIB
#include <fmt/format.h>
#endif

namespace zlog {

// 一个名字对应一个 Logger；同步分发到各 sink（控制台在前，文件在后）。
// 通常经由 LoggerRegistry::GetLogger 获取，不直接构造。
class Logger {
public:
    Logger(std::string name, LogLevel level);
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void AddSink(std::unique_ptr<ILogSink> sink);
    size_t SinkCount() const;

    void SetLevel(LogLevel level);
    LogLevel Level() const;
    bool ShouldLog(LogLevel level) const { return level >= Level(); }

    const std::string& Name() const { return name_; }

    void Flush();
    void Close();

    // 每个 sink 都会被尝试；任一文件 sink 抛出的 IoError 在全部尝试后重新抛出
    void Log(LogLevel level, const SourceLocation& loc, std::string message);

    // Core log method — template, defined in header
    template <typename... Args>
    void LogFormat(LogLevel level, const SourceLocation& loc,
                   const char* fmt, Args&&... args);

    template <typename... Args>
    void Debug(const SourceLocation& loc, const char* fmt, Args&&... args) {
        LogFormat(LogLevel::Debug, loc, fmt, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void Info(const SourceLocation& loc, const char* fmt, Args&&... args) {
        LogFormat(LogLevel::Info, loc, fmt, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void Warning(const SourceLocation& loc, const char* fmt, Args&&... args) {
        LogFormat(LogLevel::Warning, loc, fmt, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void Error(const SourceLocation& loc, const char* fmt, Args&&... args) {
        LogFormat(LogLevel::Error, loc, fmt, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void Critical(const SourceLocation& loc, const char* fmt, Args&&... args) {
        LogFormat(LogLevel::Critical, loc, fmt, std::forward<Args>(args)...);
    }

private:
    std::string name_;
    std::atomic<LogLevel> level_;
    std::vector<std::unique_ptr<ILogSink>> sinks_;
    mutable std::shared_mutex sinks_mutex_;

    void Dispatch(const LogEntry& entry);
};

// ===== LogFormat template implementation =====

template <typename... Args>
void Logger::LogFormat(LogLevel level, const SourceLocation& loc,
                       const char* fmt, Args&&... args) {
    if (!ShouldLog(level)) {
        return;
    }

    // 无参数时原样输出，'{' 与 '%' 不做解释
    if constexpr (sizeof...(Args) == 0) {
        Log(level, loc, std::string(fmt));
    } else {
#ifdef ZLOG_USE_FMTLIB
        Log(level, loc, fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...));
#else
        char buf[ZLOG_MAX_MSG_LEN];
        int written = std::snprintf(buf, sizeof(buf), fmt, args...);
        size_t len = (written > 0) ? static_cast<size_t>(written) : 0;
        if (len >= sizeof(buf)) len = sizeof(buf) - 1;
        Log(level, loc, std::string(buf, len));
#endif
    }
}

} // namespace zlog

// ===== Logging macros =====
// logger 为 zlog::Logger& 表达式，例如 ZLOG_INFO(*log, "started")

#define ZLOG_LOG_CALL(logger, lvl, ...) \
    do { \
        constexpr auto _zlog_lvl = ::zlog::LogLevel::lvl; \
        if (static_cast<int>(_zlog_lvl) >= ZLOG_ACTIVE_LEVEL) { \
            ::zlog::Logger& _zlog_logger = (logger); \
            if (_zlog_logger.ShouldLog(_zlog_lvl)) { \
                _zlog_logger.LogFormat( \
                    _zlog_lvl, ZLOG_CURRENT_LOCATION(), __VA_ARGS__); \
            } \
        } \
    } while (0)

#define ZLOG_DEBUG(logger, ...)    ZLOG_LOG_CALL(logger, Debug, __VA_ARGS__)
#define ZLOG_INFO(logger, ...)     ZLOG_LOG_CALL(logger, Info, __VA_ARGS__)
#define ZLOG_WARNING(logger, ...)  ZLOG_LOG_CALL(logger, Warning, __VA_ARGS__)
#define ZLOG_ERROR(logger, ...)    ZLOG_LOG_CALL(logger, Error, __VA_ARGS__)
#define ZLOG_CRITICAL(logger, ...) ZLOG_LOG_CALL(logger, Critical, __VA_ARGS__)
