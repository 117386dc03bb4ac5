#pragma once
#include <cstdint>
#include <string_view>

namespace zlog
{

enum class LogLevel : uint8_t
{
  Debug = 0,
  Info = 1,
  Warning = 2,
  Error = 3,
  Critical = 4
};

constexpr std::string_view to_string(LogLevel level)
{
  switch (level)
  {
    case LogLevel::Debug:
      return "DEBUG";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warning:
      return "WARNING";
    case LogLevel::Error:
      return "ERROR";
    case LogLevel::Critical:
      return "CRITICAL";
  }
  return "UNKNOWN";
}

// 配置名称 -> 级别: "debug" | "info" | "warning" | "error" | "crit"
// 未知名称抛出 ConfigError
LogLevel parse_level(std::string_view name);

// 编译期最低活跃级别（通过 CMake -DZLOG_ACTIVE_LEVEL=1 注入）
#ifndef ZLOG_ACTIVE_LEVEL
#define ZLOG_ACTIVE_LEVEL 0  // Debug
#endif

}  // namespace zlog
