#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <string>
#include <string_view>

#include "log_level.hpp"
#include "platform.hpp"
#include "timestamp.hpp"

namespace zlog
{

struct LoggerConfig
{
  // Registry 中的键；为空时取 file_path 的规范化绝对路径
  std::string name;
  std::string file_path;
  LogLevel min_level = LogLevel::Info;
  // 0 表示备份全部保留
  size_t backup_count = 0;
  // 同时作用于控制台和文件（只给消息正文着色）
  bool color_enabled = true;
  bool console_enabled = true;
  std::FILE* console_stream = stderr;
  RotateWhen rotate_when = RotateWhen::Midnight;
  std::chrono::milliseconds lock_timeout{ZLOG_LOCK_TIMEOUT_MS};
  int32_t utc_offset_seconds = kDefaultUtcOffsetSeconds;
  // 轮转判断使用的时钟，为空时取系统时间
  std::function<uint64_t()> rotation_clock;
};

// 与构造参数 (file_name, level="info", backupCount=0, add_color=True) 一一对应。
// 级别名非法时抛出 ConfigError。
LoggerConfig make_config(const std::string& file_path, std::string_view level = "info",
                         size_t backup_count = 0, bool color_enabled = true);

// 校验并补全：file_path 转为绝对路径，name 缺省为该路径。失败抛出 ConfigError。
LoggerConfig normalize_config(LoggerConfig config);

// 相对路径按当前工作目录转为绝对路径，并做词法规范化
std::string absolute_log_path(const std::string& file_path);

}  // namespace zlog
