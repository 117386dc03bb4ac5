#pragma once
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "logger.hpp"
#include "logger_config.hpp"

namespace zlog
{

// name -> Logger。同名再次获取返回同一个实例，不会重复挂载 sink。
// 测试可以各自构造独立的 registry；Global() 是进程级的默认实例。
class LoggerRegistry
{
 public:
  LoggerRegistry() = default;
  ~LoggerRegistry();

  LoggerRegistry(const LoggerRegistry&) = delete;
  LoggerRegistry& operator=(const LoggerRegistry&) = delete;

  static LoggerRegistry& Global();

  // 首次获取时创建控制台 sink + 轮转文件 sink；配置或文件无法打开时抛出 ConfigError
  std::shared_ptr<Logger> GetLogger(const LoggerConfig& config);
  std::shared_ptr<Logger> GetLogger(const std::string& file_path, std::string_view level = "info",
                                    size_t backup_count = 0, bool color_enabled = true);

  // 未注册时返回 nullptr
  std::shared_ptr<Logger> Find(const std::string& name) const;

  size_t Size() const;

  // 刷新并关闭所有 Logger，清空 registry
  void CloseAll();

 private:
  static std::shared_ptr<Logger> CreateLogger(const LoggerConfig& config);

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Logger>> loggers_;
};

}  // namespace zlog
