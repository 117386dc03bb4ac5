#include "zlog/logger_config.hpp"

#include <filesystem>
#include <system_error>

#include "zlog/errors.hpp"

namespace zlog
{

namespace fs = std::filesystem;

std::string absolute_log_path(const std::string& file_path)
{
  std::error_code ec;
  fs::path abs = fs::absolute(fs::path(file_path), ec);
  if (ec)
  {
    throw ConfigError("cannot resolve log path '" + file_path + "': " + ec.message());
  }
  return abs.lexically_normal().string();
}

LoggerConfig make_config(const std::string& file_path, std::string_view level,
                         size_t backup_count, bool color_enabled)
{
  LoggerConfig config;
  config.file_path = file_path;
  config.min_level = parse_level(level);
  config.backup_count = backup_count;
  config.color_enabled = color_enabled;
  return normalize_config(std::move(config));
}

LoggerConfig normalize_config(LoggerConfig config)
{
  if (config.file_path.empty())
  {
    throw ConfigError("log file path must not be empty");
  }
  if (config.file_path.back() == '/')
  {
    throw ConfigError("log file path '" + config.file_path + "' names a directory");
  }
  if (config.lock_timeout.count() < 0)
  {
    throw ConfigError("lock timeout must not be negative");
  }

  config.file_path = absolute_log_path(config.file_path);
  if (config.name.empty())
  {
    config.name = config.file_path;
  }
  return config;
}

}  // namespace zlog
