#include "zlog/log_level.hpp"

#include <string>

#include "zlog/errors.hpp"

namespace zlog
{

LogLevel parse_level(std::string_view name)
{
  if (name == "debug") return LogLevel::Debug;
  if (name == "info") return LogLevel::Info;
  if (name == "warning") return LogLevel::Warning;
  if (name == "error") return LogLevel::Error;
  if (name == "crit") return LogLevel::Critical;
  throw ConfigError("unknown log level '" + std::string(name) +
                    "' (expected debug, info, warning, error or crit)");
}

}  // namespace zlog
