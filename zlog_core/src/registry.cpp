#include "zlog/registry.hpp"

#include <utility>

#include "zlog/errors.hpp"
#include "zlog/formatters/pattern_formatter.hpp"
#include "zlog/sinks/console_sink.hpp"
#include "zlog/sinks/rotating_file_sink.hpp"

namespace zlog
{

LoggerRegistry::~LoggerRegistry() { CloseAll(); }

LoggerRegistry& LoggerRegistry::Global()
{
  static LoggerRegistry inst;
  return inst;
}

std::shared_ptr<Logger> LoggerRegistry::GetLogger(const LoggerConfig& config)
{
  LoggerConfig normalized = normalize_config(config);

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = loggers_.find(normalized.name);
  if (it != loggers_.end())
  {
    return it->second;
  }

  auto logger = CreateLogger(normalized);
  loggers_.emplace(normalized.name, logger);
  return logger;
}

std::shared_ptr<Logger> LoggerRegistry::GetLogger(const std::string& file_path,
                                                  std::string_view level, size_t backup_count,
                                                  bool color_enabled)
{
  return GetLogger(make_config(file_path, level, backup_count, color_enabled));
}

std::shared_ptr<Logger> LoggerRegistry::Find(const std::string& name) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = loggers_.find(name);
  return it != loggers_.end() ? it->second : nullptr;
}

size_t LoggerRegistry::Size() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return loggers_.size();
}

void LoggerRegistry::CloseAll()
{
  std::unordered_map<std::string, std::shared_ptr<Logger>> loggers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    loggers.swap(loggers_);
  }
  for (auto& [name, logger] : loggers)
  {
    logger->Close();
  }
}

std::shared_ptr<Logger> LoggerRegistry::CreateLogger(const LoggerConfig& config)
{
  auto logger = std::make_shared<Logger>(config.name, config.min_level);

  const int32_t offset = config.utc_offset_seconds;
  auto make_formatter = [&config, offset]()
  {
    auto formatter = std::make_unique<PatternFormatter>(kDefaultPattern, config.color_enabled);
    formatter->SetClock([offset](uint64_t wall_ns) { return to_local_time(wall_ns, offset); });
    return formatter;
  };

  // 1) Console sink
  ConsoleSink* console = nullptr;
  if (config.console_enabled)
  {
    auto sink = std::make_unique<ConsoleSink>(config.color_enabled, config.console_stream);
    sink->SetFormatter(make_formatter());
    console = sink.get();
    logger->AddSink(std::move(sink));
  }

  // 2) Rotating file sink
  RotatingFileOptions options;
  options.backup_count = config.backup_count;
  options.when = config.rotate_when;
  options.lock_timeout = config.lock_timeout;
  options.utc_offset_seconds = config.utc_offset_seconds;
  options.clock = config.rotation_clock;

  std::unique_ptr<RotatingFileSink> file_sink;
  try
  {
    file_sink = std::make_unique<RotatingFileSink>(config.file_path, std::move(options));
  }
  catch (const IoError& e)
  {
    throw ConfigError(std::string("cannot set up log file: ") + e.what());
  }
  file_sink->SetFormatter(make_formatter());

  // 轮转锁超时等可恢复问题只报告到控制台
  if (console != nullptr)
  {
    file_sink->SetWarningHandler(
        [console](const std::string& message)
        {
          const SourceLocation loc = ZLOG_CURRENT_LOCATION();
          LogEntry entry;
          entry.wall_clock_ns = wall_clock_now_ns();
          entry.level = LogLevel::Warning;
          entry.file_path = loc.file_path;
          entry.function_name = loc.function_name;
          entry.line = loc.line;
          entry.msg = message;
          console->Write(entry);
        });
  }
  logger->AddSink(std::move(file_sink));

  return logger;
}

}  // namespace zlog
