#include "zlog/logger.hpp"

#include <exception>
#include <mutex>

#include "zlog/errors.hpp"

namespace zlog
{

Logger::Logger(std::string name, LogLevel level) : name_(std::move(name)), level_(level) {}

Logger::~Logger() { Close(); }

void Logger::AddSink(std::unique_ptr<ILogSink> sink)
{
  std::unique_lock<std::shared_mutex> lock(sinks_mutex_);
  sinks_.push_back(std::move(sink));
}

size_t Logger::SinkCount() const
{
  std::shared_lock<std::shared_mutex> lock(sinks_mutex_);
  return sinks_.size();
}

void Logger::SetLevel(LogLevel level) { level_.store(level, std::memory_order_relaxed); }

LogLevel Logger::Level() const { return level_.load(std::memory_order_relaxed); }

void Logger::Log(LogLevel level, const SourceLocation& loc, std::string message)
{
  LogEntry entry;
  entry.wall_clock_ns = wall_clock_now_ns();
  entry.level = level;
  entry.file_path = loc.file_path;
  entry.function_name = loc.function_name;
  entry.line = loc.line;
  entry.msg = std::move(message);

  Dispatch(entry);
}

void Logger::Dispatch(const LogEntry& entry)
{
  std::shared_lock<std::shared_mutex> lock(sinks_mutex_);

  std::exception_ptr first_error;
  for (auto& sink : sinks_)
  {
    try
    {
      sink->Write(entry);
    }
    catch (const IoError&)
    {
      if (!first_error)
      {
        first_error = std::current_exception();
      }
    }
  }

  if (first_error)
  {
    std::rethrow_exception(first_error);
  }
}

void Logger::Flush()
{
  std::shared_lock<std::shared_mutex> lock(sinks_mutex_);
  for (auto& sink : sinks_)
  {
    sink->Flush();
  }
}

void Logger::Close()
{
  std::unique_lock<std::shared_mutex> lock(sinks_mutex_);
  for (auto& sink : sinks_)
  {
    sink->Close();
  }
}

}  // namespace zlog
