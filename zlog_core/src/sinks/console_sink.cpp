#include "zlog/sinks/console_sink.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "zlog/formatters/pattern_formatter.hpp"

namespace zlog
{

ConsoleSink::ConsoleSink(std::optional<bool> force_color, std::FILE* stream) : stream_(stream)
{
  if (force_color.has_value())
  {
    use_color_ = force_color.value();
  }
  else
  {
    use_color_ = stream_ != nullptr && ::isatty(::fileno(stream_)) != 0;
  }
}

void ConsoleSink::Write(const LogEntry& entry)
{
  if (!ShouldLog(entry.level))
  {
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);

  if (!formatter_)
  {
    formatter_ = std::make_unique<PatternFormatter>(kDefaultPattern, use_color_);
  }

  size_t len = DoFormat(entry);
  if (len == 0)
  {
    return;
  }

  if (stream_ == nullptr)
  {
    ++failures_;
    return;
  }

  size_t written = std::fwrite(format_buf_.data(), 1, len, stream_);
  if (written != len || std::fflush(stream_) != 0)
  {
    int err = errno;
    if (failures_++ == 0 && stream_ != stderr)
    {
      std::fprintf(stderr, "ConsoleSink: write failed: %s\n", std::strerror(err));
    }
    std::clearerr(stream_);
  }
}

void ConsoleSink::Flush()
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (stream_ != nullptr)
  {
    std::fflush(stream_);
  }
}

uint64_t ConsoleSink::FailureCount() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return failures_;
}

}  // namespace zlog
