#pragma once
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <optional>

#include "sink_interface.hpp"

namespace zlog
{

// 每行一次 fwrite + fflush 写入 stderr（或注入的流）。写失败只计数，不抛异常。
class ConsoleSink : public ILogSink
{
 public:
  explicit ConsoleSink(std::optional<bool> force_color = std::nullopt,
                       std::FILE* stream = stderr);

  void Write(const LogEntry& entry) override;
  void Flush() override;

  bool UseColor() const { return use_color_; }
  uint64_t FailureCount() const;

 private:
  std::FILE* stream_;
  bool use_color_;
  uint64_t failures_ = 0;
  mutable std::mutex mutex_;
};

}  // namespace zlog
