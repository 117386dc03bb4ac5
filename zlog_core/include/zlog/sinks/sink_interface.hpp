#pragma once
#include <memory>
#include <string>
#include <utility>

#include "../formatters/formatter_interface.hpp"
#include "../log_entry.hpp"
#include "../log_level.hpp"

namespace zlog
{

class ILogSink
{
 public:
  virtual ~ILogSink() = default;

  // 写入一条日志（在调用方线程内同步执行）
  virtual void Write(const LogEntry& entry) = 0;

  // 刷新缓冲区
  virtual void Flush() = 0;

  // 释放资源；默认只刷新
  virtual void Close() { Flush(); }

  // 设置该 Sink 的格式化器
  void SetFormatter(std::unique_ptr<IFormatter> formatter)
  {
    formatter_ = std::move(formatter);
  }

  // 设置该 Sink 的最低输出级别（独立于 Logger 级别）
  void SetLevel(LogLevel level) { min_level_ = level; }

  LogLevel Level() const { return min_level_; }

  // Sink 级别过滤
  bool ShouldLog(LogLevel entry_level) const { return entry_level >= min_level_; }

 protected:
  std::unique_ptr<IFormatter> formatter_;
  LogLevel min_level_ = LogLevel::Debug;
  std::string format_buf_;

  // 通用格式化，结果留在 format_buf_ 中，末尾追加换行
  size_t DoFormat(const LogEntry& entry)
  {
    if (!formatter_)
    {
      return 0;
    }
    formatter_->Format(entry, format_buf_);
    format_buf_ += '\n';
    return format_buf_.size();
  }
};

}  // namespace zlog
