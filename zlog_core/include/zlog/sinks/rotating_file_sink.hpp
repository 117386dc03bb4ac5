#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "../platform.hpp"
#include "../timestamp.hpp"
#include "sink_interface.hpp"

namespace zlog
{

struct RotatingFileOptions
{
  // 保留的备份数，0 表示全部保留
  size_t backup_count = 0;
  RotateWhen when = RotateWhen::Midnight;
  // 获取轮转锁的最长等待时间
  std::chrono::milliseconds lock_timeout{ZLOG_LOCK_TIMEOUT_MS};
  int32_t utc_offset_seconds = kDefaultUtcOffsetSeconds;
  // 为空时使用 wall_clock_now_ns（测试中可注入模拟时钟）
  std::function<uint64_t()> clock;
};

// 按时间周期轮转的文件 Sink，多个进程可以同时写同一个路径。
//
// 普通写入: O_APPEND + 每行一次 write(2)，不需要跨进程加锁；写入前比较 fd 与 path 的
// inode，文件已被其他进程改名时先重新打开。
// 轮转: 在 <path>.lock 上持有 flock，锁内比较 inode 重新判断是否仍需轮转，
// 然后 rename(path, path.<周期>)、重新打开 path、按 backup_count 清理旧备份。
//
// file: app.log  backups: app.log.2026-02-15, app.log.2026-02-16, ...
class RotatingFileSink : public ILogSink
{
 public:
  using WarningHandler = std::function<void(const std::string& message)>;

  // 创建缺失的父目录并以追加方式打开文件，失败抛出 IoError
  explicit RotatingFileSink(const std::string& path,
                            RotatingFileOptions options = RotatingFileOptions());
  ~RotatingFileSink();

  RotatingFileSink(const RotatingFileSink&) = delete;
  RotatingFileSink& operator=(const RotatingFileSink&) = delete;

  // 写失败抛出 IoError
  void Write(const LogEntry& entry) override;
  void Flush() override;

  // 追加一行未经格式化的文本（自动补换行）
  void Append(std::string_view line);

  // fsync 并关闭；之后的写入抛出 IoError
  void Close() override;

  // 锁超时等可恢复问题的报告出口，默认写 stderr
  void SetWarningHandler(WarningHandler handler);

  const std::string& Path() const { return path_; }
  std::string LockPath() const { return path_ + ".lock"; }
  std::string BackupPath(int64_t period) const;

  // 当前 schedule 下的备份文件，按周期从旧到新排序
  std::vector<std::string> ListBackups() const;

  int64_t CurrentPeriod() const;

 private:
  std::string path_;
  RotatingFileOptions options_;
  int fd_;
  bool closed_;
  int64_t current_period_;
  uint64_t next_rotation_attempt_ns_;
  WarningHandler warning_handler_;
  mutable std::mutex mutex_;

  void open_file();
  void close_file();
  void append_locked(const char* data, size_t len);
  // 轮转失败但旧文件仍可写时返回该错误，由调用方在写完本行后抛出
  std::exception_ptr maybe_rotate(uint64_t now_ns, int64_t now_period);
  void rotate(int64_t now_period);
  void prune_backups();
  bool open_file_is_current() const;
  int64_t period_of_open_file(int64_t now_period) const;
  uint64_t now() const;
  void warn(const std::string& message);
  static void mkdir_recursive(const std::string& path);
};

}  // namespace zlog
