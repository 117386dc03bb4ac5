#pragma once
#include <chrono>
#include <string>

namespace zlog
{

// 基于 flock(2) 的跨进程互斥锁，作用域内持有（RAII）。
// 锁文件不会被删除：删除后重建会让两个进程锁住不同的 inode。
// 持锁进程崩溃时内核自动释放 flock，等待方在超时内即可接管。
class FileLock
{
 public:
  // 轮询 LOCK_NB 直到成功或 timeout 到期。
  // 打开锁文件失败抛出 IoError，超时抛出 LockTimeoutError。
  FileLock(const std::string& lock_path, std::chrono::milliseconds timeout);
  ~FileLock();

  FileLock(const FileLock&) = delete;
  FileLock& operator=(const FileLock&) = delete;

  const std::string& Path() const { return path_; }

 private:
  std::string path_;
  int fd_;
};

}  // namespace zlog
