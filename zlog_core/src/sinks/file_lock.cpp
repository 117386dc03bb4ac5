#include "zlog/sinks/file_lock.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <string>
#include <thread>

#include "zlog/errors.hpp"
#include "zlog/platform.hpp"

namespace zlog
{

FileLock::FileLock(const std::string& lock_path, std::chrono::milliseconds timeout)
    : path_(lock_path), fd_(-1)
{
  fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, ZLOG_FILE_MODE);
  if (fd_ < 0)
  {
    int err = errno;
    throw IoError("FileLock: failed to open '" + path_ + "'", err);
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  const auto poll = std::chrono::milliseconds(ZLOG_LOCK_POLL_INTERVAL_MS);

  for (;;)
  {
    if (::flock(fd_, LOCK_EX | LOCK_NB) == 0)
    {
      return;
    }

    int err = errno;
    if (err == EINTR)
    {
      continue;
    }
    if (err != EWOULDBLOCK)
    {
      ::close(fd_);
      fd_ = -1;
      throw IoError("FileLock: flock failed on '" + path_ + "'", err);
    }

    auto now = std::chrono::steady_clock::now();
    if (now >= deadline)
    {
      ::close(fd_);
      fd_ = -1;
      throw LockTimeoutError("FileLock: timed out after " + std::to_string(timeout.count()) +
                             " ms waiting for '" + path_ + "'");
    }
    std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(poll, deadline - now));
  }
}

FileLock::~FileLock()
{
  if (fd_ >= 0)
  {
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
  }
}

}  // namespace zlog
