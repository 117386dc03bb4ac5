#include <gtest/gtest.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <chrono>
#include <memory>
#include <string>

#include "test_helpers.hpp"
#include "zlog/errors.hpp"
#include "zlog/sinks/file_lock.hpp"

using namespace std::chrono_literals;

class FileLockTest : public ::testing::Test
{
 protected:
  zlog_test::TempDir dir_;
  std::string lock_path_;

  void SetUp() override
  {
    ASSERT_TRUE(dir_.Valid());
    lock_path_ = dir_.File("app.log.lock");
  }
};

TEST_F(FileLockTest, AcquireCreatesLockFile)
{
  {
    zlog::FileLock lock(lock_path_, 100ms);
    EXPECT_EQ(lock.Path(), lock_path_);
    EXPECT_TRUE(zlog_test::file_exists(lock_path_));
  }
  // 锁文件保留，不删除
  EXPECT_TRUE(zlog_test::file_exists(lock_path_));
}

TEST_F(FileLockTest, SecondHolderTimesOutWithinBound)
{
  zlog::FileLock first(lock_path_, 100ms);

  auto start = std::chrono::steady_clock::now();
  EXPECT_THROW(zlog::FileLock second(lock_path_, 50ms), zlog::LockTimeoutError);
  auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_GE(elapsed, 50ms);
  EXPECT_LT(elapsed, 2s);
}

TEST_F(FileLockTest, ReleasedLockCanBeReacquired)
{
  {
    zlog::FileLock first(lock_path_, 100ms);
  }
  EXPECT_NO_THROW(zlog::FileLock second(lock_path_, 100ms));
}

TEST_F(FileLockTest, ZeroTimeoutFailsImmediatelyWhenHeld)
{
  zlog::FileLock first(lock_path_, 100ms);
  EXPECT_THROW(zlog::FileLock second(lock_path_, 0ms), zlog::LockTimeoutError);
}

TEST_F(FileLockTest, UnopenableLockPathThrowsIoError)
{
  std::string blocker = dir_.File("plain_file");
  zlog_test::write_file(blocker, "x");
  EXPECT_THROW(zlog::FileLock lock(blocker + "/sub.lock", 100ms), zlog::IoError);
}

TEST_F(FileLockTest, CrashedHolderReleasesLock)
{
  int ready[2];
  ASSERT_EQ(::pipe(ready), 0);

  pid_t pid = ::fork();
  ASSERT_GE(pid, 0);
  if (pid == 0)
  {
    ::close(ready[0]);
    try
    {
      zlog::FileLock held(lock_path_, 1000ms);
      char c = 'r';
      if (::write(ready[1], &c, 1) != 1) ::_exit(2);
      for (;;)
      {
        ::pause();
      }
    }
    catch (const zlog::Error&)
    {
      ::_exit(1);
    }
  }

  ::close(ready[1]);
  char c = 0;
  ASSERT_EQ(::read(ready[0], &c, 1), 1);
  ::close(ready[0]);

  EXPECT_THROW(zlog::FileLock contended(lock_path_, 30ms), zlog::LockTimeoutError);

  // 模拟持锁进程崩溃
  ::kill(pid, SIGKILL);
  int status = 0;
  ::waitpid(pid, &status, 0);

  EXPECT_NO_THROW(zlog::FileLock takeover(lock_path_, 1000ms));
}
