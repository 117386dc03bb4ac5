#include <zlog/errors.hpp>
#include <zlog/logger.hpp>
#include <zlog/registry.hpp>

#include <cstdio>
#include <memory>
#include <thread>

namespace
{

int run()
{
  auto& registry = zlog::LoggerRegistry::Global();

  // --- Logger setup ---

  // logs/testLog.log, level debug, keep every daily backup, colored message text
  std::shared_ptr<zlog::Logger> log;
  try
  {
    log = registry.GetLogger("logs/testLog.log", "debug");
  }
  catch (const zlog::ConfigError& e)
  {
    std::fprintf(stderr, "logger setup failed: %s\n", e.what());
    return 1;
  }

  // --- Basic logging ---

  ZLOG_DEBUG(*log, "debug");
  ZLOG_INFO(*log, "okkk");
  ZLOG_WARNING(*log, "warning");
  ZLOG_ERROR(*log, "error");
  ZLOG_CRITICAL(*log, "严重错误");

  // --- Same name, same logger: no duplicated lines ---

  auto again = registry.GetLogger("logs/testLog.log", "debug");
  ZLOG_INFO(*again, "acquired twice, logged once");

  // --- Formatted messages ---

#ifdef ZLOG_USE_FMTLIB
  ZLOG_INFO(*log, "hello {}, version {}", "world", "1.0");
#else
  ZLOG_INFO(*log, "hello %s, version %s", "world", "1.0");
#endif

  // --- Multi-thread demo ---

  auto worker = [&log](int id)
  {
    try
    {
      for (int i = 0; i < 5; ++i)
      {
#ifdef ZLOG_USE_FMTLIB
        ZLOG_INFO(*log, "worker {} step {}", id, i);
#else
        ZLOG_INFO(*log, "worker %d step %d", id, i);
#endif
      }
    }
    catch (const zlog::IoError& e)
    {
      std::fprintf(stderr, "worker %d: log write failed: %s\n", id, e.what());
    }
  };

  std::thread t1(worker, 1);
  std::thread t2(worker, 2);
  t1.join();
  t2.join();

  // --- Shutdown ---

  ZLOG_INFO(*log, "shutting down");
  registry.CloseAll();

  std::printf("Example finished. Check logs/testLog.log for file output.\n");
  return 0;
}

}  // namespace

int main()
{
  try
  {
    return run();
  }
  catch (const zlog::IoError& e)
  {
    // 文件写入失败不会被静默丢弃
    std::fprintf(stderr, "log write failed: %s\n", e.what());
    return 1;
  }
}
