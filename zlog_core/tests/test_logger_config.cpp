#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "zlog/errors.hpp"
#include "zlog/logger_config.hpp"

namespace fs = std::filesystem;

TEST(LoggerConfig, Defaults)
{
  zlog::LoggerConfig config;
  EXPECT_EQ(config.min_level, zlog::LogLevel::Info);
  EXPECT_EQ(config.backup_count, 0u);
  EXPECT_TRUE(config.color_enabled);
  EXPECT_TRUE(config.console_enabled);
  EXPECT_EQ(config.console_stream, stderr);
  EXPECT_EQ(config.rotate_when, zlog::RotateWhen::Midnight);
  EXPECT_EQ(config.lock_timeout.count(), ZLOG_LOCK_TIMEOUT_MS);
  EXPECT_EQ(config.utc_offset_seconds, 8 * 3600);
  EXPECT_FALSE(config.rotation_clock);
}

TEST(LoggerConfig, MakeConfigParsesArguments)
{
  auto config = zlog::make_config("/var/log/app/service.log", "warning", 7, false);
  EXPECT_EQ(config.file_path, "/var/log/app/service.log");
  EXPECT_EQ(config.name, "/var/log/app/service.log");
  EXPECT_EQ(config.min_level, zlog::LogLevel::Warning);
  EXPECT_EQ(config.backup_count, 7u);
  EXPECT_FALSE(config.color_enabled);
}

TEST(LoggerConfig, MakeConfigDefaultLevelIsInfo)
{
  auto config = zlog::make_config("/tmp/a.log");
  EXPECT_EQ(config.min_level, zlog::LogLevel::Info);
  EXPECT_TRUE(config.color_enabled);
}

TEST(LoggerConfig, InvalidLevelThrows)
{
  EXPECT_THROW(zlog::make_config("/tmp/a.log", "verbose"), zlog::ConfigError);
  EXPECT_THROW(zlog::make_config("/tmp/a.log", ""), zlog::ConfigError);
}

TEST(LoggerConfig, RelativePathBecomesAbsolute)
{
  auto config = zlog::make_config("logs/testLog.log");
  fs::path expected = (fs::current_path() / "logs" / "testLog.log").lexically_normal();
  EXPECT_EQ(config.file_path, expected.string());
  EXPECT_TRUE(fs::path(config.file_path).is_absolute());
}

TEST(LoggerConfig, EquivalentSpellingsNormalizeToSameName)
{
  auto a = zlog::make_config("logs/testLog.log");
  auto b = zlog::make_config("./logs/../logs/testLog.log");
  EXPECT_EQ(a.name, b.name);
}

TEST(LoggerConfig, ExplicitNameIsKept)
{
  zlog::LoggerConfig config;
  config.name = "worker";
  config.file_path = "/tmp/worker.log";
  auto normalized = zlog::normalize_config(config);
  EXPECT_EQ(normalized.name, "worker");
  EXPECT_EQ(normalized.file_path, "/tmp/worker.log");
}

TEST(LoggerConfig, EmptyPathThrows)
{
  zlog::LoggerConfig config;
  EXPECT_THROW(zlog::normalize_config(config), zlog::ConfigError);
  EXPECT_THROW(zlog::make_config(""), zlog::ConfigError);
}

TEST(LoggerConfig, DirectoryPathThrows)
{
  EXPECT_THROW(zlog::make_config("/tmp/logs/"), zlog::ConfigError);
}

TEST(LoggerConfig, NegativeLockTimeoutThrows)
{
  zlog::LoggerConfig config;
  config.file_path = "/tmp/a.log";
  config.lock_timeout = std::chrono::milliseconds(-1);
  EXPECT_THROW(zlog::normalize_config(config), zlog::ConfigError);
}

TEST(LoggerConfig, ConfigErrorIsAnError)
{
  try
  {
    zlog::make_config("");
    FAIL() << "expected ConfigError";
  }
  catch (const zlog::Error& e)
  {
    EXPECT_NE(std::string(e.what()).find("empty"), std::string::npos);
  }
}
