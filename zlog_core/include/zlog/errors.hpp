#pragma once
#include <stdexcept>
#include <string>
#include <system_error>

namespace zlog
{

class Error : public std::runtime_error
{
 public:
  using std::runtime_error::runtime_error;
};

// 配置错误：非法级别名、空路径、初始化阶段无法写入
class ConfigError : public Error
{
 public:
  using Error::Error;
};

// 写入/轮转/打开失败，携带 errno
class IoError : public Error
{
 public:
  IoError(const std::string& what, int err)
      : Error(what + ": " + std::generic_category().message(err)),
        code_(err, std::generic_category())
  {
  }

  const std::error_code& Code() const noexcept { return code_; }

 private:
  std::error_code code_;
};

// 轮转锁在限定时间内未获取到
class LockTimeoutError : public Error
{
 public:
  using Error::Error;
};

}  // namespace zlog
