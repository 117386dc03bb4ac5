#pragma once
#include <string>

#include "../log_entry.hpp"

namespace zlog
{

class IFormatter
{
 public:
  virtual ~IFormatter() = default;

  // 把 entry 渲染为一行（不含换行符），覆盖 out 原有内容
  virtual void Format(const LogEntry& entry, std::string& out) = 0;
};

}  // namespace zlog
