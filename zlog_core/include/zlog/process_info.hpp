#pragma once
#include <cstdint>
#include <string>

namespace zlog
{

// gethostname()，首次调用后缓存；失败时返回 "localhost"
const std::string& hostname();

uint32_t process_id();

}  // namespace zlog
