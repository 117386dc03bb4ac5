#pragma once
#include <cstdint>
#include <string>

#include "log_level.hpp"

namespace zlog {

// 每次 emit 调用构造一次，以 const& 交给各个 sink，之后不再修改。
// 各 sink 只能派生显示副本（相对路径、本地时间）。
struct LogEntry {
    uint64_t    wall_clock_ns = 0;

    LogLevel    level = LogLevel::Info;

    const char* file_path = nullptr;
    const char* function_name = nullptr;
    uint32_t    line = 0;

    std::string msg;
};

} // namespace zlog
