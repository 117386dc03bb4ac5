#pragma once
#include <string>
#include <string_view>

namespace zlog
{

// 把源文件路径改写为相对当前工作目录的路径。
// 无法相对化时（根不同、cwd 不可用、只共享文件系统根）原样返回，不抛异常。
std::string relativize(std::string_view path);

// 同上，但以 base 为起点
std::string relativize(std::string_view path, std::string_view base);

}  // namespace zlog
