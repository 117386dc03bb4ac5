#include "zlog/path_normalizer.hpp"

#include <filesystem>
#include <system_error>

namespace zlog
{

namespace fs = std::filesystem;

std::string relativize(std::string_view path)
{
  std::error_code ec;
  fs::path cwd = fs::current_path(ec);
  if (ec)
  {
    return std::string(path);
  }
  return relativize(path, cwd.native());
}

std::string relativize(std::string_view path, std::string_view base)
{
  std::string original(path);
  if (path.empty())
  {
    return original;
  }

  fs::path b = fs::path(std::string(base)).lexically_normal();
  if (!b.is_absolute())
  {
    return original;
  }
  // "/root/repo/" -> "/root/repo"
  if (!b.has_filename() && b.has_relative_path())
  {
    b = b.parent_path();
  }

  fs::path p(original);
  if (p.is_relative())
  {
    p = b / p;
  }
  p = p.lexically_normal();

  if (p.root_name() != b.root_name())
  {
    return original;
  }

  // 只共享文件系统根（首个目录分量不同）视为没有公共祖先
  fs::path b_rel = b.relative_path();
  fs::path p_rel = p.relative_path();
  if (!b_rel.empty() && !b_rel.begin()->empty())
  {
    if (p_rel.empty() || *p_rel.begin() != *b_rel.begin())
    {
      return original;
    }
  }

  fs::path rel = p.lexically_relative(b);
  if (rel.empty())
  {
    return original;
  }
  return rel.string();
}

}  // namespace zlog
