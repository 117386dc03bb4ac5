#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "zlog/path_normalizer.hpp"

using zlog::relativize;

TEST(PathNormalizer, PathUnderBaseBecomesRelative)
{
  std::string rel = relativize("/root/repo/src/zlog/main.cpp", "/root/repo");
  EXPECT_EQ(rel, "src/zlog/main.cpp");
  ASSERT_FALSE(rel.empty());
  EXPECT_NE(rel.front(), '/');
}

TEST(PathNormalizer, SiblingDirectoryUsesParentSteps)
{
  EXPECT_EQ(relativize("/root/other/a.cpp", "/root/repo"), "../other/a.cpp");
  EXPECT_EQ(relativize("/root/repo/a.cpp", "/root/repo/build"), "../a.cpp");
}

TEST(PathNormalizer, NoCommonAncestorReturnsOriginal)
{
  EXPECT_EQ(relativize("/usr/include/stdio.h", "/root/repo"), "/usr/include/stdio.h");
  EXPECT_EQ(relativize("/opt/x/../y/file.cpp", "/home/me"), "/opt/x/../y/file.cpp");
}

TEST(PathNormalizer, RootBaseRelativizesEverything)
{
  EXPECT_EQ(relativize("/usr/include/stdio.h", "/"), "usr/include/stdio.h");
}

TEST(PathNormalizer, RelativeInputIsResolvedAgainstBase)
{
  EXPECT_EQ(relativize("src/main.cpp", "/root/repo"), "src/main.cpp");
  EXPECT_EQ(relativize("./src/../src/main.cpp", "/root/repo"), "src/main.cpp");
}

TEST(PathNormalizer, SamePathIsDot)
{
  EXPECT_EQ(relativize("/root/repo", "/root/repo"), ".");
}

TEST(PathNormalizer, DotSegmentsAreNormalized)
{
  EXPECT_EQ(relativize("/root/repo/src/./x/../main.cpp", "/root/repo/"), "src/main.cpp");
}

TEST(PathNormalizer, RelativeBaseReturnsOriginal)
{
  EXPECT_EQ(relativize("/root/repo/main.cpp", "repo"), "/root/repo/main.cpp");
}

TEST(PathNormalizer, EmptyPathReturnsEmpty)
{
  EXPECT_EQ(relativize("", "/root/repo"), "");
  EXPECT_EQ(relativize(""), "");
}

TEST(PathNormalizer, DefaultBaseIsCurrentDirectory)
{
  std::filesystem::path cwd = std::filesystem::current_path();
  std::string abs = (cwd / "sub" / "file.cpp").string();
  EXPECT_EQ(relativize(abs), (std::filesystem::path("sub") / "file.cpp").string());
}
