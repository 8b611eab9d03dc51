#include "util/file.hpp"

#include <dirent.h>

#include <system_error>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::StartsWith;

const std::string test_tmpdir = "/tmp/codebox_testdir";

bool dirExists(const std::string& path) {
  auto dir = opendir(path.c_str());
  if (!dir) return false;
  closedir(dir);
  return true;
}

// NOLINTNEXTLINE
TEST(FileTest, JoinPath) {
  EXPECT_EQ(util::File::JoinPath("/sandbox", "code.py"), "/sandbox/code.py");
  EXPECT_EQ(util::File::JoinPath("/sandbox/", "code.py"), "/sandbox/code.py");
  EXPECT_EQ(util::File::JoinPath("/sandbox", "/abs"), "/abs");
  EXPECT_EQ(util::File::JoinPath("/sandbox", ""), "/sandbox");
  EXPECT_EQ(util::File::JoinPath("", "rel"), "rel");
}

// NOLINTNEXTLINE
TEST(FileTest, BaseDir) {
  EXPECT_EQ(util::File::BaseDir("/sandbox/code.py"), "/sandbox");
  EXPECT_EQ(util::File::BaseDir("/code.py"), "/");
  EXPECT_EQ(util::File::BaseDir("code.py"), ".");
}

// NOLINTNEXTLINE
TEST(FileTest, WriteCreatesDirectories) {
  util::TempDir tmp(test_tmpdir);
  std::string path = util::File::JoinPath(tmp.Path(), "a/b/c.txt");
  util::File::Write(path, std::string("bin\0ary", 7));
  EXPECT_EQ(util::File::Read(path), std::string("bin\0ary", 7));
  util::File::Write(path, "over");
  EXPECT_EQ(util::File::Read(path), "over");
}

// NOLINTNEXTLINE
TEST(FileTest, ReadMissingFile) {
  EXPECT_THROW(util::File::Read(test_tmpdir + "/does/not/exist"),
               std::system_error);
}

// NOLINTNEXTLINE
TEST(FileTest, TempDirIsRemoved) {
  std::string path;
  {
    util::TempDir tmp(test_tmpdir);
    path = tmp.Path();
    EXPECT_THAT(path, StartsWith(test_tmpdir + "/"));
    util::File::Write(util::File::JoinPath(path, "x/y"), "z");
    EXPECT_TRUE(dirExists(path));
  }
  EXPECT_FALSE(dirExists(path));
}

}  // namespace
