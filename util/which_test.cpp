#include "util/which.hpp"
#include <cstdlib>
#include <fstream>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

const std::string test_tmpdir = "/tmp/codebox_testdir";

void createFile(const std::string& path) { std::ofstream os(path); }

// NOLINTNEXTLINE
TEST(Which, Which) {
  util::TempDir tmpdir1(test_tmpdir + "/which");
  util::TempDir tmpdir2(test_tmpdir + "/which");
  createFile(tmpdir1.Path() + "/cmd");
  createFile(tmpdir2.Path() + "/cmd");
  createFile(tmpdir2.Path() + "/cmd2");
  std::string path = tmpdir1.Path() + "::" + tmpdir2.Path();
  setenv("PATH", path.c_str(), 1);

  EXPECT_EQ(util::which("cmd"), tmpdir1.Path() + "/cmd");
  EXPECT_EQ(util::which("cmd2"), tmpdir2.Path() + "/cmd2");
  EXPECT_EQ(util::which("cmd3"), "");
}

// NOLINTNEXTLINE
TEST(Which, WhichWithSlash) {
  util::TempDir tmpdir(test_tmpdir + "/which");
  createFile(tmpdir.Path() + "/tool");
  EXPECT_EQ(util::which(tmpdir.Path() + "/tool"), tmpdir.Path() + "/tool");
  EXPECT_EQ(util::which(tmpdir.Path() + "/missing"), "");
}

// NOLINTNEXTLINE
TEST(Which, WhichEmptyPath) {
  unsetenv("PATH");
  EXPECT_EQ(util::which("not_cached_cmd"), "");
}

// NOLINTNEXTLINE
TEST(Which, WhichUsesCache) {
  std::string path;
  {
    util::TempDir tmpdir1(test_tmpdir + "/which");
    createFile(tmpdir1.Path() + "/cached");
    setenv("PATH", tmpdir1.Path().c_str(), 1);
    path = util::which("cached");
    EXPECT_EQ(path, tmpdir1.Path() + "/cached");
  }
  EXPECT_EQ(util::which("cached"), path);
}

// NOLINTNEXTLINE
TEST(Which, WhichCacheDisabled) {
  std::string path;
  {
    util::TempDir tmpdir1(test_tmpdir + "/which");
    createFile(tmpdir1.Path() + "/uncached");
    setenv("PATH", tmpdir1.Path().c_str(), 1);
    path = util::which("uncached");
    EXPECT_EQ(path, tmpdir1.Path() + "/uncached");
  }
  EXPECT_EQ(util::which("uncached", false), "");
}

}  // namespace
