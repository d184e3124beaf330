#include "util/file.hpp"
#include <sys/stat.h>
#include <fstream>
#include <system_error>
#include <vector>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::IsEmpty;
using ::testing::StartsWith;
using ::testing::UnorderedElementsAre;

const std::string test_tmpdir = "/tmp/codebox_testdir";

void writeFile(const std::string& path, const std::string& content) {
  std::ofstream of(path);
  of << content;
}

std::string readFile(const std::string& path) {
  std::ifstream t(path);
  std::string str((std::istreambuf_iterator<char>(t)),
                  std::istreambuf_iterator<char>());
  return str;
}

int fileMode(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0) return -1;
  return st.st_mode & 0777;
}

// NOLINTNEXTLINE
TEST(File, Read) {
  util::TempDir tmp(test_tmpdir);
  writeFile(tmp.Path() + "/file", "0123456789");
  bool truncated = true;
  EXPECT_EQ(util::File::Read(tmp.Path() + "/file", 100, &truncated),
            "0123456789");
  EXPECT_FALSE(truncated);
  EXPECT_EQ(util::File::Read(tmp.Path() + "/file", 4, &truncated), "0123");
  EXPECT_TRUE(truncated);
  EXPECT_EQ(util::File::Read(tmp.Path() + "/file", 10, &truncated),
            "0123456789");
  EXPECT_FALSE(truncated);
}

// NOLINTNEXTLINE
TEST(File, ReadMissing) {
  util::TempDir tmp(test_tmpdir);
  EXPECT_THROW(util::File::Read(tmp.Path() + "/missing", 100),  // NOLINT
               std::system_error);
}

// NOLINTNEXTLINE
TEST(File, Write) {
  util::TempDir tmp(test_tmpdir);
  std::string path = tmp.Path() + "/a/b/file";
  util::File::Write(path, "first");
  EXPECT_EQ(readFile(path), "first");
  EXPECT_EQ(fileMode(path), 0600);
  util::File::Write(path, "second", 0644);
  EXPECT_EQ(readFile(path), "second");
  EXPECT_EQ(fileMode(path), 0644);
  EXPECT_THAT(util::File::ListDir(tmp.Path() + "/a/b"),
              UnorderedElementsAre("file"));
}

// NOLINTNEXTLINE
TEST(File, SetMode) {
  util::TempDir tmp(test_tmpdir);
  util::File::MakeDirs(tmp.Path() + "/dir");
  util::File::SetMode(tmp.Path() + "/dir", 0755);
  EXPECT_EQ(fileMode(tmp.Path() + "/dir"), 0755);
  EXPECT_THROW(util::File::SetMode(tmp.Path() + "/nope", 0755),  // NOLINT
               std::system_error);
}

// NOLINTNEXTLINE
TEST(File, ListDir) {
  util::TempDir tmp(test_tmpdir);
  EXPECT_THAT(util::File::ListDir(tmp.Path()), IsEmpty());
  writeFile(tmp.Path() + "/x", "");
  util::File::MakeDirs(tmp.Path() + "/y/z");
  EXPECT_THAT(util::File::ListDir(tmp.Path()), UnorderedElementsAre("x", "y"));
}

// NOLINTNEXTLINE
TEST(File, Remove) {
  util::TempDir tmp(test_tmpdir);
  writeFile(tmp.Path() + "/x", "");
  util::File::Remove(tmp.Path() + "/x");
  EXPECT_FALSE(util::File::Exists(tmp.Path() + "/x"));
  EXPECT_THROW(util::File::Remove(tmp.Path() + "/x"),  // NOLINT
               std::system_error);
}

// NOLINTNEXTLINE
TEST(File, Paths) {
  EXPECT_EQ(util::File::JoinPath("/tmp", "x"), "/tmp/x");
  EXPECT_EQ(util::File::JoinPath("/tmp", "/x"), "/x");
  EXPECT_EQ(util::File::BaseDir("/tmp/a/b"), "/tmp/a");
  EXPECT_EQ(util::File::BaseDir("b"), "");
  EXPECT_EQ(util::File::BaseName("/tmp/a/b"), "b");
  EXPECT_EQ(util::File::Size("/nonexistent/file"), -1);
}

// NOLINTNEXTLINE
TEST(TempDir, RemovedOnDestruction) {
  std::string path;
  {
    util::TempDir tmp(test_tmpdir);
    path = tmp.Path();
    EXPECT_THAT(path, StartsWith(test_tmpdir + "/"));
    util::File::MakeDirs(path + "/nested/dir");
    writeFile(path + "/nested/dir/file", "data");
  }
  EXPECT_FALSE(util::File::Exists(path));
}

// NOLINTNEXTLINE
TEST(TempDir, Keep) {
  std::string path;
  {
    util::TempDir tmp(test_tmpdir);
    path = tmp.Path();
    tmp.Keep();
  }
  EXPECT_TRUE(util::File::Exists(path));
  util::File::RemoveTree(path);
  EXPECT_FALSE(util::File::Exists(path));
}

// NOLINTNEXTLINE
TEST(TempDir, Move) {
  std::string path;
  {
    util::TempDir tmp(test_tmpdir);
    path = tmp.Path();
    util::TempDir moved(std::move(tmp));
    EXPECT_EQ(moved.Path(), path);
  }
  EXPECT_FALSE(util::File::Exists(path));
}

}  // namespace
