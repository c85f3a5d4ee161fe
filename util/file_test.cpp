#include "util/file.hpp"

#include <sys/stat.h>

#include <fstream>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::EndsWith;
using ::testing::StartsWith;

const std::string test_tmpdir = "/tmp/runbox_testdir";

void writeFile(const std::string& path, const std::string& content) {
  std::ofstream of(path);
  of << content;
}

// NOLINTNEXTLINE
TEST(File, JoinPath) {
  EXPECT_EQ(util::File::JoinPath("a", "b"), "a/b");
  EXPECT_EQ(util::File::JoinPath("a", "/b"), "/b");
  EXPECT_EQ(util::File::JoinPath("", "b"), "b");
}

// NOLINTNEXTLINE
TEST(File, BaseName) {
  EXPECT_EQ(util::File::BaseName("/a/b/c"), "c");
  EXPECT_EQ(util::File::BaseName("c"), "c");
}

// NOLINTNEXTLINE
TEST(File, MakeDirsAndRemoveTree) {
  util::TempDir tmp(test_tmpdir);
  std::string nested = tmp.Path() + "/x/y/z";
  util::File::MakeDirs(nested);
  EXPECT_TRUE(util::File::Exists(nested));
  writeFile(nested + "/file", "data");
  util::File::RemoveTree(tmp.Path() + "/x");
  EXPECT_FALSE(util::File::Exists(tmp.Path() + "/x"));
}

// NOLINTNEXTLINE
TEST(File, ReadWrite) {
  util::TempDir tmp(test_tmpdir);
  std::string path = tmp.Path() + "/file";
  util::File::Write(path, "hello world");
  bool truncated = true;
  EXPECT_EQ(util::File::Read(path, 1024, &truncated), "hello world");
  EXPECT_FALSE(truncated);
  EXPECT_EQ(util::File::Read(path, 5, &truncated), "hello");
  EXPECT_TRUE(truncated);
  EXPECT_EQ(util::File::Read(path, 11, &truncated), "hello world");
  EXPECT_FALSE(truncated);
}

// NOLINTNEXTLINE
TEST(File, ReadMissing) {
  EXPECT_THROW(util::File::Read(test_tmpdir + "/missing", 10),  // NOLINT
               util::file_not_found);
}

// NOLINTNEXTLINE
TEST(File, IsExecutable) {
  util::TempDir tmp(test_tmpdir);
  std::string path = tmp.Path() + "/prog";
  writeFile(path, "#!/bin/sh\n");
  EXPECT_FALSE(util::File::IsExecutable(path));
  chmod(path.c_str(), S_IRWXU);
  EXPECT_TRUE(util::File::IsExecutable(path));
  EXPECT_FALSE(util::File::IsExecutable(tmp.Path()));
}

// NOLINTNEXTLINE
TEST(TempDir, CreatesAndRemoves) {
  std::string path;
  {
    util::TempDir tmp(test_tmpdir, "run_");
    path = tmp.Path();
    EXPECT_THAT(util::File::BaseName(path), StartsWith("run_"));
    EXPECT_TRUE(util::File::Exists(path));
    util::File::MakeDirs(path + "/box/sub");
    writeFile(path + "/box/sub/file", "data");
  }
  EXPECT_FALSE(util::File::Exists(path));
}

// NOLINTNEXTLINE
TEST(TempDir, UniqueNames) {
  util::TempDir a(test_tmpdir, "run_");
  util::TempDir b(test_tmpdir, "run_");
  EXPECT_NE(a.Path(), b.Path());
}

// NOLINTNEXTLINE
TEST(TempDir, Keep) {
  std::string path;
  {
    util::TempDir tmp(test_tmpdir);
    tmp.Keep();
    path = tmp.Path();
  }
  EXPECT_TRUE(util::File::Exists(path));
  util::File::RemoveTree(path);
}

// NOLINTNEXTLINE
TEST(TempDir, CreationFailure) {
  util::TempDir tmp(test_tmpdir);
  std::string file = tmp.Path() + "/file";
  writeFile(file, "");
  EXPECT_THROW(util::TempDir(file + "/sub"), std::system_error);  // NOLINT
}

// NOLINTNEXTLINE
TEST(TempDir, AlreadyRemoved) {
  util::TempDir tmp(test_tmpdir);
  util::File::RemoveTree(tmp.Path());
  EXPECT_THAT(tmp.Path(), EndsWith(util::File::BaseName(tmp.Path())));
}

}  // namespace
