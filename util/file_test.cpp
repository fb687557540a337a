#include "util/file.hpp"

#include <dirent.h>
#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cstdio>
#include <fstream>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

const std::string test_tmpdir = "/tmp/coderunner_testdir";

int unlink_cb(const char* fpath, const struct stat* /*unused*/, int /*unused*/,
              struct FTW* /*unused*/) {
  int rv = remove(fpath);
  if (rv) perror(fpath);
  return rv;
}

int rmrf(const char* path) {
  return nftw(path, unlink_cb, 64, FTW_DEPTH | FTW_PHYS);
}

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

bool fileExists(const std::string& path) {
  auto file = open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (file < 0) return false;
  close(file);
  return true;
}

bool dirExists(const std::string& path) {
  auto dir = opendir(path.c_str());
  if (!dir) return false;
  closedir(dir);
  return true;
}

mode_t fileMode(const std::string& path) {
  struct stat info {};
  if (stat(path.c_str(), &info) == -1) return 0;
  return info.st_mode & 07777;
}

std::string makeTestDir(const std::string& name) {
  mkdir(test_tmpdir.c_str(), S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH);
  std::string testdir = test_tmpdir + "/" + name;
  rmrf(testdir.c_str());
  mkdir(testdir.c_str(), S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH);
  return testdir;
}

/*
 * Read
 */

// NOLINTNEXTLINE
TEST(File, Read) {
  std::string testdir = makeTestDir("read");
  std::string filepath = testdir + "/file";
  std::string content = "lallabalalla\n";
  writeFile(filepath, content);
  EXPECT_EQ(content, util::File::Read(filepath));
}

// NOLINTNEXTLINE
TEST(File, ReadBigFile) {
  std::string testdir = makeTestDir("read");
  std::string filepath = testdir + "/bigfile";
  std::string content(100 * 1024 + 1, 'x');
  writeFile(filepath, content);
  EXPECT_EQ(content, util::File::Read(filepath));
}

// NOLINTNEXTLINE
TEST(File, ReadNoSuchFile) {
  std::string filepath = "/no/such/file";
  EXPECT_THROW(util::File::Read(filepath), util::file_not_found);  // NOLINT
}

/*
 * Write
 */

// NOLINTNEXTLINE
TEST(File, Write) {
  std::string testdir = makeTestDir("write");
  std::string filepath = testdir + "/file";
  std::string content = "wowowow\n";
  util::File::Write(filepath, content);
  ASSERT_EQ(content, readFile(filepath));
}

// NOLINTNEXTLINE
TEST(File, WriteCreatesDirs) {
  std::string testdir = makeTestDir("write");
  std::string filepath = testdir + "/a/b/file";
  util::File::Write(filepath, "x");
  ASSERT_EQ("x", readFile(filepath));
}

// NOLINTNEXTLINE
TEST(File, WriteEmpty) {
  std::string testdir = makeTestDir("write");
  std::string filepath = testdir + "/empty";
  util::File::Write(filepath, "");
  EXPECT_TRUE(fileExists(filepath));
  EXPECT_EQ(util::File::Size(filepath), 0);
}

// NOLINTNEXTLINE
TEST(File, WriteOverwrite) {
  std::string testdir = makeTestDir("write");
  std::string filepath = testdir + "/file";
  std::string content{"alsdasdl"};
  writeFile(filepath, "this should not be here");
  util::File::Write(filepath, content, true);
  ASSERT_EQ(content, readFile(filepath));
}

// NOLINTNEXTLINE
TEST(File, WriteExistsNotOk) {
  std::string testdir = makeTestDir("write");
  std::string filepath = testdir + "/file";
  std::string content{"this should stay here"};
  writeFile(filepath, content);
  EXPECT_THROW(util::File::Write(filepath, "nope"),  // NOLINT
               util::file_exists);
  ASSERT_EQ(content, readFile(filepath));
}

/*
 * MakeDirs
 */

// NOLINTNEXTLINE
TEST(File, MakeDirs) {
  std::string testdir = makeTestDir("make_dirs");
  std::string dirpath = testdir + "/lol/my/dir";
  EXPECT_FALSE(dirExists(dirpath));
  util::File::MakeDirs(dirpath);
  EXPECT_TRUE(dirExists(dirpath));
}

// NOLINTNEXTLINE
TEST(File, MakeDirsCannot) {
  std::string testdir = makeTestDir("make_dirs");
  std::string filepath = testdir + "/file";
  writeFile(filepath, "");
  std::string dirpath = filepath + "/dir";
  EXPECT_THROW(util::File::MakeDirs(dirpath), std::system_error);  // NOLINT
}

/*
 * Copy
 */

// NOLINTNEXTLINE
TEST(File, Copy) {
  std::string testdir = makeTestDir("copy");
  std::string filepath = testdir + "/file";
  std::string filepath2 = testdir + "/file2";
  std::string content = "fooobarrr";
  writeFile(filepath, content);
  util::File::Copy(filepath, filepath2);
  EXPECT_TRUE(fileExists(filepath));
  EXPECT_EQ(content, readFile(filepath2));
}

// NOLINTNEXTLINE
TEST(File, CopyKeepsMode) {
  std::string testdir = makeTestDir("copy");
  std::string filepath = testdir + "/file";
  std::string filepath2 = testdir + "/file2";
  writeFile(filepath, "#!/bin/sh\n");
  chmod(filepath.c_str(), 0755);
  util::File::Copy(filepath, filepath2);
  EXPECT_EQ(fileMode(filepath2), 0755);
}

// NOLINTNEXTLINE
TEST(File, CopyOverwrite) {
  std::string testdir = makeTestDir("copy");
  std::string filepath = testdir + "/file";
  std::string filepath2 = testdir + "/file2";
  std::string content = "fooobarrr";
  writeFile(filepath, content);
  writeFile(filepath2, "nope");
  util::File::Copy(filepath, filepath2, true);
  EXPECT_EQ(content, readFile(filepath2));
}

// NOLINTNEXTLINE
TEST(File, CopyExistNotOk) {
  std::string testdir = makeTestDir("copy");
  std::string filepath = testdir + "/file";
  std::string filepath2 = testdir + "/file2";
  writeFile(filepath, "fooobarrr");
  writeFile(filepath2, "nope");
  EXPECT_THROW(util::File::Copy(filepath, filepath2),  // NOLINT
               util::file_exists);
  EXPECT_EQ("nope", readFile(filepath2));
}

/*
 * Move
 */

// NOLINTNEXTLINE
TEST(File, Move) {
  std::string testdir = makeTestDir("move");
  std::string filepath = testdir + "/file";
  std::string filepath2 = testdir + "/file2";
  std::string content = "fooobarrr";
  writeFile(filepath, content);
  util::File::Move(filepath, filepath2);
  EXPECT_FALSE(fileExists(filepath));
  EXPECT_EQ(content, readFile(filepath2));
}

// NOLINTNEXTLINE
TEST(File, MoveExistNotOk) {
  std::string testdir = makeTestDir("move");
  std::string filepath = testdir + "/file";
  std::string filepath2 = testdir + "/file2";
  writeFile(filepath, "fooobarrr");
  writeFile(filepath2, "nope");
  EXPECT_THROW(util::File::Move(filepath, filepath2),  // NOLINT
               util::file_exists);
  EXPECT_TRUE(fileExists(filepath));
  EXPECT_EQ("nope", readFile(filepath2));
}

// NOLINTNEXTLINE
TEST(File, MoveNoSuchFile) {
  std::string testdir = makeTestDir("move");
  EXPECT_THROW(  // NOLINT
      util::File::Move(testdir + "/nope", testdir + "/file2"),
      util::file_not_found);
}

/*
 * SetPermissions
 */

// NOLINTNEXTLINE
TEST(File, SetPermissions) {
  std::string testdir = makeTestDir("permissions");
  std::string filepath = testdir + "/file";
  writeFile(filepath, "");
  util::File::SetPermissions(filepath, 0604);
  EXPECT_EQ(fileMode(filepath), 0604);
}

// NOLINTNEXTLINE
TEST(File, SetPermissionsNoSuchFile) {
  std::string testdir = makeTestDir("permissions");
  EXPECT_THROW(util::File::SetPermissions(testdir + "/nope", 0644),  // NOLINT
               std::system_error);
}

/*
 * Paths
 */

// NOLINTNEXTLINE
TEST(File, JoinPath) {
  EXPECT_EQ(util::File::JoinPath("a", "b"), "a/b");
  EXPECT_EQ(util::File::JoinPath("a/", "b"), "a/b");
  EXPECT_EQ(util::File::JoinPath("a", "/b"), "/b");
  EXPECT_EQ(util::File::JoinPath("", "b"), "b");
  EXPECT_EQ(util::File::JoinPath("a", ""), "a");
}

// NOLINTNEXTLINE
TEST(File, BaseDirAndBaseName) {
  EXPECT_EQ(util::File::BaseDir("/tmp/x/prog.py"), "/tmp/x");
  EXPECT_EQ(util::File::BaseDir("prog.py"), ".");
  EXPECT_EQ(util::File::BaseDir("/prog.py"), "/");
  EXPECT_EQ(util::File::BaseName("/tmp/x/prog.py"), "prog.py");
  EXPECT_EQ(util::File::BaseName("prog.py"), "prog.py");
}

// NOLINTNEXTLINE
TEST(File, Size) {
  std::string testdir = makeTestDir("size");
  std::string filepath = testdir + "/file";
  writeFile(filepath, "12345");
  EXPECT_EQ(util::File::Size(filepath), 5);
  EXPECT_LT(util::File::Size(testdir + "/nope"), 0);
}

/*
 * TempDir
 */

// NOLINTNEXTLINE
TEST(TempDir, RemovedOnDestruction) {
  std::string testdir = makeTestDir("tempdir");
  std::string path;
  {
    util::TempDir tmp(testdir);
    path = tmp.Path();
    EXPECT_TRUE(dirExists(path));
    writeFile(path + "/file", "content");
    mkdir((path + "/sub").c_str(), S_IRWXU);
    writeFile(path + "/sub/file", "content");
  }
  EXPECT_FALSE(dirExists(path));
}

// NOLINTNEXTLINE
TEST(TempDir, Keep) {
  std::string testdir = makeTestDir("tempdir");
  std::string path;
  {
    util::TempDir tmp(testdir);
    path = tmp.Path();
    tmp.Keep();
  }
  EXPECT_TRUE(dirExists(path));
}

// NOLINTNEXTLINE
TEST(TempDir, Distinct) {
  std::string testdir = makeTestDir("tempdir");
  util::TempDir tmp1(testdir);
  util::TempDir tmp2(testdir);
  EXPECT_NE(tmp1.Path(), tmp2.Path());
}

}  // namespace
