#include "util/which.hpp"
#include <sys/stat.h>
#include <cstdlib>
#include <fstream>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

const std::string test_tmpdir = "/tmp/jailrun_testdir";

void createFile(const std::string& path, bool executable = true) {
  { std::ofstream os(path); }
  chmod(path.c_str(), executable ? S_IRWXU : S_IRUSR | S_IWUSR);
}

class Which : public ::testing::Test {
 protected:
  void SetUp() override {
    const char* path = std::getenv("PATH");
    if (path != nullptr) old_path_ = path;
  }
  void TearDown() override { setenv("PATH", old_path_.c_str(), 1); }

 private:
  std::string old_path_;
};

// NOLINTNEXTLINE
TEST_F(Which, Which) {
  util::TempDir tmpdir1(test_tmpdir + "/which");
  util::TempDir tmpdir2(test_tmpdir + "/which");
  createFile(tmpdir1.Path() + "/cmd");
  createFile(tmpdir2.Path() + "/cmd");
  createFile(tmpdir2.Path() + "/cmd2");
  std::string path = tmpdir1.Path() + ":" + tmpdir2.Path();
  setenv("PATH", path.c_str(), 1);

  EXPECT_EQ(util::which("cmd"), tmpdir1.Path() + "/cmd");
  EXPECT_EQ(util::which("cmd2"), tmpdir2.Path() + "/cmd2");
}

// NOLINTNEXTLINE
TEST_F(Which, WhichSkipsNonExecutable) {
  util::TempDir tmpdir1(test_tmpdir + "/which");
  util::TempDir tmpdir2(test_tmpdir + "/which");
  createFile(tmpdir1.Path() + "/cmd", false);
  createFile(tmpdir2.Path() + "/cmd");
  std::string path = tmpdir1.Path() + ":" + tmpdir2.Path();
  setenv("PATH", path.c_str(), 1);

  EXPECT_EQ(util::which("cmd", false), tmpdir2.Path() + "/cmd");
}

// NOLINTNEXTLINE
TEST_F(Which, WhichEmptyPath) {
  unsetenv("PATH");
  EXPECT_EQ(util::which("cmd"), "");
}

// NOLINTNEXTLINE
TEST_F(Which, WhichWithSlash) {
  util::TempDir tmpdir(test_tmpdir + "/which");
  createFile(tmpdir.Path() + "/cmd");
  EXPECT_EQ(util::which(tmpdir.Path() + "/cmd"), tmpdir.Path() + "/cmd");
  EXPECT_EQ(util::which(tmpdir.Path() + "/nope"), "");
}

// NOLINTNEXTLINE
TEST_F(Which, WhichUsesCache) {
  std::string path;
  {
    util::TempDir tmpdir1(test_tmpdir + "/which");
    createFile(tmpdir1.Path() + "/cmd");
    setenv("PATH", tmpdir1.Path().c_str(), 1);
    path = util::which("cmd");
    EXPECT_EQ(path, tmpdir1.Path() + "/cmd");
  }
  EXPECT_EQ(util::which("cmd"), path);
}

// NOLINTNEXTLINE
TEST_F(Which, WhichCacheDisabled) {
  std::string path;
  {
    util::TempDir tmpdir1(test_tmpdir + "/which");
    createFile(tmpdir1.Path() + "/cmd");
    setenv("PATH", tmpdir1.Path().c_str(), 1);
    path = util::which("cmd");
    EXPECT_EQ(path, tmpdir1.Path() + "/cmd");
  }
  EXPECT_EQ(util::which("cmd", false), "");
}

}  // namespace
