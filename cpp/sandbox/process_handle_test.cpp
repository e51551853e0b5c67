#include "sandbox/process_handle.hpp"
#include <poll.h>
#include <unistd.h>
#include <chrono>
#include <csignal>
#include <stdexcept>
#include <string>
#include <vector>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::StartsWith;

using namespace sandbox;  // NOLINT

std::string Helper(const std::string& name) {
  return std::string(TEST_HELPERS_DIR) + "/" + name;
}

std::string ReadAll(int fd) {
  std::string out;
  char buf[1024];
  ssize_t n = 0;
  while ((n = read(fd, buf, sizeof(buf))) > 0) out.append(buf, n);
  return out;
}

// NOLINTNEXTLINE
TEST(ProcessHandle, NoSuchFile) {
  std::string error_msg;
  auto handle = ProcessHandle::Spawn({Helper("nope")}, {}, &error_msg);
  EXPECT_FALSE(handle);
  EXPECT_THAT(error_msg, StartsWith("exec:"));
}

// NOLINTNEXTLINE
TEST(ProcessHandle, EmbeddedNull) {
  std::string error_msg;
  std::string arg("a\0b", 3);
  auto handle = ProcessHandle::Spawn({Helper("print_arg1"), arg}, {},
                                     &error_msg);
  EXPECT_FALSE(handle);
  EXPECT_EQ(error_msg, "embedded null byte");
}

// NOLINTNEXTLINE
TEST(ProcessHandle, ReturnArg1) {
  std::string error_msg;
  auto handle =
      ProcessHandle::Spawn({Helper("return_arg1"), "15"}, {}, &error_msg);
  ASSERT_TRUE(handle) << error_msg;
  EXPECT_TRUE(handle->WaitFor(-1));
  EXPECT_EQ(handle->GetState(), ProcessHandle::State::EXITED);
  EXPECT_EQ(handle->ExitCode(), 15);
  EXPECT_EQ(handle->Signal(), 0);
}

// NOLINTNEXTLINE
TEST(ProcessHandle, SignalArg1) {
  std::string error_msg;
  auto handle =
      ProcessHandle::Spawn({Helper("signal_arg1"), "9"}, {}, &error_msg);
  ASSERT_TRUE(handle) << error_msg;
  EXPECT_TRUE(handle->WaitFor(-1));
  EXPECT_EQ(handle->GetState(), ProcessHandle::State::SIGNALED);
  EXPECT_EQ(handle->Signal(), SIGKILL);
  EXPECT_EQ(handle->ExitCode(), 137);
}

// NOLINTNEXTLINE
TEST(ProcessHandle, CapturesOutput) {
  std::string error_msg;
  auto handle = ProcessHandle::Spawn({Helper("print_arg1"), "hi", "there"}, {},
                                     &error_msg);
  ASSERT_TRUE(handle) << error_msg;
  kj::AutoCloseFd out = handle->ReleaseStdout();
  kj::AutoCloseFd err = handle->ReleaseStderr();
  EXPECT_EQ(ReadAll(out.get()), "hi");
  EXPECT_EQ(ReadAll(err.get()), "there");
  EXPECT_TRUE(handle->WaitFor(-1));
  EXPECT_EQ(handle->ExitCode(), 0);
}

// NOLINTNEXTLINE
TEST(ProcessHandle, WaitForTimesOut) {
  std::string error_msg;
  auto handle =
      ProcessHandle::Spawn({Helper("wait_arg1"), "10"}, {}, &error_msg);
  ASSERT_TRUE(handle) << error_msg;
  EXPECT_FALSE(handle->WaitFor(100));
  EXPECT_EQ(handle->GetState(), ProcessHandle::State::RUNNING);
  handle->ExpireDeadline(500);
  EXPECT_TRUE(handle->Terminated());
  EXPECT_EQ(handle->GetState(), ProcessHandle::State::TIMED_OUT);
  EXPECT_EQ(handle->Signal(), SIGTERM);
}

// NOLINTNEXTLINE
TEST(ProcessHandle, ExpireDeadlineEscalates) {
  std::string error_msg;
  auto handle =
      ProcessHandle::Spawn({Helper("ignore_term_arg1"), "10"}, {}, &error_msg);
  ASSERT_TRUE(handle) << error_msg;
  // Let the child install its handler.
  EXPECT_FALSE(handle->WaitFor(200));
  auto start = std::chrono::steady_clock::now();
  handle->ExpireDeadline(300);
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_LT(elapsed, std::chrono::seconds(3));
  EXPECT_EQ(handle->GetState(), ProcessHandle::State::TIMED_OUT);
  EXPECT_EQ(handle->Signal(), SIGKILL);
}

// NOLINTNEXTLINE
TEST(ProcessHandle, KillAfterReapIsHarmless) {
  std::string error_msg;
  auto handle =
      ProcessHandle::Spawn({Helper("return_arg1"), "0"}, {}, &error_msg);
  ASSERT_TRUE(handle) << error_msg;
  EXPECT_TRUE(handle->WaitFor(-1));
  handle->Kill(SIGKILL);
  EXPECT_EQ(handle->GetState(), ProcessHandle::State::EXITED);
}

// NOLINTNEXTLINE
TEST(ProcessHandle, ReapKillsProcessGroup) {
  std::string error_msg;
  auto handle =
      ProcessHandle::Spawn({Helper("orphan_arg1"), "30"}, {}, &error_msg);
  ASSERT_TRUE(handle) << error_msg;
  kj::AutoCloseFd out = handle->ReleaseStdout();
  EXPECT_TRUE(handle->WaitFor(-1));
  // The child left behind in the group held stdout open.
  struct pollfd pfd {};
  pfd.fd = out.get();
  pfd.events = POLLIN;
  ASSERT_EQ(poll(&pfd, 1, 2000), 1);
  char c = 0;
  EXPECT_EQ(read(out.get(), &c, 1), 0);
}

// NOLINTNEXTLINE
TEST(ProcessHandle, DestructorReaps) {
  std::string error_msg;
  pid_t pid = 0;
  {
    auto handle =
        ProcessHandle::Spawn({Helper("wait_arg1"), "10"}, {}, &error_msg);
    ASSERT_TRUE(handle) << error_msg;
    pid = handle->Pid();
  }
  EXPECT_EQ(kill(pid, 0), -1);
  EXPECT_EQ(errno, ESRCH);
}

// NOLINTNEXTLINE
TEST(ProcessHandle, MemoryLimit) {
  std::string error_msg;
  SoftLimits limits;
  limits.memory_limit_bytes = 64 * 1024 * 1024;
  auto handle = ProcessHandle::Spawn({Helper("malloc_arg1"), "256"}, limits,
                                     &error_msg);
  ASSERT_TRUE(handle) << error_msg;
  EXPECT_TRUE(handle->WaitFor(-1));
  EXPECT_NE(handle->ExitCode(), 0);
}

// NOLINTNEXTLINE
TEST(ProcessHandle, Fork) {
  std::string error_msg;
  auto handle = ProcessHandle::Fork([]() { _Exit(7); }, {}, &error_msg);
  ASSERT_TRUE(handle) << error_msg;
  EXPECT_TRUE(handle->WaitFor(-1));
  EXPECT_EQ(handle->ExitCode(), 7);
}

// NOLINTNEXTLINE
TEST(ProcessHandle, ForkExceptionExitsWithOne) {
  std::string error_msg;
  auto handle = ProcessHandle::Fork(
      []() { throw std::runtime_error("boom"); }, {}, &error_msg);
  ASSERT_TRUE(handle) << error_msg;
  EXPECT_TRUE(handle->WaitFor(-1));
  EXPECT_EQ(handle->ExitCode(), 1);
}

// NOLINTNEXTLINE
TEST(ProcessHandle, NormalizeReturnCode) {
  EXPECT_EQ(NormalizeReturnCode(-9), 137);
  EXPECT_EQ(NormalizeReturnCode(-15), 143);
  EXPECT_EQ(NormalizeReturnCode(0), 0);
  EXPECT_EQ(NormalizeReturnCode(3), 3);
}

}  // namespace
