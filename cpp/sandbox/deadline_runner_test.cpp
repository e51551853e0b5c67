#include "sandbox/deadline_runner.hpp"
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <kj/debug.h>

namespace {

using ::testing::HasSubstr;
using ::testing::IsEmpty;

using namespace sandbox;  // NOLINT

DeadlineOptions Options(int64_t time_limit_millis,
                        IsolationTier tier = IsolationTier::PROCESS) {
  DeadlineOptions options;
  options.time_limit_millis = time_limit_millis;
  options.tier = tier;
  return options;
}

void Sleep(int64_t millis) {
  std::this_thread::sleep_for(std::chrono::milliseconds(millis));
}

// True if pid does not exist or is a zombie waiting for its new parent.
bool Dead(pid_t pid) {
  if (kill(pid, 0) == -1 && errno == ESRCH) return true;
  std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
  std::string line;
  if (!std::getline(stat, line)) return true;
  size_t paren = line.rfind(')');
  return paren != std::string::npos && paren + 2 < line.size() &&
         line[paren + 2] == 'Z';
}

class DeadlineRunnerTest : public ::testing::TestWithParam<IsolationTier> {};

// NOLINTNEXTLINE
TEST_P(DeadlineRunnerTest, Completes) {
  DeadlineRunner runner(Options(2000, GetParam()));
  DeadlineResult result = runner.Run([](CapturedStreams& streams) {
    streams.Out() << "hello";
    streams.Err() << "world";
    return std::string("42");
  });
  ASSERT_TRUE(result.outcome.is<Completed>()) << Describe(result.outcome);
  EXPECT_EQ(result.outcome.get<Completed>().return_value, "42");
  EXPECT_EQ(result.stdout_data, "hello");
  EXPECT_EQ(result.stderr_data, "world");
}

// NOLINTNEXTLINE
TEST_P(DeadlineRunnerTest, NoValue) {
  DeadlineRunner runner(Options(2000, GetParam()));
  DeadlineResult result =
      runner.Run([](CapturedStreams& streams) { return std::string(); });
  ASSERT_TRUE(result.outcome.is<Completed>()) << Describe(result.outcome);
  EXPECT_THAT(result.outcome.get<Completed>().return_value, IsEmpty());
}

// NOLINTNEXTLINE
TEST_P(DeadlineRunnerTest, CompletesBeforeDeadline) {
  DeadlineRunner runner(Options(2000, GetParam()));
  DeadlineResult result = runner.Run([](CapturedStreams& streams) {
    Sleep(100);
    return std::string("done");
  });
  ASSERT_TRUE(result.outcome.is<Completed>()) << Describe(result.outcome);
  EXPECT_GE(result.wall_time_millis, 100);
}

// NOLINTNEXTLINE
TEST_P(DeadlineRunnerTest, WithArgument) {
  DeadlineRunner runner(Options(2000, GetParam()));
  DeadlineResult result = runner.Run(
      [](CapturedStreams& streams, const std::string& arg) {
        streams.Out() << arg.size();
        return arg + arg;
      },
      "ab");
  ASSERT_TRUE(result.outcome.is<Completed>()) << Describe(result.outcome);
  EXPECT_EQ(result.outcome.get<Completed>().return_value, "abab");
  EXPECT_EQ(result.stdout_data, "2");
}

// NOLINTNEXTLINE
TEST_P(DeadlineRunnerTest, StdException) {
  DeadlineRunner runner(Options(2000, GetParam()));
  DeadlineResult result =
      runner.Run([](CapturedStreams& streams) -> std::string {
        streams.Out() << "before";
        throw std::runtime_error("boom");
      });
  ASSERT_TRUE(result.outcome.is<Failed>()) << Describe(result.outcome);
  EXPECT_EQ(result.outcome.get<Failed>().description, "boom");
  EXPECT_TRUE(result.outcome.get<Failed>().traceback == nullptr);
  EXPECT_EQ(result.stdout_data, "before");
}

// NOLINTNEXTLINE
TEST_P(DeadlineRunnerTest, KjExceptionHasTraceback) {
  DeadlineRunner runner(Options(2000, GetParam()));
  DeadlineResult result =
      runner.Run([](CapturedStreams& streams) -> std::string {
        KJ_FAIL_REQUIRE("bad input");
      });
  ASSERT_TRUE(result.outcome.is<Failed>()) << Describe(result.outcome);
  EXPECT_THAT(result.outcome.get<Failed>().description,
              HasSubstr("bad input"));
  KJ_IF_MAYBE(traceback, result.outcome.get<Failed>().traceback) {
    EXPECT_THAT(*traceback, HasSubstr("deadline_runner_test.cpp"));
  } else {
    FAIL() << "missing traceback";
  }
}

// NOLINTNEXTLINE
TEST_P(DeadlineRunnerTest, OutputOverflow) {
  DeadlineOptions options = Options(2000, GetParam());
  options.output_limit = 10;
  DeadlineRunner runner(options);
  DeadlineResult result = runner.Run([](CapturedStreams& streams) {
    streams.Out() << "hello";
    streams.Out() << "world!";
    return std::string("unreachable");
  });
  ASSERT_TRUE(result.outcome.is<ResourceExceeded>())
      << Describe(result.outcome);
  EXPECT_EQ(result.outcome.get<ResourceExceeded>().used, 11);
  EXPECT_EQ(result.outcome.get<ResourceExceeded>().max, 10);
  EXPECT_EQ(result.stdout_data, "hello");
}

// NOLINTNEXTLINE
TEST_P(DeadlineRunnerTest, SimulatedStdin) {
  DeadlineOptions options = Options(2000, GetParam());
  options.stdin_text = std::string("21\n");
  DeadlineRunner runner(options);
  DeadlineResult result = runner.Run([](CapturedStreams& streams) {
    int value = 0;
    streams.In() >> value;
    return std::to_string(value * 2);
  });
  ASSERT_TRUE(result.outcome.is<Completed>()) << Describe(result.outcome);
  EXPECT_EQ(result.outcome.get<Completed>().return_value, "42");
}

// NOLINTNEXTLINE
TEST_P(DeadlineRunnerTest, TimesOut) {
  DeadlineRunner runner(Options(300, GetParam()));
  auto start = std::chrono::steady_clock::now();
  DeadlineResult result = runner.Run([](CapturedStreams& streams) {
    while (!streams.StopRequested()) Sleep(10);
    return std::string("stopped");
  });
  auto elapsed = std::chrono::steady_clock::now() - start;
  ASSERT_TRUE(result.outcome.is<TimedOut>()) << Describe(result.outcome);
  EXPECT_EQ(result.outcome.get<TimedOut>().elapsed_millis, 300);
  EXPECT_LT(elapsed, std::chrono::milliseconds(300 + 500 + 1000));
}

INSTANTIATE_TEST_SUITE_P(Tiers, DeadlineRunnerTest,
                         ::testing::Values(IsolationTier::PROCESS,
                                           IsolationTier::THREAD));

// NOLINTNEXTLINE
TEST(DeadlineRunner, ProcessKilledOnTimeout) {
  DeadlineRunner runner(Options(300));
  DeadlineResult result = runner.Run([](CapturedStreams& streams) {
    // Does not cooperate: only a forked worker can be stopped.
    while (true) Sleep(1000);
    return std::string();
  });
  ASSERT_TRUE(result.outcome.is<TimedOut>()) << Describe(result.outcome);
  EXPECT_LT(result.wall_time_millis, 300 + 500 + 1000);
}

// NOLINTNEXTLINE
TEST(DeadlineRunner, KilledBySignal) {
  DeadlineRunner runner(Options(2000));
  DeadlineResult result = runner.Run([](CapturedStreams& streams) {
    raise(SIGKILL);
    return std::string();
  });
  ASSERT_TRUE(result.outcome.is<KilledBySignal>()) << Describe(result.outcome);
  EXPECT_EQ(result.outcome.get<KilledBySignal>().signal, SIGKILL);
}

// NOLINTNEXTLINE
TEST(DeadlineRunner, ExitWithoutResult) {
  DeadlineRunner runner(Options(2000));
  DeadlineResult result = runner.Run([](CapturedStreams& streams) {
    _Exit(0);
    return std::string();
  });
  ASSERT_TRUE(result.outcome.is<Failed>()) << Describe(result.outcome);
  EXPECT_EQ(result.outcome.get<Failed>().description,
            "worker exited without a result");
}

// NOLINTNEXTLINE
TEST(DeadlineRunner, ForkingWorkStillCompletes) {
  DeadlineRunner runner(Options(5000));
  DeadlineResult result = runner.Run([](CapturedStreams& streams) {
    // The child inherits the result channel and keeps it open.
    pid_t child = fork();
    if (child == 0) {
      Sleep(30000);
      _Exit(0);
    }
    return std::to_string(child);
  });
  ASSERT_TRUE(result.outcome.is<Completed>()) << Describe(result.outcome);
  EXPECT_LT(result.wall_time_millis, 2000);
  pid_t child = std::stoi(result.outcome.get<Completed>().return_value);
  ASSERT_GT(child, 0);
  // The child was in the worker's process group, so it was killed too.
  bool gone = false;
  for (int i = 0; i < 100 && !gone; i++) {
    gone = Dead(child);
    if (!gone) Sleep(10);
  }
  EXPECT_TRUE(gone);
}

// NOLINTNEXTLINE
TEST(DeadlineRunner, MemoryLimit) {
  DeadlineOptions options = Options(5000);
  options.memory_limit_bytes = 256 * 1024 * 1024;
  DeadlineRunner runner(options);
  DeadlineResult result = runner.Run([](CapturedStreams& streams) {
    std::vector<char> huge(1024LL * 1024 * 1024);
    return std::to_string(huge.size());
  });
  ASSERT_TRUE(result.outcome.is<Failed>()) << Describe(result.outcome);
  EXPECT_THAT(result.outcome.get<Failed>().description, HasSubstr("bad_alloc"));
}

// NOLINTNEXTLINE
TEST(DeadlineRunner, ProcessIsolatesState) {
  static int counter = 0;
  DeadlineRunner runner(Options(2000));
  DeadlineResult result = runner.Run([](CapturedStreams& streams) {
    counter++;
    return std::to_string(counter);
  });
  ASSERT_TRUE(result.outcome.is<Completed>()) << Describe(result.outcome);
  EXPECT_EQ(result.outcome.get<Completed>().return_value, "1");
  EXPECT_EQ(counter, 0);
}

// NOLINTNEXTLINE
TEST(DeadlineRunner, InvalidTimeLimit) {
  EXPECT_THROW(DeadlineRunner runner(Options(0)), kj::Exception);  // NOLINT
}

}  // namespace
