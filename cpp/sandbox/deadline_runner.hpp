#ifndef SANDBOX_DEADLINE_RUNNER_HPP
#define SANDBOX_DEADLINE_RUNNER_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include <kj/common.h>

#include "sandbox/outcome.hpp"
#include "sandbox/stream_capture.hpp"

namespace sandbox {

enum class IsolationTier {
  // Forked child process. Any work can be stopped.
  PROCESS,
  // Thread of the calling process. Only work that writes to its streams or
  // checks CapturedStreams::StopRequested() can be stopped.
  THREAD
};

struct DeadlineOptions {
  int64_t time_limit_millis = 0;
  // Capacity of each of the captured streams.
  size_t output_limit = 100000;
  // Address space ceiling of the worker, zero for none. Process tier only.
  int64_t memory_limit_bytes = 0;
  kj::Maybe<std::string> stdin_text;
  IsolationTier tier = IsolationTier::PROCESS;
  // Time the worker has to stop after the deadline before it is killed (or,
  // for threads, abandoned).
  int64_t grace_millis = 500;
};

struct DeadlineResult {
  ExecutionOutcome outcome;
  std::string stdout_data;
  std::string stderr_data;
  int64_t wall_time_millis = 0;
};

// Returns the value of the work; an empty string means no value.
using Work = std::function<std::string(CapturedStreams&)>;
using WorkWithArg =
    std::function<std::string(CapturedStreams&, const std::string&)>;

// Runs one unit of work in an isolated worker under a wall clock deadline.
// Every run yields exactly one outcome and is never retried.
class DeadlineRunner {
 public:
  explicit DeadlineRunner(DeadlineOptions options);

  DeadlineResult Run(const Work& work);
  DeadlineResult Run(const WorkWithArg& work, const std::string& arg);

 private:
  DeadlineResult RunInProcess(const Work& work);
  DeadlineResult RunInThread(const Work& work);

  DeadlineOptions options_;
};

}  // namespace sandbox

#endif
