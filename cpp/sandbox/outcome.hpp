#ifndef SANDBOX_OUTCOME_HPP
#define SANDBOX_OUTCOME_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <kj/common.h>
#include <kj/one-of.h>

namespace sandbox {

// Exit code reported when the supervisor itself ended the attempt (output
// overflow, timeout) or could not start the process.
static const constexpr int kInternalExitCode = -1;

enum class ResourceKind { OUTPUT, MEMORY, PROCESSES };

struct Completed {
  std::string return_value;
};

struct Failed {
  std::string description;
  kj::Maybe<std::string> traceback;
};

struct TimedOut {
  int64_t elapsed_millis;
};

struct ResourceExceeded {
  ResourceKind kind;
  size_t used;
  size_t max;
};

struct KilledBySignal {
  int signal;
};

// Result of one execution attempt. Exactly one of the alternatives is set.
using ExecutionOutcome = kj::OneOf<Completed, Failed, TimedOut,
                                   ResourceExceeded, KilledBySignal>;

const char* ResourceKindName(ResourceKind kind);

// Short name of the alternative held by outcome ("completed", "failed", ...).
const char* OutcomeName(const ExecutionOutcome& outcome);

// Human readable, single line description of an outcome.
std::string Describe(const ExecutionOutcome& outcome);

struct SandboxLogLine {
  enum class Level { DBG, INFO, WARNING, ERROR };
  Level level;
  std::string message;
};

// Result of running an external process under supervision.
struct ProcessOutcome {
  std::vector<std::string> args;
  int exit_code = kInternalExitCode;
  std::string stdout_data;
  std::string stderr_data;
  ExecutionOutcome outcome;
  // Only filled when the process ran inside the jail.
  std::vector<SandboxLogLine> log_lines;
};

}  // namespace sandbox

#endif
