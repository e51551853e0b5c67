#ifndef SANDBOX_WORKER_INVOCATION_HPP
#define SANDBOX_WORKER_INVOCATION_HPP

#include <cstdint>
#include <string>
#include <vector>

#include <kj/common.h>

namespace sandbox {

// Environment variable through which the restriction level reaches the
// interpreter.
static const constexpr char* kRestrictionLevelEnv = "JAILRUN_RESTRICTION_LEVEL";

// Arguments of the worker entry point:
//   <restriction level> <memory ceiling in bytes | "unset"> <payload>
struct WorkerInvocation {
  int32_t restriction_level = 0;
  kj::Maybe<int64_t> memory_limit_bytes;
  std::string payload;
};

// Positional arguments that encode invocation.
std::vector<std::string> WorkerArgs(const WorkerInvocation& invocation);

// Validates the positional arguments. A memory ceiling that is not positive
// means no ceiling. Returns false and sets error_msg on invalid input.
bool ParseWorkerArgs(const std::string& level, const std::string& memory,
                     const std::string& payload, WorkerInvocation* invocation,
                     std::string* error_msg);

// Applies the memory ceiling, exports the restriction level and replaces the
// current process with "<interpreter> -c <payload>". Only returns on
// failure, with error_msg set.
bool ExecWorker(const WorkerInvocation& invocation,
                const std::string& interpreter, std::string* error_msg);

}  // namespace sandbox

#endif
