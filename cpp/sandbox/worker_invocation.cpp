#include "sandbox/worker_invocation.hpp"

#include <sys/resource.h>
#include <unistd.h>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>

#include <kj/debug.h>

#include "util/misc.hpp"

namespace sandbox {
namespace {
const constexpr char* kUnset = "unset";
}  // namespace

std::vector<std::string> WorkerArgs(const WorkerInvocation& invocation) {
  std::string memory = kUnset;
  KJ_IF_MAYBE(limit, invocation.memory_limit_bytes) {
    memory = std::to_string(*limit);
  }
  return {std::to_string(invocation.restriction_level), memory,
          invocation.payload};
}

bool ParseWorkerArgs(const std::string& level, const std::string& memory,
                     const std::string& payload, WorkerInvocation* invocation,
                     std::string* error_msg) {
  KJ_IF_MAYBE(value, util::parseInt(level)) {
    if (*value < INT32_MIN || *value > INT32_MAX) {
      *error_msg = "restriction level out of range: " + level;
      return false;
    }
    invocation->restriction_level = static_cast<int32_t>(*value);
  } else {
    *error_msg = "invalid restriction level: " + level;
    return false;
  }
  invocation->memory_limit_bytes = nullptr;
  if (memory != kUnset) {
    KJ_IF_MAYBE(value, util::parseInt(memory)) {
      if (*value > 0) invocation->memory_limit_bytes = *value;
    } else {
      *error_msg = "invalid memory limit: " + memory;
      return false;
    }
  }
  invocation->payload = payload;
  return true;
}

bool ExecWorker(const WorkerInvocation& invocation,
                const std::string& interpreter, std::string* error_msg) {
  if (invocation.payload.find('\0') != std::string::npos ||
      interpreter.find('\0') != std::string::npos) {
    *error_msg = "embedded null byte";
    return false;
  }
  KJ_IF_MAYBE(limit, invocation.memory_limit_bytes) {
#ifdef RLIMIT_AS
    struct rlimit rlim {};
    rlim.rlim_cur = *limit;
    rlim.rlim_max = *limit;
    if (setrlimit(RLIMIT_AS, &rlim) == -1) {
      *error_msg = std::string("setrlimit: ") + strerror(errno);
      return false;
    }
#else
    KJ_LOG(WARNING, "Memory ceiling not supported on this platform", *limit);
#endif
  }
  std::string level = std::to_string(invocation.restriction_level);
  if (setenv(kRestrictionLevelEnv, level.c_str(), 1) == -1) {
    *error_msg = std::string("setenv: ") + strerror(errno);
    return false;
  }
  KJ_LOG(DBG, "Starting interpreter", interpreter, level);
  std::vector<char*> argv = {const_cast<char*>(interpreter.c_str()),  // NOLINT
                             const_cast<char*>("-c"),                 // NOLINT
                             const_cast<char*>(invocation.payload.c_str()),
                             nullptr};
  execv(argv[0], argv.data());
  *error_msg = std::string("exec: ") + strerror(errno);
  return false;
}

}  // namespace sandbox
