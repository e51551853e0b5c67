#ifndef SANDBOX_RESTRICTED_RUNNER_HPP
#define SANDBOX_RESTRICTED_RUNNER_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "sandbox/outcome.hpp"

namespace sandbox {

struct RestrictedOptions {
  // Executable providing the worker entry point. Empty means the running
  // executable.
  std::string worker_binary;
  // Interpreter the worker hands the payload to. Empty means the default of
  // the worker.
  std::string interpreter;
  int32_t restriction_level = 2;
  // Zero means no memory ceiling.
  int64_t memory_limit_bytes = 0;
  size_t max_output_size = 10000;
  size_t read_chunk_size = 1000;
  // Zero means no wall clock limit.
  int64_t time_limit_millis = 0;
};

// Runs payloads through the worker entry point of this executable, with
// rlimit based ceilings instead of a jail.
class RestrictedRunner {
 public:
  explicit RestrictedRunner(const RestrictedOptions& options);

  std::vector<std::string> BuildArgs(const std::string& payload) const;
  ProcessOutcome Execute(const std::string& payload);

 private:
  RestrictedOptions options_;
};

}  // namespace sandbox

#endif
