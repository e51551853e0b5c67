#include "sandbox/restricted_runner.hpp"

#include <kj/debug.h>

#include "sandbox/process_supervisor.hpp"
#include "sandbox/worker_invocation.hpp"
#include "whereami++.h"

namespace sandbox {

RestrictedRunner::RestrictedRunner(const RestrictedOptions& options)
    : options_(options) {
  if (options_.worker_binary.empty()) {
    std::string self = whereami::getExecutablePath();
    options_.worker_binary = self;
  }
}

std::vector<std::string> RestrictedRunner::BuildArgs(
    const std::string& payload) const {
  WorkerInvocation invocation;
  invocation.restriction_level = options_.restriction_level;
  if (options_.memory_limit_bytes > 0) {
    invocation.memory_limit_bytes = options_.memory_limit_bytes;
  }
  invocation.payload = payload;
  std::vector<std::string> args = {options_.worker_binary, "worker"};
  if (!options_.interpreter.empty()) {
    args.push_back("--interpreter");
    args.push_back(options_.interpreter);
  }
  // Ends the options, the payload may start with a dash.
  args.push_back("--");
  for (std::string& arg : WorkerArgs(invocation)) args.push_back(kj::mv(arg));
  return args;
}

ProcessOutcome RestrictedRunner::Execute(const std::string& payload) {
  SupervisorOptions supervisor_options;
  supervisor_options.max_output_size = options_.max_output_size;
  supervisor_options.read_chunk_size = options_.read_chunk_size;
  supervisor_options.wall_limit_millis = options_.time_limit_millis;
  KJ_LOG(INFO, "Executing restricted code", options_.restriction_level);
  ProcessOutcome result = ProcessSupervisor(supervisor_options).Run(
      BuildArgs(payload));
  KJ_LOG(INFO, "Restricted worker return code", result.exit_code);
  return result;
}

}  // namespace sandbox
