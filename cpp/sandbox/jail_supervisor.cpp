#include "sandbox/jail_supervisor.hpp"

#include <kj/debug.h>

#include "sandbox/jail_log.hpp"
#include "sandbox/process_supervisor.hpp"
#include "util/file.hpp"
#include "util/misc.hpp"
#include "util/which.hpp"

namespace sandbox {
namespace {
// Exit code of the jail when its command line is invalid. In that case the
// error goes to stdout instead of the log file.
static const constexpr int kJailUsageError = 255;
// The supervised interpreter may not create other processes.
static const constexpr int64_t kMaxProcessCount = 1;

std::string Resolve(const std::string& binary) {
  std::string path = util::which(binary);
  return path.empty() ? binary : path;
}
}  // namespace

JailSupervisor::JailSupervisor(const JailOptions& options)
    : options_(options), groups_(options.memory_group, options.pids_group) {
  KJ_REQUIRE(options_.time_limit_seconds > 0, "Invalid time limit",
             options_.time_limit_seconds);
  groups_.Setup({options_.memory_limit_bytes, kMaxProcessCount});
}

std::vector<std::string> JailSupervisor::BuildArgs(
    const std::string& log_path, const std::string& code) const {
  return {Resolve(options_.jail_binary),
          "--config",
          options_.config,
          "--log",
          log_path,
          "--time_limit",
          std::to_string(options_.time_limit_seconds),
          "--cgroup_mem_max",
          std::to_string(options_.memory_limit_bytes),
          "--cgroup_mem_mount",
          groups_.MemoryMount(),
          "--cgroup_mem_parent",
          groups_.MemoryParent(),
          "--cgroup_pids_max",
          std::to_string(kMaxProcessCount),
          "--cgroup_pids_mount",
          groups_.PidsMount(),
          "--cgroup_pids_parent",
          groups_.PidsParent(),
          "--",
          options_.interpreter,
          "-Iqu",
          "-c",
          code};
}

ProcessOutcome JailSupervisor::Execute(const std::string& code) {
  util::TempFile log(options_.log_dir);
  std::vector<std::string> args = BuildArgs(log.Path(), code);
  KJ_LOG(INFO, "Executing code in the jail", code);

  SupervisorOptions supervisor_options;
  supervisor_options.max_output_size = options_.max_output_size;
  supervisor_options.read_chunk_size = options_.read_chunk_size;
  supervisor_options.wall_limit_millis =
      options_.time_limit_seconds * 1000 + options_.grace_millis;
  ProcessOutcome result = ProcessSupervisor(supervisor_options).Run(args);

  std::vector<std::string> lines = util::File::ReadLines(log.Path());
  if (lines.empty() && result.exit_code == kJailUsageError) {
    lines = util::split(result.stdout_data, '\n');
  }
  result.log_lines = ProcessJailLog(lines);
  KJ_LOG(INFO, "Jail return code", result.exit_code);
  return result;
}

}  // namespace sandbox
