#ifndef SANDBOX_JAIL_SUPERVISOR_HPP
#define SANDBOX_JAIL_SUPERVISOR_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "sandbox/outcome.hpp"
#include "sandbox/resource_group.hpp"

namespace sandbox {

struct JailOptions {
  std::string jail_binary = "/usr/sbin/nsjail";
  std::string config = "./config/nsjail.cfg";
  std::string interpreter = "/usr/bin/python";
  std::string memory_group = "/sys/fs/cgroup/memory/NSJAIL";
  std::string pids_group = "/sys/fs/cgroup/pids/NSJAIL";
  int64_t time_limit_seconds = 6;
  int64_t memory_limit_bytes = 64000000;
  size_t max_output_size = 1000000;
  size_t read_chunk_size = 10000;
  // Extra time given to the jail to enforce its own time limit before it is
  // killed.
  int64_t grace_millis = 1000;
  // Where the temporary jail logs are created.
  std::string log_dir = "/tmp";
};

// Runs code through the interpreter inside the external jail tool. The
// control groups are prepared once, when the supervisor is created.
class JailSupervisor {
 public:
  explicit JailSupervisor(const JailOptions& options);

  // Command line of the jail for one execution.
  std::vector<std::string> BuildArgs(const std::string& log_path,
                                     const std::string& code) const;

  // Runs code and returns its outcome together with the relevant lines of
  // the jail log.
  ProcessOutcome Execute(const std::string& code);

 private:
  JailOptions options_;
  ResourceGroupManager groups_;
};

}  // namespace sandbox

#endif
