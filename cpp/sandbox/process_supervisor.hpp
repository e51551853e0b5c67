#ifndef SANDBOX_PROCESS_SUPERVISOR_HPP
#define SANDBOX_PROCESS_SUPERVISOR_HPP

#include <sys/types.h>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "sandbox/outcome.hpp"
#include "sandbox/process_handle.hpp"

namespace sandbox {

struct SupervisorOptions {
  // Combined ceiling for stdout and stderr, in bytes. Zero means unbounded.
  size_t max_output_size = 0;
  size_t read_chunk_size = 10000;
  // Zero means no wall clock limit.
  int64_t wall_limit_millis = 0;
  SoftLimits limits;
};

// Runs an external command, collecting its output under a byte ceiling and
// killing it when the ceiling or the wall clock limit is exceeded.
class ProcessSupervisor {
 public:
  explicit ProcessSupervisor(const SupervisorOptions& options)
      : options_(options) {}
  virtual ~ProcessSupervisor() = default;

  // Runs args[0] to completion. Failures of the process are reported in the
  // outcome; an error while reading its output is rethrown once both reader
  // threads have finished. Descendants that left the process group cannot
  // delay the return by more than a short grace period after the process
  // ended: their output is dropped.
  ProcessOutcome Run(const std::vector<std::string>& args);

 protected:
  // Reads one chunk of output, with the semantics of read(2).
  virtual ssize_t ReadChunk(int fd, char* buf, size_t size);

 private:
  SupervisorOptions options_;
};

}  // namespace sandbox

#endif
