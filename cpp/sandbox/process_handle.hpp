#ifndef SANDBOX_PROCESS_HANDLE_HPP
#define SANDBOX_PROCESS_HANDLE_HPP

#include <sys/types.h>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <kj/common.h>
#include <kj/io.h>

namespace sandbox {

// Limits applied to the child between fork and exec. Zero means unlimited.
struct SoftLimits {
  int64_t memory_limit_bytes = 0;
  int64_t cpu_limit_seconds = 0;
  bool disable_core_dumps = true;
};

// Owns one child process. The child runs in its own session, so signals are
// delivered to its whole process group. The process is always reaped before
// the handle goes away: the destructor kills and reaps a child that is still
// running.
class ProcessHandle {
 public:
  enum class State { SPAWNED, RUNNING, EXITED, SIGNALED, TIMED_OUT };

  // Starts args[0] with the given arguments. The child reads its standard
  // input from /dev/null, its standard output and error are connected to two
  // pipes. Returns nullptr and sets error_msg if the process could not be
  // started, including when exec fails in the child.
  static std::unique_ptr<ProcessHandle> Spawn(
      const std::vector<std::string>& args, const SoftLimits& limits,
      std::string* error_msg);

  // Forks a child that runs func and then exits with status 0. The standard
  // streams are inherited. func must not return control to the caller in any
  // other way: exceptions escaping it terminate the child with status 1.
  static std::unique_ptr<ProcessHandle> Fork(const std::function<void()>& func,
                                             const SoftLimits& limits,
                                             std::string* error_msg);

  pid_t Pid() const { return pid_; }
  State GetState() const;
  bool Terminated() const;

  // Read ends of the output pipes. Only valid for spawned processes, and only
  // once: the caller becomes the owner of the descriptor.
  kj::AutoCloseFd ReleaseStdout() { return kj::mv(stdout_fd_); }
  kj::AutoCloseFd ReleaseStderr() { return kj::mv(stderr_fd_); }

  // Checks whether the child terminated, reaping it if so. Whatever is left
  // of its process group is killed right before the child is reaped.
  bool Poll();

  // Waits up to timeout_millis (forever if negative) for the child to
  // terminate. Returns true if it did.
  bool WaitFor(int64_t timeout_millis);

  // Sends sig to the process group of the child. Does nothing once the child
  // has been reaped. Safe to call from any thread.
  void Kill(int sig);

  // Ends a child that exceeded its deadline: SIGTERM, then SIGKILL if the
  // child is still alive after grace_millis. The final state is TIMED_OUT.
  void ExpireDeadline(int64_t grace_millis);

  // Raw wait status, exit code and signal of a terminated child.
  int WaitStatus() const;
  int ExitCode() const;
  int Signal() const;

  ~ProcessHandle();
  KJ_DISALLOW_COPY(ProcessHandle);

 private:
  ProcessHandle() = default;

  // Reaps the child if it terminated, after killing the rest of its process
  // group; blocks if block is true. Must be called with mutex_ held.
  bool Reap(bool block);

  mutable std::mutex mutex_;
  pid_t pid_ = 0;
  State state_ = State::SPAWNED;
  bool reaped_ = false;
  bool deadline_expired_ = false;
  int wait_status_ = 0;
  kj::AutoCloseFd stdout_fd_;
  kj::AutoCloseFd stderr_fd_;
};

// Exit code of a wait status: the code itself for a normal exit, 128 + N for
// a termination by signal N.
int NormalizeExitCode(int wait_status);

// Maps a negative return code -N (termination by signal N) to 128 + N.
int NormalizeReturnCode(int return_code);

}  // namespace sandbox

#endif
