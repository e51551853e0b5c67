#include "sandbox/process_handle.hpp"

#include <fcntl.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <climits>
#include <csignal>
#include <cstring>
#include <system_error>
#include <thread>

#include <kj/debug.h>

#include "sandbox/outcome.hpp"

namespace {

static const constexpr size_t kStrErrorBufSize = 2048;

char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

std::string ErrnoMessage(const char* prefix, int err) {
  char buf[kStrErrorBufSize] = {};
  return std::string(prefix) + ": " +
         mystrerror(err, buf, kStrErrorBufSize);  // NOLINT
}

// Reports "<prefix>: <error>" to the parent through fd, if any, and exits.
// Runs between fork and exec, so it must not allocate.
[[noreturn]] void Die(int fd, const char* prefix, int err) {
  if (fd != -1) {
    char errbuf[kStrErrorBufSize] = {};
    char buf[kStrErrorBufSize + 64 + 3 + 1] = {};
    strncat(buf, prefix, 64);                                       // NOLINT
    strncat(buf, ": ", 3);                                          // NOLINT
    strncat(buf, mystrerror(err, errbuf, kStrErrorBufSize),         // NOLINT
            kStrErrorBufSize);                                      // NOLINT
    ssize_t len = strlen(buf);                                      // NOLINT
    if (write(fd, &len, sizeof(len)) == sizeof(len)) {
      if (write(fd, buf, len) != len) _Exit(1);  // NOLINT
    }
  }
  _Exit(1);
}

void ApplyLimits(const sandbox::SoftLimits& limits, int error_fd) {
  struct rlimit rlim {};
#define SET_RLIM(res, value)                    \
  {                                             \
    rlim_t lim = value;                         \
    if (lim) {                                  \
      rlim.rlim_cur = lim;                      \
      rlim.rlim_max = lim;                      \
      if (setrlimit(RLIMIT_##res, &rlim) < 0) { \
        Die(error_fd, "setrlim " #res, errno);  \
      }                                         \
    }                                           \
  }
  SET_RLIM(AS, limits.memory_limit_bytes);
  SET_RLIM(CPU, limits.cpu_limit_seconds);
#undef SET_RLIM
  if (limits.disable_core_dumps) {
    rlim.rlim_cur = 0;
    rlim.rlim_max = 0;
    if (setrlimit(RLIMIT_CORE, &rlim) < 0) Die(error_fd, "setrlim CORE", errno);
  }
}

bool MakePipe(kj::AutoCloseFd* read_end, kj::AutoCloseFd* write_end,
              std::string* error_msg) {
  int fds[2] = {};
  if (pipe2(fds, O_CLOEXEC) == -1) {  // NOLINT
    *error_msg = ErrnoMessage("pipe2", errno);
    return false;
  }
  *read_end = kj::AutoCloseFd(fds[0]);
  *write_end = kj::AutoCloseFd(fds[1]);
  return true;
}

// Reads the error reported by a child that failed before exec. Returns false
// if the pipe was closed without a message, i.e. exec succeeded.
bool ReadChildError(int fd, std::string* error_msg) {
  ssize_t error_len = 0;
  ssize_t ret = 0;
  do {
    ret = read(fd, &error_len, sizeof(error_len));
  } while (ret == -1 && errno == EINTR);
  if (ret != sizeof(error_len)) return false;
  std::string error(error_len, '\0');
  size_t pos = 0;
  while (pos < error.size()) {
    ret = read(fd, &error[pos], error.size() - pos);
    if (ret == -1 && errno == EINTR) continue;
    if (ret <= 0) break;
    pos += ret;
  }
  error.resize(pos);
  *error_msg = error;
  return true;
}

}  // namespace

namespace sandbox {

std::unique_ptr<ProcessHandle> ProcessHandle::Spawn(
    const std::vector<std::string>& args, const SoftLimits& limits,
    std::string* error_msg) {
  KJ_REQUIRE(!args.empty(), "No command to run");
  std::vector<char*> argv;
  for (const std::string& arg : args) {
    if (arg.find('\0') != std::string::npos) {
      *error_msg = "embedded null byte";
      return nullptr;
    }
    argv.push_back(const_cast<char*>(arg.c_str()));  // NOLINT
  }
  argv.push_back(nullptr);

  kj::AutoCloseFd error_read, error_write;
  kj::AutoCloseFd stdout_read, stdout_write;
  kj::AutoCloseFd stderr_read, stderr_write;
  if (!MakePipe(&error_read, &error_write, error_msg)) return nullptr;
  if (!MakePipe(&stdout_read, &stdout_write, error_msg)) return nullptr;
  if (!MakePipe(&stderr_read, &stderr_write, error_msg)) return nullptr;
  kj::AutoCloseFd dev_null(open("/dev/null", O_RDONLY | O_CLOEXEC));  // NOLINT
  if (dev_null.get() == -1) {
    *error_msg = ErrnoMessage("open /dev/null", errno);
    return nullptr;
  }

  std::unique_ptr<ProcessHandle> handle(new ProcessHandle());
  pid_t pid = fork();
  if (pid == -1) {
    *error_msg = ErrnoMessage("fork", errno);
    return nullptr;
  }
  if (pid == 0) {
    int fd = error_write.get();
    // Own process group, so that the whole tree can be killed at once.
    if (setsid() == -1) Die(fd, "setsid", errno);
    if (dup2(dev_null.get(), STDIN_FILENO) == -1) Die(fd, "redir stdin", errno);
    if (dup2(stdout_write.get(), STDOUT_FILENO) == -1) {
      Die(fd, "redir stdout", errno);
    }
    if (dup2(stderr_write.get(), STDERR_FILENO) == -1) {
      Die(fd, "redir stderr", errno);
    }
    ApplyLimits(limits, fd);
    execv(argv[0], argv.data());
    Die(fd, "exec", errno);
  }

  handle->pid_ = pid;
  error_write = nullptr;
  stdout_write = nullptr;
  stderr_write = nullptr;
  std::string child_error;
  if (ReadChildError(error_read.get(), &child_error)) {
    std::lock_guard<std::mutex> lck(handle->mutex_);
    handle->Reap(true);
    *error_msg = child_error;
    return nullptr;
  }
  handle->state_ = State::RUNNING;
  handle->stdout_fd_ = kj::mv(stdout_read);
  handle->stderr_fd_ = kj::mv(stderr_read);
  return handle;
}

std::unique_ptr<ProcessHandle> ProcessHandle::Fork(
    const std::function<void()>& func, const SoftLimits& limits,
    std::string* error_msg) {
  std::unique_ptr<ProcessHandle> handle(new ProcessHandle());
  pid_t pid = fork();
  if (pid == -1) {
    *error_msg = ErrnoMessage("fork", errno);
    return nullptr;
  }
  if (pid == 0) {
    if (setsid() == -1) Die(-1, "setsid", errno);
    ApplyLimits(limits, -1);
    try {
      func();
    } catch (...) {
      _Exit(1);
    }
    _Exit(0);
  }
  handle->pid_ = pid;
  handle->state_ = State::RUNNING;
  return handle;
}

ProcessHandle::State ProcessHandle::GetState() const {
  std::lock_guard<std::mutex> lck(mutex_);
  return state_;
}

bool ProcessHandle::Terminated() const {
  std::lock_guard<std::mutex> lck(mutex_);
  return reaped_;
}

bool ProcessHandle::Reap(bool block) {
  if (reaped_) return true;
  siginfo_t info{};
  int ret = 0;
  do {
    ret = waitid(P_PID, pid_, &info,
                 WEXITED | WNOWAIT | (block ? 0 : WNOHANG));
  } while (ret == -1 && errno == EINTR);
  if (ret == -1) {
    throw std::system_error(errno, std::system_category(), "waitid");
  }
  if (info.si_pid == 0) return false;
  // The zombie leader keeps the group id reserved: kill what is left of the
  // group before the id can be reused.
  if (kill(-pid_, SIGKILL) == -1 && errno != ESRCH && errno != EPERM) {
    KJ_LOG(WARNING, "Failed to kill process group", pid_, strerror(errno));
  }
  int status = 0;
  pid_t reaped = 0;
  do {
    reaped = waitpid(pid_, &status, 0);
  } while (reaped == -1 && errno == EINTR);
  if (reaped == -1) {
    throw std::system_error(errno, std::system_category(), "waitpid");
  }
  reaped_ = true;
  wait_status_ = status;
  if (deadline_expired_) {
    state_ = State::TIMED_OUT;
  } else if (WIFSIGNALED(status)) {
    state_ = State::SIGNALED;
  } else {
    state_ = State::EXITED;
  }
  return true;
}

bool ProcessHandle::Poll() {
  std::lock_guard<std::mutex> lck(mutex_);
  return Reap(false);
}

bool ProcessHandle::WaitFor(int64_t timeout_millis) {
  auto start = std::chrono::steady_clock::now();
  auto elapsed_millis = [&start]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - start)
        .count();
  };
  while (timeout_millis < 0 || elapsed_millis() < timeout_millis) {
    if (Poll()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return Poll();
}

void ProcessHandle::Kill(int sig) {
  std::lock_guard<std::mutex> lck(mutex_);
  if (pid_ <= 0 || reaped_) return;
  if (kill(-pid_, sig) == -1 && errno != ESRCH && errno != EPERM) {
    KJ_LOG(WARNING, "Failed to signal process group", pid_, strerror(errno));
  }
  if (kill(pid_, sig) == -1 && errno != ESRCH) {
    KJ_LOG(WARNING, "Failed to signal process", pid_, strerror(errno));
  }
}

void ProcessHandle::ExpireDeadline(int64_t grace_millis) {
  {
    std::lock_guard<std::mutex> lck(mutex_);
    if (reaped_) return;
    deadline_expired_ = true;
  }
  Kill(SIGTERM);
  if (!WaitFor(grace_millis)) {
    Kill(SIGKILL);
    std::lock_guard<std::mutex> lck(mutex_);
    Reap(true);
  }
}

int ProcessHandle::WaitStatus() const {
  std::lock_guard<std::mutex> lck(mutex_);
  KJ_REQUIRE(reaped_, "The process is still running");
  return wait_status_;
}

int ProcessHandle::ExitCode() const { return NormalizeExitCode(WaitStatus()); }

int ProcessHandle::Signal() const {
  int status = WaitStatus();
  return WIFSIGNALED(status) ? WTERMSIG(status) : 0;
}

ProcessHandle::~ProcessHandle() {
  std::lock_guard<std::mutex> lck(mutex_);
  if (pid_ <= 0 || reaped_) return;
  if (kill(-pid_, SIGKILL) == -1 && kill(pid_, SIGKILL) == -1) {
    KJ_LOG(WARNING, "Failed to kill process", pid_, strerror(errno));
  }
  int status = 0;
  while (waitpid(pid_, &status, 0) == -1 && errno == EINTR) {
  }
}

int NormalizeExitCode(int wait_status) {
  if (WIFSIGNALED(wait_status)) return 128 + WTERMSIG(wait_status);
  if (WIFEXITED(wait_status)) return WEXITSTATUS(wait_status);
  return kInternalExitCode;
}

int NormalizeReturnCode(int return_code) {
  return return_code < 0 ? 128 - return_code : return_code;
}

}  // namespace sandbox
