#include "sandbox/process_supervisor.hpp"

#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <exception>
#include <future>
#include <system_error>

#include <kj/debug.h>
#include <kj/io.h>

namespace sandbox {
namespace {
// How often the readers check whether they should stop.
static const constexpr int kReaderPollMillis = 50;
// Time the readers get to drain the pipes once the process is gone.
static const constexpr int64_t kDrainGraceMillis = 500;
}  // namespace

ssize_t ProcessSupervisor::ReadChunk(int fd, char* buf, size_t size) {
  return read(fd, buf, size);
}

ProcessOutcome ProcessSupervisor::Run(const std::vector<std::string>& args) {
  KJ_REQUIRE(options_.read_chunk_size > 0, "Invalid read chunk size");
  ProcessOutcome result;
  result.args = args;

  std::string error_msg;
  std::unique_ptr<ProcessHandle> handle =
      ProcessHandle::Spawn(args, options_.limits, &error_msg);
  if (!handle) {
    KJ_LOG(WARNING, "Failed to start process", args[0], error_msg);
    result.exit_code = kInternalExitCode;
    result.outcome = Failed{error_msg, nullptr};
    return result;
  }
  KJ_LOG(DBG, "Started process", args[0], handle->Pid());

  const size_t max_output = options_.max_output_size;
  std::atomic<size_t> total{0};
  std::atomic<bool> overflow{false};
  std::atomic<size_t> overflow_used{0};
  std::atomic<bool> stop{false};
  auto reader = [this, &handle, &total, &overflow, &overflow_used, &stop,
                 max_output](kj::AutoCloseFd fd) {
    std::string data;
    std::vector<char> buf(options_.read_chunk_size);
    try {
      while (!overflow && !stop) {
        struct pollfd pfd {};
        pfd.fd = fd.get();
        pfd.events = POLLIN;
        int ready = poll(&pfd, 1, kReaderPollMillis);
        if (ready == -1 && errno == EINTR) continue;
        if (ready == -1) {
          throw std::system_error(errno, std::system_category(), "poll");
        }
        if (ready == 0) continue;
        ssize_t amount = ReadChunk(fd.get(), buf.data(), buf.size());
        if (amount == -1 && errno == EINTR) continue;
        if (amount == -1) {
          throw std::system_error(errno, std::system_category(), "read");
        }
        if (amount == 0) break;
        if (max_output != 0) {
          size_t used = total.fetch_add(amount) + amount;
          if (used > max_output) {
            bool expected = false;
            if (overflow.compare_exchange_strong(expected, true)) {
              overflow_used = used;
            }
            handle->Kill(SIGKILL);
            break;
          }
        }
        data.append(buf.data(), amount);
      }
    } catch (...) {
      // The process could block forever on a pipe nobody reads.
      handle->Kill(SIGKILL);
      throw;
    }
    return data;
  };
  std::future<std::string> stdout_reader =
      std::async(std::launch::async, reader, handle->ReleaseStdout());
  std::future<std::string> stderr_reader =
      std::async(std::launch::async, reader, handle->ReleaseStderr());

  bool timed_out = false;
  if (options_.wall_limit_millis > 0) {
    if (!handle->WaitFor(options_.wall_limit_millis)) {
      timed_out = true;
      handle->ExpireDeadline(0);
    }
  } else {
    handle->WaitFor(-1);
  }
  // Reaping killed the rest of the process group, but descendants that
  // started their own session may still hold the pipes open.
  auto drain_deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(kDrainGraceMillis);
  if (stdout_reader.wait_until(drain_deadline) != std::future_status::ready ||
      stderr_reader.wait_until(drain_deadline) != std::future_status::ready) {
    KJ_LOG(WARNING, "Output pipes still open after the process ended", args[0],
           handle->Pid());
    stop = true;
  }

  std::exception_ptr reader_error;
  try {
    result.stdout_data = stdout_reader.get();
  } catch (...) {
    reader_error = std::current_exception();
  }
  try {
    result.stderr_data = stderr_reader.get();
  } catch (...) {
    if (!reader_error) reader_error = std::current_exception();
  }
  if (reader_error) std::rethrow_exception(reader_error);

  int status = handle->WaitStatus();
  if (overflow) {
    KJ_LOG(WARNING, "Process output exceeded the limit", args[0],
           overflow_used.load(), max_output);
    result.exit_code = kInternalExitCode;
    result.outcome = ResourceExceeded{ResourceKind::OUTPUT, overflow_used,
                                      max_output};
  } else if (timed_out) {
    KJ_LOG(WARNING, "Process timed out", args[0], options_.wall_limit_millis);
    result.exit_code = kInternalExitCode;
    result.outcome = TimedOut{options_.wall_limit_millis};
  } else if (WIFSIGNALED(status)) {
    result.exit_code = NormalizeExitCode(status);
    result.outcome = KilledBySignal{WTERMSIG(status)};
  } else {
    result.exit_code = NormalizeExitCode(status);
    result.outcome = Completed{std::to_string(result.exit_code)};
  }
  KJ_LOG(DBG, "Process finished", args[0], result.exit_code);
  return result;
}

}  // namespace sandbox
