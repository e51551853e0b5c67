#include "sandbox/deadline_runner.hpp"

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <future>
#include <memory>
#include <system_error>
#include <thread>

#include <capnp/message.h>
#include <capnp/serialize.h>
#include <kj/debug.h>
#include <kj/io.h>

#include "capnp/worker.capnp.h"
#include "sandbox/process_handle.hpp"
#include "util/bounded_buffer.hpp"

namespace sandbox {
namespace {

using Clock = std::chrono::steady_clock;

// How often the parent checks whether the worker is still alive while
// waiting for its result.
static const constexpr int64_t kResultPollMillis = 50;

int64_t MillisSince(Clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() -
                                                               start)
      .count();
}

capnp::Data::Reader AsData(const std::string& str) {
  return capnp::Data::Reader(reinterpret_cast<const kj::byte*>(str.data()),
                             str.size());
}

capnp::Text::Reader AsText(const std::string& str) {
  return capnp::Text::Reader(str.data(), str.size());
}

std::string AsString(capnp::Data::Reader data) {
  return std::string(reinterpret_cast<const char*>(data.begin()), data.size());
}

std::string AsString(capnp::Text::Reader text) {
  return std::string(text.cStr(), text.size());
}

// Waits up to timeout_millis for fd to become readable (or closed).
bool WaitReadable(int fd, int64_t timeout_millis) {
  struct pollfd pfd {};
  pfd.fd = fd;
  pfd.events = POLLIN;
  while (true) {
    int ret = poll(&pfd, 1, static_cast<int>(timeout_millis));
    if (ret == -1 && errno == EINTR) continue;
    if (ret == -1) {
      throw std::system_error(errno, std::system_category(), "poll");
    }
    return ret > 0;
  }
}

// Appends one chunk of fd to data. Returns false at end of file.
bool ReadChunk(int fd, std::string* data) {
  char buf[64 * 1024];
  while (true) {
    ssize_t amount = read(fd, buf, sizeof(buf));
    if (amount == -1 && errno == EINTR) continue;
    if (amount == -1) {
      throw std::system_error(errno, std::system_category(), "read");
    }
    if (amount == 0) return false;
    data->append(buf, amount);
    return true;
  }
}

// Runs work in the current process and converts whatever it throws into an
// outcome.
ExecutionOutcome RunCatching(const Work& work, CapturedStreams& streams) {
  try {
    return Completed{work(streams)};
  } catch (const util::CapacityExceeded& exc) {
    return ResourceExceeded{ResourceKind::OUTPUT, exc.Used(), exc.Max()};
  } catch (const kj::Exception& exc) {
    return Failed{exc.getDescription().cStr(),
                  std::string(kj::str(exc).cStr())};
  } catch (const std::exception& exc) {
    return Failed{exc.what(), nullptr};
  } catch (...) {
    return Failed{"unknown exception", nullptr};
  }
}

// Body of the forked worker: runs the work and writes one WorkerResult on fd.
void WorkerMain(const Work& work, const DeadlineOptions& options, int fd) {
  StreamCapture capture(options.output_limit, options.stdin_text);
  ExecutionOutcome outcome = capture.Capture(
      [&work](CapturedStreams& streams) { return RunCatching(work, streams); });

  capnp::MallocMessageBuilder message;
  auto result = message.initRoot<capnproto::WorkerResult>();
  if (outcome.is<Completed>()) {
    result.setCompleted(AsText(outcome.get<Completed>().return_value));
  } else if (outcome.is<ResourceExceeded>()) {
    auto exceeded = result.initOutputExceeded();
    exceeded.setUsed(outcome.get<ResourceExceeded>().used);
    exceeded.setMax(outcome.get<ResourceExceeded>().max);
  } else {
    const Failed& failed = outcome.get<Failed>();
    auto failure = result.initFailure();
    failure.setDescription(AsText(failed.description));
    KJ_IF_MAYBE(traceback, failed.traceback) {
      failure.setTraceback(AsText(*traceback));
      failure.setHasTraceback(true);
    }
  }
  std::string out = capture.Stdout();
  std::string err = capture.Stderr();
  result.setCapturedStdout(AsData(out));
  result.setCapturedStderr(AsData(err));
  capnp::writeMessageToFd(fd, message);
}

void DecodeResult(const std::string& payload, DeadlineResult* result) {
  kj::ArrayInputStream stream(kj::arrayPtr(
      reinterpret_cast<const kj::byte*>(payload.data()), payload.size()));
  capnp::InputStreamMessageReader reader(stream);
  auto message = reader.getRoot<capnproto::WorkerResult>();
  result->stdout_data = AsString(message.getCapturedStdout());
  result->stderr_data = AsString(message.getCapturedStderr());
  switch (message.which()) {
    case capnproto::WorkerResult::COMPLETED:
      result->outcome = Completed{AsString(message.getCompleted())};
      break;
    case capnproto::WorkerResult::FAILURE: {
      auto failure = message.getFailure();
      kj::Maybe<std::string> traceback;
      if (failure.getHasTraceback()) {
        traceback = AsString(failure.getTraceback());
      }
      result->outcome =
          Failed{AsString(failure.getDescription()), kj::mv(traceback)};
      break;
    }
    case capnproto::WorkerResult::OUTPUT_EXCEEDED: {
      auto exceeded = message.getOutputExceeded();
      result->outcome = ResourceExceeded{
          ResourceKind::OUTPUT, exceeded.getUsed(), exceeded.getMax()};
      break;
    }
    default:
      KJ_FAIL_REQUIRE("Unknown worker result", (int)message.which());
  }
}

}  // namespace

DeadlineRunner::DeadlineRunner(DeadlineOptions options)
    : options_(kj::mv(options)) {
  KJ_REQUIRE(options_.time_limit_millis > 0, "Invalid time limit",
             options_.time_limit_millis);
}

DeadlineResult DeadlineRunner::Run(const Work& work) {
  if (options_.tier == IsolationTier::THREAD) return RunInThread(work);
  return RunInProcess(work);
}

DeadlineResult DeadlineRunner::Run(const WorkWithArg& work,
                                   const std::string& arg) {
  return Run([work, arg](CapturedStreams& streams) {
    return work(streams, arg);
  });
}

DeadlineResult DeadlineRunner::RunInProcess(const Work& work) {
  DeadlineResult result;
  auto start = Clock::now();

  int fds[2] = {};
  if (pipe2(fds, O_CLOEXEC) == -1) {  // NOLINT
    throw std::system_error(errno, std::system_category(), "pipe2");
  }
  kj::AutoCloseFd result_read(fds[0]);
  kj::AutoCloseFd result_write(fds[1]);

  SoftLimits limits;
  limits.memory_limit_bytes = options_.memory_limit_bytes;
  std::string error_msg;
  std::unique_ptr<ProcessHandle> handle = ProcessHandle::Fork(
      [this, &work, &result_read, &result_write]() {
        result_read = nullptr;
        WorkerMain(work, options_, result_write.get());
      },
      limits, &error_msg);
  if (!handle) {
    result.outcome = Failed{error_msg, nullptr};
    result.wall_time_millis = MillisSince(start);
    return result;
  }
  result_write = nullptr;

  std::string payload;
  bool timed_out = false;
  bool eof = false;
  while (!eof) {
    int64_t remaining = options_.time_limit_millis - MillisSince(start);
    if (remaining <= 0) {
      timed_out = true;
      break;
    }
    if (WaitReadable(result_read.get(),
                     std::min(remaining, kResultPollMillis))) {
      eof = !ReadChunk(result_read.get(), &payload);
    } else if (handle->Poll()) {
      // Descendants of the worker may keep the channel open after the worker
      // exited; whatever it sent is already in the pipe.
      while (!eof && WaitReadable(result_read.get(), 0)) {
        eof = !ReadChunk(result_read.get(), &payload);
      }
      break;
    }
  }

  if (timed_out) {
    KJ_LOG(WARNING, "Worker exceeded its deadline", handle->Pid(),
           options_.time_limit_millis);
    handle->ExpireDeadline(options_.grace_millis);
    result.outcome = TimedOut{options_.time_limit_millis};
    result.wall_time_millis = MillisSince(start);
    return result;
  }

  // The result channel is closed: the worker is exiting.
  if (!handle->WaitFor(options_.grace_millis)) {
    handle->ExpireDeadline(0);
  }
  result.wall_time_millis = MillisSince(start);
  if (payload.empty()) {
    if (handle->Signal() != 0) {
      result.outcome = KilledBySignal{handle->Signal()};
    } else {
      result.outcome = Failed{"worker exited without a result", nullptr};
    }
    return result;
  }
  try {
    DecodeResult(payload, &result);
  } catch (const kj::Exception& exc) {
    KJ_LOG(WARNING, "Malformed worker result", exc.getDescription());
    if (handle->Signal() != 0) {
      result.outcome = KilledBySignal{handle->Signal()};
      return result;
    }
    result.outcome = Failed{std::string("malformed worker result: ") +
                                exc.getDescription().cStr(),
                            nullptr};
  }
  return result;
}

DeadlineResult DeadlineRunner::RunInThread(const Work& work) {
  DeadlineResult result;
  auto start = Clock::now();

  StreamCapture capture(options_.output_limit, options_.stdin_text);
  StreamCapture::Scope scope(&capture);
  // Shared with the thread, which may outlive this call.
  std::shared_ptr<CapturedStreams> streams = capture.Shared();
  auto promise = std::make_shared<std::promise<ExecutionOutcome>>();
  std::future<ExecutionOutcome> future = promise->get_future();
  std::thread worker([streams, promise, work]() {
    promise->set_value(RunCatching(work, *streams));
  });

  if (future.wait_for(std::chrono::milliseconds(options_.time_limit_millis)) ==
      std::future_status::ready) {
    worker.join();
    result.outcome = future.get();
  } else {
    KJ_LOG(WARNING, "Worker thread exceeded its deadline",
           options_.time_limit_millis);
    streams->RequestStop();
    streams->Close();
    if (future.wait_for(std::chrono::milliseconds(options_.grace_millis)) ==
        std::future_status::ready) {
      worker.join();
    } else {
      KJ_LOG(ERROR, "Worker thread did not stop, abandoning it");
      worker.detach();
    }
    result.outcome = TimedOut{options_.time_limit_millis};
  }
  result.stdout_data = streams->StdoutText();
  result.stderr_data = streams->StderrText();
  result.wall_time_millis = MillisSince(start);
  return result;
}

}  // namespace sandbox
