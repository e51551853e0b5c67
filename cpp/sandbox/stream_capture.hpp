#ifndef SANDBOX_STREAM_CAPTURE_HPP
#define SANDBOX_STREAM_CAPTURE_HPP

#include <atomic>
#include <istream>
#include <memory>
#include <mutex>
#include <ostream>
#include <sstream>
#include <streambuf>
#include <string>
#include <utility>

#include <kj/common.h>

#include "util/bounded_buffer.hpp"

namespace sandbox {

// The standard streams handed to one unit of work. Out() and Err() write
// into two BoundedBuffers: a write that does not fit throws
// util::CapacityExceeded out of the << expression and nothing of it is kept.
// Once closed, every write fails.
//
// The streams are meant to be used by a single worker thread; the captured
// text can be read from any thread.
class CapturedStreams {
 public:
  CapturedStreams(size_t capacity, const kj::Maybe<std::string>& stdin_text);

  std::ostream& Out() { return out_; }
  std::ostream& Err() { return err_; }

  // Simulated standard input. Empty if no text was provided.
  std::istream& In() { return in_; }

  // Set when the runner gave up on the work. Long running work should poll
  // it and return as soon as possible.
  bool StopRequested() const { return stop_; }
  void RequestStop() { stop_ = true; }

  void Close();
  bool Closed() const;

  std::string StdoutText() const;
  std::string StderrText() const;

 private:
  class Sink : public std::streambuf {
   public:
    Sink(CapturedStreams* owner, util::BoundedBuffer* buffer)
        : owner_(owner), buffer_(buffer) {}

   protected:
    std::streamsize xsputn(const char* s, std::streamsize n) override;
    int_type overflow(int_type ch) override;

   private:
    CapturedStreams* owner_;
    util::BoundedBuffer* buffer_;
  };

  mutable std::mutex mutex_;
  bool closed_ = false;
  std::atomic<bool> stop_{false};
  util::BoundedBuffer stdout_buffer_;
  util::BoundedBuffer stderr_buffer_;
  Sink stdout_sink_;
  Sink stderr_sink_;
  std::ostream out_;
  std::ostream err_;
  std::istringstream in_;

  KJ_DISALLOW_COPY(CapturedStreams);
};

// Scoped capture of the output of one attempt. Enter() creates fresh sinks
// and Exit() closes them; the captured text stays readable until the next
// Enter(). Captures do not nest.
class StreamCapture {
 public:
  explicit StreamCapture(size_t capacity,
                         kj::Maybe<std::string> stdin_text = nullptr)
      : capacity_(capacity), stdin_text_(kj::mv(stdin_text)) {}

  CapturedStreams& Enter();
  void Exit();
  bool Active() const { return active_; }

  // The sinks of the current (or last) capture, kept alive for as long as
  // the caller holds the pointer.
  std::shared_ptr<CapturedStreams> Shared() const { return streams_; }

  std::string Stdout() const;
  std::string Stderr() const;

  // Calls Exit() when going out of scope, also during unwinding.
  class Scope {
   public:
    explicit Scope(StreamCapture* capture)
        : capture_(capture), streams_(capture->Enter()) {}
    ~Scope() { capture_->Exit(); }
    CapturedStreams& Streams() { return streams_; }
    KJ_DISALLOW_COPY(Scope);

   private:
    StreamCapture* capture_;
    CapturedStreams& streams_;
  };

  // Runs func with the sinks of a new capture and closes them afterwards.
  template <typename Func>
  auto Capture(Func&& func)
      -> decltype(func(std::declval<CapturedStreams&>())) {
    Scope scope(this);
    return func(scope.Streams());
  }

 private:
  size_t capacity_;
  kj::Maybe<std::string> stdin_text_;
  std::shared_ptr<CapturedStreams> streams_;
  bool active_ = false;
};

}  // namespace sandbox

#endif
