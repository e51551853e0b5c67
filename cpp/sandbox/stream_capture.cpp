#include "sandbox/stream_capture.hpp"

#include <ios>

#include <kj/debug.h>

namespace sandbox {

CapturedStreams::CapturedStreams(size_t capacity,
                                 const kj::Maybe<std::string>& stdin_text)
    : stdout_buffer_(capacity),
      stderr_buffer_(capacity),
      stdout_sink_(this, &stdout_buffer_),
      stderr_sink_(this, &stderr_buffer_),
      out_(&stdout_sink_),
      err_(&stderr_sink_) {
  // Rethrow whatever the sink throws instead of only setting badbit.
  out_.exceptions(std::ios_base::badbit);
  err_.exceptions(std::ios_base::badbit);
  KJ_IF_MAYBE(text, stdin_text) { in_.str(*text); }
}

void CapturedStreams::Close() {
  std::lock_guard<std::mutex> lck(mutex_);
  closed_ = true;
}

bool CapturedStreams::Closed() const {
  std::lock_guard<std::mutex> lck(mutex_);
  return closed_;
}

std::string CapturedStreams::StdoutText() const {
  std::lock_guard<std::mutex> lck(mutex_);
  return stdout_buffer_.ReadAll();
}

std::string CapturedStreams::StderrText() const {
  std::lock_guard<std::mutex> lck(mutex_);
  return stderr_buffer_.ReadAll();
}

std::streamsize CapturedStreams::Sink::xsputn(const char* s,
                                              std::streamsize n) {
  std::lock_guard<std::mutex> lck(owner_->mutex_);
  if (owner_->closed_) {
    throw std::ios_base::failure("write to a closed capture stream");
  }
  buffer_->Write(s, n);
  return n;
}

CapturedStreams::Sink::int_type CapturedStreams::Sink::overflow(int_type ch) {
  if (traits_type::eq_int_type(ch, traits_type::eof())) {
    return traits_type::not_eof(ch);
  }
  char c = traits_type::to_char_type(ch);
  xsputn(&c, 1);
  return ch;
}

CapturedStreams& StreamCapture::Enter() {
  KJ_REQUIRE(!active_, "Output capture is already active");
  streams_ = std::make_shared<CapturedStreams>(capacity_, stdin_text_);
  active_ = true;
  return *streams_;
}

void StreamCapture::Exit() {
  if (streams_) streams_->Close();
  active_ = false;
}

std::string StreamCapture::Stdout() const {
  return streams_ ? streams_->StdoutText() : "";
}

std::string StreamCapture::Stderr() const {
  return streams_ ? streams_->StderrText() : "";
}

}  // namespace sandbox
