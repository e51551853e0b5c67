#ifndef UTIL_LOG_MANAGER_HPP
#define UTIL_LOG_MANAGER_HPP
#include <kj/exception.h>
#include <kj/main.h>
#include <mutex>
#include <ostream>
#include "backward.hpp"

namespace util {

// Renders KJ log messages as "<date> <level> <file:line> <text>" on stderr,
// or on the file given with --logfile. The log level follows the --verbose
// and --debug flags. Supervisor reader threads log concurrently, so every
// message is written under a lock.
class LogManager : public kj::ExceptionCallback {
 public:
  explicit LogManager(kj::ProcessContext& context);
  void logMessage(kj::LogSeverity severity, const char* file, int line,
                  int contextDepth, kj::String&& text) override;
  void onRecoverableException(kj::Exception&& exception) override;
  void onFatalException(kj::Exception&& exception) override;
  StackTraceMode stackTraceMode() override { return StackTraceMode::NONE; }

 private:
  void PrintStackTrace();

  std::ostream& out;
  std::mutex mutex;
  bool use_colors;
  backward::SignalHandling sh;  // Override kj's signal handling.
};
}  // namespace util

#endif
