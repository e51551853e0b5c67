#include "sandbox/outcome.hpp"

#include <cstring>

#include <kj/debug.h>

namespace sandbox {

const char* ResourceKindName(ResourceKind kind) {
  switch (kind) {
    case ResourceKind::OUTPUT:
      return "output";
    case ResourceKind::MEMORY:
      return "memory";
    case ResourceKind::PROCESSES:
      return "processes";
  }
  KJ_FAIL_ASSERT("Unknown resource kind", static_cast<int>(kind));
}

const char* OutcomeName(const ExecutionOutcome& outcome) {
  if (outcome.is<Completed>()) return "completed";
  if (outcome.is<Failed>()) return "failed";
  if (outcome.is<TimedOut>()) return "timed_out";
  if (outcome.is<ResourceExceeded>()) return "resource_exceeded";
  if (outcome.is<KilledBySignal>()) return "killed_by_signal";
  return "unset";
}

std::string Describe(const ExecutionOutcome& outcome) {
  if (outcome.is<Completed>()) {
    return "completed: " + outcome.get<Completed>().return_value;
  }
  if (outcome.is<Failed>()) {
    return "failed: " + outcome.get<Failed>().description;
  }
  if (outcome.is<TimedOut>()) {
    return "timed out after " +
           std::to_string(outcome.get<TimedOut>().elapsed_millis) + "ms";
  }
  if (outcome.is<ResourceExceeded>()) {
    const auto& exceeded = outcome.get<ResourceExceeded>();
    return std::string(ResourceKindName(exceeded.kind)) + " limit exceeded (" +
           std::to_string(exceeded.used) + " > " +
           std::to_string(exceeded.max) + ")";
  }
  if (outcome.is<KilledBySignal>()) {
    int signal = outcome.get<KilledBySignal>().signal;
    return "killed by signal " + std::to_string(signal) + " (" +
           strsignal(signal) + ")";
  }
  return "no outcome";
}

}  // namespace sandbox
