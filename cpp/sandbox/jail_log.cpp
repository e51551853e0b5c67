#include "sandbox/jail_log.hpp"

#include <regex>

#include <kj/debug.h>

namespace sandbox {
namespace {

const char* const kIgnoredPrefixes[] = {"Process will be "};

bool StartsWith(const std::string& str, const std::string& prefix) {
  return str.compare(0, prefix.size(), prefix) == 0;
}

bool Ignored(const std::string& message) {
  for (const char* prefix : kIgnoredPrefixes) {
    if (StartsWith(message, prefix)) return true;
  }
  return false;
}

}  // namespace

kj::Maybe<SandboxLogLine> ParseJailLogLine(const std::string& line) {
  static const std::regex info_line(R"(^\[I\]\[[^\]]+?\] ?(.+)$)");
  static const std::regex other_line(
      R"(^\[([DWEF])\]\[[^\]]+?\]\[\d+\] .+?:\d+ (.+)$)");
  std::smatch match;
  if (std::regex_match(line, match, info_line)) {
    return SandboxLogLine{SandboxLogLine::Level::INFO, match[1]};
  }
  if (std::regex_match(line, match, other_line)) {
    SandboxLogLine parsed{SandboxLogLine::Level::ERROR, match[2]};
    switch (match[1].str()[0]) {
      case 'D':
        parsed.level = SandboxLogLine::Level::DBG;
        break;
      case 'W':
        parsed.level = SandboxLogLine::Level::WARNING;
        break;
      default:
        break;
    }
    return parsed;
  }
  return nullptr;
}

std::vector<SandboxLogLine> ProcessJailLog(
    const std::vector<std::string>& lines) {
  std::vector<SandboxLogLine> kept;
  for (const std::string& line : lines) {
    if (line.empty()) continue;
    KJ_IF_MAYBE(parsed, ParseJailLogLine(line)) {
      if (Ignored(parsed->message)) continue;
      switch (parsed->level) {
        case SandboxLogLine::Level::DBG:
          KJ_LOG(DBG, "jail", parsed->message);
          break;
        case SandboxLogLine::Level::INFO:
          if (!StartsWith(parsed->message, "pid=")) continue;
          KJ_LOG(INFO, "jail", parsed->message);
          break;
        case SandboxLogLine::Level::WARNING:
          KJ_LOG(WARNING, "jail", parsed->message);
          break;
        case SandboxLogLine::Level::ERROR:
          KJ_LOG(ERROR, "jail", parsed->message);
          break;
      }
      kept.push_back(*parsed);
    } else {
      KJ_LOG(WARNING, "Failed to parse jail log line", line);
    }
  }
  return kept;
}

}  // namespace sandbox
