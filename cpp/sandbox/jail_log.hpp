#ifndef SANDBOX_JAIL_LOG_HPP
#define SANDBOX_JAIL_LOG_HPP

#include <string>
#include <vector>

#include <kj/common.h>

#include "sandbox/outcome.hpp"

namespace sandbox {

// Parses one line of the jail log:
//   [<L>][<timestamp>]([<pid>] <function>:<line> )<message>
// The location part is present for every level except I. Returns nullptr if
// the line does not match.
kj::Maybe<SandboxLogLine> ParseJailLogLine(const std::string& line);

// Parses a whole jail log and re-emits the relevant lines through the KJ log.
// Informational lines are kept only when they report the pid of the jailed
// process; known noise is dropped and unparseable lines are logged as
// warnings. Returns the kept lines.
std::vector<SandboxLogLine> ProcessJailLog(
    const std::vector<std::string>& lines);

}  // namespace sandbox

#endif
