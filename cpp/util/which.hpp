#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which: returns the first executable
// file called cmd in the directories of PATH, or an empty string. A cmd that
// contains a slash is not searched, it is returned if it is executable.
// Lookups are cached per value of PATH unless explicitly disabled; a cached
// result is not checked again.
std::string which(const std::string& cmd, bool use_cache = true);

}  // namespace util

#endif
