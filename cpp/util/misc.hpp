#ifndef UTIL_MISC_HPP
#define UTIL_MISC_HPP
#include <cstdint>
#include <functional>
#include <sstream>
#include <string>
#include <vector>

#include <kj/common.h>
#include <kj/main.h>
#include <kj/string.h>

namespace util {

template <typename Out>
void split(const std::string& s, char delim, Out result) {
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    if (!item.empty()) *(result++) = item;
  }
}
std::vector<std::string> split(const std::string& s, char delim);

// Parses a whole string as a base-10 integer. Leading or trailing garbage,
// an empty string or an out-of-range value give nullptr.
kj::Maybe<int64_t> parseInt(const std::string& s);

std::function<bool()> setBool(bool& var);
std::function<bool(kj::StringPtr)> setString(std::string& var);
std::function<kj::MainBuilder::Validity(kj::StringPtr)> setInt(int32_t& var);
std::function<kj::MainBuilder::Validity(kj::StringPtr)> setInt64(
    int64_t& var);

}  // namespace util
#endif
