#include "util/misc.hpp"
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <iterator>

namespace util {

std::vector<std::string> split(const std::string& s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

kj::Maybe<int64_t> parseInt(const std::string& s) {
  if (s.empty()) return nullptr;
  char* end = nullptr;
  errno = 0;
  long long value = strtoll(s.c_str(), &end, 10);  // NOLINT
  if (errno == ERANGE || end != s.c_str() + s.size()) return nullptr;
  return static_cast<int64_t>(value);
}

std::function<bool()> setBool(bool& var) {
  return [&var]() {
    var = true;
    return true;
  };
};

std::function<bool(kj::StringPtr)> setString(std::string& var) {
  return [&var](kj::StringPtr p) {
    var = p;
    return true;
  };
};

std::function<kj::MainBuilder::Validity(kj::StringPtr)> setInt(int32_t& var) {
  return [&var](kj::StringPtr p) -> kj::MainBuilder::Validity {
    KJ_IF_MAYBE(value, parseInt(p)) {
      if (*value < INT32_MIN || *value > INT32_MAX) return "out of range";
      var = static_cast<int32_t>(*value);
      return true;
    }
    return "not an integer";
  };
};

std::function<kj::MainBuilder::Validity(kj::StringPtr)> setInt64(
    int64_t& var) {
  return [&var](kj::StringPtr p) -> kj::MainBuilder::Validity {
    KJ_IF_MAYBE(value, parseInt(p)) {
      var = *value;
      return true;
    }
    return "not an integer";
  };
};

}  // namespace util
