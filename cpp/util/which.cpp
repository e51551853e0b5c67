#include "util/which.hpp"
#include <unistd.h>
#include <cstdlib>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include "util/file.hpp"
#include "util/misc.hpp"

namespace {
std::mutex cmd_cache_mutex;
std::map<std::pair<std::string, std::string>, std::string> cmd_cache;

bool IsExecutable(const std::string& path) {
  return access(path.c_str(), X_OK) == 0 && util::File::Exists(path);
}
}  // namespace

namespace util {

std::string which(const std::string& cmd, bool use_cache) {
  if (cmd.find('/') != std::string::npos) {
    return IsExecutable(cmd) ? cmd : "";
  }
  const char* env_path = std::getenv("PATH");
  std::string path = env_path == nullptr ? "" : env_path;
  auto key = std::make_pair(path, cmd);

  std::lock_guard<std::mutex> lck(cmd_cache_mutex);
  if (use_cache && cmd_cache.count(key) > 0) return cmd_cache[key];

  for (const std::string& dir : split(path, ':')) {
    std::string fullpath = util::File::JoinPath(dir, cmd);
    if (IsExecutable(fullpath)) return cmd_cache[key] = fullpath;
  }
  return cmd_cache[key] = "";
}

}  // namespace util
