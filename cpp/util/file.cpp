#include "util/file.hpp"

#include <kj/debug.h>
#include <kj/exception.h>
#include <kj/io.h>
#include <cstdlib>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>

// if REMOVE_ALSO_MOUNT_POINTS is set remove also the mount points mounted in
// the sandbox when cleaning
#ifdef REMOVE_ALSO_MOUNT_POINTS
#define NFTW_EXTRA_FLAGS 0
#else
#define NFTW_EXTRA_FLAGS FTW_MOUNT
#endif

namespace {

const constexpr char* kPathSeparators = "/";
const constexpr size_t kReadChunkSize = 64 * 1024;

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) != -1 ||
         errno == EEXIST;
}

bool OsRemove(const std::string& path) { return remove(path.c_str()) != -1; }

bool OsRemoveTree(const std::string& path) {
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* sb, int typeflags,
                 struct FTW* ftwbuf) { return remove(fpath); },
              64, FTW_DEPTH | FTW_PHYS | NFTW_EXTRA_FLAGS) != -1;
}

const size_t max_path_len = 1 << 15;
std::string OsTempName(const std::string& path) {
  std::string tmp = util::File::JoinPath(path, "XXXXXX");
  KJ_REQUIRE(tmp.size() < max_path_len, tmp.size(), max_path_len,
             "Path too long");
  return tmp;
}

std::string OsTempDir(const std::string& path) {
  std::string tmp = OsTempName(path);
  char data[max_path_len + 1];
  data[0] = 0;
  strncat(data, tmp.c_str(), max_path_len - 1);  // NOLINT
  if (mkdtemp(data) == nullptr)                  // NOLINT
    return "";
  return data;  // NOLINT
}

std::string OsTempFile(const std::string& path) {
  std::string tmp = OsTempName(path);
  char data[max_path_len + 1];
  data[0] = 0;
  strncat(data, tmp.c_str(), max_path_len - 1);  // NOLINT
  kj::AutoCloseFd fd(mkostemp(data, O_CLOEXEC));  // NOLINT
  if (fd.get() == -1) return "";
  return data;  // NOLINT
}

}  // namespace

namespace util {

std::string File::Read(const std::string& path) {
  kj::AutoCloseFd fd{open(path.c_str(), O_CLOEXEC | O_RDONLY)};  // NOLINT
  if (fd.get() == -1) {
    throw std::system_error(errno, std::system_category(), "Read " + path);
  }
  std::string content;
  char buf[kReadChunkSize];
  while (true) {
    ssize_t amount = read(fd.get(), buf, kReadChunkSize);  // NOLINT
    if (amount == -1 && errno == EINTR) continue;
    if (amount == -1) {
      throw std::system_error(errno, std::system_category(), "Read " + path);
    }
    if (amount == 0) break;
    content.append(buf, amount);  // NOLINT
  }
  return content;
}

std::vector<std::string> File::ReadLines(const std::string& path) {
  std::string content = Read(path);
  std::vector<std::string> lines;
  size_t start = 0;
  while (start < content.size()) {
    size_t end = content.find('\n', start);
    if (end == std::string::npos) end = content.size();
    std::string line = content.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    lines.push_back(std::move(line));
    start = end + 1;
  }
  return lines;
}

void File::WriteText(const std::string& path, const std::string& text) {
  kj::AutoCloseFd fd{open(path.c_str(),  // NOLINT
                          O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                          S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH)};
  if (fd.get() == -1) {
    throw std::system_error(errno, std::system_category(), "Write " + path);
  }
  size_t pos = 0;
  while (pos < text.size()) {
    ssize_t written = write(fd.get(), text.data() + pos, text.size() - pos);
    if (written == -1 && errno == EINTR) continue;
    if (written == -1) {
      throw std::system_error(errno, std::system_category(), "Write " + path);
    }
    pos += written;
  }
}

void File::MakeDirs(const std::string& path) {
  uint64_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    if (!MkDir(path.substr(0, pos))) {
      throw std::system_error(errno, std::system_category(), "mkdir");
    }
  }
}

void File::Remove(const std::string& path) {
  if (!OsRemove(path)) {
    throw std::system_error(errno, std::system_category(), "remove");
  }
}

void File::RemoveTree(const std::string& path) {
  if (!OsRemoveTree(path)) {
    throw std::system_error(errno, std::system_category(), "removetree");
  }
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (strchr(kPathSeparators, second[0]) != nullptr) return second;
  return first + kPathSeparators[0] + second;  // NOLINT
}

std::string File::BaseDir(const std::string& path) {
  if (path.find_last_of(kPathSeparators) == std::string::npos) return "";
  return path.substr(0, path.find_last_of(kPathSeparators));
}

std::string File::BaseName(const std::string& path) {
  return path.substr(path.find_last_of(kPathSeparators) + 1);
}

int64_t File::Size(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0) {
    return -1;
  }
  return st.st_size;
}

TempDir::TempDir(const std::string& base) {
  File::MakeDirs(base);
  path_ = OsTempDir(base);
  if (path_.empty()) {
    throw std::system_error(errno, std::system_category(), "mkdtemp");
  }
}
const std::string& TempDir::Path() const { return path_; }
TempDir::~TempDir() {  // NOLINT
  if (!moved_) {
    kj::UnwindDetector detector;
    detector.catchExceptionsIfUnwinding([&]() { File::RemoveTree(path_); });
  }
}

TempFile::TempFile(const std::string& base) {
  File::MakeDirs(base);
  path_ = OsTempFile(base);
  if (path_.empty()) {
    throw std::system_error(errno, std::system_category(), "mkostemp");
  }
}
TempFile::~TempFile() {  // NOLINT
  kj::UnwindDetector detector;
  detector.catchExceptionsIfUnwinding([&]() { File::Remove(path_); });
}

}  // namespace util
