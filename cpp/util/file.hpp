#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP
#include <cstdint>
#include <string>
#include <vector>

#include <kj/common.h>

namespace util {

class File {
 public:
  // Reads the whole content of the file specified by path.
  static std::string Read(const std::string& path);

  // Reads the file specified by path and splits it into lines, without the
  // line terminators.
  static std::vector<std::string> ReadLines(const std::string& path);

  // Replaces the content of the file with the given text, creating it if
  // needed. Unlike an atomic write this works on pseudo-filesystems such as
  // cgroupfs, where temporary files cannot be created.
  static void WriteText(const std::string& path, const std::string& text);

  // Creates all the folders that are needed to write the specified file
  // or, if path is a directory, creates all the folders.
  static void MakeDirs(const std::string& path);

  // Removes a file.
  static void Remove(const std::string& path);

  // Recursively removes a tree.
  static void RemoveTree(const std::string& path);

  // Joins two paths.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Computes the directory name for a path
  static std::string BaseDir(const std::string& path);

  // Computes the file name for a path
  static std::string BaseName(const std::string& path);

  // Computes a file's size. Returns a negative number in case of errors.
  static int64_t Size(const std::string& path);

  // Returns true if a file exists
  static bool Exists(const std::string& path) { return Size(path) >= 0; }
};

// Creates a temporary directory in a given folder. The folder will be
// (recursively) removed on destruction.
class TempDir {
 public:
  // base is the directory in which the temporary directory will be created.
  explicit TempDir(const std::string& base);

  // Returns the path of the temporary folder.
  const std::string& Path() const;

  ~TempDir();

  TempDir(TempDir&& other) noexcept { *this = std::move(other); }
  TempDir& operator=(TempDir&& other) noexcept {
    path_ = std::move(other.path_);
    other.moved_ = true;
    return *this;
  }
  KJ_DISALLOW_COPY(TempDir);

 private:
  std::string path_;
  bool moved_ = false;
};

// Creates an empty temporary file in a given folder, removed on destruction.
class TempFile {
 public:
  explicit TempFile(const std::string& base);
  const std::string& Path() const { return path_; }
  ~TempFile();
  KJ_DISALLOW_COPY(TempFile);

 private:
  std::string path_;
};

}  // namespace util

#endif
