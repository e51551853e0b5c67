#ifndef UTIL_BOUNDED_BUFFER_HPP
#define UTIL_BOUNDED_BUFFER_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace util {

// Raised when a write would make a bounded sink grow past its capacity.
// used is the size the sink would have had after the write.
class CapacityExceeded : public std::runtime_error {
 public:
  CapacityExceeded(size_t used, size_t max);

  size_t Used() const { return used_; }
  size_t Max() const { return max_; }

 private:
  size_t used_;
  size_t max_;
};

// Append-only byte sink with a hard capacity. A write either fits entirely or
// is rejected with CapacityExceeded, leaving the contents untouched.
class BoundedBuffer {
 public:
  explicit BoundedBuffer(size_t capacity) : capacity_(capacity) {}

  // Appends size bytes and returns size. Throws CapacityExceeded if the
  // projected size would exceed the capacity.
  size_t Write(const char* data, size_t size);
  size_t Write(const std::string& chunk) {
    return Write(chunk.data(), chunk.size());
  }

  const std::string& ReadAll() const { return data_; }

  // Discards the contents, keeping the capacity.
  void Reset() { data_.clear(); }

  size_t Size() const { return data_.size(); }
  size_t Capacity() const { return capacity_; }
  size_t Available() const { return capacity_ - data_.size(); }

 private:
  std::string data_;
  size_t capacity_;
};

}  // namespace util

#endif
