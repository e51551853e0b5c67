#include "util/bounded_buffer.hpp"

namespace util {

CapacityExceeded::CapacityExceeded(size_t used, size_t max)
    : std::runtime_error("Maximum output size surpassed (" +
                         std::to_string(used) + " > " + std::to_string(max) +
                         ")"),
      used_(used),
      max_(max) {}

size_t BoundedBuffer::Write(const char* data, size_t size) {
  size_t projected = data_.size() + size;
  if (projected > capacity_) {
    throw CapacityExceeded(projected, capacity_);
  }
  data_.append(data, size);
  return size;
}

}  // namespace util
