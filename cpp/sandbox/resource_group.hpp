#ifndef SANDBOX_RESOURCE_GROUP_HPP
#define SANDBOX_RESOURCE_GROUP_HPP

#include <cstdint>
#include <string>
#include <utility>

namespace sandbox {

struct ResourceGroupLimits {
  int64_t memory_ceiling_bytes;
  int64_t max_process_count;
};

// Prepares the memory and pids control groups used by the jail. Each group is
// identified by its directory; the jail receives the mount point (parent
// directory) and the group name separately.
class ResourceGroupManager {
 public:
  ResourceGroupManager(std::string memory_group, std::string pids_group)
      : memory_group_(std::move(memory_group)),
        pids_group_(std::move(pids_group)) {}

  // Creates both groups and writes the memory ceiling. Failing to set the
  // memory limit throws std::system_error; the memory+swap limit is optional
  // and only logged when it cannot be set. Calling it again with the same
  // limits leaves the groups unchanged.
  void Setup(const ResourceGroupLimits& limits);

  const std::string& MemoryGroup() const { return memory_group_; }
  const std::string& PidsGroup() const { return pids_group_; }
  std::string MemoryMount() const;
  std::string MemoryParent() const;
  std::string PidsMount() const;
  std::string PidsParent() const;

 private:
  std::string memory_group_;
  std::string pids_group_;
};

}  // namespace sandbox

#endif
