#include "sandbox/resource_group.hpp"

#include <cerrno>
#include <system_error>

#include <kj/debug.h>

#include "util/file.hpp"

namespace sandbox {

void ResourceGroupManager::Setup(const ResourceGroupLimits& limits) {
  KJ_REQUIRE(limits.memory_ceiling_bytes > 0, "Invalid memory ceiling",
             limits.memory_ceiling_bytes);
  std::string ceiling = std::to_string(limits.memory_ceiling_bytes);

  util::File::MakeDirs(memory_group_);
  util::File::WriteText(
      util::File::JoinPath(memory_group_, "memory.limit_in_bytes"), ceiling);
  KJ_LOG(INFO, "Memory ceiling set", memory_group_, ceiling);

  // Not available when swap accounting is disabled.
  std::string memsw =
      util::File::JoinPath(memory_group_, "memory.memsw.limit_in_bytes");
  try {
    util::File::WriteText(memsw, ceiling);
  } catch (const std::system_error& exc) {
    int err = exc.code().value();
    if (err != EACCES && err != EPERM && err != ENOENT) throw;
    KJ_LOG(WARNING, "Failed to set the memory+swap ceiling", memsw,
           exc.what());
  }

  // The jail writes the process count ceiling itself on every run.
  util::File::MakeDirs(pids_group_);
}

std::string ResourceGroupManager::MemoryMount() const {
  return util::File::BaseDir(memory_group_);
}

std::string ResourceGroupManager::MemoryParent() const {
  return util::File::BaseName(memory_group_);
}

std::string ResourceGroupManager::PidsMount() const {
  return util::File::BaseDir(pids_group_);
}

std::string ResourceGroupManager::PidsParent() const {
  return util::File::BaseName(pids_group_);
}

}  // namespace sandbox
