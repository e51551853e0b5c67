#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include <cstdint>
#include <string>

struct Flags {
  // Common flags
  static std::string log_file;
  static bool verbose;
  static bool debug;

  // Execution flags
  static std::string tier;
  static int32_t restriction_level;
  static int64_t time_limit;
  static int64_t memory_limit;
  // Zero selects the default of the tier.
  static int64_t max_output_size;
  static int64_t read_chunk_size;

  // Jail-only flags
  static std::string jail_binary;
  static std::string jail_config;
  static std::string memory_cgroup;
  static std::string pids_cgroup;

  // Worker-only flags
  static std::string interpreter;
};

#endif
