#include "util/flags.hpp"

std::string Flags::log_file;
bool Flags::verbose = false;
bool Flags::debug = false;

std::string Flags::tier = "jail";
int32_t Flags::restriction_level = 2;
int64_t Flags::time_limit = 6;
int64_t Flags::memory_limit = 64000000;
int64_t Flags::max_output_size = 0;
int64_t Flags::read_chunk_size = 0;

std::string Flags::jail_binary = "/usr/sbin/nsjail";
std::string Flags::jail_config = "./config/nsjail.cfg";
std::string Flags::memory_cgroup = "/sys/fs/cgroup/memory/NSJAIL";
std::string Flags::pids_cgroup = "/sys/fs/cgroup/pids/NSJAIL";

std::string Flags::interpreter = "/usr/bin/python";
