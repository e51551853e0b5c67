#include "sandbox/main.hpp"

#include <cstdio>
#include <iostream>
#include <iterator>

#include <kj/debug.h>

#include "sandbox/jail_supervisor.hpp"
#include "sandbox/restricted_runner.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

namespace sandbox {
namespace {
ProcessOutcome RunInJail(const std::string& code) {
  JailOptions options;
  options.jail_binary = Flags::jail_binary;
  options.config = Flags::jail_config;
  options.interpreter = Flags::interpreter;
  options.memory_group = Flags::memory_cgroup;
  options.pids_group = Flags::pids_cgroup;
  options.time_limit_seconds = Flags::time_limit;
  options.memory_limit_bytes = Flags::memory_limit;
  if (Flags::max_output_size > 0) {
    options.max_output_size = Flags::max_output_size;
  }
  if (Flags::read_chunk_size > 0) {
    options.read_chunk_size = Flags::read_chunk_size;
  }
  JailSupervisor jail(options);
  return jail.Execute(code);
}

ProcessOutcome RunRestricted(const std::string& code) {
  RestrictedOptions options;
  options.interpreter = Flags::interpreter;
  options.restriction_level = Flags::restriction_level;
  options.memory_limit_bytes = Flags::memory_limit;
  options.time_limit_millis = Flags::time_limit * 1000;
  if (Flags::max_output_size > 0) {
    options.max_output_size = Flags::max_output_size;
  }
  if (Flags::read_chunk_size > 0) {
    options.read_chunk_size = Flags::read_chunk_size;
  }
  RestrictedRunner runner(options);
  return runner.Execute(code);
}

void WriteAll(FILE* stream, const std::string& data) {
  if (fwrite(data.data(), 1, data.size(), stream) != data.size() ||
      fflush(stream) != 0) {
    KJ_LOG(WARNING, "Failed to forward the output of the payload");
  }
}
}  // namespace

kj::MainBuilder::Validity Main::Run() {
  util::LogManager log_manager(context);
  if (Flags::time_limit <= 0) return "The time limit must be positive";
  if (Flags::memory_limit <= 0) return "The memory limit must be positive";
  if (!has_payload) {
    payload.assign(std::istreambuf_iterator<char>(std::cin),
                   std::istreambuf_iterator<char>());
  }

  ProcessOutcome outcome;
  if (Flags::tier == "jail") {
    outcome = RunInJail(payload);
  } else if (Flags::tier == "restricted") {
    outcome = RunRestricted(payload);
  } else {
    return "Unknown tier, expected jail or restricted";
  }

  WriteAll(stdout, outcome.stdout_data);
  WriteAll(stderr, outcome.stderr_data);
  KJ_LOG(INFO, "Execution finished", OutcomeName(outcome.outcome),
         outcome.exit_code);
  if (outcome.outcome.is<Completed>() && outcome.exit_code == 0) return true;
  std::string message = Describe(outcome.outcome) +
                        " (exit code " + std::to_string(outcome.exit_code) +
                        ")";
  context.exitError(kj::heapString(message.data(), message.size()));
}

kj::MainFunc Main::getMain() {
  return kj::MainBuilder(context, "jailrun (" + util::version + ")",
                         "Runs untrusted code under time, memory and output "
                         "limits. The code is read from standard input if "
                         "not given.")
      .addOptionWithArg({'L', "logfile"}, util::setString(Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOption({'v', "verbose"}, util::setBool(Flags::verbose),
                 "Log informational messages")
      .addOption({"debug"}, util::setBool(Flags::debug),
                 "Log debug messages")
      .addOptionWithArg({'t', "tier"}, util::setString(Flags::tier),
                        "<TIER>", "Isolation tier: jail (default) or restricted")
      .addOptionWithArg({'l', "level"}, util::setInt(Flags::restriction_level),
                        "<LEVEL>", "Restriction level passed to the worker")
      .addOptionWithArg({'T', "time-limit"}, util::setInt64(Flags::time_limit),
                        "<SECONDS>", "Wall clock limit")
      .addOptionWithArg({'m', "memory-limit"},
                        util::setInt64(Flags::memory_limit), "<BYTES>",
                        "Memory ceiling")
      .addOptionWithArg({'o', "max-output"},
                        util::setInt64(Flags::max_output_size), "<BYTES>",
                        "Combined ceiling for stdout and stderr")
      .addOptionWithArg({"read-chunk"}, util::setInt64(Flags::read_chunk_size),
                        "<BYTES>", "Size of the reads from the output pipes")
      .addOptionWithArg({'j', "jail"}, util::setString(Flags::jail_binary),
                        "<PATH>", "Jail executable")
      .addOptionWithArg({'c', "jail-config"},
                        util::setString(Flags::jail_config), "<PATH>",
                        "Configuration file of the jail")
      .addOptionWithArg({"memory-cgroup"},
                        util::setString(Flags::memory_cgroup), "<DIR>",
                        "Memory control group used by the jail")
      .addOptionWithArg({"pids-cgroup"}, util::setString(Flags::pids_cgroup),
                        "<DIR>", "Pids control group used by the jail")
      .addOptionWithArg({'i', "interpreter"},
                        util::setString(Flags::interpreter), "<PATH>",
                        "Interpreter that runs the code")
      .expectOptionalArg("<CODE>",
                         [this](kj::StringPtr code) {
                           payload = code;
                           has_payload = true;
                           return true;
                         })
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}
}  // namespace sandbox
