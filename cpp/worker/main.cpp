#include "worker/main.hpp"

#include <kj/debug.h>

#include "sandbox/worker_invocation.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

namespace worker {
kj::MainBuilder::Validity Main::Run() {
  util::LogManager log_manager(context);
  sandbox::WorkerInvocation invocation;
  std::string error_msg;
  if (!sandbox::ParseWorkerArgs(level, memory, payload, &invocation,
                                &error_msg)) {
    return kj::heapString(error_msg.data(), error_msg.size());
  }
  if (!sandbox::ExecWorker(invocation, Flags::interpreter, &error_msg)) {
    KJ_LOG(ERROR, "Failed to start the interpreter", Flags::interpreter,
           error_msg);
  }
  context.exitError(kj::heapString(error_msg.data(), error_msg.size()));
}

kj::MainFunc Main::getMain() {
  return kj::MainBuilder(context, "jailrun worker (" + util::version + ")",
                         "Runs a payload with the interpreter, under the "
                         "given restriction level and memory ceiling")
      .addOptionWithArg({'L', "logfile"}, util::setString(Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOption({'v', "verbose"}, util::setBool(Flags::verbose),
                 "Log informational messages")
      .addOption({"debug"}, util::setBool(Flags::debug),
                 "Log debug messages")
      .addOptionWithArg({'i', "interpreter"},
                        util::setString(Flags::interpreter), "<PATH>",
                        "Interpreter that runs the payload")
      .expectArg("<LEVEL>", util::setString(level))
      .expectArg("<MEMORY>", util::setString(memory))
      .expectArg("<PAYLOAD>", util::setString(payload))
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}
}  // namespace worker
