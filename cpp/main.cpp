#include "sandbox/main.hpp"
#include "util/flags.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"
#include "worker/main.hpp"

class JailrunMain {
 public:
  // NOLINTNEXTLINE(google-runtime-references)
  explicit JailrunMain(kj::ProcessContext& context)
      : context(context), rm(&context), wm(&context) {}
  kj::MainFunc getMain() {
    return kj::MainBuilder(context, "jailrun (" + util::version + ")",
                           "Runs untrusted code under bounded resources")
        .addSubCommand("run", KJ_BIND_METHOD(rm, getMain),
                       "run code in an isolation tier")
        .addSubCommand("worker", KJ_BIND_METHOD(wm, getMain),
                       "worker entry point of the restricted tier")
        .build();
  }

 private:
  kj::ProcessContext& context;
  sandbox::Main rm;
  worker::Main wm;
};

KJ_MAIN(JailrunMain);
