#ifndef SANDBOX_MAIN_HPP
#define SANDBOX_MAIN_HPP
#include <kj/main.h>
#include <string>

namespace sandbox {

// jailrun run: executes one payload in the selected tier and reports its
// outcome.
class Main {
 public:
  explicit Main(kj::ProcessContext* context) : context(*context) {}
  kj::MainBuilder::Validity Run();
  kj::MainFunc getMain();

 private:
  kj::ProcessContext& context;
  std::string payload;
  bool has_payload = false;
};
}  // namespace sandbox
#endif
