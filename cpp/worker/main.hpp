#ifndef WORKER_MAIN_HPP
#define WORKER_MAIN_HPP
#include <kj/main.h>
#include <string>

namespace worker {

// Internal entry point used by the restricted tier:
//   jailrun worker <level> <memory|unset> <payload>
class Main {
 public:
  explicit Main(kj::ProcessContext* context) : context(*context) {}
  kj::MainBuilder::Validity Run();
  kj::MainFunc getMain();

 private:
  kj::ProcessContext& context;
  std::string level;
  std::string memory;
  std::string payload;
};
}  // namespace worker
#endif
