#include <unistd.h>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <thread>

// Leaves behind a child that keeps stdout open for argv[1] seconds.
int main(int argc, char** argv) {
  if (fork() == 0) {
    std::this_thread::sleep_for(
        std::chrono::milliseconds(static_cast<int64_t>(atof(argv[1]) * 1000)));
    return 0;
  }
  return 0;
}
