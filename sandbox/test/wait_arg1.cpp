#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <thread>

int main(int argc, char** argv) {
  if (argc < 2) return 1;
  std::this_thread::sleep_for(
      std::chrono::microseconds(static_cast<int64_t>(atof(argv[1]) * 1e6)));
  return 0;
}
