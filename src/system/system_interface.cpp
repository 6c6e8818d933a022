/**
 * @file system_interface.cpp
 * @brief Process measurements for Linux (getrusage fallback elsewhere)
 */

#include "system/system_interface.h"

#include <spdlog/spdlog.h>
#include <sys/resource.h>

#include <chrono>
#include <ctime>
#include <fstream>
#include <sstream>
#include <string>

namespace stashd::system {

namespace {

constexpr uint64_t kNanosPerSecond = 1000000000ULL;
constexpr uint64_t kBytesPerKB = 1024ULL;

uint64_t PeakRssFromRusage() {
  struct rusage usage {};
  if (getrusage(RUSAGE_SELF, &usage) != 0) {
    return 0;
  }
#ifdef __APPLE__
  return static_cast<uint64_t>(usage.ru_maxrss);
#else
  // ru_maxrss is in kilobytes on Linux
  return static_cast<uint64_t>(usage.ru_maxrss) * kBytesPerKB;
#endif
}

}  // namespace

uint64_t ProcessSystem::InstructionCounter() const {
  struct timespec spec {};
  if (clock_gettime(CLOCK_PROCESS_CPUTIME_ID, &spec) != 0) {
    spdlog::warn("clock_gettime(CLOCK_PROCESS_CPUTIME_ID) failed");
    return 0;
  }
  return static_cast<uint64_t>(spec.tv_sec) * kNanosPerSecond + static_cast<uint64_t>(spec.tv_nsec);
}

uint64_t ProcessSystem::MemoryUsage() const {
#ifdef __linux__
  std::ifstream status("/proc/self/status");
  if (status) {
    std::string line;
    while (std::getline(status, line)) {
      std::istringstream iss(line);
      std::string key;
      uint64_t value = 0;
      iss >> key >> value;
      if (key == "VmRSS:") {
        return value * kBytesPerKB;
      }
    }
  }
#endif
  return PeakRssFromRusage();
}

uint64_t ProcessSystem::Now() const {
  auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}

}  // namespace stashd::system
