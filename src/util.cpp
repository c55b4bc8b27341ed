#include "util.hpp"
#include <cstring>
#include <thread>

#include <spdlog/spdlog.h>

#ifdef __linux__
#include <pthread.h>
#endif

namespace mdv {

std::string code_hash() {
#ifdef MDVAULT_CODE_HASH
  return MDVAULT_CODE_HASH;
#else
  return "unknown";
#endif
}

bool pin_to_cpu(int cpu) {
#ifdef __linux__
  if (cpu < 0) return false;
  cpu_set_t cpuset;
  CPU_ZERO(&cpuset);
  CPU_SET(cpu, &cpuset);
  pthread_t thread = pthread_self();
  int rc = pthread_setaffinity_np(thread, sizeof(cpu_set_t), &cpuset);
  if (rc != 0) {
    spdlog::warn("pin_to_cpu({}) failed: {}", cpu, rc);
    return false;
  }
  return true;
#else
  (void)cpu;
  spdlog::warn("pin_to_cpu not supported on this platform");
  return false;
#endif
}

static constexpr uint64_t kFnvOffset = 1469598103934665603ull; // FNV offset basis
static constexpr uint64_t kFnvPrime = 1099511628211ull;

uint64_t fnv1a64_update(uint64_t hash, const void* data, size_t len) {
  const uint8_t* p = static_cast<const uint8_t*>(data);
  for (size_t i = 0; i < len; ++i) {
    hash ^= p[i];
    hash *= kFnvPrime;
  }
  return hash;
}

uint64_t fnv1a64(const void* data, size_t len) { return fnv1a64_update(kFnvOffset, data, len); }

uint64_t fnv1a64_str(const std::string& s) { return fnv1a64(s.data(), s.size()); }

std::vector<std::string> split_csv(const std::string& s) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= s.size()) {
    size_t end = s.find(',', start);
    if (end == std::string::npos) end = s.size();
    std::string item = s.substr(start, end - start);
    auto b = item.find_first_not_of(" \t");
    auto e = item.find_last_not_of(" \t");
    if (b != std::string::npos) out.push_back(item.substr(b, e - b + 1));
    start = end + 1;
  }
  return out;
}

} // namespace mdv
