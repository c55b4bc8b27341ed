#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <chrono>

namespace mdv {

// Build-time code hash from git short SHA or "unknown"
std::string code_hash();

// Best-effort CPU affinity pinning (Linux only); returns true on success
bool pin_to_cpu(int cpu);

// FNV-1a 64-bit checksum
uint64_t fnv1a64(const void* data, size_t len);
uint64_t fnv1a64_str(const std::string& s);
// Continue a running FNV-1a hash over another chunk
uint64_t fnv1a64_update(uint64_t hash, const void* data, size_t len);

// Split "a,b,,c" into {"a","b","c"}; trims spaces
std::vector<std::string> split_csv(const std::string& s);

// Time helpers
using steady_clock = std::chrono::steady_clock;
using time_point = steady_clock::time_point;
inline uint64_t to_ns(time_point t) {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(t.time_since_epoch()).count();
}
inline double ns_to_ms(uint64_t ns) { return double(ns) / 1e6; }

// Wall-clock nanoseconds since the Unix epoch (record timestamps)
inline int64_t wall_ns() {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
}
constexpr int64_t kNsPerSec = 1000000000LL;

} // namespace mdv
