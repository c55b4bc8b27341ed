#pragma once
#include <array>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace mdv {

struct Percentiles { double p50=0, p95=0, p99=0, max=0, jitter_ratio=0; };

class LatencyRecorder {
public:
  // Histogram up to max_ms in 'bins' bins; also store up to sample_cap samples (ms)
  LatencyRecorder(double max_ms=5.0, int bins=64, size_t sample_cap=2000);
  void add_sample(double ms);
  Percentiles percentiles() const;
  uint64_t count() const;
  std::string csv_samples_header() const { return "latency_ms"; }
  std::string csv_samples() const; // one value per line
private:
  double max_ms_;
  int bins_;
  std::vector<uint64_t> hist_;
  std::vector<double> samples_;
  size_t sample_cap_;
  double max_observed_ = 0.0;
  mutable std::mutex m_; // both batch threads record into one recorder
};

enum class Counter : size_t {
  TradesReceived,
  DepthsReceived,
  VwapCalculations,
  DecisionsDispatched,
  FeatureErrors,
  StoreErrors,
  WsReconnects,
  ErrorsTotal,
  TradeBatches,
  DepthBatches,
  UnknownSymbol,
  TaskFailures,
  kCount
};

const char* counter_name(Counter c);

// Recording side used by the pipeline; counters only ever increase
class MetricsSink {
public:
  virtual ~MetricsSink() = default;
  virtual void inc(Counter c, uint64_t n = 1) = 0;
  virtual void observe_flush_ms(double ms) = 0;
};

struct RunInfo {
  std::string code_hash;
  std::vector<std::string> symbols;
  int seed = 7;
  int rate = 0;
  bool persistence = false;
  double elapsed_s = 0.0;
};

class Metrics : public MetricsSink {
public:
  void inc(Counter c, uint64_t n = 1) override {
    counters_[(size_t)c].fetch_add(n, std::memory_order_relaxed);
  }
  void observe_flush_ms(double ms) override { flush_latency_.add_sample(ms); }

  uint64_t get(Counter c) const { return counters_[(size_t)c].load(std::memory_order_relaxed); }
  const LatencyRecorder& flush_latency() const { return flush_latency_; }

  // channel high-water marks, filled in at shutdown
  uint64_t trade_queue_max = 0;
  uint64_t depth_queue_max = 0;

  std::string to_json(const RunInfo& info) const;

private:
  std::array<std::atomic<uint64_t>, (size_t)Counter::kCount> counters_{};
  LatencyRecorder flush_latency_{50.0, 100};
};

// Best-effort resident set size in MB (Linux only); returns 0.0 on unsupported platforms.
double rss_mb();

} // namespace mdv
