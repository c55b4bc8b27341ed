#pragma once
#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include "channel.hpp"
#include "context.hpp"
#include "events.hpp"

namespace mdv {

// Rate multiplier active for [t_s, t_s + dur_s) seconds into the run
struct Burst { double t_s=0; double dur_s=0; double x=1; };

double rate_with_bursts(int base_rate, double t, const std::vector<Burst>& bursts);

// Exchange-side producer. stream() pushes until the context is cancelled or
// a channel is closed; transient faults go to `errors` as text.
class FeedSource {
public:
  virtual ~FeedSource() = default;
  virtual void stream(const Context& ctx, const std::vector<std::string>& symbols, Channel<Trade>& trades,
                      Channel<Depth>& depths, Channel<std::string>& errors) = 0;
};

struct SimFeedOptions {
  int rate = 1000;       // events per second across all symbols
  uint64_t seed = 7;
  std::vector<Burst> bursts;
  int depth_every = 4;   // one depth snapshot per N trades of a symbol
  int fault_every = 0;   // report a simulated stream fault every N events; 0 = never
  uint64_t max_events = 0; // stop after N events; 0 = until cancelled
};

// Seeded random walk per symbol, round-robin across symbols.
class SimFeed : public FeedSource {
public:
  explicit SimFeed(SimFeedOptions opts);

  void stream(const Context& ctx, const std::vector<std::string>& symbols, Channel<Trade>& trades,
              Channel<Depth>& depths, Channel<std::string>& errors) override;

  uint64_t produced() const { return produced_; }
  uint64_t faults() const { return faults_; }

private:
  SimFeedOptions opts_;
  std::mt19937_64 rng_;
  uint64_t produced_ = 0;
  uint64_t faults_ = 0;
};

} // namespace mdv
