#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "channel.hpp"
#include "context.hpp"
#include "metrics.hpp"

namespace mdv {

// Drains a channel into a bounded buffer and hands it to `on_flush` when the
// buffer reaches max_batch or when the periodic tick finds it non-empty.
// Both wake-ups come from a single pop_until() on the channel with the next
// tick as deadline. On cancellation the partial buffer is dropped unless
// flush_on_cancel is set.
template <typename T>
class BatchAccumulator {
public:
  using FlushFn = std::function<void(std::vector<T>&)>;

  struct Options {
    std::string name = "batch";
    size_t max_batch = 20;
    std::chrono::microseconds interval{1000};
    bool flush_on_cancel = false;
    Counter flush_counter = Counter::TradeBatches;
  };

  BatchAccumulator(Channel<T>& source, Options opts, FlushFn on_flush, MetricsSink* metrics = nullptr)
    : src_(source), opts_(std::move(opts)), on_flush_(std::move(on_flush)), metrics_(metrics) {
    if (opts_.max_batch == 0) opts_.max_batch = 1;
    if (opts_.interval.count() <= 0) opts_.interval = std::chrono::microseconds(1000);
    buf_.reserve(opts_.max_batch);
  }

  void run(const Context& ctx) {
    using clock = std::chrono::steady_clock;
    auto next_tick = clock::now() + opts_.interval;
    while (!ctx.cancelled()) {
      T item;
      RecvStatus rs = src_.pop_until(item, next_tick);
      if (rs == RecvStatus::Closed) break;
      if (rs == RecvStatus::Item) {
        buf_.push_back(std::move(item));
        if (buf_.size() >= opts_.max_batch) flush();
        // keep the tick firing under sustained input
        if (clock::now() < next_tick) continue;
      }
      if (ctx.cancelled()) break;
      if (!buf_.empty()) flush();
      next_tick += opts_.interval;
      auto now = clock::now();
      if (next_tick <= now) next_tick = now + opts_.interval;
    }
    finish(ctx.cancelled());
  }

  uint64_t flushes() const { return flushes_; }
  uint64_t flushed_events() const { return flushed_events_; }
  size_t discarded() const { return discarded_; }

private:
  void flush() {
    auto t0 = std::chrono::steady_clock::now();
    size_t n = buf_.size();
    on_flush_(buf_);
    buf_.clear();
    ++flushes_;
    flushed_events_ += n;
    if (metrics_) {
      double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
      metrics_->observe_flush_ms(ms);
      metrics_->inc(opts_.flush_counter);
    }
  }

  // A closed channel without cancellation is end of input: flush what is left
  void finish(bool cancelled) {
    if (buf_.empty()) return;
    if (!cancelled || opts_.flush_on_cancel) {
      flush();
      return;
    }
    discarded_ = buf_.size();
    spdlog::debug("[Batch] {}: dropping {} buffered events on cancel", opts_.name, discarded_);
    buf_.clear();
  }

  Channel<T>& src_;
  Options opts_;
  FlushFn on_flush_;
  MetricsSink* metrics_;
  std::vector<T> buf_;
  uint64_t flushes_ = 0;
  uint64_t flushed_events_ = 0;
  size_t discarded_ = 0;
};

} // namespace mdv
