#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <string>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>

#include "batcher.hpp"
#include "channel.hpp"
#include "codec.hpp"
#include "config.hpp"
#include "decision.hpp"
#include "features.hpp"
#include "feed.hpp"
#include "logging.hpp"
#include "metrics.hpp"
#include "pipeline.hpp"
#include "shutdown.hpp"
#include "sink.hpp"
#include "store.hpp"
#include "util.hpp"

using namespace std::chrono;

namespace mdv {

static constexpr size_t kEventChannelCap = 64;
static constexpr size_t kErrorChannelCap = 32;
static constexpr auto kDrainTimeout = seconds(10);

static std::string ts_str(int64_t ns) {
  if (ns == std::numeric_limits<int64_t>::max() || ns == std::numeric_limits<int64_t>::min()) return "-";
  return std::to_string(ns);
}

static int run_inspect(const Config& cfg) {
  Store::Options so; so.read_only = true;
  Status st;
  auto store = Store::open(cfg.data_dir, so, st);
  if (!store) {
    spdlog::error("[Store] cannot open {}: {}", cfg.data_dir, st.message);
    return 1;
  }
  std::cout << "database: " << store->path() << "\n";
  std::cout << "size_bytes: " << store->db().file_size() << "\n";
  for (auto& kv : store->bucket_counts()) std::cout << kv.first << ": " << kv.second << "\n";
  return 0;
}

static int run_export(const Config& cfg) {
  Store::Options so; so.read_only = true;
  Status st;
  auto store = Store::open(cfg.data_dir, so, st);
  if (!store) {
    spdlog::error("[Store] cannot open {}: {}", cfg.data_dir, st.message);
    return 1;
  }
  std::ofstream out(cfg.export_path, std::ios::trunc);
  if (!out.is_open()) {
    spdlog::error("[Export] cannot open {}", cfg.export_path);
    return 1;
  }

  int64_t cutoff = std::numeric_limits<int64_t>::min();
  if (cfg.days > 0) cutoff = wall_ns() - int64_t(cfg.days) * 86400LL * kNsPerSec;

  uint64_t exported = 0, skipped = 0;
  int64_t first = std::numeric_limits<int64_t>::max(), last = std::numeric_limits<int64_t>::min();
  std::string line;
  st = store->for_each_feature([&](const FeatureRecord& f) {
    if (!cfg.symbol.empty() && f.symbol != cfg.symbol) return;
    if (f.ts_ns < cutoff) return;
    // non-finite fields do not encode
    if (!encode(f, line)) { ++skipped; return; }
    out << line << "\n";
    ++exported;
    first = std::min(first, f.ts_ns);
    last = std::max(last, f.ts_ns);
  });
  if (!st) {
    spdlog::error("[Export] scan failed: {}", st.message);
    return 1;
  }
  out.flush();
  if (!out) {
    spdlog::error("[Export] write to {} failed", cfg.export_path);
    return 1;
  }
  spdlog::info("[Export] wrote {} feature records to {} (skipped {} invalid, {} malformed), ts range [{}, {}]",
               exported, cfg.export_path, skipped, store->malformed_skipped(), ts_str(first), ts_str(last));
  return 0;
}

static int run_compact(const Config& cfg) {
  Store::Options so; so.sync = cfg.sync;
  Status st;
  auto store = Store::open(cfg.data_dir, so, st);
  if (!store) {
    spdlog::error("[Store] cannot open {}: {}", cfg.data_dir, st.message);
    return 1;
  }
  uint64_t before = store->db().file_size();
  st = store->compact();
  if (!st) {
    spdlog::error("[Store] compaction failed: {}", st.message);
    return 1;
  }
  spdlog::info("[Store] compacted {}: {} -> {} bytes", store->path(), before, store->db().file_size());
  st = store->close();
  if (!st) {
    spdlog::error("[Store] close failed: {}", st.message);
    return 1;
  }
  return 0;
}

static void write_report(const Config& cfg, const Metrics& m, const RunInfo& info) {
  namespace fs = std::filesystem;
  std::ofstream f_json((fs::path(cfg.report)/"metrics.json").string());
  f_json << m.to_json(info) << std::endl;
  std::ofstream f_lat((fs::path(cfg.report)/"latency.csv").string());
  f_lat << m.flush_latency().csv_samples_header() << "\n" << m.flush_latency().csv_samples();
  std::ofstream f_fp((fs::path(cfg.report)/"run_fingerprint.txt").string());
  f_fp << "seed=" << cfg.seed << "\ncode_hash=" << info.code_hash << "\nsymbols=";
  for (size_t i=0;i<cfg.symbols.size();++i) f_fp << (i ? "," : "") << cfg.symbols[i];
  f_fp << "\nrate=" << cfg.rate << "\npersistence=" << (info.persistence ? "on" : "off") << "\n";
  if (!f_json || !f_lat || !f_fp) spdlog::warn("[Report] could not write all artifacts to {}", cfg.report);
}

static int run_pipeline(const Config& cfg) {
  namespace fs = std::filesystem;
  std::error_code ec;
  fs::create_directories(cfg.report, ec);
  if (ec) spdlog::warn("[Report] cannot create {}: {}", cfg.report, ec.message());

  ShutdownCoordinator::block_signals();
  if (cfg.affinity) pin_to_cpu(*cfg.affinity);

  Metrics m;

  // persistence is optional: a store that fails to open disables it
  Store::Options so; so.sync = cfg.sync;
  Status st;
  std::unique_ptr<Store> store = Store::open(cfg.data_dir, so, st);
  NullSink null_sink;
  EventSink* sink = &null_sink;
  if (store) sink = store.get();
  else spdlog::warn("[Store] persistence disabled: {}", st.message);

  FeatureState state(cfg.symbols, cfg.feature_params());
  ThresholdDecider decider(cfg.z_entry, 1.0, (fs::path(cfg.report)/"decisions.csv").string());
  Pipeline pipe(state, *sink, decider, m);

  Channel<Trade> trades(kEventChannelCap);
  Channel<Depth> depths(kEventChannelCap);
  Channel<std::string> errors(kErrorChannelCap);

  BatchAccumulator<Trade>::Options to;
  to.name = "trades";
  to.max_batch = size_t(cfg.trade_batch);
  to.interval = microseconds(cfg.flush_us);
  to.flush_on_cancel = cfg.flush_on_cancel;
  to.flush_counter = Counter::TradeBatches;
  BatchAccumulator<Trade> trade_batches(trades, to, [&](std::vector<Trade>& b) { pipe.process_trades(b); }, &m);

  BatchAccumulator<Depth>::Options dopt;
  dopt.name = "depths";
  dopt.max_batch = size_t(cfg.depth_batch);
  dopt.interval = microseconds(cfg.flush_us);
  dopt.flush_on_cancel = cfg.flush_on_cancel;
  dopt.flush_counter = Counter::DepthBatches;
  BatchAccumulator<Depth> depth_batches(depths, dopt, [&](std::vector<Depth>& b) { pipe.process_depths(b); }, &m);

  SimFeedOptions fo;
  fo.rate = cfg.rate;
  fo.seed = uint64_t(cfg.seed);
  fo.bursts = cfg.bursts;
  fo.fault_every = cfg.fault_every;
  SimFeed feed(fo);

  spdlog::info("[Pipeline] starting: symbols={} persistence={} duration_s={} code_hash={}",
               cfg.symbols.size(), sink->enabled() ? "on" : "off", cfg.duration_s, code_hash());
  auto start_tp = steady_clock::now();

  // declared last: its destructor joins tasks that reference everything above
  ShutdownCoordinator coord(&m);
  coord.on_stop([&] {
    trades.close();
    depths.close();
    errors.close();
  });
  coord.watch_signals();
  coord.spawn("trades", [&](const Context& ctx) { trade_batches.run(ctx); });
  coord.spawn("depths", [&](const Context& ctx) { depth_batches.run(ctx); });
  coord.spawn("errors", [&](const Context&) {
    std::string msg;
    // runs until the channel is closed and drained
    while (errors.pop_for(msg, milliseconds(100)) != RecvStatus::Closed) {
      if (msg.empty()) continue;
      spdlog::warn("[Feed] stream error: {}", msg);
      m.inc(Counter::WsReconnects);
      m.inc(Counter::ErrorsTotal);
      msg.clear();
    }
  });
  coord.spawn("feed", [&](const Context& ctx) { feed.stream(ctx, cfg.symbols, trades, depths, errors); });

  const Context& ctx = coord.context();
  if (cfg.duration_s > 0) {
    if (!ctx.wait_for(seconds(cfg.duration_s))) coord.stop("duration elapsed");
  } else {
    while (!ctx.wait_for(seconds(1))) {}
  }

  if (!coord.drain(kDrainTimeout)) {
    spdlog::warn("[Shutdown] drain timed out after {}s, forcing exit", kDrainTimeout.count());
    spdlog::default_logger()->flush();
    std::_Exit(1);
  }
  double elapsed_s = duration<double>(steady_clock::now() - start_tp).count();

  m.trade_queue_max = trades.max_depth();
  m.depth_queue_max = depths.max_depth();
  RunInfo info;
  info.code_hash = code_hash();
  info.symbols = cfg.symbols;
  info.seed = cfg.seed;
  info.rate = cfg.rate;
  info.persistence = sink->enabled();
  info.elapsed_s = elapsed_s;
  write_report(cfg, m, info);

  spdlog::info("[Pipeline] done in {:.2f}s: trades={} depths={} vwap_calcs={} decisions={} entries={} "
               "store_errors={} dropped_on_cancel={}",
               elapsed_s, m.get(Counter::TradesReceived), m.get(Counter::DepthsReceived),
               m.get(Counter::VwapCalculations), m.get(Counter::DecisionsDispatched), decider.entries(),
               m.get(Counter::StoreErrors), trade_batches.discarded() + depth_batches.discarded());

  if (store) {
    st = store->close();
    if (!st) {
      spdlog::error("[Store] close failed: {}", st.message);
      return 1;
    }
  }
  return coord.failures() ? 1 : 0;
}

} // namespace mdv

int main(int argc, char** argv) {
  using namespace mdv;
  Config cfg;
  Status st = parse_args(argc, argv, cfg);
  if (st) st = apply_env(cfg);
  if (st) st = cfg.validate();
  if (!st) {
    std::fprintf(stderr, "mdvault: %s\n", st.message.c_str());
    return 2;
  }
  st = init_logging(cfg.log_level, cfg.log_file);
  if (!st) spdlog::warn("[Config] {}", st.message);

  if (cfg.inspect) return run_inspect(cfg);
  if (!cfg.export_path.empty()) return run_export(cfg);
  if (cfg.compact) return run_compact(cfg);
  return run_pipeline(cfg);
}
