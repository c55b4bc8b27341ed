#include "config.hpp"
#include "logging.hpp"
#include "util.hpp"

#include <cstdio>
#include <cstdlib>
#include <stdexcept>

namespace mdv {

bool parse_burst(const std::string& s, Burst& b) {
  double t=0, dur=0, x=1;
  if (sscanf(s.c_str(), "t=%lf,dur=%lf,x=%lf", &t, &dur, &x) == 3) { b.t_s=t; b.dur_s=dur; b.x=x; return true; }
  return false;
}

bool parse_duration_s(const std::string& s, int& out) {
  if (s.empty()) return false;
  size_t pos = 0;
  long v = 0;
  try {
    v = std::stol(s, &pos);
  } catch (const std::logic_error&) {
    return false;
  }
  std::string unit = s.substr(pos);
  long mult = 0;
  if (unit.empty() || unit == "s") mult = 1;
  else if (unit == "m") mult = 60;
  else if (unit == "h") mult = 3600;
  else return false;
  if (v < 0 || v > 100000000L / mult) return false;
  out = int(v * mult);
  return true;
}

Status parse_args(int argc, char** argv, Config& a) {
  std::string arg;
  try {
    for (int i=1;i<argc;++i) {
      arg = argv[i];
      auto next = [&]{ return (i+1<argc)? std::string(argv[++i]) : std::string(); };
      if (arg == "--symbols") a.symbols = split_csv(next());
      else if (arg == "--data-dir") a.data_dir = next();
      else if (arg == "--duration-s") a.duration_s = std::stoi(next());
      else if (arg == "--rate") a.rate = std::stoi(next());
      else if (arg == "--seed") a.seed = std::stoi(next());
      else if (arg == "--burst") {
        Burst b;
        if (!parse_burst(next(), b)) return Status::error("bad --burst, expected t=..,dur=..,x=..");
        a.bursts.push_back(b);
      }
      else if (arg == "--fault-every") a.fault_every = std::stoi(next());
      else if (arg == "--vwap-size") a.vwap_size = std::stoi(next());
      else if (arg == "--vwap-window-s") {
        if (!parse_duration_s(next(), a.vwap_window_s)) return Status::error("bad --vwap-window-s");
      }
      else if (arg == "--tick-size") a.tick_size = std::stoi(next());
      else if (arg == "--trade-batch") a.trade_batch = std::stoi(next());
      else if (arg == "--depth-batch") a.depth_batch = std::stoi(next());
      else if (arg == "--flush-us") a.flush_us = std::stoi(next());
      else if (arg == "--flush-on-cancel") a.flush_on_cancel = true;
      else if (arg == "--z-entry") a.z_entry = std::stod(next());
      else if (arg == "--report") a.report = next();
      else if (arg == "--log-level") a.log_level = next();
      else if (arg == "--log-file") a.log_file = next();
      else if (arg == "--no-sync") a.sync = false;
      else if (arg == "--affinity") { int c = std::stoi(next()); a.affinity = c; }
      else if (arg == "--inspect") a.inspect = true;
      else if (arg == "--compact") a.compact = true;
      else if (arg == "--export-features") a.export_path = next();
      else if (arg == "--symbol") a.symbol = next();
      else if (arg == "--days") a.days = std::stoi(next());
      else return Status::error("unknown flag " + arg);
    }
  } catch (const std::logic_error&) {
    // std::stoi / std::stod: missing, non-numeric or out-of-range value
    return Status::error("bad value for " + arg);
  }
  return Status::success();
}

static bool env_int(const char* v, int& out) {
  try {
    size_t pos = 0;
    int x = std::stoi(v, &pos);
    if (v[pos] != '\0') return false;
    out = x;
    return true;
  } catch (const std::logic_error&) {
    return false;
  }
}

Status apply_env(Config& cfg, const EnvLookup& lookup) {
  auto get = [&](const char* name) -> const char* {
    const char* v = lookup ? lookup(name) : std::getenv(name);
    return (v && *v) ? v : nullptr;
  };
  if (auto v = get("DATA_PATH")) cfg.data_dir = v;
  if (auto v = get("SYMBOLS")) cfg.symbols = split_csv(v);
  if (auto v = get("VWAP_SIZE")) {
    if (!env_int(v, cfg.vwap_size)) return Status::error(std::string("bad VWAP_SIZE=") + v);
  }
  if (auto v = get("TICK_SIZE")) {
    if (!env_int(v, cfg.tick_size)) return Status::error(std::string("bad TICK_SIZE=") + v);
  }
  if (auto v = get("VWAP_WINDOW")) {
    if (!parse_duration_s(v, cfg.vwap_window_s)) return Status::error(std::string("bad VWAP_WINDOW=") + v);
  }
  if (auto v = get("LOG_LEVEL")) cfg.log_level = v;
  return Status::success();
}

Status Config::validate() const {
  if (symbols.empty()) return Status::error("at least one symbol is required");
  if (vwap_size < 10 || vwap_size > 10000) return Status::error("vwap size must be between 10 and 10000");
  if (vwap_window_s < 1 || vwap_window_s > 3600) return Status::error("vwap window must be between 1s and 1h");
  if (tick_size < 1) return Status::error("tick size must be at least 1");
  if (trade_batch < 1 || depth_batch < 1) return Status::error("batch sizes must be at least 1");
  if (flush_us <= 0) return Status::error("flush interval must be positive");
  if (rate < 1) return Status::error("rate must be at least 1");
  if (duration_s < 0) return Status::error("duration must not be negative");
  if (days < 0) return Status::error("days must not be negative");
  if (fault_every < 0) return Status::error("fault interval must not be negative");
  if (!(z_entry > 0)) return Status::error("z entry must be positive");
  if (data_dir.empty()) return Status::error("data dir must not be empty");
  if (!valid_log_level(log_level)) return Status::error("unknown log level " + log_level);
  return Status::success();
}

FeatureParams Config::feature_params() const {
  FeatureParams p;
  p.vwap_window_ns = int64_t(vwap_window_s) * kNsPerSec;
  p.vwap_size = size_t(vwap_size);
  p.tick_size = size_t(tick_size);
  return p;
}

} // namespace mdv
