#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "events.hpp"
#include "features.hpp"
#include "feed.hpp"

namespace mdv {

struct Config {
  std::vector<std::string> symbols{"BTCUSDT", "ETHUSDT"};
  std::string data_dir = "./data";
  int duration_s = 10; // 0 = until SIGINT/SIGTERM
  int rate = 1000;
  int seed = 7;
  std::vector<Burst> bursts;
  int fault_every = 0;

  int vwap_size = 600;
  int vwap_window_s = 30;
  int tick_size = 50;

  int trade_batch = 20;
  int depth_batch = 10;
  int flush_us = 1000;
  bool flush_on_cancel = false;

  double z_entry = 2.0;
  std::string report = "./out/run";
  std::string log_level = "info";
  std::string log_file;
  bool sync = true;
  std::optional<int> affinity;

  // offline modes
  bool inspect = false;
  bool compact = false;
  std::string export_path;
  std::string symbol; // export filter
  int days = 0;       // export filter, 0 = all

  Status validate() const;
  FeatureParams feature_params() const;
};

// format t=10,dur=2,x=5
bool parse_burst(const std::string& s, Burst& b);

// "45", "45s", "5m", "1h" -> seconds; false on anything else
bool parse_duration_s(const std::string& s, int& out);

Status parse_args(int argc, char** argv, Config& cfg);

// Environment overrides applied over parsed flags; `lookup` defaults to getenv
using EnvLookup = std::function<const char*(const char*)>;
Status apply_env(Config& cfg, const EnvLookup& lookup = nullptr);

} // namespace mdv
