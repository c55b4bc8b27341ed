#include <catch2/catch.hpp>
#include "config.hpp"
#include "util.hpp"
#include <map>
#include <string>
#include <vector>

using namespace mdv;

namespace {

// argv-style view over a list of strings
struct Argv {
  std::vector<std::string> args;
  std::vector<char*> ptrs;
  explicit Argv(std::vector<std::string> a) : args(std::move(a)) {
    args.insert(args.begin(), "mdvault");
    for (auto& s : args) ptrs.push_back(&s[0]);
  }
  int argc() { return (int)ptrs.size(); }
  char** argv() { return ptrs.data(); }
};

Status parse(std::vector<std::string> args, Config& cfg) {
  Argv a(std::move(args));
  return parse_args(a.argc(), a.argv(), cfg);
}

EnvLookup env_of(const std::map<std::string, std::string>& vars) {
  return [vars](const char* name) -> const char* {
    auto it = vars.find(name);
    return it == vars.end() ? nullptr : it->second.c_str();
  };
}

} // namespace

TEST_CASE("Defaults are valid", "[config]") {
  Config cfg;
  REQUIRE(cfg.validate().ok);
  auto p = cfg.feature_params();
  REQUIRE(p.vwap_window_ns == 30 * kNsPerSec);
  REQUIRE(p.vwap_size == 600);
  REQUIRE(p.tick_size == 50);
}

TEST_CASE("Flags parse into the config", "[config]") {
  Config cfg;
  REQUIRE(parse({"--symbols", "BTCUSDT, SOLUSDT,", "--data-dir", "/tmp/x", "--duration-s", "3", "--rate", "500",
                 "--burst", "t=1,dur=2,x=4", "--vwap-size", "100", "--vwap-window-s", "5m", "--tick-size", "20",
                 "--trade-batch", "8", "--depth-batch", "4", "--flush-us", "250", "--flush-on-cancel", "--no-sync",
                 "--z-entry", "1.5", "--log-level", "debug", "--affinity", "2"}, cfg).ok);
  REQUIRE(cfg.symbols == std::vector<std::string>{"BTCUSDT", "SOLUSDT"});
  REQUIRE(cfg.data_dir == "/tmp/x");
  REQUIRE(cfg.duration_s == 3);
  REQUIRE(cfg.rate == 500);
  REQUIRE(cfg.bursts.size() == 1);
  REQUIRE(cfg.bursts[0].x == 4);
  REQUIRE(cfg.vwap_size == 100);
  REQUIRE(cfg.vwap_window_s == 300);
  REQUIRE(cfg.tick_size == 20);
  REQUIRE(cfg.trade_batch == 8);
  REQUIRE(cfg.depth_batch == 4);
  REQUIRE(cfg.flush_us == 250);
  REQUIRE(cfg.flush_on_cancel);
  REQUIRE_FALSE(cfg.sync);
  REQUIRE(cfg.z_entry == 1.5);
  REQUIRE(cfg.log_level == "debug");
  REQUIRE(cfg.affinity.value_or(-1) == 2);
  REQUIRE(cfg.validate().ok);
}

TEST_CASE("Offline mode flags", "[config]") {
  Config cfg;
  REQUIRE(parse({"--export-features", "out.ndjson", "--symbol", "BTCUSDT", "--days", "7"}, cfg).ok);
  REQUIRE(cfg.export_path == "out.ndjson");
  REQUIRE(cfg.symbol == "BTCUSDT");
  REQUIRE(cfg.days == 7);
  REQUIRE(parse({"--inspect", "--compact"}, cfg).ok);
  REQUIRE(cfg.inspect);
  REQUIRE(cfg.compact);
}

TEST_CASE("Bad flags are reported", "[config]") {
  Config cfg;
  REQUIRE_FALSE(parse({"--bogus"}, cfg).ok);
  REQUIRE_FALSE(parse({"--rate", "fast"}, cfg).ok);
  REQUIRE_FALSE(parse({"--rate"}, cfg).ok);
  REQUIRE_FALSE(parse({"--burst", "t=1"}, cfg).ok);
  REQUIRE_FALSE(parse({"--vwap-window-s", "10d"}, cfg).ok);
  Status st = parse({"--seed", "99999999999999999999"}, cfg);
  REQUIRE_FALSE(st.ok);
  REQUIRE(st.message.find("--seed") != std::string::npos);
}

TEST_CASE("Durations accept seconds, minutes and hours", "[config]") {
  int s = 0;
  REQUIRE(parse_duration_s("45", s)); REQUIRE(s == 45);
  REQUIRE(parse_duration_s("30s", s)); REQUIRE(s == 30);
  REQUIRE(parse_duration_s("2m", s)); REQUIRE(s == 120);
  REQUIRE(parse_duration_s("1h", s)); REQUIRE(s == 3600);
  REQUIRE_FALSE(parse_duration_s("", s));
  REQUIRE_FALSE(parse_duration_s("m", s));
  REQUIRE_FALSE(parse_duration_s("-5s", s));
  REQUIRE_FALSE(parse_duration_s("5ms", s));
}

TEST_CASE("Environment overrides flags", "[config]") {
  Config cfg;
  REQUIRE(parse({"--symbols", "BTCUSDT", "--data-dir", "/flag"}, cfg).ok);
  REQUIRE(apply_env(cfg, env_of({{"DATA_PATH", "/env"}, {"SYMBOLS", "ETHUSDT,SOLUSDT"}, {"VWAP_SIZE", "50"},
                                 {"TICK_SIZE", "5"}, {"VWAP_WINDOW", "10s"}, {"LOG_LEVEL", "warn"}})).ok);
  REQUIRE(cfg.data_dir == "/env");
  REQUIRE(cfg.symbols == std::vector<std::string>{"ETHUSDT", "SOLUSDT"});
  REQUIRE(cfg.vwap_size == 50);
  REQUIRE(cfg.tick_size == 5);
  REQUIRE(cfg.vwap_window_s == 10);
  REQUIRE(cfg.log_level == "warn");

  Config untouched;
  REQUIRE(apply_env(untouched, env_of({{"DATA_PATH", ""}})).ok);
  REQUIRE(untouched.data_dir == "./data");

  REQUIRE_FALSE(apply_env(untouched, env_of({{"VWAP_SIZE", "12abc"}})).ok);
  REQUIRE_FALSE(apply_env(untouched, env_of({{"VWAP_WINDOW", "forever"}})).ok);
}

TEST_CASE("Validation enforces the documented ranges", "[config]") {
  auto check = [](auto mutate) {
    Config cfg;
    mutate(cfg);
    return cfg.validate().ok;
  };
  REQUIRE_FALSE(check([](Config& c) { c.symbols.clear(); }));
  REQUIRE_FALSE(check([](Config& c) { c.vwap_size = 9; }));
  REQUIRE_FALSE(check([](Config& c) { c.vwap_size = 10001; }));
  REQUIRE(check([](Config& c) { c.vwap_size = 10; }));
  REQUIRE(check([](Config& c) { c.vwap_size = 10000; }));
  REQUIRE_FALSE(check([](Config& c) { c.vwap_window_s = 0; }));
  REQUIRE_FALSE(check([](Config& c) { c.vwap_window_s = 3601; }));
  REQUIRE(check([](Config& c) { c.vwap_window_s = 3600; }));
  REQUIRE_FALSE(check([](Config& c) { c.tick_size = 0; }));
  REQUIRE_FALSE(check([](Config& c) { c.trade_batch = 0; }));
  REQUIRE_FALSE(check([](Config& c) { c.depth_batch = 0; }));
  REQUIRE_FALSE(check([](Config& c) { c.flush_us = 0; }));
  REQUIRE_FALSE(check([](Config& c) { c.log_level = "verbose"; }));
}
