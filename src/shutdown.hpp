#pragma once
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "context.hpp"
#include "metrics.hpp"

namespace mdv {

// Owns the run's tasks and their shared Context. stop() cancels the context
// and runs the stop hooks (closing channels) once; drain() waits for every
// spawned task with a deadline.
//
// Tasks share ownership of the coordinator's state, so a task still running
// when the destructor gives up on it is detached without dangling.
class ShutdownCoordinator {
public:
  explicit ShutdownCoordinator(MetricsSink* metrics = nullptr,
                               std::chrono::milliseconds destroy_drain = std::chrono::seconds(10));
  ~ShutdownCoordinator();

  ShutdownCoordinator(const ShutdownCoordinator&) = delete;
  ShutdownCoordinator& operator=(const ShutdownCoordinator&) = delete;

  const Context& context() const { return state_->ctx; }

  // Runs fn on its own thread. An exception ends the task; it is logged and
  // counted as TaskFailures.
  void spawn(const std::string& name, std::function<void(const Context&)> fn);

  // Called from stop(), in registration order
  void on_stop(std::function<void()> hook);

  // Idempotent
  void stop(const std::string& reason);
  bool stopping() const { return state_->ctx.cancelled(); }

  // Blocks SIGINT/SIGTERM in the calling thread. Call before spawning so
  // every task inherits the mask and only the watcher receives them.
  static bool block_signals();
  // Task that turns SIGINT/SIGTERM into stop()
  void watch_signals();

  // True when all tasks ended within `timeout`; they are joined then
  bool drain(std::chrono::milliseconds timeout);

  size_t running() const;
  size_t failures() const;

private:
  struct State {
    Context ctx;
    MetricsSink* metrics = nullptr; // cleared when tasks are abandoned
    std::vector<std::function<void()>> hooks;
    std::mutex m;
    std::condition_variable done_cv;
    size_t running = 0;
    size_t failures = 0;
    bool stopped = false;
  };

  static void stop_state(State& s, const std::string& reason);

  std::shared_ptr<State> state_;
  std::chrono::milliseconds destroy_drain_;
  std::vector<std::thread> threads_; // guarded by state_->m
  bool drained_ = false;
};

} // namespace mdv
