#include "shutdown.hpp"

#include <signal.h>
#include <ctime>
#include <exception>

#include <pthread.h>
#include <spdlog/spdlog.h>

namespace mdv {

ShutdownCoordinator::ShutdownCoordinator(MetricsSink* metrics, std::chrono::milliseconds destroy_drain)
  : state_(std::make_shared<State>()), destroy_drain_(destroy_drain) {
  state_->metrics = metrics;
}

ShutdownCoordinator::~ShutdownCoordinator() {
  stop("coordinator destroyed");
  if (!drained_) drain(destroy_drain_);
  if (drained_) return;

  std::vector<std::thread> threads;
  {
    std::lock_guard<std::mutex> lk(state_->m);
    state_->metrics = nullptr;
    threads.swap(threads_);
  }
  // stragglers keep the state alive until they finish
  spdlog::warn("[Shutdown] abandoning {} task(s) still running", threads.size());
  for (auto& t : threads)
    if (t.joinable()) t.detach();
}

void ShutdownCoordinator::spawn(const std::string& name, std::function<void(const Context&)> fn) {
  std::lock_guard<std::mutex> lk(state_->m);
  ++state_->running;
  threads_.emplace_back([s = state_, name, fn = std::move(fn)] {
    spdlog::debug("[Shutdown] task {} started", name);
    try {
      fn(s->ctx);
    } catch (const std::exception& e) {
      spdlog::error("[Shutdown] task {} failed: {}", name, e.what());
      std::lock_guard<std::mutex> g(s->m);
      if (s->metrics) s->metrics->inc(Counter::TaskFailures);
      ++s->failures;
    }
    spdlog::debug("[Shutdown] task {} finished", name);
    {
      std::lock_guard<std::mutex> g(s->m);
      --s->running;
    }
    s->done_cv.notify_all();
  });
}

void ShutdownCoordinator::on_stop(std::function<void()> hook) {
  std::lock_guard<std::mutex> lk(state_->m);
  state_->hooks.push_back(std::move(hook));
}

void ShutdownCoordinator::stop(const std::string& reason) {
  stop_state(*state_, reason);
}

void ShutdownCoordinator::stop_state(State& s, const std::string& reason) {
  std::vector<std::function<void()>> hooks;
  {
    std::lock_guard<std::mutex> lk(s.m);
    if (s.stopped) return;
    s.stopped = true;
    hooks.swap(s.hooks);
  }
  spdlog::info("[Shutdown] stopping: {}", reason);
  s.ctx.cancel();
  for (auto& h : hooks) h();
}

bool ShutdownCoordinator::block_signals() {
  sigset_t set;
  sigemptyset(&set);
  sigaddset(&set, SIGINT);
  sigaddset(&set, SIGTERM);
  int rc = pthread_sigmask(SIG_BLOCK, &set, nullptr);
  if (rc != 0) spdlog::warn("[Shutdown] pthread_sigmask failed: {}", rc);
  return rc == 0;
}

void ShutdownCoordinator::watch_signals() {
  spawn("signals", [s = state_](const Context& ctx) {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    timespec tick{0, 200 * 1000 * 1000};
    while (!ctx.cancelled()) {
      int sig = sigtimedwait(&set, nullptr, &tick);
      if (sig == SIGINT || sig == SIGTERM) {
        stop_state(*s, sig == SIGINT ? "SIGINT" : "SIGTERM");
        return;
      }
    }
  });
}

bool ShutdownCoordinator::drain(std::chrono::milliseconds timeout) {
  State& s = *state_;
  std::unique_lock<std::mutex> lk(s.m);
  if (!s.done_cv.wait_for(lk, timeout, [&s] { return s.running == 0; })) {
    spdlog::warn("[Shutdown] {} task(s) still running after {} ms", s.running, timeout.count());
    return false;
  }
  drained_ = true;
  std::vector<std::thread> threads;
  threads.swap(threads_);
  lk.unlock();
  for (auto& t : threads) t.join();
  return true;
}

size_t ShutdownCoordinator::running() const {
  std::lock_guard<std::mutex> lk(state_->m);
  return state_->running;
}

size_t ShutdownCoordinator::failures() const {
  std::lock_guard<std::mutex> lk(state_->m);
  return state_->failures;
}

} // namespace mdv
