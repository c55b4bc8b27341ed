#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace mdv {

// Shared cancellation signal. cancel() is idempotent and wakes every wait_for().
class Context {
public:
  void cancel() {
    {
      std::lock_guard<std::mutex> lk(m_);
      cancelled_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
  }

  bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

  // Sleeps up to d; returns true if cancelled (before or during the wait)
  template <typename Rep, typename Period>
  bool wait_for(std::chrono::duration<Rep, Period> d) const {
    std::unique_lock<std::mutex> lk(m_);
    return cv_.wait_for(lk, d, [this] { return cancelled_.load(std::memory_order_acquire); });
  }

private:
  std::atomic<bool> cancelled_{false};
  mutable std::mutex m_;
  mutable std::condition_variable cv_;
};

} // namespace mdv
