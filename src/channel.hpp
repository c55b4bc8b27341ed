#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <utility>
#include <vector>

namespace mdv {

enum class RecvStatus { Item, Timeout, Closed };

// Bounded MPMC channel over a power-of-two ring. push() blocks while full
// (backpressure); close() wakes all waiters, after which pushes fail and
// pops drain what is left before reporting Closed.
template <typename T>
class Channel {
public:
  explicit Channel(size_t capacity)
      : capacity_(round_pow2(capacity)), mask_(capacity_ - 1), buf_(capacity_) {}

  Channel(const Channel&) = delete;
  Channel& operator=(const Channel&) = delete;

  // Blocks until there is room; false if the channel is closed
  bool push(T v) {
    std::unique_lock<std::mutex> lk(m_);
    not_full_.wait(lk, [&] { return closed_ || head_ - tail_ < capacity_; });
    if (closed_) return false;
    buf_[head_ & mask_] = std::move(v);
    ++head_;
    lk.unlock();
    not_empty_.notify_one();
    return true;
  }

  bool try_push(T v) {
    std::unique_lock<std::mutex> lk(m_);
    if (closed_ || head_ - tail_ >= capacity_) return false;
    buf_[head_ & mask_] = std::move(v);
    ++head_;
    lk.unlock();
    not_empty_.notify_one();
    return true;
  }

  // Waits for one element until `deadline`
  template <typename Clock, typename Dur>
  RecvStatus pop_until(T& out, std::chrono::time_point<Clock, Dur> deadline) {
    std::unique_lock<std::mutex> lk(m_);
    if (!not_empty_.wait_until(lk, deadline, [&] { return closed_ || head_ != tail_; }))
      return RecvStatus::Timeout;
    if (head_ == tail_) return RecvStatus::Closed;
    take(out);
    lk.unlock();
    not_full_.notify_one();
    return RecvStatus::Item;
  }

  template <typename Rep, typename Period>
  RecvStatus pop_for(T& out, std::chrono::duration<Rep, Period> d) {
    return pop_until(out, std::chrono::steady_clock::now() + d);
  }

  bool try_pop(T& out) {
    std::unique_lock<std::mutex> lk(m_);
    if (head_ == tail_) return false;
    take(out);
    lk.unlock();
    not_full_.notify_one();
    return true;
  }

  void close() {
    {
      std::lock_guard<std::mutex> lk(m_);
      closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lk(m_);
    return closed_;
  }

  size_t depth() const {
    std::lock_guard<std::mutex> lk(m_);
    return (size_t)(head_ - tail_);
  }

  size_t capacity() const { return capacity_; }

  size_t max_depth() const {
    std::lock_guard<std::mutex> lk(m_);
    return max_depth_;
  }

private:
  static size_t round_pow2(size_t n) {
    size_t c = 1;
    while (c < n) c <<= 1;
    return c;
  }

  // requires lock held and a non-empty ring
  void take(T& out) {
    // track depth on consumer side
    auto depth = (size_t)(head_ - tail_);
    if (depth > max_depth_) max_depth_ = depth;
    out = std::move(buf_[tail_ & mask_]);
    ++tail_;
  }

  size_t capacity_;
  size_t mask_;
  std::vector<T> buf_;
  uint64_t head_ = 0;
  uint64_t tail_ = 0;
  size_t max_depth_ = 0;
  bool closed_ = false;
  mutable std::mutex m_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
};

} // namespace mdv
