#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

namespace blr {

// Blocking FIFO channel with a fixed capacity. push() waits while the queue
// is full, pop() waits while it is empty. close() wakes both sides: pending
// and later pushes are refused, pops drain what is left and then report
// the end with std::nullopt.
template <class T>
class BoundedQueue {
public:
  explicit BoundedQueue(std::size_t capacity) : cap_(capacity) {
    if (cap_ == 0) throw std::invalid_argument("queue capacity must be >= 1");
  }

  BoundedQueue(const BoundedQueue&) = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;

  // False if the queue was closed before `v` could be stored.
  bool push(T v) {
    std::unique_lock<std::mutex> lk(mu_);
    not_full_.wait(lk, [this] { return closed_ || items_.size() < cap_; });
    if (closed_) return false;
    items_.push_back(std::move(v));
    if (items_.size() > high_water_) high_water_ = items_.size();
    lk.unlock();
    not_empty_.notify_one();
    return true;
  }

  std::optional<T> pop() {
    std::unique_lock<std::mutex> lk(mu_);
    not_empty_.wait(lk, [this] { return closed_ || !items_.empty(); });
    if (items_.empty()) return std::nullopt;
    T v = std::move(items_.front());
    items_.pop_front();
    lk.unlock();
    not_full_.notify_one();
    return v;
  }

  void close() {
    {
      std::lock_guard<std::mutex> lk(mu_);
      closed_ = true;
    }
    not_full_.notify_all();
    not_empty_.notify_all();
  }

  // Drop everything still queued; returns how many items were discarded.
  std::size_t clear() {
    std::size_t n;
    {
      std::lock_guard<std::mutex> lk(mu_);
      n = items_.size();
      items_.clear();
    }
    not_full_.notify_all();
    return n;
  }

  std::size_t capacity() const noexcept { return cap_; }

  std::size_t size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return items_.size();
  }

  // Largest number of items ever queued at once.
  std::size_t high_water() const {
    std::lock_guard<std::mutex> lk(mu_);
    return high_water_;
  }

private:
  const std::size_t cap_;
  mutable std::mutex mu_;
  std::condition_variable not_full_;
  std::condition_variable not_empty_;
  std::deque<T> items_;
  std::size_t high_water_{0};
  bool closed_{false};
};

}
