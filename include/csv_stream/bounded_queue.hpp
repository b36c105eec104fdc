#pragma once
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>

namespace cs {

// Thread-safe bounded FIFO with close support.
template <typename T>
class BoundedQueue {
public:
  explicit BoundedQueue(std::size_t capacity) : capacity_(capacity ? capacity : 1) {}

  BoundedQueue(const BoundedQueue&) = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;

  // Blocks while full. False once closed.
  bool push(T item) {
    std::unique_lock<std::mutex> lk(mu_);
    cv_full_.wait(lk, [&] { return q_.size() < capacity_ || closed_; });
    if (closed_) return false;
    q_.push(std::move(item));
    cv_empty_.notify_one();
    return true;
  }

  // Non-blocking push; false when full or closed.
  bool try_push(T item) {
    std::lock_guard<std::mutex> lk(mu_);
    if (closed_ || q_.size() >= capacity_) return false;
    q_.push(std::move(item));
    cv_empty_.notify_one();
    return true;
  }

  // Blocks while empty. False once closed and drained.
  bool pop(T& out) {
    std::unique_lock<std::mutex> lk(mu_);
    cv_empty_.wait(lk, [&] { return !q_.empty() || closed_; });
    if (q_.empty()) return false;
    out = std::move(q_.front());
    q_.pop();
    cv_full_.notify_one();
    return true;
  }

  void close() {
    std::lock_guard<std::mutex> lk(mu_);
    closed_ = true;
    cv_empty_.notify_all();
    cv_full_.notify_all();
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return q_.size();
  }

private:
  std::size_t capacity_;
  std::queue<T> q_;
  mutable std::mutex mu_;
  std::condition_variable cv_empty_;
  std::condition_variable cv_full_;
  bool closed_ = false;
};

}
