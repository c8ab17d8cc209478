#pragma once

#include "dirimg/cancellation.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

namespace dirimg::core {

// Multi-producer multi-consumer FIFO with a fixed capacity. Push blocks while
// the queue is full; Pop blocks while it is empty and still open.
template <typename T>
class BoundedQueue {
 public:
  explicit BoundedQueue(std::size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
      throw std::invalid_argument("bounded queue capacity must be positive");
    }
  }
  BoundedQueue(const BoundedQueue&) = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;

  // Returns false, without enqueueing, once `cancel` fires or the queue is closed.
  bool Push(T item, const CancellationToken& cancel) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (items_.size() >= capacity_) {
      if (closed_ || cancel.IsCancelled()) {
        return false;
      }
      // Cancellation does not notify the queue, so it is polled.
      not_full_.wait_for(lock, kCancelPollInterval);
    }
    if (closed_ || cancel.IsCancelled()) {
      return false;
    }
    items_.push_back(std::move(item));
    lock.unlock();
    not_empty_.notify_one();
    return true;
  }

  // Empty result means closed and fully drained.
  std::optional<T> Pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock, [this] { return !items_.empty() || closed_; });
    if (items_.empty()) {
      return std::nullopt;
    }
    T item = std::move(items_.front());
    items_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return item;
  }

  void Close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  [[nodiscard]] std::size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
  }

  [[nodiscard]] std::size_t capacity() const { return capacity_; }

 private:
  static constexpr std::chrono::milliseconds kCancelPollInterval{5};

  const std::size_t capacity_;
  mutable std::mutex mutex_{};
  std::condition_variable not_empty_{};
  std::condition_variable not_full_{};
  std::deque<T> items_{};
  bool closed_ = false;
};

// Closes the queue when the producing scope exits, however it exits.
template <typename T>
class QueueCloser {
 public:
  explicit QueueCloser(BoundedQueue<T>& queue) : queue_(queue) {}
  QueueCloser(const QueueCloser&) = delete;
  QueueCloser& operator=(const QueueCloser&) = delete;
  ~QueueCloser() { queue_.Close(); }

 private:
  BoundedQueue<T>& queue_;
};

}  // namespace dirimg::core
