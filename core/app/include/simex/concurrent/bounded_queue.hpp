#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace simex {

// -----------------------------------------------------------------------------
// BoundedQueue<T>
// -----------------------------------------------------------------------------
//
// @brief  FIFO with a fixed capacity, blocking push/pop and a close() that
//         releases every waiter.
//
// @details
// Sits between the live stream's receive thread (producer) and the bar worker
// (consumer). The capacity is the backpressure: a producer that outruns the
// pipeline blocks in push() instead of growing memory without bound.
//
// After close():
//   - push() returns false immediately and does not enqueue.
//   - pop() keeps returning queued items until the queue is empty, then
//     returns std::nullopt instead of blocking.
//   - clear() may be used by a consumer that wants to discard the rest.
//
// Thread model:
//   Any number of producers and consumers. Every member function is
//   thread-safe.
// -----------------------------------------------------------------------------
template <typename T>
class BoundedQueue {
 public:
  explicit BoundedQueue(std::size_t capacity)
      : capacity_(capacity == 0 ? 1 : capacity) {}

  BoundedQueue(const BoundedQueue&) = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;
  BoundedQueue(BoundedQueue&&) = delete;
  BoundedQueue& operator=(BoundedQueue&&) = delete;

  // -------------------------------------------------------------------------
  // push(value)
  // -------------------------------------------------------------------------
  // @brief  Appends value, waiting while the queue is full.
  // @return false if the queue was closed before space became available.
  // -------------------------------------------------------------------------
  bool push(T value) {
    {
      std::unique_lock lock(mutex_);
      not_full_.wait(lock,
                     [this] { return closed_ || queue_.size() < capacity_; });
      if (closed_) {
        return false;
      }
      queue_.push_back(std::move(value));
    }
    not_empty_.notify_one();
    return true;
  }

  // -------------------------------------------------------------------------
  // try_push(value)
  // -------------------------------------------------------------------------
  // @brief  Appends value only if there is room right now.
  // @return false if full or closed; value is dropped in that case.
  // -------------------------------------------------------------------------
  bool try_push(T value) {
    {
      std::lock_guard lock(mutex_);
      if (closed_ || queue_.size() >= capacity_) {
        return false;
      }
      queue_.push_back(std::move(value));
    }
    not_empty_.notify_one();
    return true;
  }

  // -------------------------------------------------------------------------
  // pop()
  // -------------------------------------------------------------------------
  // @brief  Removes the front item, waiting while the queue is empty.
  // @return std::nullopt once the queue is closed and drained.
  // -------------------------------------------------------------------------
  std::optional<T> pop() {
    std::unique_lock lock(mutex_);
    not_empty_.wait(lock, [this] { return closed_ || !queue_.empty(); });
    return takeFront(lock);
  }

  // Like pop() but gives up after `timeout`.
  template <typename Rep, typename Period>
  std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock lock(mutex_);
    not_empty_.wait_for(lock, timeout,
                        [this] { return closed_ || !queue_.empty(); });
    return takeFront(lock);
  }

  std::optional<T> try_pop() {
    std::unique_lock lock(mutex_);
    return takeFront(lock);
  }

  // Closes the queue and wakes all blocked producers and consumers.
  // Idempotent.
  void close() {
    {
      std::lock_guard lock(mutex_);
      closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  // Discards everything still queued. Returns how many items were dropped.
  std::size_t clear() {
    std::size_t dropped = 0;
    {
      std::lock_guard lock(mutex_);
      dropped = queue_.size();
      queue_.clear();
    }
    not_full_.notify_all();
    return dropped;
  }

  bool closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
  }

  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

  std::size_t capacity() const { return capacity_; }

 private:
  // Caller holds the lock.
  std::optional<T> takeFront(std::unique_lock<std::mutex>& lock) {
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return value;
  }

  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<T> queue_;
  bool closed_{false};
};

}  // namespace simex
