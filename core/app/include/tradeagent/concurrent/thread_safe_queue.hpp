#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace tradeagent {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
//
// @brief  Unbounded multi-producer / multi-consumer FIFO with close().
//
// @details
// Used at every thread hand-off in the engine: the WorkerPool task queue,
// the IPC telemetry queue and the paper exchange's work queue.
//
// close() is the shutdown handshake. After close():
//   - push() refuses new items and returns false.
//   - pop() keeps returning queued items until the queue is empty, then
//     returns std::nullopt instead of blocking. Consumers therefore drain
//     everything that was accepted before close() and then exit.
//
// Thread model:
//   All methods are safe from any thread. pop() blocks the caller until an
//   item is available or the queue is closed.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // Returns false (and drops value) once the queue is closed.
  bool push(T value) {
    {
      std::lock_guard lock(mutex_);
      if (closed_) {
        return false;
      }
      queue_.push_back(std::move(value));
    }
    condition_.notify_one();
    return true;
  }

  // Blocks until an item is available. Returns std::nullopt only when the
  // queue is closed and fully drained.
  std::optional<T> pop() {
    std::unique_lock lock(mutex_);
    condition_.wait(lock, [this] { return closed_ || !queue_.empty(); });
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // Idempotent. Wakes every blocked consumer.
  void close() {
    {
      std::lock_guard lock(mutex_);
      closed_ = true;
    }
    condition_.notify_all();
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

 private:
  mutable std::mutex mutex_;
  std::condition_variable condition_;
  std::deque<T> queue_;
  bool closed_{false};
};

}  // namespace tradeagent
