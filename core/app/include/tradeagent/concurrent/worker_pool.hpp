#pragma once

#include "tradeagent/concurrent/thread_safe_queue.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <string>
#include <thread>
#include <vector>

namespace tradeagent {

// -----------------------------------------------------------------------------
// WorkerPool: fixed set of threads draining one task queue
// -----------------------------------------------------------------------------
//
// @brief  Bounded concurrency for evaluation cycles, fills and exchange work.
//
// @details
// The pool owns N threads that pop std::function<void()> tasks from a shared
// ThreadSafeQueue. The pool itself gives no ordering guarantee between tasks;
// per-instrument ordering is layered on top by InstrumentLanes.
//
// stop() closes the queue and joins. Tasks accepted before stop() still run
// (the queue drains before pop() reports closed), tasks submitted afterwards
// are refused. A task that throws std::exception is logged under the pool's
// name and the worker keeps going.
//
// Thread model:
//   start() and stop() are idempotent and may be called from any thread
//   except a pool worker (stop() joins). submit() is safe from any thread,
//   including from inside a running task.
//
// Ownership:
//   Not copyable or movable. A pool is single-use: once stopped it cannot be
//   restarted.
// -----------------------------------------------------------------------------
class WorkerPool {
 public:
  using Task = std::function<void()>;

  WorkerPool(std::string name, std::size_t workers);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

  void start();

  // Drains accepted tasks, then joins every worker.
  void stop();

  // Returns false when the pool is stopped.
  bool submit(Task task);

  std::size_t workerCount() const { return worker_count_; }
  bool running() const { return running_.load(); }

 private:
  void run();

  std::string name_;
  std::size_t worker_count_;
  ThreadSafeQueue<Task> tasks_;
  std::vector<std::thread> threads_;
  std::atomic<bool> running_{false};
  std::atomic<bool> stopped_{false};
};

}  // namespace tradeagent
