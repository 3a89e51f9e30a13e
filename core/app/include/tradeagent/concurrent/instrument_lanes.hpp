#pragma once

#include "tradeagent/concurrent/worker_pool.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace tradeagent {

// -----------------------------------------------------------------------------
// InstrumentLanes: one sequential strand per instrument over a WorkerPool
// -----------------------------------------------------------------------------
//
// @brief  Tasks posted for the same instrument run one at a time, in post
//         order. Tasks for different instruments run in parallel on the pool.
//
// @details
// Each lane is a FIFO plus a "scheduled" flag. post() appends the task and,
// if the lane is idle, submits one drain job to the pool. The drain job runs
// the lane's tasks until the FIFO is empty, then clears the flag. Since at
// most one drain job exists per lane, two tasks of the same instrument can
// never overlap, and the order of post() calls is the order of execution.
//
// This is what serializes everything the engine does for one instrument:
// bar appends, evaluation cycles, order submission and fill application.
//
// waitIdle() blocks until no lane has queued or running work. It is used by
// orderly shutdown and by tests that need a quiescent engine.
//
// Thread model:
//   post(), pending() and waitIdle() are safe from any thread. post() may be
//   called from inside a lane task (including the same lane). waitIdle() must
//   not be called from inside a lane task.
// -----------------------------------------------------------------------------
class InstrumentLanes {
 public:
  using Task = std::function<void()>;

  explicit InstrumentLanes(WorkerPool& pool);

  InstrumentLanes(const InstrumentLanes&) = delete;
  InstrumentLanes& operator=(const InstrumentLanes&) = delete;

  // Returns false if the pool refused the drain job (pool stopped). The task
  // is discarded in that case.
  bool post(const std::string& instrument, Task task);

  // Queued plus running tasks for one lane.
  std::size_t pending(const std::string& instrument) const;

  // Returns false on timeout.
  bool waitIdle(std::chrono::milliseconds timeout);

 private:
  struct Lane {
    std::string instrument;
    std::mutex mutex;
    std::deque<Task> tasks;
    bool scheduled{false};
    std::size_t running{0};
  };

  Lane& laneFor(const std::string& instrument);
  void drain(Lane& lane);
  void finished(std::size_t n);

  WorkerPool& pool_;

  mutable std::mutex lanes_mutex_;
  std::unordered_map<std::string, std::unique_ptr<Lane>> lanes_;

  std::mutex idle_mutex_;
  std::condition_variable idle_cv_;
  std::size_t outstanding_{0};
};

}  // namespace tradeagent
