#pragma once

#include "tradeagent/concurrent/instrument_lanes.hpp"
#include "tradeagent/concurrent/worker_pool.hpp"
#include "tradeagent/domain/fill.hpp"
#include "tradeagent/domain/price_bar.hpp"
#include "tradeagent/eventbus/event_bus.hpp"
#include "tradeagent/execution/order_execution_manager.hpp"
#include "tradeagent/indicators/indicator_engine.hpp"
#include "tradeagent/market/market_data_cache.hpp"
#include "tradeagent/risk/position_tracker.hpp"
#include "tradeagent/strategy/signal_evaluator.hpp"
#include "tradeagent/time/i_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace tradeagent {

struct SchedulerOptions {
  std::size_t workers{4};
  // 0 disables the timer; cycles then run only on bars and explicit
  // evaluate() calls.
  std::chrono::milliseconds evaluation_interval{0};
  std::chrono::milliseconds drain_timeout{30000};
};

struct SchedulerStats {
  std::uint64_t cycles{0};
  std::uint64_t cycle_errors{0};
  std::uint64_t actionable_signals{0};
  std::uint64_t fills_routed{0};
};

// -----------------------------------------------------------------------------
// ExecutionScheduler: the per-instrument execution loop
// -----------------------------------------------------------------------------
//
// @brief  Runs one evaluation cycle per instrument per bar (or per timer
//         tick) on that instrument's lane, and routes fills to the same lane.
//
// @details
// A cycle for instrument X:
//   1. history(X, lookback) from the cache
//   2. IndicatorEngine::compute()
//   3. SignalEvaluator::evaluate() against the current Position
//   4. OrderExecutionManager::submit() if the signal is actionable
// A cycle that throws is logged, counted and reported as a CycleErrorEvent;
// the lane then continues with its next task. InsufficientHistory during
// warm-up is expected and logged once per instrument.
//
// Entry points, all non-blocking:
//   onBar(X, bar)   append to the cache and mark the position, then a cycle
//   onFill(fill)    OrderExecutionManager::onFill on the fill's lane, or
//                   directly on the caller's thread once the pool stopped
//   evaluate(X)     a cycle without a new bar (operator / timer trigger)
//
// Because all three post to X's lane, a fill for X is never applied while
// X's cycle is reading the position, and cycles for X see bars in arrival
// order. Different instruments proceed in parallel on the worker pool.
//
// shutdown():
//   Stops the timer, refuses further bars and evaluate() calls, waits (up to
//   drain_timeout) for queued cycles to finish, which lets any in-flight
//   submission reach ACKED, REJECTED or UNKNOWN, then stops the pool.
//
// Thread model:
//   Public methods are safe from any thread except a lane task (shutdown()
//   joins the pool).
// -----------------------------------------------------------------------------
class ExecutionScheduler {
 public:
  ExecutionScheduler(EventBus& bus, const ITimeProvider& clock,
                     MarketDataCache& cache, const IndicatorEngine& indicators,
                     SignalEvaluator& evaluator, PositionTracker& positions,
                     OrderExecutionManager& executor,
                     std::vector<std::string> instruments,
                     SchedulerOptions options);
  ~ExecutionScheduler();

  ExecutionScheduler(const ExecutionScheduler&) = delete;
  ExecutionScheduler& operator=(const ExecutionScheduler&) = delete;
  ExecutionScheduler(ExecutionScheduler&&) = delete;
  ExecutionScheduler& operator=(ExecutionScheduler&&) = delete;

  void start();
  void shutdown();

  // Return false when the instrument is not configured or the scheduler is
  // not accepting work.
  bool onBar(const std::string& instrument, domain::PriceBar bar);
  bool onFill(const domain::FillEvent& fill);
  bool evaluate(const std::string& instrument);

  // Blocks until every lane is idle.
  bool waitIdle(std::chrono::milliseconds timeout);

  bool accepting() const { return accepting_.load(); }
  SchedulerStats stats() const;
  const std::vector<std::string>& instruments() const { return instruments_; }

 private:
  void runCycle(const std::string& instrument);
  void runTimer();
  void reportCycleError(const std::string& instrument, ErrorCode code,
                        bool core_error, const std::string& message);
  bool knows(const std::string& instrument) const;

  EventBus& bus_;
  const ITimeProvider& clock_;
  MarketDataCache& cache_;
  const IndicatorEngine& indicators_;
  SignalEvaluator& evaluator_;
  PositionTracker& positions_;
  OrderExecutionManager& executor_;
  const std::vector<std::string> instruments_;
  const std::set<std::string> known_;
  const SchedulerOptions options_;

  WorkerPool pool_;
  InstrumentLanes lanes_;

  std::atomic<bool> accepting_{false};
  std::atomic<bool> stopped_{false};

  std::mutex timer_mutex_;
  std::condition_variable timer_cv_;
  bool timer_stop_{false};
  std::thread timer_;

  mutable std::mutex warmup_mutex_;
  std::set<std::string> warming_up_logged_;

  std::atomic<std::uint64_t> cycles_{0};
  std::atomic<std::uint64_t> cycle_errors_{0};
  std::atomic<std::uint64_t> actionable_{0};
  std::atomic<std::uint64_t> fills_routed_{0};
};

}  // namespace tradeagent
