#pragma once

#include "tradeagent/config/engine_config.hpp"
#include "tradeagent/domain/price_bar.hpp"
#include "tradeagent/eventbus/event_bus.hpp"
#include "tradeagent/execution/i_exchange.hpp"
#include "tradeagent/execution/order_execution_manager.hpp"
#include "tradeagent/execution/order_tracker.hpp"
#include "tradeagent/indicators/indicator_engine.hpp"
#include "tradeagent/market/market_data_cache.hpp"
#include "tradeagent/network/ipc_server.hpp"
#include "tradeagent/network/market_data_thread.hpp"
#include "tradeagent/risk/i_reconciler.hpp"
#include "tradeagent/risk/position_tracker.hpp"
#include "tradeagent/scheduler/execution_scheduler.hpp"
#include "tradeagent/strategy/signal_evaluator.hpp"
#include "tradeagent/time/i_time_provider.hpp"
#include "tradeagent/time/simulation_time_provider.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace tradeagent {

// -----------------------------------------------------------------------------
// TradingEngine: owner and orchestrator
// -----------------------------------------------------------------------------
//
// @brief  Builds every component from an EngineConfig, wires them to the
//         exchange and the ZeroMQ surfaces, and owns the start/stop
//         lifecycle.
//
// @details
// Components are constructed in the constructor (the configuration is
// immutable, so nothing depends on start()):
//
//   EventBus -> MarketDataCache -> IndicatorEngine -> SignalEvaluator
//            -> PositionTracker -> OrderTracker -> OrderExecutionManager
//            -> ExecutionScheduler
//
// start(reconciler):
//   1. Hydrate positions and open orders from the reconciler (optional).
//   2. Attach exchange.streamFills() to ExecutionScheduler::onFill.
//   3. Start the scheduler (worker pool + interval timer).
//   4. Start the IpcServer and forward every bus event to its telemetry
//      queue (skipped when either IPC endpoint is empty).
//   5. Start the MarketDataThread last, so bars only flow once everything
//      downstream is ready (skipped when the endpoint is empty).
//
// stop() runs the same steps backwards: bars stop first, the scheduler
// drains in-flight cycles (submissions finish as ACKED, REJECTED or
// UNKNOWN), fills are detached, then the IPC server goes down.
//
// Thread model:
//   start() / stop() from the owning thread. pushBar(), executeCommand()
//   and the accessors are safe from any thread.
//
// Ownership:
//   Owns every component. Borrows the exchange and the clocks, which must
//   outlive the engine.
// -----------------------------------------------------------------------------
class TradingEngine {
 public:
  // sim_clock, when given, is advanced by the gateway with each bar's
  // timestamp; it is normally the same object as `clock`.
  TradingEngine(config::EngineConfig config, IExchange& exchange,
                const ITimeProvider& clock,
                SimulationTimeProvider* sim_clock = nullptr);
  ~TradingEngine();

  TradingEngine(const TradingEngine&) = delete;
  TradingEngine& operator=(const TradingEngine&) = delete;
  TradingEngine(TradingEngine&&) = delete;
  TradingEngine& operator=(TradingEngine&&) = delete;

  void start(IReconciler* reconciler = nullptr);
  void stop();
  bool running() const { return running_; }

  // Same path as a gateway bar. False if the instrument is not configured
  // or the engine is not running.
  bool pushBar(const std::string& instrument, domain::PriceBar bar);

  // Blocks until every queued cycle and fill has been processed.
  bool waitIdle(std::chrono::milliseconds timeout);

  // Operator commands (IPC REP socket). Returns a JSON document with
  // "status": "ok" | "error".
  //   PING | STATUS | ORDERS | UNKNOWN | HALT | RESUME
  //   EVALUATE <instrument> | RESOLVE <key> <STATE>
  std::string executeCommand(const std::string& cmd);

  const config::EngineConfig& config() const { return config_; }
  EventBus& eventBus() { return bus_; }
  MarketDataCache& cache() { return cache_; }
  PositionTracker& positions() { return positions_; }
  OrderTracker& orders() { return orders_; }
  OrderExecutionManager& executor() { return executor_; }
  ExecutionScheduler& scheduler() { return scheduler_; }

 private:
  std::string statusJson();

  const config::EngineConfig config_;
  IExchange& exchange_;
  const ITimeProvider& clock_;
  SimulationTimeProvider* sim_clock_;

  EventBus bus_;
  MarketDataCache cache_;
  IndicatorEngine indicators_;
  SignalEvaluator evaluator_;
  PositionTracker positions_;
  OrderTracker orders_;
  OrderExecutionManager executor_;
  ExecutionScheduler scheduler_;

  std::shared_ptr<IpcServer> ipc_server_;
  std::optional<EventBus::SubscriptionId> telemetry_subscription_;
  std::unique_ptr<MarketDataThread> market_data_thread_;

  bool running_{false};
  bool stopped_{false};
};

}  // namespace tradeagent
