#pragma once

#include "tradeagent/gateway/market_data_gateway.hpp"
#include "tradeagent/time/simulation_time_provider.hpp"

#include <memory>
#include <string>
#include <thread>

namespace tradeagent {

// -----------------------------------------------------------------------------
// MarketDataThread: dedicated I/O thread for the bar feed
// -----------------------------------------------------------------------------
//
// @brief  Owns a MarketDataGateway and the std::thread running its recv loop.
//
// @details
// The gateway is created in start(), not in the constructor, so that
// TradingEngine can build this object early and connect the socket only
// after reconciliation has finished.
//
// Thread model:
//   start() / stop() from the owning thread. The sink runs on the I/O
//   thread; ExecutionScheduler::onBar only enqueues, so the loop never
//   waits on an evaluation cycle.
// -----------------------------------------------------------------------------
class MarketDataThread {
 public:
  MarketDataThread(MarketDataGateway::BarSink sink, std::string endpoint,
                   SimulationTimeProvider* sim_clock = nullptr);
  ~MarketDataThread();

  MarketDataThread(const MarketDataThread&) = delete;
  MarketDataThread& operator=(const MarketDataThread&) = delete;
  MarketDataThread(MarketDataThread&&) = delete;
  MarketDataThread& operator=(MarketDataThread&&) = delete;

  void start();
  void stop();

  bool running() const { return thread_.joinable(); }

 private:
  MarketDataGateway::BarSink sink_;
  std::string endpoint_;
  SimulationTimeProvider* sim_clock_;

  std::unique_ptr<MarketDataGateway> gateway_;
  std::thread thread_;
};

}  // namespace tradeagent
