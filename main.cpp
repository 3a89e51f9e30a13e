// -----------------------------------------------------------------------------
// trade_agent: single executable entry point
//
//   trade_agent [config.json]
//
//   1) Load the configuration (built-in defaults if the file is missing).
//   2) Pick the clock: wall clock, or a SimulationTimeProvider advanced by
//      bar timestamps from the market data feed.
//   3) Build the TradingEngine on the paper exchange and start it. Bars
//      arrive on the ZeroMQ SUB endpoint; commands on the REP endpoint;
//      telemetry goes out on the PUB endpoint.
//   4) Wait for SIGINT / SIGTERM, then stop: bars stop, in-flight cycles
//      drain, any order left UNKNOWN is reported.
//
// Thread layout:
//   main thread          waits for the shutdown signal
//   market data thread   MarketDataGateway::run()
//   ExecutionScheduler   worker pool; one lane per instrument
//   PaperExchange        acks and fills
//   IPC thread           commands + telemetry
// -----------------------------------------------------------------------------

#include "tradeagent/config/engine_config.hpp"
#include "tradeagent/domain/errors.hpp"
#include "tradeagent/engine/trading_engine.hpp"
#include "tradeagent/execution/paper_exchange.hpp"
#include "tradeagent/time/live_time_provider.hpp"
#include "tradeagent/time/simulation_time_provider.hpp"

#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

// Set from the signal handler, polled by main(). sig_atomic_t keeps the
// handler async-signal-safe.
static volatile std::sig_atomic_t g_shutdown_requested = 0;

static void shutdown_handler(int /*signum*/) { g_shutdown_requested = 1; }

int main(int argc, char** argv) {
  const std::string config_path =
      argc > 1 ? argv[1] : "configs/trade_agent.json";

  tradeagent::config::EngineConfig config;
  try {
    config = tradeagent::config::loadConfig(config_path);
  } catch (const tradeagent::ConfigError& e) {
    std::cerr << "[main] " << e.what() << "\n";
    return 2;
  }

  tradeagent::LiveTimeProvider live_clock;
  std::unique_ptr<tradeagent::SimulationTimeProvider> sim_clock;
  const tradeagent::ITimeProvider* clock = &live_clock;
  if (config.clock == tradeagent::config::ClockMode::Simulation) {
    sim_clock = std::make_unique<tradeagent::SimulationTimeProvider>();
    clock = sim_clock.get();
  }

  tradeagent::PaperExchange exchange(*clock);

  try {
    tradeagent::TradingEngine engine(config, exchange, *clock,
                                     sim_clock.get());

    std::signal(SIGINT, shutdown_handler);
    std::signal(SIGTERM, shutdown_handler);

    engine.start();

    std::cout << "[main] listening for bars on "
              << config.endpoints.market_data << "\n"
              << "[main] commands on " << config.endpoints.ipc_command
              << ", telemetry on " << config.endpoints.ipc_telemetry << "\n"
              << "[main] Press Ctrl-C to shut down.\n";

    while (g_shutdown_requested == 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "\n[main] shutdown requested. Stopping engine...\n";
    engine.stop();
  } catch (const std::exception& e) {
    std::cerr << "[main] fatal: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
