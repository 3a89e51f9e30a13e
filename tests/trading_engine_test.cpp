// =============================================================================
// trading_engine_test.cpp
// =============================================================================
// Unit tests for tradeagent::TradingEngine.
//
// Validates:
//   - Lifecycle: start() / stop() / destructor, idempotent and one-shot
//   - pushBar() drives the full pipeline from bar to position
//   - Operator commands: PING, STATUS, ORDERS, UNKNOWN, HALT, RESUME,
//     EVALUATE, RESOLVE
//   - Keys carry a per-run id, so orders from an earlier run never collide
//   - stop() is safe while the IPC thread publishes
//   - Startup reconciliation hydrates positions and open orders
//
// Design: Each test creates its own PaperExchange and TradingEngine. ZeroMQ
// endpoints are disabled, except for in-process IPC endpoints where the IPC
// thread itself is under test. No global state.
// =============================================================================

#include "tradeagent/engine/trading_engine.hpp"
#include "tradeagent/events/event_types.hpp"
#include "tradeagent/execution/paper_exchange.hpp"
#include "tradeagent/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace std::chrono_literals;
using nlohmann::json;
using tradeagent::domain::PositionSide;
using tradeagent::domain::PriceBar;
using tradeagent::domain::SignalType;

// BTC-USDT and ETH-USDT from the defaults, a SMA(2)/SMA(3) crossover rule,
// no cooldown, fast retries, no sockets.
tradeagent::config::EngineConfig testConfig() {
  using namespace tradeagent::strategy;

  auto cfg = tradeagent::config::defaultConfig();
  cfg.clock = tradeagent::config::ClockMode::Simulation;
  cfg.endpoints.market_data.clear();
  cfg.endpoints.ipc_command.clear();
  cfg.endpoints.ipc_telemetry.clear();
  cfg.entry_cooldown = 0ms;
  cfg.scheduler.workers = 2;
  cfg.retry.ack_timeout = 30ms;
  cfg.retry.initial_backoff = 1ms;
  cfg.retry.max_backoff = 5ms;

  tradeagent::IndicatorSpec fast;
  fast.name = "fast";
  fast.kind = tradeagent::IndicatorKind::Sma;
  fast.period = 2;
  tradeagent::IndicatorSpec slow;
  slow.name = "slow";
  slow.kind = tradeagent::IndicatorKind::Sma;
  slow.period = 3;
  cfg.indicators = {fast, slow};

  cfg.rules = {{"cross_up", PositionSide::Flat,
                {CrossCondition{"fast", "slow", Direction::Above}},
                SignalType::EnterLong}};

  tradeagent::config::validateConfig(cfg);
  return cfg;
}

PriceBar makeBar(std::int64_t ts, double close) {
  PriceBar b;
  b.timestamp_ms = ts;
  b.open = close;
  b.high = close;
  b.low = close;
  b.close = close;
  b.volume = 1.0;
  return b;
}

// Bar 5 crosses fast above slow.
void feedCrossover(tradeagent::TradingEngine& engine,
                   tradeagent::SimulationTimeProvider& clock) {
  const std::vector<double> closes{100.0, 100.0, 100.0, 100.0, 110.0};
  std::int64_t ts = 1'700'000'000'000;
  for (double c : closes) {
    clock.advance_time(ts);
    ASSERT_TRUE(engine.pushBar("BTC-USDT", makeBar(ts, c)));
    ts += 60'000;
  }
}

class FixedReconciler final : public tradeagent::IReconciler {
 public:
  std::vector<tradeagent::domain::Position> reconcilePositions() override {
    tradeagent::domain::Position btc;
    btc.instrument = "BTC-USDT";
    btc.side = PositionSide::Long;
    btc.size = 0.002;
    btc.average_entry_price = 40000.0;

    tradeagent::domain::Position doge;
    doge.instrument = "DOGE-USDT";
    doge.side = PositionSide::Long;
    doge.size = 100.0;
    return {btc, doge};
  }

  std::vector<tradeagent::domain::Order> reconcileOrders() override {
    tradeagent::domain::Order eth;
    eth.idempotency_key = "TAETHUSDTS41";
    eth.instrument = "ETH-USDT";
    eth.side = tradeagent::domain::Side::Buy;
    eth.size = 0.01;
    eth.status = tradeagent::domain::OrderStatus::Acked;
    return {eth};
  }
};

}  // namespace

class TradingEngineTest : public ::testing::Test {
 protected:
  void settle(tradeagent::TradingEngine& engine) {
    ASSERT_TRUE(engine.waitIdle(2000ms));
    exchange.flush();
    ASSERT_TRUE(engine.waitIdle(2000ms));
  }

  tradeagent::SimulationTimeProvider clock;
  tradeagent::PaperExchange exchange{clock};
};

// -----------------------------------------------------------------------------
// 1. Idempotent start and stop; a stopped engine does not restart
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTest, LifecycleIsIdempotent) {
  tradeagent::TradingEngine engine(testConfig(), exchange, clock, &clock);
  EXPECT_NO_FATAL_FAILURE(engine.stop());
  EXPECT_FALSE(engine.pushBar("BTC-USDT", makeBar(60'000, 100.0)));

  engine.start();
  engine.start();
  EXPECT_TRUE(engine.running());

  engine.stop();
  engine.stop();
  EXPECT_FALSE(engine.running());

  engine.start();
  EXPECT_FALSE(engine.running());
  EXPECT_FALSE(engine.pushBar("BTC-USDT", makeBar(60'000, 100.0)));
}

// -----------------------------------------------------------------------------
// 2. RAII: the destructor stops the scheduler without an explicit stop()
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTest, DestructorStops) {
  {
    tradeagent::TradingEngine engine(testConfig(), exchange, clock, &clock);
    engine.start();
    engine.pushBar("BTC-USDT", makeBar(60'000, 100.0));
  }
  SUCCEED();
}

// -----------------------------------------------------------------------------
// 3. Bars in, position out
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTest, BarsToPosition) {
  tradeagent::TradingEngine engine(testConfig(), exchange, clock, &clock);

  std::promise<tradeagent::SignalEvent> signal_promise;
  auto signal_future = signal_promise.get_future();
  engine.eventBus().subscribe<tradeagent::SignalEvent>(
      [&signal_promise](const tradeagent::SignalEvent& e) {
        signal_promise.set_value(e);
      });

  engine.start();
  feedCrossover(engine, clock);

  ASSERT_EQ(signal_future.wait_for(2s), std::future_status::ready)
      << "crossover did not produce a SignalEvent";
  auto signal = signal_future.get();
  EXPECT_EQ(signal.instrument, "BTC-USDT");
  EXPECT_EQ(signal.sequence, 5u);

  settle(engine);
  auto pos = engine.positions().position("BTC-USDT");
  EXPECT_EQ(pos.side, PositionSide::Long);
  EXPECT_DOUBLE_EQ(pos.size, 0.001);

  auto orders = json::parse(engine.executeCommand("ORDERS"));
  ASSERT_EQ(orders["orders"].size(), 1u);
  EXPECT_EQ(orders["orders"][0]["key"],
            engine.executor().makeIdempotencyKey("BTC-USDT", 5));
  EXPECT_EQ(orders["orders"][0]["status"], "FILLED");
  EXPECT_EQ(orders["orders"][0]["intent"], "ENTER_LONG");

  engine.stop();
}

// -----------------------------------------------------------------------------
// 4. PING / STATUS / unknown commands
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTest, BasicCommands) {
  tradeagent::TradingEngine engine(testConfig(), exchange, clock, &clock);
  engine.start();

  auto ping = json::parse(engine.executeCommand("ping"));
  EXPECT_EQ(ping["status"], "ok");
  EXPECT_EQ(ping["response"], "PONG");

  auto status = json::parse(engine.executeCommand("STATUS"));
  EXPECT_EQ(status["status"], "ok");
  EXPECT_EQ(status["halted"], false);
  EXPECT_EQ(status["accepting"], true);
  ASSERT_EQ(status["positions"].size(), 2u);
  EXPECT_EQ(status["positions"][0]["instrument"], "BTC-USDT");
  EXPECT_EQ(status["positions"][0]["side"], "FLAT");
  EXPECT_EQ(status["unknown_orders"], 0);

  EXPECT_EQ(json::parse(engine.executeCommand("FROBNICATE"))["status"],
            "error");
  EXPECT_EQ(json::parse(engine.executeCommand("   "))["status"], "error");
  EXPECT_EQ(json::parse(engine.executeCommand("EVALUATE"))["status"], "error");
  EXPECT_EQ(json::parse(engine.executeCommand("EVALUATE DOGE-USDT"))["status"],
            "error");
  EXPECT_EQ(json::parse(engine.executeCommand("EVALUATE BTC-USDT"))["status"],
            "ok");

  engine.stop();
}

// -----------------------------------------------------------------------------
// 5. HALT blocks entries and is reported
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTest, HaltBlocksEntries) {
  tradeagent::TradingEngine engine(testConfig(), exchange, clock, &clock);

  std::vector<tradeagent::RiskRejectEvent> rejects;
  engine.eventBus().subscribe<tradeagent::RiskRejectEvent>(
      [&rejects](const tradeagent::RiskRejectEvent& e) { rejects.push_back(e); });

  engine.start();
  auto halt = json::parse(engine.executeCommand("HALT"));
  EXPECT_EQ(halt["status"], "ok");
  EXPECT_EQ(json::parse(engine.executeCommand("STATUS"))["halted"], true);

  feedCrossover(engine, clock);
  settle(engine);

  EXPECT_EQ(engine.positions().position("BTC-USDT").side, PositionSide::Flat);
  ASSERT_EQ(rejects.size(), 1u);
  EXPECT_EQ(rejects[0].reason, "trading halted");
  EXPECT_TRUE(exchange.receivedKeys().empty());

  engine.stop();
}

// -----------------------------------------------------------------------------
// 6. UNKNOWN orders are listed and resolved by the operator
// -----------------------------------------------------------------------------
// Why: an order the venue never confirmed blocks its instrument; RESOLVE is
// the only way to release it when no late exchange event arrives.
// -----------------------------------------------------------------------------
TEST(TradingEngineResolveTest, ResolveUnknownOrder) {
  tradeagent::SimulationTimeProvider clock;
  tradeagent::PaperExchangeOptions options;
  options.auto_fill = false;
  tradeagent::PaperExchange exchange(clock, options);
  exchange.dropNextAcks(3);

  tradeagent::TradingEngine engine(testConfig(), exchange, clock, &clock);
  engine.start();
  feedCrossover(engine, clock);
  ASSERT_TRUE(engine.waitIdle(5000ms));

  auto unknown = json::parse(engine.executeCommand("UNKNOWN"));
  ASSERT_EQ(unknown["orders"].size(), 1u);
  const std::string key = unknown["orders"][0]["key"];
  EXPECT_EQ(key, engine.executor().makeIdempotencyKey("BTC-USDT", 5));
  EXPECT_EQ(json::parse(engine.executeCommand("STATUS"))["unknown_orders"], 1);

  EXPECT_EQ(
      json::parse(engine.executeCommand("RESOLVE " + key + " SIDEWAYS"))
          ["status"],
      "error");
  EXPECT_EQ(json::parse(engine.executeCommand("RESOLVE " + key))["status"],
            "error");

  auto resolved =
      json::parse(engine.executeCommand("resolve " + key + " cancelled"));
  EXPECT_EQ(resolved["status"], "ok");
  EXPECT_EQ(resolved["order"]["status"], "CANCELLED");

  // Already resolved.
  EXPECT_EQ(
      json::parse(engine.executeCommand("RESOLVE " + key + " FILLED"))
          ["status"],
      "error");
  EXPECT_TRUE(engine.orders().unknownOrders().empty());
  EXPECT_FALSE(engine.orders().openOrder("BTC-USDT").has_value());

  engine.stop();
}

// -----------------------------------------------------------------------------
// 7. Startup reconciliation
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTest, ReconcilerHydratesState) {
  tradeagent::TradingEngine engine(testConfig(), exchange, clock, &clock);
  FixedReconciler reconciler;
  engine.start(&reconciler);

  auto btc = engine.positions().position("BTC-USDT");
  EXPECT_EQ(btc.side, PositionSide::Long);
  EXPECT_DOUBLE_EQ(btc.size, 0.002);

  auto open = engine.orders().openOrder("ETH-USDT");
  ASSERT_TRUE(open.has_value());
  EXPECT_EQ(open->idempotency_key, "TAETHUSDTS41");

  // The hydrated long position blocks the crossover entry.
  feedCrossover(engine, clock);
  settle(engine);
  EXPECT_TRUE(exchange.receivedKeys().empty());
  EXPECT_DOUBLE_EQ(engine.positions().position("BTC-USDT").size, 0.002);

  engine.stop();
}

// -----------------------------------------------------------------------------
// 8. RESUME clears an operator halt
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTest, ResumeAfterHalt) {
  tradeagent::TradingEngine engine(testConfig(), exchange, clock, &clock);

  std::vector<tradeagent::TradingResumedEvent> resumed;
  engine.eventBus().subscribe<tradeagent::TradingResumedEvent>(
      [&resumed](const tradeagent::TradingResumedEvent& e) {
        resumed.push_back(e);
      });

  engine.start();
  EXPECT_EQ(json::parse(engine.executeCommand("RESUME"))["status"], "error");

  engine.executeCommand("HALT");
  auto reply = json::parse(engine.executeCommand("resume"));
  EXPECT_EQ(reply["status"], "ok");
  EXPECT_EQ(reply["response"], "Trading resumed");
  EXPECT_EQ(json::parse(engine.executeCommand("STATUS"))["halted"], false);
  ASSERT_EQ(resumed.size(), 1u);
  EXPECT_EQ(resumed[0].reason, "operator resume");

  feedCrossover(engine, clock);
  settle(engine);
  EXPECT_EQ(engine.positions().position("BTC-USDT").side, PositionSide::Long);

  engine.stop();
}

// -----------------------------------------------------------------------------
// 9. An order left by an earlier run does not swallow a new signal
// -----------------------------------------------------------------------------
// Why: bar sequences restart at 1 in every process. A reconciled order keyed
// from the last run's sequence 5 must not make this run's sequence-5 signal
// look like a duplicate.
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTest, ReconciledKeyFromEarlierRunDoesNotCollide) {
  class EarlierRun final : public tradeagent::IReconciler {
   public:
    std::vector<tradeagent::domain::Position> reconcilePositions() override {
      return {};
    }
    std::vector<tradeagent::domain::Order> reconcileOrders() override {
      tradeagent::domain::Order done;
      done.idempotency_key = "TABTCUSDTS5";
      done.instrument = "BTC-USDT";
      done.side = tradeagent::domain::Side::Buy;
      done.size = 0.001;
      done.status = tradeagent::domain::OrderStatus::Filled;
      return {done};
    }
  };

  tradeagent::TradingEngine engine(testConfig(), exchange, clock, &clock);
  EarlierRun reconciler;
  engine.start(&reconciler);

  const std::string key = engine.executor().makeIdempotencyKey("BTC-USDT", 5);
  EXPECT_NE(key, "TABTCUSDTS5");
  EXPECT_FALSE(engine.executor().runId().empty());
  EXPECT_LE(key.size(), 32u);

  feedCrossover(engine, clock);
  settle(engine);

  ASSERT_EQ(exchange.receivedKeys().size(), 1u);
  EXPECT_EQ(exchange.receivedKeys()[0], key);
  EXPECT_EQ(engine.positions().position("BTC-USDT").side, PositionSide::Long);

  engine.stop();
}

// -----------------------------------------------------------------------------
// 10. stop() while commands keep publishing telemetry
// -----------------------------------------------------------------------------
// Why: HALT and RESUME publish on the thread that runs the command. stop()
// tears the IPC surface down while such a publish may hold a copy of the
// telemetry subscriber; the subscriber must not reach a released server.
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTest, StopWhileCommandsPublish) {
  auto cfg = testConfig();
  cfg.endpoints.ipc_command = "inproc://tradeagent-stop-cmd";
  cfg.endpoints.ipc_telemetry = "inproc://tradeagent-stop-pub";

  tradeagent::TradingEngine engine(cfg, exchange, clock, &clock);
  engine.start();

  std::atomic<bool> done{false};
  std::promise<void> first_command;
  auto first_command_done = first_command.get_future();
  std::thread operator_thread([&] {
    bool signalled = false;
    while (!done.load()) {
      engine.executeCommand("HALT");
      engine.executeCommand("RESUME");
      if (!signalled) {
        first_command.set_value();
        signalled = true;
      }
    }
    if (!signalled) {
      first_command.set_value();
    }
  });

  ASSERT_EQ(first_command_done.wait_for(2s), std::future_status::ready);
  engine.stop();
  done.store(true);
  operator_thread.join();

  EXPECT_FALSE(engine.running());
}
