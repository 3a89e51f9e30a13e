// =============================================================================
// execution_scheduler_test.cpp
// =============================================================================
// Integration tests for tradeagent::ExecutionScheduler wired to the real
// cache, indicator engine, evaluator, trackers, order manager and a
// PaperExchange.
//
// Validates:
//   - A crossover on bar 5 becomes a SignalEvent, an order and a long
//     position of one lot
//   - Warm-up bars produce no signal and no error events
//   - Suppressed signals never reach the order manager
//   - A failing cycle for one instrument is reported and contained
//   - Timer-driven cycles run without new bars
//   - No work is accepted after shutdown()
//   - Fills arriving after shutdown() still reach the position
// =============================================================================

#include "tradeagent/eventbus/event_bus.hpp"
#include "tradeagent/execution/order_execution_manager.hpp"
#include "tradeagent/execution/order_tracker.hpp"
#include "tradeagent/execution/paper_exchange.hpp"
#include "tradeagent/indicators/indicator_engine.hpp"
#include "tradeagent/market/market_data_cache.hpp"
#include "tradeagent/risk/position_tracker.hpp"
#include "tradeagent/scheduler/execution_scheduler.hpp"
#include "tradeagent/strategy/signal_evaluator.hpp"
#include "tradeagent/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace std::chrono_literals;
using tradeagent::domain::PositionSide;
using tradeagent::domain::PriceBar;
using tradeagent::domain::SignalType;
using namespace tradeagent::strategy;

tradeagent::config::InstrumentConfig instrument(const std::string& id) {
  tradeagent::config::InstrumentConfig cfg;
  cfg.instrument.id = id;
  cfg.instrument.tick_size = 0.01;
  cfg.instrument.lot_size = 0.001;
  cfg.instrument.min_order_size = 0.001;
  cfg.instrument.order_size = 0.0;  // one lot
  cfg.limits.max_position_size = 1.0;
  cfg.limits.max_notional = 10000.0;
  return cfg;
}

PriceBar bar(std::int64_t ts, double close) {
  PriceBar b;
  b.timestamp_ms = ts;
  b.open = close;
  b.high = close;
  b.low = close;
  b.close = close;
  b.volume = 1.0;
  return b;
}

// fast = SMA(2), slow = SMA(3): lookback 4 bars. With these closes fast
// crosses above slow exactly on bar 5.
const std::vector<double> kCrossCloses{100.0, 100.0, 100.0, 100.0, 110.0};

std::vector<StrategyRule> crossRules(std::optional<PositionSide> when) {
  return {{"cross_up", when, {CrossCondition{"fast", "slow", Direction::Above}},
           SignalType::EnterLong}};
}

// Collects events published from lane threads.
struct Recorder {
  std::mutex mutex;
  std::vector<tradeagent::SignalEvent> signals;
  std::vector<tradeagent::CycleErrorEvent> errors;

  void attach(tradeagent::EventBus& bus) {
    bus.subscribe<tradeagent::SignalEvent>(
        [this](const tradeagent::SignalEvent& e) {
          std::lock_guard lock(mutex);
          signals.push_back(e);
        });
    bus.subscribe<tradeagent::CycleErrorEvent>(
        [this](const tradeagent::CycleErrorEvent& e) {
          std::lock_guard lock(mutex);
          errors.push_back(e);
        });
  }
};

}  // namespace

class ExecutionSchedulerTest : public ::testing::Test {
 protected:
  void TearDown() override {
    if (scheduler) {
      scheduler->shutdown();
    }
    if (exchange) {
      exchange->streamFills({});
    }
  }

  // scheduled lists what the scheduler runs; tracked what the position
  // tracker knows. A scheduled instrument the tracker lacks fails its cycles.
  void build(std::vector<StrategyRule> rules,
             std::vector<std::string> scheduled = {"BTC-USDT"},
             std::vector<std::string> tracked = {"BTC-USDT"},
             std::chrono::milliseconds interval = 0ms) {
    recorder.attach(bus);

    std::vector<tradeagent::config::InstrumentConfig> configs;
    for (const auto& id : tracked) {
      configs.push_back(instrument(id));
    }

    tradeagent::domain::RiskLimits limits;
    limits.max_open_positions = 5;
    limits.max_gross_notional = 1e6;
    limits.max_drawdown = -1e6;

    indicators = std::make_unique<tradeagent::IndicatorEngine>(
        std::vector<tradeagent::IndicatorSpec>{
            {"fast", tradeagent::IndicatorKind::Sma, 2},
            {"slow", tradeagent::IndicatorKind::Sma, 3},
        });
    evaluator = std::make_unique<tradeagent::SignalEvaluator>(std::move(rules));
    positions = std::make_unique<tradeagent::PositionTracker>(bus, clock,
                                                              configs, limits);
    orders = std::make_unique<tradeagent::OrderTracker>(bus, clock);
    exchange =
        std::make_unique<tradeagent::PaperExchange>(clock, exchange_options);

    tradeagent::RetryPolicy policy;
    policy.ack_timeout = 500ms;
    policy.initial_backoff = 1ms;
    executor = std::make_unique<tradeagent::OrderExecutionManager>(
        bus, *exchange, *positions, *orders, clock, configs, policy, 0ms);

    tradeagent::SchedulerOptions options;
    options.workers = 2;
    options.evaluation_interval = interval;
    options.drain_timeout = 2000ms;
    scheduler = std::make_unique<tradeagent::ExecutionScheduler>(
        bus, clock, cache, *indicators, *evaluator, *positions, *executor,
        scheduled, options);

    exchange->streamFills([this](const tradeagent::domain::FillEvent& f) {
      scheduler->onFill(f);
    });
    scheduler->start();
  }

  void feed(const std::string& id, const std::vector<double>& closes) {
    std::int64_t ts = 60'000;
    for (double c : closes) {
      ASSERT_TRUE(scheduler->onBar(id, bar(ts, c)));
      ts += 60'000;
    }
  }

  // Lanes, then the exchange worker, then the fill tasks it posted.
  void settle() {
    ASSERT_TRUE(scheduler->waitIdle(2000ms));
    exchange->flush();
    ASSERT_TRUE(scheduler->waitIdle(2000ms));
  }

  tradeagent::EventBus bus;
  tradeagent::SimulationTimeProvider clock{1'700'000'000'000};
  tradeagent::MarketDataCache cache{64};
  tradeagent::PaperExchangeOptions exchange_options;
  Recorder recorder;
  std::unique_ptr<tradeagent::IndicatorEngine> indicators;
  std::unique_ptr<tradeagent::SignalEvaluator> evaluator;
  std::unique_ptr<tradeagent::PositionTracker> positions;
  std::unique_ptr<tradeagent::OrderTracker> orders;
  std::unique_ptr<tradeagent::PaperExchange> exchange;
  std::unique_ptr<tradeagent::OrderExecutionManager> executor;
  std::unique_ptr<tradeagent::ExecutionScheduler> scheduler;
};

// -----------------------------------------------------------------------------
// 1. Crossover on bar 5 ends in a long position of one lot
// -----------------------------------------------------------------------------
TEST_F(ExecutionSchedulerTest, CrossoverOpensLongPosition) {
  build(crossRules(PositionSide::Flat));
  feed("BTC-USDT", kCrossCloses);
  settle();

  {
    std::lock_guard lock(recorder.mutex);
    ASSERT_EQ(recorder.signals.size(), 1u);
    EXPECT_EQ(recorder.signals[0].sequence, 5u);
    EXPECT_EQ(recorder.signals[0].type, SignalType::EnterLong);
    EXPECT_EQ(recorder.signals[0].rule, "cross_up");
    EXPECT_DOUBLE_EQ(recorder.signals[0].close, 110.0);
    EXPECT_TRUE(recorder.errors.empty());
  }

  auto pos = positions->position("BTC-USDT");
  EXPECT_EQ(pos.side, PositionSide::Long);
  EXPECT_DOUBLE_EQ(pos.size, 0.001);
  EXPECT_DOUBLE_EQ(pos.average_entry_price, 110.0);

  auto keys = exchange->receivedKeys();
  ASSERT_EQ(keys.size(), 1u);
  EXPECT_EQ(keys[0], "TABTCUSDTS5");

  auto stats = scheduler->stats();
  EXPECT_EQ(stats.cycles, 5u);
  EXPECT_EQ(stats.actionable_signals, 1u);
  EXPECT_EQ(stats.fills_routed, 1u);
  EXPECT_EQ(stats.cycle_errors, 0u);
}

// -----------------------------------------------------------------------------
// 2. Warm-up produces neither signals nor error events
// -----------------------------------------------------------------------------
TEST_F(ExecutionSchedulerTest, WarmUpIsQuiet) {
  build(crossRules(PositionSide::Flat));
  feed("BTC-USDT", {100.0, 101.0, 102.0});
  settle();

  std::lock_guard lock(recorder.mutex);
  EXPECT_TRUE(recorder.signals.empty());
  EXPECT_TRUE(recorder.errors.empty());
  EXPECT_EQ(scheduler->stats().cycle_errors, 0u);
  EXPECT_EQ(cache.size("BTC-USDT"), 3u);
}

// -----------------------------------------------------------------------------
// 3. A suppressed signal never reaches the order manager
// -----------------------------------------------------------------------------
// Why: the rule has no state filter, so it fires while already long. The
// mirrored state must stop a second entry before any order exists.
// -----------------------------------------------------------------------------
TEST_F(ExecutionSchedulerTest, SuppressedSignalNotSubmitted) {
  build(crossRules(std::nullopt));

  tradeagent::domain::Position held;
  held.instrument = "BTC-USDT";
  held.side = PositionSide::Long;
  held.size = 0.001;
  held.average_entry_price = 95.0;
  positions->hydratePosition(held);

  feed("BTC-USDT", kCrossCloses);
  settle();

  std::lock_guard lock(recorder.mutex);
  EXPECT_TRUE(recorder.signals.empty());
  EXPECT_TRUE(exchange->receivedKeys().empty());
  EXPECT_TRUE(orders->orders().empty());
  EXPECT_EQ(scheduler->stats().actionable_signals, 0u);
}

// -----------------------------------------------------------------------------
// 4. One instrument failing does not stop another
// -----------------------------------------------------------------------------
TEST_F(ExecutionSchedulerTest, CycleErrorIsContained) {
  build(crossRules(PositionSide::Flat), {"BTC-USDT", "ETH-USDT"},
        {"BTC-USDT"});

  feed("ETH-USDT", kCrossCloses);
  feed("BTC-USDT", kCrossCloses);
  settle();

  {
    std::lock_guard lock(recorder.mutex);
    ASSERT_EQ(recorder.errors.size(), kCrossCloses.size());
    for (const auto& e : recorder.errors) {
      EXPECT_EQ(e.instrument, "ETH-USDT");
      EXPECT_EQ(e.code, tradeagent::ErrorCode::UnknownInstrument);
      EXPECT_TRUE(e.core_error);
    }
    ASSERT_EQ(recorder.signals.size(), 1u);
    EXPECT_EQ(recorder.signals[0].instrument, "BTC-USDT");
  }
  EXPECT_EQ(positions->position("BTC-USDT").side, PositionSide::Long);
  EXPECT_EQ(scheduler->stats().cycle_errors, kCrossCloses.size());
}

// -----------------------------------------------------------------------------
// 5. Bars for unscheduled instruments are refused
// -----------------------------------------------------------------------------
TEST_F(ExecutionSchedulerTest, UnknownInstrumentBarRefused) {
  build(crossRules(PositionSide::Flat));
  EXPECT_FALSE(scheduler->onBar("DOGE-USDT", bar(60'000, 1.0)));
  EXPECT_FALSE(scheduler->evaluate("DOGE-USDT"));
}

// -----------------------------------------------------------------------------
// 6. The timer runs cycles without new bars
// -----------------------------------------------------------------------------
TEST_F(ExecutionSchedulerTest, TimerDrivesCycles) {
  build(crossRules(PositionSide::Flat), {"BTC-USDT"}, {"BTC-USDT"}, 10ms);
  feed("BTC-USDT", {100.0, 100.0, 100.0, 100.0});
  ASSERT_TRUE(scheduler->waitIdle(2000ms));
  const auto before = scheduler->stats().cycles;

  std::this_thread::sleep_for(100ms);
  ASSERT_TRUE(scheduler->waitIdle(2000ms));

  EXPECT_GT(scheduler->stats().cycles, before);
  // Re-evaluating the same snapshot is stale: no signal without a new bar.
  std::lock_guard lock(recorder.mutex);
  EXPECT_TRUE(recorder.signals.empty());
}

// -----------------------------------------------------------------------------
// 7. shutdown() drains and then refuses work
// -----------------------------------------------------------------------------
TEST_F(ExecutionSchedulerTest, ShutdownRefusesWork) {
  build(crossRules(PositionSide::Flat));
  feed("BTC-USDT", kCrossCloses);

  scheduler->shutdown();
  EXPECT_FALSE(scheduler->accepting());
  EXPECT_FALSE(scheduler->onBar("BTC-USDT", bar(1'000'000, 120.0)));
  EXPECT_FALSE(scheduler->evaluate("BTC-USDT"));

  // Every bar accepted before shutdown was processed.
  EXPECT_EQ(cache.size("BTC-USDT"), kCrossCloses.size());
  EXPECT_EQ(scheduler->stats().cycles, kCrossCloses.size());
}

// -----------------------------------------------------------------------------
// 8. A fill that arrives after shutdown() is applied, not dropped
// -----------------------------------------------------------------------------
// Why: the venue keeps executing while the engine stops. Positions reported
// at exit must include executions delivered between the drain and the
// moment fills are detached.
// -----------------------------------------------------------------------------
TEST_F(ExecutionSchedulerTest, FillAfterShutdownIsApplied) {
  exchange_options.auto_fill = false;
  build(crossRules(PositionSide::Flat));
  feed("BTC-USDT", kCrossCloses);
  settle();

  ASSERT_EQ(exchange->receivedKeys().size(), 1u);
  const std::string key = exchange->receivedKeys()[0];
  EXPECT_EQ(positions->position("BTC-USDT").side, PositionSide::Flat);

  scheduler->shutdown();
  ASSERT_TRUE(exchange->emitFill(key, 0.001, 110.0));

  auto pos = positions->position("BTC-USDT");
  EXPECT_EQ(pos.side, PositionSide::Long);
  EXPECT_DOUBLE_EQ(pos.size, 0.001);
  EXPECT_EQ(orders->find(key)->status,
            tradeagent::domain::OrderStatus::Filled);
  EXPECT_EQ(scheduler->stats().fills_routed, 1u);
}
