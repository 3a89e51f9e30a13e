// =============================================================================
// indicator_engine_test.cpp
// =============================================================================
// Unit tests for the indicator function library and tradeagent::IndicatorEngine.
//
// Validates:
//   - SMA / EMA / RSI / ROC / MACD formulas on hand-computed series
//   - Undefined values (warm-up, flat RSI, zero ROC base) are NaN, not 0
//   - Engine lookback is the largest window any indicator needs
//   - compute() stamps the snapshot with the newest bar's sequence and time
//   - compute() always provides "close" with current and previous values
//   - compute() is a pure function of the history it is given
//   - Configuration errors are raised as ConfigError
// =============================================================================

#include "tradeagent/domain/errors.hpp"
#include "tradeagent/indicators/indicator_engine.hpp"
#include "tradeagent/indicators/indicator_math.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

namespace {

using tradeagent::IndicatorKind;
using tradeagent::IndicatorSpec;

IndicatorSpec spec(const std::string& name, IndicatorKind kind, int period) {
  IndicatorSpec s;
  s.name = name;
  s.kind = kind;
  s.period = period;
  return s;
}

std::vector<tradeagent::domain::PriceBar> barsFrom(
    const std::vector<double>& closes) {
  std::vector<tradeagent::domain::PriceBar> bars;
  std::uint64_t seq = 1;
  for (double c : closes) {
    tradeagent::domain::PriceBar b;
    b.timestamp_ms = static_cast<std::int64_t>(seq) * 60000;
    b.open = b.high = b.low = b.close = c;
    b.sequence = seq++;
    bars.push_back(b);
  }
  return bars;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. SMA at an index averages the trailing window; warm-up is NaN.
// -----------------------------------------------------------------------------
TEST(IndicatorMathTest, SmaWindowAndWarmup) {
  std::vector<double> closes = {1, 2, 3, 4, 5};
  EXPECT_DOUBLE_EQ(tradeagent::indicators::smaAt(closes, 4, 3), 4.0);
  EXPECT_DOUBLE_EQ(tradeagent::indicators::smaAt(closes, 2, 3), 2.0);
  EXPECT_TRUE(std::isnan(tradeagent::indicators::smaAt(closes, 1, 3)));
}

// -----------------------------------------------------------------------------
// 2. EMA is seeded with the SMA of the first window.
// -----------------------------------------------------------------------------
TEST(IndicatorMathTest, EmaSeededWithSma) {
  std::vector<double> closes = {2, 4, 6, 8};
  auto ema = tradeagent::indicators::emaSeries(closes, 3);
  EXPECT_TRUE(std::isnan(ema[1]));
  EXPECT_DOUBLE_EQ(ema[2], 4.0);
  // alpha = 0.5: 0.5 * 8 + 0.5 * 4
  EXPECT_DOUBLE_EQ(ema[3], 6.0);
}

// -----------------------------------------------------------------------------
// 3. RSI uses simple averages of gains and losses over the period.
// Why: Matches the rolling-mean RSI the trend-RSI rule thresholds were
//      tuned against.
// -----------------------------------------------------------------------------
TEST(IndicatorMathTest, RsiSimpleAverage) {
  // Deltas over the last 4: +1 +1 -1 +1 -> gain 3, loss 1 -> RS 3 -> 75
  std::vector<double> closes = {1, 2, 3, 2, 3};
  EXPECT_DOUBLE_EQ(tradeagent::indicators::rsiAt(closes, 4, 4), 75.0);

  std::vector<double> rising = {1, 2, 3, 4, 5};
  EXPECT_DOUBLE_EQ(tradeagent::indicators::rsiAt(rising, 4, 4), 100.0);

  std::vector<double> flat = {5, 5, 5, 5, 5};
  EXPECT_TRUE(std::isnan(tradeagent::indicators::rsiAt(flat, 4, 4)));
}

// -----------------------------------------------------------------------------
// 4. ROC is percent change; a zero base is undefined.
// -----------------------------------------------------------------------------
TEST(IndicatorMathTest, RocPercentChange) {
  std::vector<double> closes = {100, 105, 110};
  EXPECT_DOUBLE_EQ(tradeagent::indicators::rocAt(closes, 2, 2), 10.0);

  std::vector<double> zero = {0, 1, 2};
  EXPECT_TRUE(std::isnan(tradeagent::indicators::rocAt(zero, 2, 2)));
}

// -----------------------------------------------------------------------------
// 5. MACD on a constant series is zero once both EMAs are defined.
// -----------------------------------------------------------------------------
TEST(IndicatorMathTest, MacdOfConstantSeriesIsZero) {
  std::vector<double> closes(10, 50.0);
  auto macd = tradeagent::indicators::macdSeries(closes, 2, 4);
  EXPECT_TRUE(std::isnan(macd[2]));
  EXPECT_DOUBLE_EQ(macd[3], 0.0);

  auto signal = tradeagent::indicators::macdSignalSeries(closes, 2, 4, 3);
  EXPECT_TRUE(std::isnan(signal[4]));
  EXPECT_DOUBLE_EQ(signal[5], 0.0);
}

// -----------------------------------------------------------------------------
// 6. Lookback covers current and previous values of the widest indicator.
// -----------------------------------------------------------------------------
TEST(IndicatorEngineTest, LookbackIsWidestRequirement) {
  tradeagent::IndicatorEngine engine({spec("sma_20", IndicatorKind::Sma, 20),
                                      spec("rsi_14", IndicatorKind::Rsi, 14)});
  EXPECT_EQ(engine.lookback(), 21u);

  IndicatorSpec macd_signal = spec("macd_signal", IndicatorKind::MacdSignal, 0);
  macd_signal.fast = 12;
  macd_signal.slow = 26;
  macd_signal.signal = 9;
  tradeagent::IndicatorEngine wide({macd_signal});
  EXPECT_EQ(wide.lookback(), 35u);

  tradeagent::IndicatorEngine empty(std::vector<IndicatorSpec>{});
  EXPECT_EQ(empty.lookback(), 2u);
}

// -----------------------------------------------------------------------------
// 7. compute() stamps the snapshot and fills current/previous values.
// Why: The evaluator's staleness check and crossover detection depend on
//      exactly these two fields.
// -----------------------------------------------------------------------------
TEST(IndicatorEngineTest, ComputeStampsSnapshot) {
  tradeagent::IndicatorEngine engine({spec("sma_2", IndicatorKind::Sma, 2)});
  auto history = barsFrom({10, 12, 14});

  auto snap = engine.compute("BTC-USDT", history);

  EXPECT_EQ(snap.instrument, "BTC-USDT");
  EXPECT_EQ(snap.sequence, 3u);
  EXPECT_EQ(snap.bar_timestamp_ms, 180000);

  const auto* close = snap.find("close");
  ASSERT_NE(close, nullptr);
  EXPECT_DOUBLE_EQ(close->current, 14.0);
  EXPECT_DOUBLE_EQ(close->previous, 12.0);

  const auto* sma = snap.find("sma_2");
  ASSERT_NE(sma, nullptr);
  EXPECT_DOUBLE_EQ(sma->current, 13.0);
  EXPECT_DOUBLE_EQ(sma->previous, 11.0);
}

// -----------------------------------------------------------------------------
// 8. Same history in, same snapshot out.
// -----------------------------------------------------------------------------
TEST(IndicatorEngineTest, ComputeIsDeterministic) {
  tradeagent::IndicatorEngine engine({spec("ema_3", IndicatorKind::Ema, 3),
                                      spec("rsi_3", IndicatorKind::Rsi, 3)});
  auto history = barsFrom({10, 11, 9, 12, 13, 12});

  auto a = engine.compute("ETH-USDT", history);
  auto b = engine.compute("ETH-USDT", history);

  for (const auto& [name, value] : a.values) {
    const auto* other = b.find(name);
    ASSERT_NE(other, nullptr) << name;
    EXPECT_DOUBLE_EQ(value.current, other->current) << name;
    EXPECT_DOUBLE_EQ(value.previous, other->previous) << name;
  }
}

// -----------------------------------------------------------------------------
// 9. Too little history throws InsufficientHistory with the requirement.
// -----------------------------------------------------------------------------
TEST(IndicatorEngineTest, ComputeRequiresLookback) {
  tradeagent::IndicatorEngine engine({spec("sma_5", IndicatorKind::Sma, 5)});
  auto history = barsFrom({1, 2, 3, 4, 5});

  try {
    engine.compute("BTC-USDT", history);
    FAIL() << "expected InsufficientHistory";
  } catch (const tradeagent::InsufficientHistory& e) {
    EXPECT_EQ(e.required(), 6u);
    EXPECT_EQ(e.available(), 5u);
  }
}

// -----------------------------------------------------------------------------
// 10. Invalid indicator sets are configuration errors.
// -----------------------------------------------------------------------------
TEST(IndicatorEngineTest, RejectsInvalidSpecs) {
  using tradeagent::ConfigError;
  using tradeagent::IndicatorEngine;

  EXPECT_THROW(IndicatorEngine({spec("close", IndicatorKind::Sma, 3)}),
               ConfigError);
  EXPECT_THROW(IndicatorEngine({spec("a", IndicatorKind::Sma, 3),
                                spec("a", IndicatorKind::Ema, 4)}),
               ConfigError);
  EXPECT_THROW(IndicatorEngine({spec("a", IndicatorKind::Rsi, 0)}),
               ConfigError);

  IndicatorSpec macd = spec("macd", IndicatorKind::Macd, 0);
  macd.fast = 26;
  macd.slow = 12;
  EXPECT_THROW(IndicatorEngine({macd}), ConfigError);

  tradeagent::IndicatorEngine ok({spec("a", IndicatorKind::Roc, 3)});
  EXPECT_TRUE(ok.defines("a"));
  EXPECT_TRUE(ok.defines("close"));
  EXPECT_FALSE(ok.defines("b"));
}
