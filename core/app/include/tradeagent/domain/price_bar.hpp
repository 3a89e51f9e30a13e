#pragma once

#include <cstdint>

namespace tradeagent {
namespace domain {

// -----------------------------------------------------------------------------
// PriceBar: one OHLCV candle
// -----------------------------------------------------------------------------
// sequence is assigned by MarketDataCache::append() and strictly increases
// per instrument. A bar that arrives from the feed carries sequence 0 until
// the cache stamps it. Every indicator snapshot inherits the sequence of the
// newest bar it was computed from.
// -----------------------------------------------------------------------------
struct PriceBar {
  std::int64_t timestamp_ms{0};  // Bar open time, epoch milliseconds
  double open{0.0};
  double high{0.0};
  double low{0.0};
  double close{0.0};
  double volume{0.0};
  std::uint64_t sequence{0};
};

}  // namespace domain
}  // namespace tradeagent
