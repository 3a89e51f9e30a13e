#pragma once

#include "tradeagent/domain/price_bar.hpp"
#include "tradeagent/time/simulation_time_provider.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace tradeagent {

struct DecodedBar {
  std::string instrument;
  domain::PriceBar bar;
};

// -----------------------------------------------------------------------------
// MarketDataGateway: ZeroMQ SUB bridge for the bar feed
// -----------------------------------------------------------------------------
//
// @brief  Receives JSON-encoded price bars on a SUB socket and hands each
//         decoded bar to a sink (ExecutionScheduler::onBar via TradingEngine).
//
// @details
// Expected message:
//   {
//     "instrument":   "BTC-USDT",
//     "timestamp_ms": 1700000000000,   // bar open time, epoch milliseconds
//     "open": 100.0, "high": 101.0, "low": 99.5, "close": 100.5,
//     "volume": 12.5                   // optional, defaults to 0
//   }
//
// Per message, in order:
//   1. decode; malformed payloads are logged and dropped
//   2. advance the simulation clock when one is attached, so that anything
//      reading now_ms() while this bar is processed sees the bar's time
//   3. sink(instrument, bar)
//
// The feed is at-least-once; a redelivered bar carries the same timestamp
// and replaces the newest cached bar instead of extending history.
//
// Thread model:
//   run() blocks the calling thread (MarketDataThread). stop() may be called
//   from any thread; the loop notices within kRecvTimeoutMs.
//
// Ownership:
//   Owns the zmq context and socket. Borrows the optional simulation clock.
// -----------------------------------------------------------------------------
class MarketDataGateway {
 public:
  using BarSink =
      std::function<void(const std::string& instrument, domain::PriceBar bar)>;

  MarketDataGateway(BarSink sink, const std::string& endpoint,
                    SimulationTimeProvider* sim_clock = nullptr);
  ~MarketDataGateway() = default;

  MarketDataGateway(const MarketDataGateway&) = delete;
  MarketDataGateway& operator=(const MarketDataGateway&) = delete;
  MarketDataGateway(MarketDataGateway&&) = delete;
  MarketDataGateway& operator=(MarketDataGateway&&) = delete;

  void run();
  void stop();

  // Decodes one feed message. std::nullopt (after logging the reason) when
  // the JSON is malformed, a field is missing, or the prices are not
  // positive and consistent (low <= open/close <= high).
  static std::optional<DecodedBar> parseBar(const std::string& payload);

  std::uint64_t received() const { return received_.load(); }
  std::uint64_t rejected() const { return rejected_.load(); }

 private:
  static constexpr int kRecvTimeoutMs = 100;

  BarSink sink_;
  SimulationTimeProvider* sim_clock_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> received_{0};
  std::atomic<std::uint64_t> rejected_{0};
};

}  // namespace tradeagent
