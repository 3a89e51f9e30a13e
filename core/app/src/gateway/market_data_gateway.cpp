#include "tradeagent/gateway/market_data_gateway.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <utility>

namespace tradeagent {

MarketDataGateway::MarketDataGateway(BarSink sink, const std::string& endpoint,
                                     SimulationTimeProvider* sim_clock)
    : sink_(std::move(sink)), sim_clock_(sim_clock) {
  socket_.set(zmq::sockopt::subscribe, "");
  // Without a receive timeout recv() never returns on a quiet feed and
  // stop() would hang.
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.connect(endpoint);
}

// -----------------------------------------------------------------------------
// run(): blocking recv loop
// -----------------------------------------------------------------------------
void MarketDataGateway::run() {
  running_.store(true);

  while (running_.load()) {
    zmq::message_t msg;
    zmq::recv_result_t result;
    try {
      result = socket_.recv(msg, zmq::recv_flags::none);
    } catch (const zmq::error_t& e) {
      if (e.num() == EINTR) {
        continue;
      }
      throw;
    }
    if (!result.has_value()) {
      continue;
    }

    received_.fetch_add(1);
    auto decoded = parseBar(msg.to_string());
    if (!decoded) {
      rejected_.fetch_add(1);
      continue;
    }

    if (sim_clock_ != nullptr) {
      sim_clock_->advance_time(decoded->bar.timestamp_ms);
    }
    sink_(decoded->instrument, decoded->bar);
  }
}

void MarketDataGateway::stop() { running_.store(false); }

// -----------------------------------------------------------------------------
// parseBar(): JSON -> (instrument, PriceBar)
// -----------------------------------------------------------------------------
std::optional<DecodedBar> MarketDataGateway::parseBar(
    const std::string& payload) {
  DecodedBar out;
  try {
    auto json = nlohmann::json::parse(payload);
    out.instrument = json.at("instrument").get<std::string>();
    out.bar.timestamp_ms = json.at("timestamp_ms").get<std::int64_t>();
    out.bar.open = json.at("open").get<double>();
    out.bar.high = json.at("high").get<double>();
    out.bar.low = json.at("low").get<double>();
    out.bar.close = json.at("close").get<double>();
    out.bar.volume = json.value("volume", 0.0);
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[MarketDataGateway] JSON error: " << e.what()
              << " payload: " << payload << "\n";
    return std::nullopt;
  }

  const auto& b = out.bar;
  bool finite = std::isfinite(b.open) && std::isfinite(b.high) &&
                std::isfinite(b.low) && std::isfinite(b.close) &&
                std::isfinite(b.volume);
  if (out.instrument.empty() || !finite || b.low <= 0.0 || b.high < b.low ||
      b.open < b.low || b.open > b.high || b.close < b.low ||
      b.close > b.high || b.volume < 0.0) {
    std::cerr << "[MarketDataGateway] inconsistent bar dropped: " << payload
              << "\n";
    return std::nullopt;
  }
  return out;
}

}  // namespace tradeagent
