#include "tradeagent/network/market_data_thread.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace tradeagent {

MarketDataThread::MarketDataThread(MarketDataGateway::BarSink sink,
                                   std::string endpoint,
                                   SimulationTimeProvider* sim_clock)
    : sink_(std::move(sink)),
      endpoint_(std::move(endpoint)),
      sim_clock_(sim_clock) {}

MarketDataThread::~MarketDataThread() { stop(); }

void MarketDataThread::start() {
  if (thread_.joinable()) {
    return;
  }

  gateway_ = std::make_unique<MarketDataGateway>(sink_, endpoint_, sim_clock_);

  thread_ = std::thread([this] {
    std::cout << "[MarketDataThread] listening on " << endpoint_ << "\n";
    try {
      gateway_->run();
    } catch (const std::exception& e) {
      std::cerr << "[MarketDataThread] recv loop failed: " << e.what()
                << "\n";
      return;
    }
    std::cout << "[MarketDataThread] recv loop exited. received="
              << gateway_->received() << " rejected=" << gateway_->rejected()
              << "\n";
  });
}

void MarketDataThread::stop() {
  if (gateway_) {
    gateway_->stop();
  }
  if (thread_.joinable()) {
    thread_.join();
  }
  gateway_.reset();
}

}  // namespace tradeagent
