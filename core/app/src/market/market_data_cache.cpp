#include "tradeagent/market/market_data_cache.hpp"
#include "tradeagent/domain/errors.hpp"

#include <iostream>
#include <mutex>
#include <stdexcept>

namespace tradeagent {

MarketDataCache::MarketDataCache(std::size_t capacity) : capacity_(capacity) {
  if (capacity_ == 0) {
    throw std::invalid_argument("MarketDataCache capacity must be > 0");
  }
}

MarketDataCache::Series* MarketDataCache::find(
    const std::string& instrument) const {
  std::shared_lock lock(series_mutex_);
  auto it = series_.find(instrument);
  return it != series_.end() ? it->second.get() : nullptr;
}

MarketDataCache::Series& MarketDataCache::findOrCreate(
    const std::string& instrument) {
  if (Series* s = find(instrument)) {
    return *s;
  }
  std::unique_lock lock(series_mutex_);
  auto& slot = series_[instrument];
  if (!slot) {
    slot = std::make_unique<Series>(capacity_);
  }
  return *slot;
}

// -----------------------------------------------------------------------------
// append(): stamp, then append / replace / discard
// -----------------------------------------------------------------------------
AppendResult MarketDataCache::append(const std::string& instrument,
                                     domain::PriceBar bar,
                                     std::uint64_t* assigned) {
  Series& series = findOrCreate(instrument);
  std::unique_lock lock(series.mutex);

  AppendResult result = AppendResult::Appended;
  if (!series.bars.empty()) {
    const domain::PriceBar& newest = series.bars.back();
    if (bar.timestamp_ms < newest.timestamp_ms) {
      std::cerr << "[MarketDataCache] stale bar for " << instrument
                << " ts=" << bar.timestamp_ms
                << " newest=" << newest.timestamp_ms << " discarded\n";
      return AppendResult::Stale;
    }
    if (bar.timestamp_ms == newest.timestamp_ms) {
      result = AppendResult::Replaced;
    }
  }

  bar.sequence = series.next_sequence++;
  if (assigned != nullptr) {
    *assigned = bar.sequence;
  }

  if (result == AppendResult::Replaced) {
    series.bars.back() = bar;
  } else {
    series.bars.push_back(bar);
  }
  return result;
}

std::vector<domain::PriceBar> MarketDataCache::history(
    const std::string& instrument, std::size_t n) const {
  Series* series = find(instrument);
  if (series == nullptr) {
    throw InsufficientHistory(instrument, n, 0);
  }

  std::shared_lock lock(series->mutex);
  if (series->bars.size() < n) {
    throw InsufficientHistory(instrument, n, series->bars.size());
  }
  return series->bars.last(n);
}

std::optional<domain::PriceBar> MarketDataCache::latest(
    const std::string& instrument) const {
  Series* series = find(instrument);
  if (series == nullptr) {
    return std::nullopt;
  }
  std::shared_lock lock(series->mutex);
  if (series->bars.empty()) {
    return std::nullopt;
  }
  return series->bars.back();
}

std::size_t MarketDataCache::size(const std::string& instrument) const {
  Series* series = find(instrument);
  if (series == nullptr) {
    return 0;
  }
  std::shared_lock lock(series->mutex);
  return series->bars.size();
}

}  // namespace tradeagent
