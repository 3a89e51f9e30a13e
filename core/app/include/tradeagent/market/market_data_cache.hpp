#pragma once

#include "tradeagent/domain/price_bar.hpp"
#include "tradeagent/market/ring_buffer.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tradeagent {

enum class AppendResult {
  Appended,   // New bar, oldest evicted if the buffer was full
  Replaced,   // Same timestamp as the newest bar: in-progress candle update
  Stale,      // Older than the newest bar: discarded
};

// -----------------------------------------------------------------------------
// MarketDataCache: bounded per-instrument bar history
// -----------------------------------------------------------------------------
//
// @brief  Keeps the last `capacity` bars of every instrument and stamps each
//         accepted bar with a per-instrument sequence number.
//
// @details
// Sequence numbers start at 1 and strictly increase per instrument. A
// replacing bar (same timestamp as the newest one) also receives a fresh
// sequence number: the candle changed, so indicators computed from it are a
// new snapshot that supersedes the previous one.
//
// history(instrument, n) returns a copy. Readers never observe a partially
// appended bar and may keep the copy as long as they like.
//
// Locking:
//   series_mutex_ (shared) guards the instrument map; it is taken exclusively
//   only the first time an instrument is seen. Each Series has its own
//   shared_mutex so appends for BTC never block readers of ETH.
//
// Thread model:
//   One writer per instrument (its lane), any number of concurrent readers.
// -----------------------------------------------------------------------------
class MarketDataCache {
 public:
  explicit MarketDataCache(std::size_t capacity);

  MarketDataCache(const MarketDataCache&) = delete;
  MarketDataCache& operator=(const MarketDataCache&) = delete;

  // bar.sequence is ignored on input; on success the stamped sequence is
  // written back through `assigned` when provided.
  AppendResult append(const std::string& instrument, domain::PriceBar bar,
                      std::uint64_t* assigned = nullptr);

  // Throws InsufficientHistory when fewer than n bars are cached.
  std::vector<domain::PriceBar> history(const std::string& instrument,
                                        std::size_t n) const;

  std::optional<domain::PriceBar> latest(const std::string& instrument) const;

  std::size_t size(const std::string& instrument) const;

  std::size_t capacity() const { return capacity_; }

 private:
  struct Series {
    explicit Series(std::size_t capacity) : bars(capacity) {}

    mutable std::shared_mutex mutex;
    RingBuffer<domain::PriceBar> bars;
    std::uint64_t next_sequence{1};
  };

  Series* find(const std::string& instrument) const;
  Series& findOrCreate(const std::string& instrument);

  std::size_t capacity_;
  mutable std::shared_mutex series_mutex_;
  std::unordered_map<std::string, std::unique_ptr<Series>> series_;
};

}  // namespace tradeagent
