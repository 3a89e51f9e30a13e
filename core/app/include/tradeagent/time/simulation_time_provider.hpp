#pragma once

#include "tradeagent/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace tradeagent {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: clock driven by the bar feed
// -----------------------------------------------------------------------------
//
// @brief  now_ms() returns the newest bar timestamp seen so far.
//
// @details
// MarketDataGateway calls advance_time() with each bar's timestamp before
// handing the bar to the scheduler, so the cooldown and order timestamps
// follow data time during a replay.
//
// The clock never moves backwards: advance_time() with an older value is
// ignored. Stale or replaced bars from the feed therefore cannot rewind the
// cooldown window.
//
// Thread model:
//   advance_time() from the gateway thread, now_ms() from any thread. Both
//   are lock-free atomics.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  explicit SimulationTimeProvider(std::int64_t start_ms = 0)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  void advance_time(std::int64_t new_time_ms);

  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_;
};

}  // namespace tradeagent
