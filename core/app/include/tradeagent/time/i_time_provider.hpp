#pragma once

#include <cstdint>

namespace tradeagent {

// -----------------------------------------------------------------------------
// ITimeProvider: source of "now" for every time-dependent decision
// -----------------------------------------------------------------------------
//
// @brief  Returns epoch milliseconds.
//
// @details
// Order timestamps, the per-instrument entry cooldown and every reporting
// event read time through this interface, never from std::chrono directly.
// Replaying recorded bars through a SimulationTimeProvider therefore yields
// the same cooldown decisions as the live run did.
//
// Thread-safety: implementations must allow concurrent now_ms() calls.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  virtual std::int64_t now_ms() const = 0;
};

}  // namespace tradeagent
