#pragma once

#include "tradeagent/time/i_time_provider.hpp"

namespace tradeagent {

// Wall-clock time from std::chrono::system_clock. Used when the engine trades
// live bars.
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace tradeagent
