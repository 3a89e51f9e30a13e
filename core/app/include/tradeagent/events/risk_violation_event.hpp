#pragma once

#include "tradeagent/events/event_types.hpp"

#include <string>

namespace tradeagent {

// -----------------------------------------------------------------------------
// RiskViolationEvent: kill switch tripped
// -----------------------------------------------------------------------------
// Published once when PositionTracker halts entries, either because total
// realized PnL fell below RiskLimits::max_drawdown or because an operator
// sent HALT. instrument is the one whose fill breached the floor (empty for
// an operator halt).
// -----------------------------------------------------------------------------
struct RiskViolationEvent {
  std::string instrument;
  std::string reason;
  double current_value{0.0};
  double limit_value{0.0};
  Timestamp timestamp{};
};

}  // namespace tradeagent
