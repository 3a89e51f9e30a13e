#pragma once

#include "tradeagent/domain/position.hpp"
#include "tradeagent/events/event_types.hpp"

namespace tradeagent {

// Published by PositionTracker after every applied (non-duplicate) fill.
struct PositionUpdateEvent {
  domain::Position position;  // Snapshot after the fill
  double mark_price{0.0};
  Timestamp timestamp{};
};

}  // namespace tradeagent
