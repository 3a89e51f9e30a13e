#pragma once

#include "tradeagent/events/event_types.hpp"
#include "tradeagent/events/order_update_event.hpp"
#include "tradeagent/events/position_update_event.hpp"
#include "tradeagent/events/risk_violation_event.hpp"

#include <variant>

namespace tradeagent {

// Every reporting event the engine publishes on its EventBus.
using Event = std::variant<
    SignalEvent,
    OrderUpdateEvent,
    PositionUpdateEvent,
    RiskRejectEvent,
    RiskViolationEvent,
    TradingResumedEvent,
    CycleErrorEvent>;

}  // namespace tradeagent
