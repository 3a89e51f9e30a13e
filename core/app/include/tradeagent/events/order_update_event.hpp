#pragma once

#include "tradeagent/domain/order.hpp"
#include "tradeagent/domain/order_status.hpp"
#include "tradeagent/events/event_types.hpp"

namespace tradeagent {

// -----------------------------------------------------------------------------
// OrderUpdateEvent: order state change notification
// -----------------------------------------------------------------------------
//
// @brief  Published by OrderTracker after every accepted state transition and
//         after every applied fill.
//
// @details
// order is a snapshot taken after the change. previous_status equals
// order.status when the event reports an additional fill that did not move
// the state (PartiallyFilled -> PartiallyFilled).
//
// Consumers:
//   - IpcServer: forwards as JSON telemetry; orders entering UNKNOWN are
//     flagged for operator reconciliation.
// -----------------------------------------------------------------------------
struct OrderUpdateEvent {
  domain::Order order;
  domain::OrderStatus previous_status{domain::OrderStatus::Pending};
  Timestamp timestamp{};
};

}  // namespace tradeagent
