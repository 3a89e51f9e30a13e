#pragma once

#include "tradeagent/domain/order.hpp"
#include "tradeagent/domain/position.hpp"

#include <vector>

namespace tradeagent {

// -----------------------------------------------------------------------------
// IReconciler: exchange state at startup
// -----------------------------------------------------------------------------
//
// @brief  Reports positions and orders that exist on the venue before the
//         engine starts, e.g. after a crash or a manual trade.
//
// @details
// TradingEngine::start() calls both methods once, on the calling thread,
// before fills are streamed or bars accepted. Positions are hydrated into
// PositionTracker and orders into OrderTracker, so that an order still open
// on the venue keeps its instrument busy and its fills find their row.
//
// Instruments that are not configured are logged and skipped.
//
// Ownership:
//   Non-owning pointer passed to start(); used only during start().
// -----------------------------------------------------------------------------
class IReconciler {
 public:
  virtual ~IReconciler() = default;

  virtual std::vector<domain::Position> reconcilePositions() = 0;

  // Orders the venue still considers open. Their idempotency keys must be
  // the keys the engine originally submitted.
  virtual std::vector<domain::Order> reconcileOrders() = 0;
};

}  // namespace tradeagent
