#pragma once

#include "tradeagent/domain/fill.hpp"
#include "tradeagent/domain/order.hpp"
#include "tradeagent/domain/order_status.hpp"
#include "tradeagent/eventbus/event_bus.hpp"
#include "tradeagent/time/i_time_provider.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace tradeagent {

enum class Registration {
  Created,         // New row stored as Pending
  Exists,          // A row with this key already exists; returned unchanged
  InstrumentBusy,  // Another open order blocks the instrument; returned
};

struct RegisterResult {
  Registration outcome{Registration::Created};
  domain::Order order;
};

enum class FillOutcome {
  Applied,
  Duplicate,     // fill_id seen before: nothing changed
  UnknownOrder,  // No row for the fill's idempotency key
};

struct FillRecord {
  FillOutcome outcome{FillOutcome::Applied};
  domain::Order order;  // Row after the fill (Applied) or as is (Duplicate)
};

// -----------------------------------------------------------------------------
// OrderTracker: order book keyed by idempotency key
// -----------------------------------------------------------------------------
//
// @brief  Holds one row per idempotency key for the process lifetime,
//         enforces the order state machine and remembers applied fill ids.
//
// @details
// registerOrder() is the single gate for new orders. Under one lock it
// checks that the key is new and that the instrument has no open order
// (Pending, Acked, PartiallyFilled or Unknown), then stores the row.
//
// Every state change goes through transitionStatus(). An illegal transition
// is logged and ignored; the row keeps its state, so states only ever move
// forward along the graph documented in order_status.hpp.
//
// recordFill() accumulates quantity and the volume-weighted fill price and
// moves the row to PartiallyFilled or Filled when that transition is legal.
// A fill for a row that is already terminal (a late fill after a cancel, or
// an overfill) is still accumulated, because the exchange says it happened,
// but the state stays where it is.
//
// Rows are never erased. Terminal rows simply stop blocking their
// instrument.
//
// Thread model:
//   All public methods are safe from any thread. OrderUpdateEvent is
//   published after the lock is released.
// -----------------------------------------------------------------------------
class OrderTracker {
 public:
  OrderTracker(EventBus& bus, const ITimeProvider& clock);

  OrderTracker(const OrderTracker&) = delete;
  OrderTracker& operator=(const OrderTracker&) = delete;
  OrderTracker(OrderTracker&&) = delete;
  OrderTracker& operator=(OrderTracker&&) = delete;

  RegisterResult registerOrder(const domain::Order& order);

  // Returns false if the key is unknown or the transition illegal.
  bool transition(const std::string& key, domain::OrderStatus next,
                  const std::string& reason = {});

  // Returns the new attempt count, 0 for an unknown key.
  int recordAttempt(const std::string& key);

  void setExchangeOrderId(const std::string& key,
                          const std::string& exchange_order_id);

  FillRecord recordFill(const domain::FillEvent& fill);

  std::optional<domain::Order> find(const std::string& key) const;
  std::optional<domain::Order> openOrder(const std::string& instrument) const;

  // All rows in submission order.
  std::vector<domain::Order> orders() const;
  std::vector<domain::Order> unknownOrders() const;

  // Inserts a row reported by the exchange at startup. Open rows block
  // their instrument like any other.
  void hydrateOrder(const domain::Order& order);

  static bool transitionStatus(domain::OrderStatus current,
                               domain::OrderStatus next);

  static bool isOpen(domain::OrderStatus status) {
    return !domain::isTerminal(status);
  }

 private:
  void publishUpdate(const domain::Order& order,
                     domain::OrderStatus previous);

  EventBus& bus_;
  const ITimeProvider& clock_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, domain::Order> orders_;
  std::vector<std::string> submission_order_;
  std::unordered_map<std::string, std::string> open_by_instrument_;
  std::unordered_set<std::string> applied_fills_;
};

}  // namespace tradeagent
