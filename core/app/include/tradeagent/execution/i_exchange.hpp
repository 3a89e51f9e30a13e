#pragma once

#include "tradeagent/domain/fill.hpp"
#include "tradeagent/domain/order.hpp"

#include <functional>
#include <future>
#include <string>

namespace tradeagent {

enum class PlaceStatus {
  Acked,           // Exchange accepted the order
  Rejected,        // Exchange refused it; terminal, never retried
  TransportError,  // Request did not make it; safe to retry with the same key
};

struct PlaceResult {
  PlaceStatus status{PlaceStatus::TransportError};
  std::string exchange_order_id;
  std::string reason;
};

using FillHandler = std::function<void(const domain::FillEvent&)>;

// -----------------------------------------------------------------------------
// IExchange: order entry and execution feed of one venue
// -----------------------------------------------------------------------------
//
// @brief  The two capabilities the engine needs from a venue.
//
// @details
// placeOrder() must return immediately. The future becomes ready when the
// venue acks, rejects or the transport fails; it may also never become
// ready (a lost ack), which the caller detects with its own timeout.
// Implementations must treat idempotency_key as the client order id: placing
// the same key twice must not create a second order on the venue.
//
// streamFills() installs the handler that receives executions. Fills are
// delivered at-least-once and may arrive before the corresponding ack.
// The handler may be invoked on any thread. Installing an empty handler
// detaches the previous one; after streamFills() returns the old handler is
// never called again.
//
// Ownership:
//   The exchange is owned outside TradingEngine and outlives it.
// -----------------------------------------------------------------------------
class IExchange {
 public:
  virtual ~IExchange() = default;

  virtual std::future<PlaceResult> placeOrder(
      const domain::OrderRequest& request) = 0;

  virtual void streamFills(FillHandler handler) = 0;
};

}  // namespace tradeagent
