#pragma once

#include "tradeagent/domain/order_status.hpp"
#include "tradeagent/domain/signal.hpp"

#include <cstdint>
#include <string>

namespace tradeagent {
namespace domain {

enum class Side {
  Buy,
  Sell,
};

enum class OrderType {
  Market,
  Limit,
};

inline const char* sideToString(Side s) {
  return s == Side::Buy ? "BUY" : "SELL";
}

inline const char* orderTypeToString(OrderType t) {
  return t == OrderType::Market ? "MARKET" : "LIMIT";
}

// -----------------------------------------------------------------------------
// OrderRequest: what is sent to the exchange
// -----------------------------------------------------------------------------
// price is the limit price for limit orders and the reference price (close of
// the signalling bar) for market orders. idempotency_key is identical on
// every retry of the same logical order.
// -----------------------------------------------------------------------------
struct OrderRequest {
  std::string instrument;
  Side side{Side::Buy};
  double size{0.0};
  OrderType type{OrderType::Market};
  double price{0.0};
  std::string idempotency_key;
};

// -----------------------------------------------------------------------------
// Order: the engine's record of one logical order
// -----------------------------------------------------------------------------
//
// @brief  Original intent plus lifecycle state and cumulative fills.
//
// @details
// Keyed by idempotency_key. OrderTracker holds exactly one row per key for
// the lifetime of the process; rows are never erased, so a repeated
// submission for an old key finds its row and does not reach the exchange
// again. Copies handed out through events are snapshots.
// -----------------------------------------------------------------------------
struct Order {
  std::string idempotency_key;
  std::string instrument;
  Side side{Side::Buy};
  double size{0.0};
  OrderType type{OrderType::Market};
  double price{0.0};
  std::int64_t submitted_at_ms{0};
  OrderStatus status{OrderStatus::Pending};
  double filled_quantity{0.0};
  double average_fill_price{0.0};
  std::string exchange_order_id;
  int attempts{0};
  std::string reject_reason;
  std::uint64_t signal_sequence{0};
  SignalType intent{SignalType::Hold};
};

inline OrderRequest toRequest(const Order& order) {
  OrderRequest request;
  request.instrument = order.instrument;
  request.side = order.side;
  request.size = order.size;
  request.type = order.type;
  request.price = order.price;
  request.idempotency_key = order.idempotency_key;
  return request;
}

}  // namespace domain
}  // namespace tradeagent
