#pragma once

#include "tradeagent/domain/order.hpp"

#include <cstdint>
#include <string>

namespace tradeagent {
namespace domain {

// -----------------------------------------------------------------------------
// FillEvent: one execution reported by the exchange
// -----------------------------------------------------------------------------
// Delivered at-least-once. fill_id is unique per execution on the exchange
// side; both OrderTracker and PositionTracker remember the ids they have
// applied and ignore repeats.
// -----------------------------------------------------------------------------
struct FillEvent {
  std::string fill_id;
  std::string idempotency_key;
  std::string instrument;
  Side side{Side::Buy};
  double quantity{0.0};
  double price{0.0};
  std::int64_t timestamp_ms{0};
};

}  // namespace domain
}  // namespace tradeagent
