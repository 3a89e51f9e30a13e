#pragma once

#include <optional>
#include <string>

namespace tradeagent {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus: lifecycle of a submitted order
// -----------------------------------------------------------------------------
//
// @brief  Each value is a stage in the order's life, from creation to a
//         terminal outcome.
//
// @details
// Allowed transitions (enforced by OrderTracker::transitionStatus):
//
//   Pending ──► Acked ──► PartiallyFilled ──► Filled
//     │           │              │
//     │           └──────────────┴──► Cancelled
//     ├──► PartiallyFilled / Filled   (fill arrived before the ack)
//     ├──► Rejected
//     └──► Unknown ──► Acked / PartiallyFilled / Filled / Rejected / Cancelled
//
// Unknown means the exchange never confirmed the order within the retry
// budget. It still counts as open: it blocks new submissions for the
// instrument until a late exchange event or the operator resolves it.
//
// Terminal states: Filled, Rejected, Cancelled.
// -----------------------------------------------------------------------------
enum class OrderStatus {
  Pending,
  Acked,
  PartiallyFilled,
  Filled,
  Rejected,
  Cancelled,
  Unknown,
};

inline bool isTerminal(OrderStatus s) {
  return s == OrderStatus::Filled || s == OrderStatus::Rejected ||
         s == OrderStatus::Cancelled;
}

inline const char* orderStatusToString(OrderStatus s) {
  switch (s) {
    case OrderStatus::Pending:         return "PENDING";
    case OrderStatus::Acked:           return "ACKED";
    case OrderStatus::PartiallyFilled: return "PARTIALLY_FILLED";
    case OrderStatus::Filled:          return "FILLED";
    case OrderStatus::Rejected:        return "REJECTED";
    case OrderStatus::Cancelled:       return "CANCELLED";
    case OrderStatus::Unknown:         return "UNKNOWN";
  }
  return "UNKNOWN";
}

inline std::optional<OrderStatus> orderStatusFromString(const std::string& s) {
  if (s == "PENDING") return OrderStatus::Pending;
  if (s == "ACKED") return OrderStatus::Acked;
  if (s == "PARTIALLY_FILLED") return OrderStatus::PartiallyFilled;
  if (s == "FILLED") return OrderStatus::Filled;
  if (s == "REJECTED") return OrderStatus::Rejected;
  if (s == "CANCELLED") return OrderStatus::Cancelled;
  if (s == "UNKNOWN") return OrderStatus::Unknown;
  return std::nullopt;
}

}  // namespace domain
}  // namespace tradeagent
