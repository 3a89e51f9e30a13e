#pragma once

#include <cstddef>

namespace tradeagent {
namespace domain {

// -----------------------------------------------------------------------------
// InstrumentLimits: per-instrument pre-trade limits
// -----------------------------------------------------------------------------
struct InstrumentLimits {
  double max_position_size{1.0};   // Absolute quantity after the fill
  double max_notional{10000.0};    // size * price of a single order
};

// -----------------------------------------------------------------------------
// RiskLimits: account-wide limits
// -----------------------------------------------------------------------------
//
// @details
// max_gross_notional caps the sum of |size| * mark over all open positions
// plus the notional reserved by entries still in flight.
//
// max_drawdown is a floor on total realized PnL (a negative number). Once
// breached, PositionTracker trips its kill switch: new entries are denied,
// exits remain allowed.
// -----------------------------------------------------------------------------
struct RiskLimits {
  std::size_t max_open_positions{3};
  double max_gross_notional{50000.0};
  double max_drawdown{-1000.0};
};

}  // namespace domain
}  // namespace tradeagent
