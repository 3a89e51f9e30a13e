#pragma once

#include <string>

namespace tradeagent {
namespace domain {

enum class PositionSide {
  Flat,
  Long,
  Short,
};

inline const char* positionSideToString(PositionSide s) {
  switch (s) {
    case PositionSide::Flat:  return "FLAT";
    case PositionSide::Long:  return "LONG";
    case PositionSide::Short: return "SHORT";
  }
  return "FLAT";
}

// -----------------------------------------------------------------------------
// Position: per-instrument holding
// -----------------------------------------------------------------------------
//
// @brief  Side, unsigned size, average entry price and realized PnL for one
//         instrument.
//
// @details
// size is always >= 0 and side carries the direction; side == Flat implies
// size == 0. average_entry_price is the weighted cost of the open quantity;
// it is kept unchanged by reducing fills and reset to the fill price when a
// fill flips the position through zero.
//
// Unrealized PnL is not stored. It depends on the mark price, which only the
// PositionTracker knows, and is derived on demand with unrealizedPnl().
//
// Thread model:
//   Value type. The authoritative copy lives inside PositionTracker behind a
//   per-instrument mutex; everything else receives copies.
// -----------------------------------------------------------------------------
struct Position {
  std::string instrument;
  PositionSide side{PositionSide::Flat};
  double size{0.0};
  double average_entry_price{0.0};
  double realized_pnl{0.0};
};

inline double signedQuantity(const Position& p) {
  switch (p.side) {
    case PositionSide::Long:  return p.size;
    case PositionSide::Short: return -p.size;
    case PositionSide::Flat:  return 0.0;
  }
  return 0.0;
}

inline double unrealizedPnl(const Position& p, double mark_price) {
  return signedQuantity(p) * (mark_price - p.average_entry_price);
}

}  // namespace domain
}  // namespace tradeagent
