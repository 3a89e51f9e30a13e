#pragma once

#include <cmath>
#include <string>

namespace tradeagent {
namespace domain {

// -----------------------------------------------------------------------------
// Instrument: static trading parameters for one tradable symbol
// -----------------------------------------------------------------------------
//
// @brief  Loaded once from configuration and never mutated afterwards.
//
// @details
// order_size is the quantity submitted on every entry signal. A value of 0
// means "one lot". The effective size is always rounded down to a whole
// multiple of lot_size; configuration validation rejects instruments whose
// effective size falls below min_order_size.
// -----------------------------------------------------------------------------
struct Instrument {
  std::string id;               // e.g. "BTC-USDT"
  double tick_size{0.01};       // Minimum price increment
  double lot_size{1.0};         // Minimum quantity increment
  double min_order_size{0.0};   // Exchange minimum per order
  double order_size{0.0};       // Quantity per entry; 0 = one lot
};

// Rounds q down to a whole number of lots. The epsilon keeps 0.3 / 0.1 from
// flooring to 2.
inline double roundToLot(double q, double lot_size) {
  if (lot_size <= 0.0) {
    return q;
  }
  double lots = std::floor(q / lot_size + 1e-9);
  return lots * lot_size;
}

inline double entryOrderSize(const Instrument& instrument) {
  double requested =
      instrument.order_size > 0.0 ? instrument.order_size : instrument.lot_size;
  return roundToLot(requested, instrument.lot_size);
}

}  // namespace domain
}  // namespace tradeagent
