#pragma once

#include "tradeagent/domain/instrument.hpp"
#include "tradeagent/domain/order.hpp"
#include "tradeagent/domain/risk_limits.hpp"

namespace tradeagent {
namespace config {

// One configured instrument: trading parameters, its risk limits and the
// order type used for its entries and exits.
struct InstrumentConfig {
  domain::Instrument instrument;
  domain::InstrumentLimits limits;
  domain::OrderType order_type{domain::OrderType::Market};
};

}  // namespace config
}  // namespace tradeagent
