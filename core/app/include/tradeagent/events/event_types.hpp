#pragma once

#include "tradeagent/domain/errors.hpp"
#include "tradeagent/domain/signal.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace tradeagent {

// -----------------------------------------------------------------------------
// Timestamp
// -----------------------------------------------------------------------------
// Wall-clock (or simulated) time attached to every reporting event. Produced
// from ITimeProvider::now_ms() via ms_to_timestamp().
// -----------------------------------------------------------------------------
using Timestamp = std::chrono::system_clock::time_point;

// -----------------------------------------------------------------------------
// SignalEvent
// -----------------------------------------------------------------------------
// Published by the scheduler for every actionable signal (after the mirrored
// state allowed the transition and before the order manager is called).
// HOLD and suppressed signals are not published.
// -----------------------------------------------------------------------------
struct SignalEvent {
  std::string instrument;
  domain::SignalType type{domain::SignalType::Hold};
  std::uint64_t sequence{0};
  std::string rule;
  double close{0.0};  // Close of the bar that produced the signal
  Timestamp timestamp{};
};

// -----------------------------------------------------------------------------
// RiskRejectEvent
// -----------------------------------------------------------------------------
// Published by OrderExecutionManager when PositionTracker::authorize() denies
// a signal. The signal is dropped; nothing reaches the exchange.
// -----------------------------------------------------------------------------
struct RiskRejectEvent {
  std::string instrument;
  domain::SignalType signal_type{domain::SignalType::Hold};
  std::uint64_t sequence{0};
  std::string reason;
  Timestamp timestamp{};
};

// -----------------------------------------------------------------------------
// CycleErrorEvent
// -----------------------------------------------------------------------------
// Published by the scheduler when an evaluation cycle for one instrument
// raised. The cycle is skipped; other instruments are unaffected.
// -----------------------------------------------------------------------------
struct CycleErrorEvent {
  std::string instrument;
  ErrorCode code{ErrorCode::InsufficientHistory};
  bool core_error{true};  // false when the exception was not a tradeagent::Error
  std::string message;
  Timestamp timestamp{};
};

// -----------------------------------------------------------------------------
// TradingResumedEvent
// -----------------------------------------------------------------------------
// Published by PositionTracker when an operator clears the kill switch.
// -----------------------------------------------------------------------------
struct TradingResumedEvent {
  std::string reason;
  double realized_pnl{0.0};  // Total realized PnL at the moment of resuming
  Timestamp timestamp{};
};

}  // namespace tradeagent
