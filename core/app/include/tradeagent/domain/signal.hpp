#pragma once

#include <cstdint>
#include <limits>
#include <map>
#include <string>

namespace tradeagent {
namespace domain {

enum class SignalType {
  EnterLong,
  EnterShort,
  Exit,
  Hold,
};

inline const char* signalTypeToString(SignalType t) {
  switch (t) {
    case SignalType::EnterLong:  return "ENTER_LONG";
    case SignalType::EnterShort: return "ENTER_SHORT";
    case SignalType::Exit:       return "EXIT";
    case SignalType::Hold:       return "HOLD";
  }
  return "HOLD";
}

inline bool isEntry(SignalType t) {
  return t == SignalType::EnterLong || t == SignalType::EnterShort;
}

// -----------------------------------------------------------------------------
// IndicatorValue
// -----------------------------------------------------------------------------
// current is the value at the newest bar, previous the value one bar earlier.
// Either may be NaN: NaN is the sentinel for "undefined" (warm-up, division
// by zero) and makes any rule that reads it evaluate to HOLD.
// -----------------------------------------------------------------------------
struct IndicatorValue {
  double current{std::numeric_limits<double>::quiet_NaN()};
  double previous{std::numeric_limits<double>::quiet_NaN()};
};

// -----------------------------------------------------------------------------
// IndicatorSnapshot: every configured indicator at one bar
// -----------------------------------------------------------------------------
//
// @brief  Immutable result of IndicatorEngine::compute().
//
// @details
// sequence and bar_timestamp_ms are copied from the newest bar of the history
// the snapshot was computed from. A snapshot is never updated in place; the
// next bar produces a new one with a strictly greater sequence.
//
// values is an ordered map so JSON telemetry and log lines list indicators
// in a stable order.
// -----------------------------------------------------------------------------
struct IndicatorSnapshot {
  std::string instrument;
  std::uint64_t sequence{0};
  std::int64_t bar_timestamp_ms{0};
  std::map<std::string, IndicatorValue> values;

  const IndicatorValue* find(const std::string& name) const {
    auto it = values.find(name);
    return it != values.end() ? &it->second : nullptr;
  }
};

// -----------------------------------------------------------------------------
// Signal: output of one evaluation
// -----------------------------------------------------------------------------
// sequence equals snapshot.sequence. The order manager derives the
// idempotency key from (instrument, sequence), so one snapshot can never
// produce two distinct orders.
// -----------------------------------------------------------------------------
struct Signal {
  std::string instrument;
  SignalType type{SignalType::Hold};
  std::uint64_t sequence{0};
  std::string rule;  // Name of the rule that fired; empty for HOLD
  IndicatorSnapshot snapshot;
};

}  // namespace domain
}  // namespace tradeagent
