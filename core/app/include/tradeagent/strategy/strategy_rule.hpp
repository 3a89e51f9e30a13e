#pragma once

#include "tradeagent/domain/position.hpp"
#include "tradeagent/domain/signal.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tradeagent {
namespace strategy {

enum class Direction {
  Above,
  Below,
};

// fast crosses slow between the previous and the current bar.
struct CrossCondition {
  std::string fast;
  std::string slow;
  Direction direction{Direction::Above};
};

// indicator.current is strictly above / below level.
struct ThresholdCondition {
  std::string indicator;
  Direction direction{Direction::Above};
  double level{0.0};
};

// left.current is strictly above / below right.current.
struct CompareCondition {
  std::string left;
  std::string right;
  Direction direction{Direction::Below};
};

// Close moved against the open position by at least pct of the entry price.
struct StopLossCondition {
  double pct{0.03};
};

// Close moved in favour of the open position by at least pct.
struct TakeProfitCondition {
  double pct{0.06};
};

using Condition = std::variant<CrossCondition, ThresholdCondition,
                               CompareCondition, StopLossCondition,
                               TakeProfitCondition>;

// -----------------------------------------------------------------------------
// StrategyRule
// -----------------------------------------------------------------------------
// Fires `action` when every condition holds and the mirrored position side
// equals `when` (a rule without `when` applies in every state). Rules are
// tried in configuration order; the first one that fires decides the signal.
// -----------------------------------------------------------------------------
struct StrategyRule {
  std::string name;
  std::optional<domain::PositionSide> when;
  std::vector<Condition> conditions;
  domain::SignalType action{domain::SignalType::Hold};
};

// Names of every indicator a condition reads. Stop-loss and take-profit read
// "close".
std::vector<std::string> referencedIndicators(const Condition& condition);

// std::nullopt when a referenced value is missing or NaN.
std::optional<bool> holds(const Condition& condition,
                          const domain::IndicatorSnapshot& snapshot,
                          const domain::Position& position);

const char* directionToString(Direction d);
std::optional<Direction> directionFromString(const std::string& s);

}  // namespace strategy
}  // namespace tradeagent
