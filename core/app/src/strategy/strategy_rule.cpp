#include "tradeagent/strategy/strategy_rule.hpp"

#include <cmath>

namespace tradeagent {
namespace strategy {

namespace {

bool defined(const domain::IndicatorValue* v, bool need_previous) {
  if (v == nullptr || std::isnan(v->current)) {
    return false;
  }
  return !need_previous || !std::isnan(v->previous);
}

// -----------------------------------------------------------------------------
// ConditionVisitor: one operator() per condition alternative
// -----------------------------------------------------------------------------
struct ConditionVisitor {
  const domain::IndicatorSnapshot& snapshot;
  const domain::Position& position;

  std::optional<bool> operator()(const CrossCondition& c) const {
    const auto* fast = snapshot.find(c.fast);
    const auto* slow = snapshot.find(c.slow);
    if (!defined(fast, true) || !defined(slow, true)) {
      return std::nullopt;
    }
    if (c.direction == Direction::Above) {
      return fast->previous <= slow->previous && fast->current > slow->current;
    }
    return fast->previous >= slow->previous && fast->current < slow->current;
  }

  std::optional<bool> operator()(const ThresholdCondition& c) const {
    const auto* v = snapshot.find(c.indicator);
    if (!defined(v, false)) {
      return std::nullopt;
    }
    return c.direction == Direction::Above ? v->current > c.level
                                           : v->current < c.level;
  }

  std::optional<bool> operator()(const CompareCondition& c) const {
    const auto* left = snapshot.find(c.left);
    const auto* right = snapshot.find(c.right);
    if (!defined(left, false) || !defined(right, false)) {
      return std::nullopt;
    }
    return c.direction == Direction::Above ? left->current > right->current
                                           : left->current < right->current;
  }

  std::optional<bool> operator()(const StopLossCondition& c) const {
    const auto* close = snapshot.find("close");
    if (!defined(close, false)) {
      return std::nullopt;
    }
    const double entry = position.average_entry_price;
    switch (position.side) {
      case domain::PositionSide::Long:
        return close->current <= entry * (1.0 - c.pct);
      case domain::PositionSide::Short:
        return close->current >= entry * (1.0 + c.pct);
      case domain::PositionSide::Flat:
        return false;
    }
    return false;
  }

  std::optional<bool> operator()(const TakeProfitCondition& c) const {
    const auto* close = snapshot.find("close");
    if (!defined(close, false)) {
      return std::nullopt;
    }
    const double entry = position.average_entry_price;
    switch (position.side) {
      case domain::PositionSide::Long:
        return close->current >= entry * (1.0 + c.pct);
      case domain::PositionSide::Short:
        return close->current <= entry * (1.0 - c.pct);
      case domain::PositionSide::Flat:
        return false;
    }
    return false;
  }
};

}  // namespace

std::vector<std::string> referencedIndicators(const Condition& condition) {
  if (const auto* c = std::get_if<CrossCondition>(&condition)) {
    return {c->fast, c->slow};
  }
  if (const auto* c = std::get_if<ThresholdCondition>(&condition)) {
    return {c->indicator};
  }
  if (const auto* c = std::get_if<CompareCondition>(&condition)) {
    return {c->left, c->right};
  }
  return {"close"};
}

std::optional<bool> holds(const Condition& condition,
                          const domain::IndicatorSnapshot& snapshot,
                          const domain::Position& position) {
  return std::visit(ConditionVisitor{snapshot, position}, condition);
}

const char* directionToString(Direction d) {
  return d == Direction::Above ? "above" : "below";
}

std::optional<Direction> directionFromString(const std::string& s) {
  if (s == "above") return Direction::Above;
  if (s == "below") return Direction::Below;
  return std::nullopt;
}

}  // namespace strategy
}  // namespace tradeagent
