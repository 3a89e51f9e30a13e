#include "tradeagent/strategy/signal_evaluator.hpp"

#include <utility>

namespace tradeagent {

const char* evaluationOutcomeToString(EvaluationOutcome outcome) {
  switch (outcome) {
    case EvaluationOutcome::Stale:      return "stale";
    case EvaluationOutcome::Hold:       return "hold";
    case EvaluationOutcome::Suppressed: return "suppressed";
    case EvaluationOutcome::Actionable: return "actionable";
  }
  return "hold";
}

SignalEvaluator::SignalEvaluator(std::vector<strategy::StrategyRule> rules)
    : rules_(std::move(rules)) {}

SignalEvaluator::InstrumentState& SignalEvaluator::stateFor(
    const std::string& instrument) {
  std::lock_guard lock(states_mutex_);
  auto& slot = states_[instrument];
  if (!slot) {
    slot = std::make_unique<InstrumentState>();
  }
  return *slot;
}

bool SignalEvaluator::transitionPermitted(domain::PositionSide state,
                                          domain::SignalType type) {
  using domain::PositionSide;
  using domain::SignalType;
  switch (state) {
    case PositionSide::Flat:
      return type == SignalType::EnterLong || type == SignalType::EnterShort;
    case PositionSide::Long:
    case PositionSide::Short:
      return type == SignalType::Exit;
  }
  return false;
}

// -----------------------------------------------------------------------------
// evaluate(): stale guard, rules, sequence update
// -----------------------------------------------------------------------------
Evaluation SignalEvaluator::evaluate(const domain::IndicatorSnapshot& snapshot,
                                     const domain::Position& position) {
  InstrumentState& state = stateFor(snapshot.instrument);
  std::lock_guard lock(state.mutex);

  Evaluation result;
  result.signal.instrument = snapshot.instrument;
  result.signal.sequence = snapshot.sequence;
  result.signal.snapshot = snapshot;

  if (snapshot.sequence <= state.last_sequence) {
    result.outcome = EvaluationOutcome::Stale;
    return result;
  }
  state.last_sequence = snapshot.sequence;

  const strategy::StrategyRule* fired = nullptr;
  for (const auto& rule : rules_) {
    if (rule.when && *rule.when != position.side) {
      continue;
    }
    bool all = true;
    for (const auto& condition : rule.conditions) {
      // An undefined input (NaN or missing) fails only this rule.
      std::optional<bool> ok = strategy::holds(condition, snapshot, position);
      if (!ok || !*ok) {
        all = false;
        break;
      }
    }
    if (all) {
      fired = &rule;
      break;
    }
  }

  if (fired == nullptr || fired->action == domain::SignalType::Hold) {
    result.outcome = EvaluationOutcome::Hold;
    return result;
  }

  result.signal.type = fired->action;
  result.signal.rule = fired->name;
  result.outcome = transitionPermitted(position.side, fired->action)
                       ? EvaluationOutcome::Actionable
                       : EvaluationOutcome::Suppressed;
  return result;
}

std::uint64_t SignalEvaluator::lastEvaluatedSequence(
    const std::string& instrument) const {
  const InstrumentState* state = nullptr;
  {
    std::lock_guard lock(states_mutex_);
    auto it = states_.find(instrument);
    if (it == states_.end()) {
      return 0;
    }
    state = it->second.get();
  }
  std::lock_guard lock(state->mutex);
  return state->last_sequence;
}

}  // namespace tradeagent
