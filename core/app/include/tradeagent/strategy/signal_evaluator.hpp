#pragma once

#include "tradeagent/domain/position.hpp"
#include "tradeagent/domain/signal.hpp"
#include "tradeagent/strategy/strategy_rule.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tradeagent {

enum class EvaluationOutcome {
  Stale,        // sequence <= last evaluated; nothing else happened
  Hold,         // no rule fired
  Suppressed,   // a rule fired but the mirrored state forbids the transition
  Actionable,   // hand the signal to the order manager
};

const char* evaluationOutcomeToString(EvaluationOutcome outcome);

struct Evaluation {
  EvaluationOutcome outcome{EvaluationOutcome::Hold};
  domain::Signal signal;
};

// -----------------------------------------------------------------------------
// SignalEvaluator: per-instrument FLAT / LONG / SHORT state machine
// -----------------------------------------------------------------------------
//
// @brief  Turns an IndicatorSnapshot plus the current position into a Signal.
//
// @details
// The evaluator owns no position state. Its FLAT / LONG / SHORT state is the
// side of the Position passed in, which the caller reads from the
// PositionTracker right before evaluating. The only state the evaluator keeps
// is the last evaluated sequence per instrument.
//
// evaluate() runs three steps:
//   1. Stale guard: snapshot.sequence <= last evaluated sequence returns
//      Stale and changes nothing.
//   2. Rules: rules applicable to the current state are tried in order and
//      the first one whose conditions all hold decides. A condition that
//      reads a missing or NaN value does not hold, so its rule is skipped;
//      no match is HOLD.
//   3. The last evaluated sequence is updated, whatever the result.
//
// A fired signal is Actionable only when the state permits it:
// FLAT -> ENTER_LONG / ENTER_SHORT, LONG / SHORT -> EXIT. Everything else
// (ENTER_LONG while LONG, EXIT while FLAT, ...) is Suppressed and never
// reaches the order manager.
//
// Thread model:
//   Different instruments may be evaluated concurrently. Calls for one
//   instrument are expected to be serialized by its lane; the per-instrument
//   mutex still makes lastEvaluatedSequence() safe from other threads.
// -----------------------------------------------------------------------------
class SignalEvaluator {
 public:
  explicit SignalEvaluator(std::vector<strategy::StrategyRule> rules);

  SignalEvaluator(const SignalEvaluator&) = delete;
  SignalEvaluator& operator=(const SignalEvaluator&) = delete;

  Evaluation evaluate(const domain::IndicatorSnapshot& snapshot,
                      const domain::Position& position);

  // 0 when the instrument has never been evaluated.
  std::uint64_t lastEvaluatedSequence(const std::string& instrument) const;

  static bool transitionPermitted(domain::PositionSide state,
                                  domain::SignalType type);

  const std::vector<strategy::StrategyRule>& rules() const { return rules_; }

 private:
  struct InstrumentState {
    mutable std::mutex mutex;
    std::uint64_t last_sequence{0};
  };

  InstrumentState& stateFor(const std::string& instrument);

  std::vector<strategy::StrategyRule> rules_;

  mutable std::mutex states_mutex_;
  std::unordered_map<std::string, std::unique_ptr<InstrumentState>> states_;
};

}  // namespace tradeagent
