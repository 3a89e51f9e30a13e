#pragma once

#include "tradeagent/domain/price_bar.hpp"
#include "tradeagent/domain/signal.hpp"
#include "tradeagent/indicators/indicator_spec.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace tradeagent {

// -----------------------------------------------------------------------------
// IndicatorEngine: bar history to IndicatorSnapshot
// -----------------------------------------------------------------------------
//
// @brief  Evaluates every configured indicator over a chronological bar
//         history and returns one immutable snapshot.
//
// @details
// The engine holds only the immutable spec list. compute() is const, keeps
// no state between calls and may run concurrently for different instruments.
//
// lookback() is the number of bars the slowest indicator needs to produce its
// current and previous value. Callers pass at least that many bars; compute()
// throws InsufficientHistory otherwise. More bars are accepted and give the
// EMA based indicators a longer warm-up.
//
// The snapshot always contains "close" in addition to the configured
// indicators, because stop-loss and take-profit rules compare against it.
// -----------------------------------------------------------------------------
class IndicatorEngine {
 public:
  // Throws ConfigError on duplicate names, the reserved name "close", or
  // non-positive periods.
  explicit IndicatorEngine(std::vector<IndicatorSpec> specs);

  domain::IndicatorSnapshot compute(
      const std::string& instrument,
      const std::vector<domain::PriceBar>& history) const;

  std::size_t lookback() const { return lookback_; }

  const std::vector<IndicatorSpec>& specs() const { return specs_; }

  // True for "close" and every configured name.
  bool defines(const std::string& name) const;

 private:
  domain::IndicatorValue evaluate(const IndicatorSpec& spec,
                                  const std::vector<double>& closes) const;

  std::vector<IndicatorSpec> specs_;
  std::size_t lookback_{2};
};

}  // namespace tradeagent
