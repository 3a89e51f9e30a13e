#include "tradeagent/indicators/indicator_engine.hpp"
#include "tradeagent/domain/errors.hpp"
#include "tradeagent/indicators/indicator_math.hpp"

#include <algorithm>
#include <set>
#include <utility>

namespace tradeagent {

// -----------------------------------------------------------------------------
// lookbackFor(): bars needed for current + previous value
// -----------------------------------------------------------------------------
std::size_t lookbackFor(const IndicatorSpec& spec) {
  switch (spec.kind) {
    case IndicatorKind::Close:
      return 2;
    case IndicatorKind::Sma:
    case IndicatorKind::Ema:
      return static_cast<std::size_t>(spec.period) + 1;
    case IndicatorKind::Rsi:
    case IndicatorKind::Roc:
      return static_cast<std::size_t>(spec.period) + 2;
    case IndicatorKind::Macd:
      return static_cast<std::size_t>(std::max(spec.fast, spec.slow)) + 1;
    case IndicatorKind::MacdSignal:
      return static_cast<std::size_t>(std::max(spec.fast, spec.slow)) +
             static_cast<std::size_t>(spec.signal);
  }
  return 2;
}

const char* indicatorKindToString(IndicatorKind kind) {
  switch (kind) {
    case IndicatorKind::Close:      return "close";
    case IndicatorKind::Sma:        return "sma";
    case IndicatorKind::Ema:        return "ema";
    case IndicatorKind::Rsi:        return "rsi";
    case IndicatorKind::Roc:        return "roc";
    case IndicatorKind::Macd:       return "macd";
    case IndicatorKind::MacdSignal: return "macd_signal";
  }
  return "close";
}

std::optional<IndicatorKind> indicatorKindFromString(const std::string& s) {
  if (s == "close") return IndicatorKind::Close;
  if (s == "sma") return IndicatorKind::Sma;
  if (s == "ema") return IndicatorKind::Ema;
  if (s == "rsi") return IndicatorKind::Rsi;
  if (s == "roc") return IndicatorKind::Roc;
  if (s == "macd") return IndicatorKind::Macd;
  if (s == "macd_signal") return IndicatorKind::MacdSignal;
  return std::nullopt;
}

IndicatorEngine::IndicatorEngine(std::vector<IndicatorSpec> specs)
    : specs_(std::move(specs)) {
  std::set<std::string> names;
  for (const auto& spec : specs_) {
    if (spec.name.empty() || spec.name == "close") {
      throw ConfigError("indicator name '" + spec.name + "' is reserved");
    }
    if (!names.insert(spec.name).second) {
      throw ConfigError("duplicate indicator name '" + spec.name + "'");
    }
    bool uses_period = spec.kind == IndicatorKind::Sma ||
                       spec.kind == IndicatorKind::Ema ||
                       spec.kind == IndicatorKind::Rsi ||
                       spec.kind == IndicatorKind::Roc;
    bool uses_macd = spec.kind == IndicatorKind::Macd ||
                     spec.kind == IndicatorKind::MacdSignal;
    if (uses_period && spec.period < 1) {
      throw ConfigError("indicator '" + spec.name + "' needs period >= 1");
    }
    if (uses_macd && (spec.fast < 1 || spec.slow < 1 || spec.signal < 1 ||
                      spec.fast >= spec.slow)) {
      throw ConfigError("indicator '" + spec.name +
                        "' needs 1 <= fast < slow and signal >= 1");
    }
    lookback_ = std::max(lookback_, lookbackFor(spec));
  }
}

bool IndicatorEngine::defines(const std::string& name) const {
  if (name == "close") {
    return true;
  }
  return std::any_of(specs_.begin(), specs_.end(),
                     [&name](const IndicatorSpec& s) { return s.name == name; });
}

// -----------------------------------------------------------------------------
// compute(): one snapshot per call, stamped with the newest bar
// -----------------------------------------------------------------------------
domain::IndicatorSnapshot IndicatorEngine::compute(
    const std::string& instrument,
    const std::vector<domain::PriceBar>& history) const {
  if (history.size() < lookback_) {
    throw InsufficientHistory(instrument, lookback_, history.size());
  }

  std::vector<double> closes;
  closes.reserve(history.size());
  for (const auto& bar : history) {
    closes.push_back(bar.close);
  }

  domain::IndicatorSnapshot snapshot;
  snapshot.instrument = instrument;
  snapshot.sequence = history.back().sequence;
  snapshot.bar_timestamp_ms = history.back().timestamp_ms;

  IndicatorSpec close_spec;
  close_spec.name = "close";
  snapshot.values["close"] = evaluate(close_spec, closes);

  for (const auto& spec : specs_) {
    snapshot.values[spec.name] = evaluate(spec, closes);
  }
  return snapshot;
}

domain::IndicatorValue IndicatorEngine::evaluate(
    const IndicatorSpec& spec, const std::vector<double>& closes) const {
  const std::size_t last = closes.size() - 1;
  domain::IndicatorValue v;

  switch (spec.kind) {
    case IndicatorKind::Close:
      v.current = closes[last];
      v.previous = closes[last - 1];
      break;
    case IndicatorKind::Sma:
      v.current = indicators::smaAt(closes, last, spec.period);
      v.previous = indicators::smaAt(closes, last - 1, spec.period);
      break;
    case IndicatorKind::Rsi:
      v.current = indicators::rsiAt(closes, last, spec.period);
      v.previous = indicators::rsiAt(closes, last - 1, spec.period);
      break;
    case IndicatorKind::Roc:
      v.current = indicators::rocAt(closes, last, spec.period);
      v.previous = indicators::rocAt(closes, last - 1, spec.period);
      break;
    case IndicatorKind::Ema: {
      auto series = indicators::emaSeries(closes, spec.period);
      v.current = series[last];
      v.previous = series[last - 1];
      break;
    }
    case IndicatorKind::Macd: {
      auto series = indicators::macdSeries(closes, spec.fast, spec.slow);
      v.current = series[last];
      v.previous = series[last - 1];
      break;
    }
    case IndicatorKind::MacdSignal: {
      auto series = indicators::macdSignalSeries(closes, spec.fast, spec.slow,
                                                 spec.signal);
      v.current = series[last];
      v.previous = series[last - 1];
      break;
    }
  }
  return v;
}

}  // namespace tradeagent
