#include "tradeagent/config/engine_config.hpp"
#include "tradeagent/domain/errors.hpp"
#include "tradeagent/indicators/indicator_engine.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <optional>
#include <set>
#include <sstream>
#include <utility>
#include <variant>

namespace tradeagent {
namespace config {

namespace {

using nlohmann::json;
using domain::PositionSide;
using domain::SignalType;
using strategy::Direction;

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::chrono::milliseconds millis(const json& j, const char* key,
                                 std::chrono::milliseconds fallback) {
  return std::chrono::milliseconds{j.value(key, static_cast<std::int64_t>(fallback.count()))};
}

// -----------------------------------------------------------------------------
// Enum parsing
// -----------------------------------------------------------------------------
domain::OrderType parseOrderType(const std::string& s) {
  std::string v = lower(s);
  if (v == "market") return domain::OrderType::Market;
  if (v == "limit") return domain::OrderType::Limit;
  throw ConfigError("unknown order_type '" + s + "'");
}

std::optional<PositionSide> parseWhen(const std::string& s) {
  std::string v = lower(s);
  if (v == "any") return std::nullopt;
  if (v == "flat") return PositionSide::Flat;
  if (v == "long") return PositionSide::Long;
  if (v == "short") return PositionSide::Short;
  throw ConfigError("unknown rule state '" + s + "'");
}

SignalType parseAction(const std::string& s) {
  std::string v = lower(s);
  if (v == "enter_long") return SignalType::EnterLong;
  if (v == "enter_short") return SignalType::EnterShort;
  if (v == "exit") return SignalType::Exit;
  throw ConfigError("unknown rule action '" + s + "'");
}

Direction parseDirection(const json& j) {
  std::string raw = j.at("direction").get<std::string>();
  auto direction = strategy::directionFromString(lower(raw));
  if (!direction) {
    throw ConfigError("unknown direction '" + raw + "'");
  }
  return *direction;
}

ClockMode parseClock(const std::string& s) {
  std::string v = lower(s);
  if (v == "live") return ClockMode::Live;
  if (v == "simulation") return ClockMode::Simulation;
  throw ConfigError("unknown clock '" + s + "'");
}

// -----------------------------------------------------------------------------
// Section parsers
// -----------------------------------------------------------------------------
InstrumentConfig parseInstrument(const json& j) {
  InstrumentConfig ic;
  ic.instrument.id = j.at("id").get<std::string>();
  ic.instrument.tick_size = j.value("tick_size", ic.instrument.tick_size);
  ic.instrument.lot_size = j.value("lot_size", ic.instrument.lot_size);
  ic.instrument.min_order_size =
      j.value("min_order_size", ic.instrument.min_order_size);
  ic.instrument.order_size = j.value("order_size", ic.instrument.order_size);
  ic.limits.max_position_size =
      j.value("max_position_size", ic.limits.max_position_size);
  ic.limits.max_notional = j.value("max_notional", ic.limits.max_notional);
  if (j.contains("order_type")) {
    ic.order_type = parseOrderType(j.at("order_type").get<std::string>());
  }
  return ic;
}

IndicatorSpec parseIndicator(const json& j) {
  IndicatorSpec spec;
  spec.name = j.at("name").get<std::string>();
  std::string kind = j.at("kind").get<std::string>();
  auto parsed = indicatorKindFromString(lower(kind));
  if (!parsed) {
    throw ConfigError("indicator '" + spec.name + "': unknown kind '" + kind +
                      "'");
  }
  spec.kind = *parsed;
  spec.period = j.value("period", spec.period);
  spec.fast = j.value("fast", spec.fast);
  spec.slow = j.value("slow", spec.slow);
  spec.signal = j.value("signal", spec.signal);
  return spec;
}

strategy::Condition parseCondition(const json& j) {
  std::string type = lower(j.at("type").get<std::string>());
  if (type == "cross") {
    strategy::CrossCondition c;
    c.fast = j.at("fast").get<std::string>();
    c.slow = j.at("slow").get<std::string>();
    c.direction = parseDirection(j);
    return c;
  }
  if (type == "threshold") {
    strategy::ThresholdCondition c;
    c.indicator = j.at("indicator").get<std::string>();
    c.direction = parseDirection(j);
    c.level = j.at("level").get<double>();
    return c;
  }
  if (type == "compare") {
    strategy::CompareCondition c;
    c.left = j.at("left").get<std::string>();
    c.right = j.at("right").get<std::string>();
    c.direction = parseDirection(j);
    return c;
  }
  if (type == "stop_loss") {
    return strategy::StopLossCondition{j.at("pct").get<double>()};
  }
  if (type == "take_profit") {
    return strategy::TakeProfitCondition{j.at("pct").get<double>()};
  }
  throw ConfigError("unknown condition type '" + type + "'");
}

strategy::StrategyRule parseRule(const json& j) {
  strategy::StrategyRule rule;
  rule.name = j.at("name").get<std::string>();
  rule.when = parseWhen(j.value("when", std::string("any")));
  rule.action = parseAction(j.at("action").get<std::string>());
  for (const auto& c : j.at("conditions")) {
    rule.conditions.push_back(parseCondition(c));
  }
  return rule;
}

void applyDocument(const json& doc, EngineConfig& cfg) {
  if (!doc.is_object()) {
    throw ConfigError("top-level JSON value must be an object");
  }

  if (doc.contains("instruments")) {
    cfg.instruments.clear();
    for (const auto& item : doc.at("instruments")) {
      cfg.instruments.push_back(parseInstrument(item));
    }
  }

  if (doc.contains("risk")) {
    const json& r = doc.at("risk");
    cfg.risk.max_open_positions =
        r.value("max_open_positions", cfg.risk.max_open_positions);
    cfg.risk.max_gross_notional =
        r.value("max_gross_notional", cfg.risk.max_gross_notional);
    cfg.risk.max_drawdown = r.value("max_drawdown", cfg.risk.max_drawdown);
  }

  if (doc.contains("indicators")) {
    cfg.indicators.clear();
    for (const auto& item : doc.at("indicators")) {
      cfg.indicators.push_back(parseIndicator(item));
    }
  }

  if (doc.contains("rules")) {
    cfg.rules.clear();
    for (const auto& item : doc.at("rules")) {
      cfg.rules.push_back(parseRule(item));
    }
  }

  if (doc.contains("retry")) {
    const json& r = doc.at("retry");
    cfg.retry.max_attempts = r.value("max_attempts", cfg.retry.max_attempts);
    cfg.retry.ack_timeout = millis(r, "ack_timeout_ms", cfg.retry.ack_timeout);
    cfg.retry.initial_backoff =
        millis(r, "initial_backoff_ms", cfg.retry.initial_backoff);
    cfg.retry.backoff_multiplier =
        r.value("backoff_multiplier", cfg.retry.backoff_multiplier);
    cfg.retry.max_backoff = millis(r, "max_backoff_ms", cfg.retry.max_backoff);
  }

  if (doc.contains("scheduler")) {
    const json& s = doc.at("scheduler");
    cfg.scheduler.workers = s.value("workers", cfg.scheduler.workers);
    cfg.scheduler.evaluation_interval = millis(
        s, "evaluation_interval_ms", cfg.scheduler.evaluation_interval);
  }

  if (doc.contains("endpoints")) {
    const json& e = doc.at("endpoints");
    cfg.endpoints.market_data =
        e.value("market_data", cfg.endpoints.market_data);
    cfg.endpoints.ipc_command =
        e.value("ipc_command", cfg.endpoints.ipc_command);
    cfg.endpoints.ipc_telemetry =
        e.value("ipc_telemetry", cfg.endpoints.ipc_telemetry);
  }

  cfg.cache_capacity = doc.value("cache_capacity", cfg.cache_capacity);
  cfg.entry_cooldown = millis(doc, "entry_cooldown_ms", cfg.entry_cooldown);
  cfg.key_prefix = doc.value("key_prefix", cfg.key_prefix);
  if (doc.contains("clock")) {
    cfg.clock = parseClock(doc.at("clock").get<std::string>());
  }
}

}  // namespace

std::vector<std::string> EngineConfig::instrumentIds() const {
  std::vector<std::string> ids;
  ids.reserve(instruments.size());
  for (const auto& ic : instruments) {
    ids.push_back(ic.instrument.id);
  }
  return ids;
}

const char* clockModeToString(ClockMode mode) {
  switch (mode) {
    case ClockMode::Live:       return "live";
    case ClockMode::Simulation: return "simulation";
  }
  return "live";
}

// -----------------------------------------------------------------------------
// defaultConfig()
// -----------------------------------------------------------------------------
EngineConfig defaultConfig() {
  EngineConfig cfg;

  InstrumentConfig btc;
  btc.instrument = {"BTC-USDT", 0.1, 0.001, 0.001, 0.001};
  btc.limits = {0.01, 1000.0};
  InstrumentConfig eth;
  eth.instrument = {"ETH-USDT", 0.01, 0.01, 0.01, 0.01};
  eth.limits = {0.5, 1000.0};
  cfg.instruments = {btc, eth};

  cfg.risk.max_open_positions = 3;
  cfg.risk.max_gross_notional = 5000.0;
  cfg.risk.max_drawdown = -500.0;

  IndicatorSpec sma;
  sma.name = "sma_20";
  sma.kind = IndicatorKind::Sma;
  sma.period = 20;
  IndicatorSpec rsi;
  rsi.name = "rsi_14";
  rsi.kind = IndicatorKind::Rsi;
  rsi.period = 14;
  cfg.indicators = {sma, rsi};

  using strategy::CompareCondition;
  using strategy::StopLossCondition;
  using strategy::TakeProfitCondition;
  using strategy::ThresholdCondition;

  // Exits first so that a protective exit always wins over a re-entry.
  cfg.rules = {
      {"long_stop_loss", PositionSide::Long, {StopLossCondition{0.03}},
       SignalType::Exit},
      {"long_take_profit", PositionSide::Long, {TakeProfitCondition{0.06}},
       SignalType::Exit},
      {"long_rsi_overbought", PositionSide::Long,
       {ThresholdCondition{"rsi_14", Direction::Above, 70.0}},
       SignalType::Exit},
      {"short_stop_loss", PositionSide::Short, {StopLossCondition{0.03}},
       SignalType::Exit},
      {"short_take_profit", PositionSide::Short, {TakeProfitCondition{0.06}},
       SignalType::Exit},
      {"short_rsi_oversold", PositionSide::Short,
       {ThresholdCondition{"rsi_14", Direction::Below, 30.0}},
       SignalType::Exit},
      {"trend_pullback_long", PositionSide::Flat,
       {CompareCondition{"close", "sma_20", Direction::Above},
        ThresholdCondition{"rsi_14", Direction::Below, 30.0}},
       SignalType::EnterLong},
      {"trend_rally_short", PositionSide::Flat,
       {CompareCondition{"close", "sma_20", Direction::Below},
        ThresholdCondition{"rsi_14", Direction::Above, 70.0}},
       SignalType::EnterShort},
  };

  return cfg;
}

// -----------------------------------------------------------------------------
// parseConfig() / loadConfig()
// -----------------------------------------------------------------------------
EngineConfig parseConfig(const std::string& text) {
  EngineConfig cfg = defaultConfig();
  try {
    applyDocument(json::parse(text), cfg);
  } catch (const json::exception& e) {
    throw ConfigError(e.what());
  }
  validateConfig(cfg);
  return cfg;
}

EngineConfig loadConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    std::cout << "[Config] " << path
              << " not found, using built-in defaults\n";
    EngineConfig cfg = defaultConfig();
    validateConfig(cfg);
    return cfg;
  }

  std::stringstream buffer;
  buffer << in.rdbuf();
  EngineConfig cfg = parseConfig(buffer.str());
  std::cout << "[Config] loaded " << path << ": " << cfg.instruments.size()
            << " instrument(s), " << cfg.indicators.size()
            << " indicator(s), " << cfg.rules.size() << " rule(s), clock="
            << clockModeToString(cfg.clock) << "\n";
  return cfg;
}

// -----------------------------------------------------------------------------
// validateConfig()
// -----------------------------------------------------------------------------
void validateConfig(const EngineConfig& cfg) {
  if (cfg.instruments.empty()) {
    throw ConfigError("at least one instrument is required");
  }

  std::set<std::string> ids;
  for (const auto& ic : cfg.instruments) {
    const auto& inst = ic.instrument;
    if (inst.id.empty()) {
      throw ConfigError("instrument id must not be empty");
    }
    if (!ids.insert(inst.id).second) {
      throw ConfigError("duplicate instrument '" + inst.id + "'");
    }
    if (inst.tick_size <= 0.0 || inst.lot_size <= 0.0) {
      throw ConfigError(inst.id + ": tick_size and lot_size must be positive");
    }
    if (inst.min_order_size < 0.0 || inst.order_size < 0.0) {
      throw ConfigError(inst.id + ": sizes must not be negative");
    }
    double size = domain::entryOrderSize(inst);
    if (size <= 0.0 || size + 1e-12 < inst.min_order_size) {
      throw ConfigError(inst.id + ": order size " + std::to_string(size) +
                        " is below the minimum order size");
    }
    if (ic.limits.max_position_size <= 0.0 || ic.limits.max_notional <= 0.0) {
      throw ConfigError(inst.id + ": risk limits must be positive");
    }
  }

  if (cfg.risk.max_open_positions < 1) {
    throw ConfigError("risk.max_open_positions must be at least 1");
  }
  if (cfg.risk.max_gross_notional <= 0.0) {
    throw ConfigError("risk.max_gross_notional must be positive");
  }
  if (cfg.risk.max_drawdown > 0.0) {
    throw ConfigError("risk.max_drawdown must be zero or negative");
  }

  // IndicatorEngine rejects duplicate names, bad periods and MACD settings.
  IndicatorEngine indicators(cfg.indicators);

  if (cfg.rules.empty()) {
    throw ConfigError("at least one strategy rule is required");
  }
  for (const auto& rule : cfg.rules) {
    if (rule.name.empty()) {
      throw ConfigError("rule name must not be empty");
    }
    if (rule.conditions.empty()) {
      throw ConfigError("rule '" + rule.name + "' has no conditions");
    }
    if (rule.action == SignalType::Hold) {
      throw ConfigError("rule '" + rule.name + "' must not produce HOLD");
    }
    for (const auto& condition : rule.conditions) {
      for (const auto& name : strategy::referencedIndicators(condition)) {
        if (!indicators.defines(name)) {
          throw ConfigError("rule '" + rule.name +
                            "' references undefined indicator '" + name +
                            "'");
        }
      }
      const auto* stop = std::get_if<strategy::StopLossCondition>(&condition);
      const auto* take = std::get_if<strategy::TakeProfitCondition>(&condition);
      if ((stop && stop->pct <= 0.0) || (take && take->pct <= 0.0)) {
        throw ConfigError("rule '" + rule.name + "': pct must be positive");
      }
    }
  }

  const RetryPolicy& retry = cfg.retry;
  if (retry.max_attempts < 1) {
    throw ConfigError("retry.max_attempts must be at least 1");
  }
  if (retry.ack_timeout.count() <= 0 || retry.initial_backoff.count() < 0 ||
      retry.max_backoff < retry.initial_backoff) {
    throw ConfigError("retry timings are inconsistent");
  }
  if (retry.backoff_multiplier < 1.0) {
    throw ConfigError("retry.backoff_multiplier must be at least 1");
  }

  if (cfg.cache_capacity < indicators.lookback()) {
    throw ConfigError("cache_capacity " + std::to_string(cfg.cache_capacity) +
                      " is below the indicator lookback " +
                      std::to_string(indicators.lookback()));
  }
  if (cfg.entry_cooldown.count() < 0 ||
      cfg.scheduler.evaluation_interval.count() < 0) {
    throw ConfigError("durations must not be negative");
  }
  if (cfg.scheduler.workers < 1) {
    throw ConfigError("scheduler.workers must be at least 1");
  }

  if (cfg.key_prefix.empty() || cfg.key_prefix.size() > 8 ||
      !std::all_of(cfg.key_prefix.begin(), cfg.key_prefix.end(),
                   [](unsigned char c) { return std::isalnum(c) != 0; })) {
    throw ConfigError("key_prefix must be 1-8 alphanumeric characters");
  }
}

}  // namespace config
}  // namespace tradeagent
