#pragma once

#include "tradeagent/config/instrument_config.hpp"
#include "tradeagent/domain/risk_limits.hpp"
#include "tradeagent/execution/retry_policy.hpp"
#include "tradeagent/indicators/indicator_spec.hpp"
#include "tradeagent/strategy/strategy_rule.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace tradeagent {
namespace config {

enum class ClockMode {
  Live,        // Wall clock
  Simulation,  // Advanced by bar timestamps from the gateway
};

struct SchedulerConfig {
  std::size_t workers{4};
  std::chrono::milliseconds evaluation_interval{0};
};

struct Endpoints {
  std::string market_data{"tcp://127.0.0.1:5555"};
  std::string ipc_command{"tcp://127.0.0.1:5556"};
  std::string ipc_telemetry{"tcp://127.0.0.1:5557"};
};

// -----------------------------------------------------------------------------
// EngineConfig
// -----------------------------------------------------------------------------
// Everything the engine reads at startup. Loaded once, validated once and
// then passed by const reference; no component mutates it.
// -----------------------------------------------------------------------------
struct EngineConfig {
  std::vector<InstrumentConfig> instruments;
  domain::RiskLimits risk;
  std::vector<IndicatorSpec> indicators;
  std::vector<strategy::StrategyRule> rules;
  RetryPolicy retry;
  std::size_t cache_capacity{500};
  // Minimum time between two entries on one instrument.
  std::chrono::milliseconds entry_cooldown{300000};
  SchedulerConfig scheduler;
  Endpoints endpoints;
  ClockMode clock{ClockMode::Live};
  std::string key_prefix{"TA"};

  std::vector<std::string> instrumentIds() const;
};

// BTC-USDT and ETH-USDT with the trend-RSI rule set: enter with the SMA(20)
// trend on an RSI(14) pullback, leave on a 3% stop, a 6% target or an RSI
// reversal.
EngineConfig defaultConfig();

// Parses a JSON document. Keys that are absent keep their defaultConfig()
// value. Throws ConfigError on malformed JSON or invalid values.
EngineConfig parseConfig(const std::string& text);

// Reads `path`; a missing file yields defaultConfig(). Throws ConfigError if
// the file exists but cannot be parsed or validated.
EngineConfig loadConfig(const std::string& path);

// Throws ConfigError describing the first problem found.
void validateConfig(const EngineConfig& config);

const char* clockModeToString(ClockMode mode);

}  // namespace config
}  // namespace tradeagent
