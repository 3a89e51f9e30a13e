#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace tradeagent {

// -----------------------------------------------------------------------------
// ErrorCode
// -----------------------------------------------------------------------------
// Responsibility: Classifies every failure the engine can raise or report.
// Only the first group is ever thrown; RiskRejected, OrderRejected and
// ExchangeTimeout travel as result values (RiskDecision, SubmitResult) so the
// order path never unwinds through a half-updated order row.
// -----------------------------------------------------------------------------
enum class ErrorCode {
  InsufficientHistory,
  StaleSignal,
  UnknownInstrument,
  InvalidConfig,
  RiskRejected,
  OrderRejected,
  ExchangeTimeout,
};

inline const char* errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::InsufficientHistory: return "InsufficientHistory";
    case ErrorCode::StaleSignal:         return "StaleSignal";
    case ErrorCode::UnknownInstrument:   return "UnknownInstrument";
    case ErrorCode::InvalidConfig:       return "InvalidConfig";
    case ErrorCode::RiskRejected:        return "RiskRejected";
    case ErrorCode::OrderRejected:       return "OrderRejected";
    case ErrorCode::ExchangeTimeout:     return "ExchangeTimeout";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// Error: base of every exception thrown by tradeagent components
// -----------------------------------------------------------------------------
//
// @brief  std::runtime_error carrying an ErrorCode.
//
// @details
// The scheduler catches Error around each evaluation cycle, logs it with the
// instrument and the code, publishes a CycleErrorEvent and moves on. Nothing
// below the scheduler catches Error, so one instrument's failure is contained
// to that instrument's cycle.
// -----------------------------------------------------------------------------
class Error : public std::runtime_error {
 public:
  Error(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  ErrorCode code() const noexcept { return code_; }

 private:
  ErrorCode code_;
};

// Thrown by MarketDataCache::history() and IndicatorEngine::compute() when
// fewer bars exist than the configured lookback needs. The cycle is skipped.
class InsufficientHistory : public Error {
 public:
  InsufficientHistory(const std::string& instrument, std::size_t required,
                      std::size_t available)
      : Error(ErrorCode::InsufficientHistory,
              "insufficient history for " + instrument + ": required=" +
                  std::to_string(required) +
                  " available=" + std::to_string(available)),
        instrument_(instrument),
        required_(required),
        available_(available) {}

  const std::string& instrument() const noexcept { return instrument_; }
  std::size_t required() const noexcept { return required_; }
  std::size_t available() const noexcept { return available_; }

 private:
  std::string instrument_;
  std::size_t required_;
  std::size_t available_;
};

class UnknownInstrument : public Error {
 public:
  explicit UnknownInstrument(const std::string& instrument)
      : Error(ErrorCode::UnknownInstrument,
              "instrument not configured: " + instrument) {}
};

class ConfigError : public Error {
 public:
  explicit ConfigError(const std::string& message)
      : Error(ErrorCode::InvalidConfig, "invalid configuration: " + message) {}
};

}  // namespace tradeagent
