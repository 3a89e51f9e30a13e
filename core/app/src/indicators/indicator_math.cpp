#include "tradeagent/indicators/indicator_math.hpp"

#include <cmath>
#include <limits>

namespace tradeagent {
namespace indicators {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

}  // namespace

double smaAt(const std::vector<double>& closes, std::size_t i, int period) {
  if (period <= 0 || i >= closes.size() ||
      i + 1 < static_cast<std::size_t>(period)) {
    return kNaN;
  }
  double sum = 0.0;
  for (std::size_t k = i + 1 - period; k <= i; ++k) {
    sum += closes[k];
  }
  return sum / period;
}

std::vector<double> emaSeries(const std::vector<double>& values, int period) {
  std::vector<double> out(values.size(), kNaN);
  if (period <= 0) {
    return out;
  }

  std::size_t first = 0;
  while (first < values.size() && std::isnan(values[first])) {
    ++first;
  }
  std::size_t seed = first + static_cast<std::size_t>(period) - 1;
  if (seed >= values.size()) {
    return out;
  }

  double sum = 0.0;
  for (std::size_t k = first; k <= seed; ++k) {
    sum += values[k];
  }
  out[seed] = sum / period;

  const double alpha = 2.0 / (period + 1.0);
  for (std::size_t k = seed + 1; k < values.size(); ++k) {
    out[k] = alpha * values[k] + (1.0 - alpha) * out[k - 1];
  }
  return out;
}

double rsiAt(const std::vector<double>& closes, std::size_t i, int period) {
  if (period <= 0 || i >= closes.size() ||
      i < static_cast<std::size_t>(period)) {
    return kNaN;
  }

  double gains = 0.0;
  double losses = 0.0;
  for (std::size_t k = i + 1 - period; k <= i; ++k) {
    double delta = closes[k] - closes[k - 1];
    if (delta > 0.0) {
      gains += delta;
    } else {
      losses -= delta;
    }
  }

  double avg_gain = gains / period;
  double avg_loss = losses / period;
  if (avg_loss == 0.0) {
    return avg_gain == 0.0 ? kNaN : 100.0;
  }
  double rs = avg_gain / avg_loss;
  return 100.0 - 100.0 / (1.0 + rs);
}

double rocAt(const std::vector<double>& closes, std::size_t i, int period) {
  if (period <= 0 || i >= closes.size() ||
      i < static_cast<std::size_t>(period)) {
    return kNaN;
  }
  double base = closes[i - period];
  if (base == 0.0) {
    return kNaN;
  }
  return (closes[i] - base) / base * 100.0;
}

std::vector<double> macdSeries(const std::vector<double>& closes, int fast,
                               int slow) {
  std::vector<double> fast_ema = emaSeries(closes, fast);
  std::vector<double> slow_ema = emaSeries(closes, slow);
  std::vector<double> out(closes.size(), kNaN);
  for (std::size_t k = 0; k < closes.size(); ++k) {
    out[k] = fast_ema[k] - slow_ema[k];  // NaN propagates
  }
  return out;
}

std::vector<double> macdSignalSeries(const std::vector<double>& closes,
                                     int fast, int slow, int signal) {
  return emaSeries(macdSeries(closes, fast, slow), signal);
}

}  // namespace indicators
}  // namespace tradeagent
