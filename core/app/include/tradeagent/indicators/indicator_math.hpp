#pragma once

#include <cstddef>
#include <vector>

namespace tradeagent {
namespace indicators {

// -----------------------------------------------------------------------------
// Pure indicator formulas over a close series.
// -----------------------------------------------------------------------------
// Every function returns the value at index i of `closes` (or a whole series
// aligned with `closes`). Undefined points are NaN: not enough data before i,
// or a division by zero. Nothing here throws on bad numeric input.
// -----------------------------------------------------------------------------

double smaAt(const std::vector<double>& closes, std::size_t i, int period);

// EMA with alpha = 2 / (period + 1), seeded by the SMA of the first `period`
// defined values. Leading NaNs in `values` are skipped.
std::vector<double> emaSeries(const std::vector<double>& values, int period);

// RSI over the `period` close-to-close changes ending at i, using simple
// means. No losses and some gains gives 100; no movement at all gives NaN.
double rsiAt(const std::vector<double>& closes, std::size_t i, int period);

double rocAt(const std::vector<double>& closes, std::size_t i, int period);

std::vector<double> macdSeries(const std::vector<double>& closes, int fast,
                               int slow);

std::vector<double> macdSignalSeries(const std::vector<double>& closes,
                                     int fast, int slow, int signal);

}  // namespace indicators
}  // namespace tradeagent
