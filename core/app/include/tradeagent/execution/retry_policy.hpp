#pragma once

#include <algorithm>
#include <chrono>

namespace tradeagent {

// -----------------------------------------------------------------------------
// RetryPolicy: bounded retry of one order submission
// -----------------------------------------------------------------------------
// max_attempts counts every placeOrder() call including the first. After an
// attempt that timed out or failed in transport, the manager sleeps
// backoffAfter(attempt) before the next one. Rejections are never retried.
// -----------------------------------------------------------------------------
struct RetryPolicy {
  int max_attempts{3};
  std::chrono::milliseconds ack_timeout{2000};
  std::chrono::milliseconds initial_backoff{200};
  double backoff_multiplier{2.0};
  std::chrono::milliseconds max_backoff{5000};

  // attempt is 1-based: backoffAfter(1) == initial_backoff.
  std::chrono::milliseconds backoffAfter(int attempt) const {
    double delay = static_cast<double>(initial_backoff.count());
    for (int i = 1; i < attempt; ++i) {
      delay *= backoff_multiplier;
      if (delay >= static_cast<double>(max_backoff.count())) {
        break;
      }
    }
    auto ms = static_cast<std::chrono::milliseconds::rep>(delay);
    return std::min(std::chrono::milliseconds{ms}, max_backoff);
  }
};

}  // namespace tradeagent
