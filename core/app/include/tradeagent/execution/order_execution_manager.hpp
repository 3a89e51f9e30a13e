#pragma once

#include "tradeagent/config/instrument_config.hpp"
#include "tradeagent/domain/fill.hpp"
#include "tradeagent/domain/order_status.hpp"
#include "tradeagent/domain/signal.hpp"
#include "tradeagent/eventbus/event_bus.hpp"
#include "tradeagent/execution/i_exchange.hpp"
#include "tradeagent/execution/order_tracker.hpp"
#include "tradeagent/execution/retry_policy.hpp"
#include "tradeagent/risk/position_tracker.hpp"
#include "tradeagent/time/i_time_provider.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tradeagent {

enum class SubmitOutcome {
  Acked,           // Exchange accepted (the row may already be filled)
  RiskRejected,    // authorize() denied; nothing sent
  OrderRejected,   // Exchange refused; terminal
  Unknown,         // No confirmation within the retry budget
  Duplicate,       // A row for this key exists; returned without resending
  InstrumentBusy,  // Another open order for the instrument
  Stale,           // Older than the last submitted signal for the instrument
  Cooldown,        // Entry inside the per-instrument cooldown window
  NotActionable,   // HOLD, or the signal names another instrument
};

const char* submitOutcomeToString(SubmitOutcome outcome);

struct SubmitResult {
  SubmitOutcome outcome{SubmitOutcome::NotActionable};
  std::string idempotency_key;
  domain::OrderStatus status{domain::OrderStatus::Pending};
  std::string reason;
  int attempts{0};
};

// -----------------------------------------------------------------------------
// OrderExecutionManager: signal to exchange order, exactly once
// -----------------------------------------------------------------------------
//
// @brief  Authorizes a signal, places the order with bounded retries under a
//         single idempotency key, and applies fills to orders and positions.
//
// @details
// submit(signal, instrument):
//   1. The idempotency key is derived from (instrument, signal.sequence) and
//      the run id. Bar sequences restart at 1 in every process, so the run
//      id keeps a new run's keys apart from orders hydrated from the last
//      one. If a row with that key exists the row is returned (Duplicate)
//      and the exchange is not contacted.
//   2. Stale, busy-instrument and entry-cooldown guards.
//   3. PositionTracker::authorize(). A denial publishes RiskRejectEvent and
//      returns RiskRejected.
//   4. The Pending row is registered, then placeOrder() is called up to
//      RetryPolicy::max_attempts times, always with the same request and
//      key. An attempt that times out (no ack within ack_timeout) or fails
//      in transport is followed by an exponential backoff sleep and retried.
//      Ack -> ACKED. Reject -> REJECTED, reservation released, never retried.
//      Budget exhausted -> UNKNOWN; the row keeps blocking the instrument
//      until a late fill or resolve() settles it.
//
// onFill(fill):
//   Dedupes via OrderTracker (fill id), then applies the fill to the
//   position. Fills may arrive before the ack. A fill for a key the engine
//   did not submit is still applied to the position, since the venue is the
//   authority on what was executed.
//
// submit() blocks its caller for up to
// max_attempts * ack_timeout + total backoff. It is meant to run on the
// instrument's lane, which serializes it with that instrument's fills.
//
// Thread model:
//   submit() for different instruments may run concurrently. onFill() and
//   resolve() are safe from any thread.
// -----------------------------------------------------------------------------
class OrderExecutionManager {
 public:
  OrderExecutionManager(EventBus& bus, IExchange& exchange,
                        PositionTracker& positions, OrderTracker& orders,
                        const ITimeProvider& clock,
                        const std::vector<config::InstrumentConfig>& instruments,
                        RetryPolicy policy,
                        std::chrono::milliseconds entry_cooldown,
                        std::string key_prefix = "TA",
                        std::string run_id = "");

  OrderExecutionManager(const OrderExecutionManager&) = delete;
  OrderExecutionManager& operator=(const OrderExecutionManager&) = delete;

  SubmitResult submit(const domain::Signal& signal,
                      const std::string& instrument);

  void onFill(const domain::FillEvent& fill);

  // Operator reconciliation of an UNKNOWN order. Returns false when the key
  // is unknown, the order is not UNKNOWN, or the transition is illegal.
  bool resolve(const std::string& key, domain::OrderStatus status);

  // <prefix><instrument alnum>S<sequence>, or
  // <prefix><instrument alnum>R<run id>S<sequence> when a run id is set.
  // The instrument part is truncated so the key fits 32 characters.
  std::string makeIdempotencyKey(const std::string& instrument,
                                 std::uint64_t sequence) const;

  // Base-36 rendering of a process start time, used as the run id.
  static std::string makeRunId(std::int64_t epoch_ms);

  const std::string& runId() const { return run_id_; }

  const RetryPolicy& retryPolicy() const { return policy_; }

 private:
  SubmitResult placeWithRetry(const domain::Order& order);
  void publishRiskReject(const domain::Signal& signal,
                         const std::string& reason);

  EventBus& bus_;
  IExchange& exchange_;
  PositionTracker& positions_;
  OrderTracker& orders_;
  const ITimeProvider& clock_;
  const RetryPolicy policy_;
  const std::chrono::milliseconds entry_cooldown_;
  const std::string key_prefix_;
  const std::string run_id_;
  std::unordered_map<std::string, domain::OrderType> order_types_;

  std::mutex state_mutex_;
  std::unordered_map<std::string, std::uint64_t> last_submitted_sequence_;
  std::unordered_map<std::string, std::int64_t> last_entry_ms_;
};

}  // namespace tradeagent
