#include "tradeagent/execution/order_execution_manager.hpp"
#include "tradeagent/domain/errors.hpp"
#include "tradeagent/events/event_types.hpp"
#include "tradeagent/time/time_utils.hpp"

#include <cctype>
#include <exception>
#include <future>
#include <iostream>
#include <thread>
#include <utility>

namespace tradeagent {

namespace {

// Venues commonly cap client order ids at 32 alphanumeric characters.
constexpr std::size_t kMaxKeyLength = 32;

}  // namespace

const char* submitOutcomeToString(SubmitOutcome outcome) {
  switch (outcome) {
    case SubmitOutcome::Acked:          return "acked";
    case SubmitOutcome::RiskRejected:   return "risk_rejected";
    case SubmitOutcome::OrderRejected:  return "order_rejected";
    case SubmitOutcome::Unknown:        return "unknown";
    case SubmitOutcome::Duplicate:      return "duplicate";
    case SubmitOutcome::InstrumentBusy: return "instrument_busy";
    case SubmitOutcome::Stale:          return "stale";
    case SubmitOutcome::Cooldown:       return "cooldown";
    case SubmitOutcome::NotActionable:  return "not_actionable";
  }
  return "not_actionable";
}

OrderExecutionManager::OrderExecutionManager(
    EventBus& bus, IExchange& exchange, PositionTracker& positions,
    OrderTracker& orders, const ITimeProvider& clock,
    const std::vector<config::InstrumentConfig>& instruments,
    RetryPolicy policy, std::chrono::milliseconds entry_cooldown,
    std::string key_prefix, std::string run_id)
    : bus_(bus),
      exchange_(exchange),
      positions_(positions),
      orders_(orders),
      clock_(clock),
      policy_(policy),
      entry_cooldown_(entry_cooldown),
      key_prefix_(std::move(key_prefix)),
      run_id_(std::move(run_id)) {
  for (const auto& cfg : instruments) {
    order_types_[cfg.instrument.id] = cfg.order_type;
  }
}

// -----------------------------------------------------------------------------
// makeIdempotencyKey: <prefix><instrument alnum>[R<run id>]S<sequence>
// -----------------------------------------------------------------------------
std::string OrderExecutionManager::makeIdempotencyKey(
    const std::string& instrument, std::uint64_t sequence) const {
  std::string suffix = "S" + std::to_string(sequence);
  if (!run_id_.empty()) {
    suffix = "R" + run_id_ + suffix;
  }

  std::string symbol;
  for (char c : instrument) {
    if (std::isalnum(static_cast<unsigned char>(c))) {
      symbol.push_back(c);
    }
  }

  std::size_t budget = kMaxKeyLength > key_prefix_.size() + suffix.size()
                           ? kMaxKeyLength - key_prefix_.size() - suffix.size()
                           : 0;
  if (symbol.size() > budget) {
    symbol.resize(budget);
  }
  return key_prefix_ + symbol + suffix;
}

std::string OrderExecutionManager::makeRunId(std::int64_t epoch_ms) {
  static constexpr char kDigits[] = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ";
  auto value = static_cast<std::uint64_t>(epoch_ms < 0 ? 0 : epoch_ms);
  std::string out;
  do {
    out.insert(out.begin(), kDigits[value % 36]);
    value /= 36;
  } while (value != 0);
  return out;
}

void OrderExecutionManager::publishRiskReject(const domain::Signal& signal,
                                              const std::string& reason) {
  RiskRejectEvent event;
  event.instrument = signal.instrument;
  event.signal_type = signal.type;
  event.sequence = signal.sequence;
  event.reason = reason;
  event.timestamp = ms_to_timestamp(clock_.now_ms());
  bus_.publish(event);
}

// -----------------------------------------------------------------------------
// submit(): guards, authorize, register, place
// -----------------------------------------------------------------------------
SubmitResult OrderExecutionManager::submit(const domain::Signal& signal,
                                           const std::string& instrument) {
  SubmitResult result;

  if (signal.type == domain::SignalType::Hold ||
      signal.instrument != instrument) {
    result.outcome = SubmitOutcome::NotActionable;
    result.reason = signal.type == domain::SignalType::Hold
                        ? "HOLD"
                        : "signal is for " + signal.instrument;
    return result;
  }

  const std::string key = makeIdempotencyKey(instrument, signal.sequence);
  result.idempotency_key = key;

  if (auto existing = orders_.find(key)) {
    result.outcome = SubmitOutcome::Duplicate;
    result.status = existing->status;
    result.attempts = existing->attempts;
    return result;
  }

  const bool entry = domain::isEntry(signal.type);
  const std::int64_t now = clock_.now_ms();
  {
    std::lock_guard lock(state_mutex_);
    auto seq_it = last_submitted_sequence_.find(instrument);
    if (seq_it != last_submitted_sequence_.end() &&
        signal.sequence <= seq_it->second) {
      result.outcome = SubmitOutcome::Stale;
      result.reason = "last submitted sequence " +
                      std::to_string(seq_it->second);
      return result;
    }

    auto cd_it = last_entry_ms_.find(instrument);
    if (entry && entry_cooldown_.count() > 0 && cd_it != last_entry_ms_.end() &&
        now - cd_it->second < entry_cooldown_.count()) {
      result.outcome = SubmitOutcome::Cooldown;
      result.reason = "entry cooldown active";
      std::cout << "[OrderExecutionManager] " << instrument
                << " entry skipped, cooldown "
                << (entry_cooldown_.count() - (now - cd_it->second))
                << "ms remaining\n";
      return result;
    }
  }

  if (auto open = orders_.openOrder(instrument)) {
    result.outcome = SubmitOutcome::InstrumentBusy;
    result.status = open->status;
    result.reason = "open order " + open->idempotency_key;
    return result;
  }

  RiskDecision decision = positions_.authorize(instrument, signal);
  if (!decision.allowed) {
    result.outcome = SubmitOutcome::RiskRejected;
    result.reason = decision.reason;
    publishRiskReject(signal, decision.reason);
    return result;
  }

  domain::Order order;
  order.idempotency_key = key;
  order.instrument = instrument;
  order.side = decision.side;
  order.size = decision.size;
  auto type_it = order_types_.find(instrument);
  order.type = type_it != order_types_.end() ? type_it->second
                                             : domain::OrderType::Market;
  order.price = decision.price;
  order.submitted_at_ms = now;
  order.signal_sequence = signal.sequence;
  order.intent = signal.type;

  RegisterResult reg = orders_.registerOrder(order);
  if (reg.outcome != Registration::Created) {
    if (entry) {
      positions_.release(instrument);
    }
    result.outcome = reg.outcome == Registration::Exists
                         ? SubmitOutcome::Duplicate
                         : SubmitOutcome::InstrumentBusy;
    result.status = reg.order.status;
    return result;
  }

  {
    std::lock_guard lock(state_mutex_);
    last_submitted_sequence_[instrument] = signal.sequence;
    if (entry) {
      last_entry_ms_[instrument] = now;
    }
  }

  std::cout << "[OrderExecutionManager] submit " << key << " "
            << domain::signalTypeToString(signal.type) << " "
            << domain::sideToString(order.side) << " " << order.size << " "
            << instrument << " @ " << order.price << "\n";

  return placeWithRetry(reg.order);
}

// -----------------------------------------------------------------------------
// placeWithRetry(): same request, same key, bounded attempts
// -----------------------------------------------------------------------------
SubmitResult OrderExecutionManager::placeWithRetry(const domain::Order& order) {
  SubmitResult result;
  result.idempotency_key = order.idempotency_key;
  const domain::OrderRequest request = domain::toRequest(order);
  const std::string& key = order.idempotency_key;

  for (int attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
    result.attempts = orders_.recordAttempt(key);

    std::string failure;
    try {
      std::future<PlaceResult> pending = exchange_.placeOrder(request);
      if (pending.wait_for(policy_.ack_timeout) != std::future_status::ready) {
        failure = "ack timeout";
      } else {
        PlaceResult placed = pending.get();
        if (placed.status == PlaceStatus::Acked) {
          orders_.setExchangeOrderId(key, placed.exchange_order_id);
          auto current = orders_.find(key);
          if (current && (current->status == domain::OrderStatus::Pending ||
                          current->status == domain::OrderStatus::Unknown)) {
            orders_.transition(key, domain::OrderStatus::Acked);
          }
          current = orders_.find(key);
          result.outcome = SubmitOutcome::Acked;
          result.status = current ? current->status : domain::OrderStatus::Acked;
          std::cout << "[OrderExecutionManager] " << key << " acked as "
                    << placed.exchange_order_id << " (attempt " << attempt
                    << ")\n";
          return result;
        }
        if (placed.status == PlaceStatus::Rejected) {
          orders_.transition(key, domain::OrderStatus::Rejected, placed.reason);
          positions_.release(order.instrument);
          result.outcome = SubmitOutcome::OrderRejected;
          result.status = domain::OrderStatus::Rejected;
          result.reason = placed.reason;
          std::cerr << "[OrderExecutionManager] " << key
                    << " REJECTED by exchange: " << placed.reason << "\n";
          return result;
        }
        failure = "transport error: " + placed.reason;
      }
    } catch (const std::exception& e) {
      failure = std::string("transport error: ") + e.what();
    }

    std::cerr << "[OrderExecutionManager] " << key << " attempt " << attempt
              << "/" << policy_.max_attempts << " failed: " << failure
              << "\n";

    if (attempt < policy_.max_attempts) {
      std::this_thread::sleep_for(policy_.backoffAfter(attempt));
    }
  }

  // Budget exhausted. A fill may have confirmed the order in the meantime.
  auto current = orders_.find(key);
  if (current && current->status != domain::OrderStatus::Pending) {
    result.outcome = SubmitOutcome::Acked;
    result.status = current->status;
    return result;
  }

  orders_.transition(key, domain::OrderStatus::Unknown,
                     "no confirmation after " +
                         std::to_string(policy_.max_attempts) + " attempts");
  result.outcome = SubmitOutcome::Unknown;
  result.status = domain::OrderStatus::Unknown;
  result.reason = "exchange timeout";
  std::cerr << "[OrderExecutionManager] " << key
            << " UNKNOWN after retries; operator reconciliation required\n";
  return result;
}

// -----------------------------------------------------------------------------
// onFill(): order row first (dedupe), then position
// -----------------------------------------------------------------------------
void OrderExecutionManager::onFill(const domain::FillEvent& fill) {
  FillRecord record = orders_.recordFill(fill);

  if (record.outcome == FillOutcome::Duplicate) {
    return;
  }
  if (record.outcome == FillOutcome::UnknownOrder) {
    std::cerr << "[OrderExecutionManager] WARNING: fill " << fill.fill_id
              << " for unknown key=" << fill.idempotency_key
              << ", applying to position only\n";
  }

  try {
    positions_.apply(fill);
  } catch (const UnknownInstrument& e) {
    std::cerr << "[OrderExecutionManager] fill " << fill.fill_id
              << " dropped: " << e.what() << "\n";
    return;
  }

  if (record.outcome == FillOutcome::Applied &&
      domain::isTerminal(record.order.status)) {
    positions_.release(record.order.instrument);
  }
}

bool OrderExecutionManager::resolve(const std::string& key,
                                    domain::OrderStatus status) {
  auto current = orders_.find(key);
  if (!current || current->status != domain::OrderStatus::Unknown) {
    return false;
  }
  const bool failed = status == domain::OrderStatus::Rejected ||
                      status == domain::OrderStatus::Cancelled;
  if (!orders_.transition(key, status,
                          failed ? "resolved by operator" : "")) {
    return false;
  }
  if (domain::isTerminal(status)) {
    positions_.release(current->instrument);
  }
  std::cout << "[OrderExecutionManager] " << key << " resolved to "
            << domain::orderStatusToString(status) << "\n";
  return true;
}

}  // namespace tradeagent
