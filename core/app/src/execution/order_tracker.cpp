#include "tradeagent/execution/order_tracker.hpp"
#include "tradeagent/events/order_update_event.hpp"
#include "tradeagent/time/time_utils.hpp"

#include <iostream>

namespace tradeagent {

namespace {

// Fill quantities are sums of doubles; compare with a small tolerance.
constexpr double kQtyEpsilon = 1e-9;

}  // namespace

OrderTracker::OrderTracker(EventBus& bus, const ITimeProvider& clock)
    : bus_(bus), clock_(clock) {}

// -----------------------------------------------------------------------------
// transitionStatus: the order state machine
// -----------------------------------------------------------------------------
bool OrderTracker::transitionStatus(domain::OrderStatus current,
                                    domain::OrderStatus next) {
  using S = domain::OrderStatus;

  switch (current) {
    case S::Pending:
      return next == S::Acked ||
             next == S::PartiallyFilled ||
             next == S::Filled ||
             next == S::Rejected ||
             next == S::Cancelled ||
             next == S::Unknown;

    case S::Acked:
      return next == S::PartiallyFilled ||
             next == S::Filled ||
             next == S::Cancelled;

    case S::PartiallyFilled:
      return next == S::PartiallyFilled ||
             next == S::Filled ||
             next == S::Cancelled;

    case S::Unknown:
      return next == S::Acked ||
             next == S::PartiallyFilled ||
             next == S::Filled ||
             next == S::Rejected ||
             next == S::Cancelled;

    case S::Filled:
    case S::Rejected:
    case S::Cancelled:
      return false;
  }

  return false;
}

void OrderTracker::publishUpdate(const domain::Order& order,
                                 domain::OrderStatus previous) {
  OrderUpdateEvent update;
  update.order = order;
  update.previous_status = previous;
  update.timestamp = ms_to_timestamp(clock_.now_ms());
  bus_.publish(update);
}

// -----------------------------------------------------------------------------
// registerOrder: key uniqueness + one open order per instrument
// -----------------------------------------------------------------------------
RegisterResult OrderTracker::registerOrder(const domain::Order& order) {
  RegisterResult result;
  {
    std::lock_guard lock(mutex_);

    if (auto it = orders_.find(order.idempotency_key); it != orders_.end()) {
      result.outcome = Registration::Exists;
      result.order = it->second;
      return result;
    }

    if (auto it = open_by_instrument_.find(order.instrument);
        it != open_by_instrument_.end()) {
      result.outcome = Registration::InstrumentBusy;
      result.order = orders_.at(it->second);
      return result;
    }

    domain::Order row = order;
    row.status = domain::OrderStatus::Pending;
    orders_.emplace(row.idempotency_key, row);
    submission_order_.push_back(row.idempotency_key);
    open_by_instrument_[row.instrument] = row.idempotency_key;

    result.outcome = Registration::Created;
    result.order = row;
  }

  publishUpdate(result.order, domain::OrderStatus::Pending);
  return result;
}

bool OrderTracker::transition(const std::string& key,
                              domain::OrderStatus next,
                              const std::string& reason) {
  domain::Order snapshot;
  domain::OrderStatus previous;
  {
    std::lock_guard lock(mutex_);
    auto it = orders_.find(key);
    if (it == orders_.end()) {
      std::cerr << "[OrderTracker] WARNING: transition for unknown key="
                << key << ". Skipping.\n";
      return false;
    }

    domain::Order& order = it->second;
    previous = order.status;
    if (!transitionStatus(previous, next)) {
      std::cerr << "[OrderTracker] WARNING: illegal transition for key="
                << key << " from " << domain::orderStatusToString(previous)
                << " to " << domain::orderStatusToString(next)
                << ". Skipping.\n";
      return false;
    }

    order.status = next;
    if (!reason.empty()) {
      order.reject_reason = reason;
    }
    if (domain::isTerminal(next)) {
      open_by_instrument_.erase(order.instrument);
    }
    snapshot = order;
  }

  publishUpdate(snapshot, previous);
  return true;
}

int OrderTracker::recordAttempt(const std::string& key) {
  std::lock_guard lock(mutex_);
  auto it = orders_.find(key);
  if (it == orders_.end()) {
    return 0;
  }
  return ++it->second.attempts;
}

void OrderTracker::setExchangeOrderId(const std::string& key,
                                      const std::string& exchange_order_id) {
  std::lock_guard lock(mutex_);
  auto it = orders_.find(key);
  if (it != orders_.end() && !exchange_order_id.empty()) {
    it->second.exchange_order_id = exchange_order_id;
  }
}

// -----------------------------------------------------------------------------
// recordFill: dedupe by fill id, accumulate, advance state when legal
// -----------------------------------------------------------------------------
FillRecord OrderTracker::recordFill(const domain::FillEvent& fill) {
  FillRecord record;
  domain::OrderStatus previous;
  {
    std::lock_guard lock(mutex_);
    auto it = orders_.find(fill.idempotency_key);
    if (it == orders_.end()) {
      record.outcome = FillOutcome::UnknownOrder;
      return record;
    }

    domain::Order& order = it->second;
    if (!applied_fills_.insert(fill.fill_id).second) {
      record.outcome = FillOutcome::Duplicate;
      record.order = order;
      return record;
    }

    double total = order.filled_quantity + fill.quantity;
    if (total > 0.0) {
      order.average_fill_price =
          (order.filled_quantity * order.average_fill_price +
           fill.quantity * fill.price) / total;
    }
    order.filled_quantity = total;

    previous = order.status;
    domain::OrderStatus next = total + kQtyEpsilon >= order.size
                                   ? domain::OrderStatus::Filled
                                   : domain::OrderStatus::PartiallyFilled;
    if (transitionStatus(previous, next)) {
      order.status = next;
      if (domain::isTerminal(next)) {
        open_by_instrument_.erase(order.instrument);
      }
    } else {
      std::cerr << "[OrderTracker] WARNING: fill " << fill.fill_id
                << " for key=" << fill.idempotency_key << " in state "
                << domain::orderStatusToString(previous)
                << "; quantity recorded, state kept\n";
    }

    record.outcome = FillOutcome::Applied;
    record.order = order;
  }

  publishUpdate(record.order, previous);
  return record;
}

std::optional<domain::Order> OrderTracker::find(const std::string& key) const {
  std::lock_guard lock(mutex_);
  auto it = orders_.find(key);
  if (it == orders_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<domain::Order> OrderTracker::openOrder(
    const std::string& instrument) const {
  std::lock_guard lock(mutex_);
  auto it = open_by_instrument_.find(instrument);
  if (it == open_by_instrument_.end()) {
    return std::nullopt;
  }
  return orders_.at(it->second);
}

std::vector<domain::Order> OrderTracker::orders() const {
  std::lock_guard lock(mutex_);
  std::vector<domain::Order> out;
  out.reserve(submission_order_.size());
  for (const auto& key : submission_order_) {
    out.push_back(orders_.at(key));
  }
  return out;
}

std::vector<domain::Order> OrderTracker::unknownOrders() const {
  std::lock_guard lock(mutex_);
  std::vector<domain::Order> out;
  for (const auto& key : submission_order_) {
    const domain::Order& order = orders_.at(key);
    if (order.status == domain::OrderStatus::Unknown) {
      out.push_back(order);
    }
  }
  return out;
}

void OrderTracker::hydrateOrder(const domain::Order& order) {
  std::lock_guard lock(mutex_);
  if (orders_.count(order.idempotency_key) != 0) {
    return;
  }
  orders_.emplace(order.idempotency_key, order);
  submission_order_.push_back(order.idempotency_key);
  if (isOpen(order.status)) {
    open_by_instrument_[order.instrument] = order.idempotency_key;
  }
  std::cout << "[OrderTracker] hydrated order key=" << order.idempotency_key
            << " " << order.instrument << " "
            << domain::orderStatusToString(order.status) << "\n";
}

}  // namespace tradeagent
