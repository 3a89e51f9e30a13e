#include "tradeagent/risk/position_tracker.hpp"
#include "tradeagent/domain/errors.hpp"
#include "tradeagent/events/position_update_event.hpp"
#include "tradeagent/events/risk_violation_event.hpp"
#include "tradeagent/time/time_utils.hpp"

#include <cmath>
#include <iostream>
#include <optional>

namespace tradeagent {

namespace {

void setFromSigned(domain::Position& pos, double signed_qty) {
  // Fill arithmetic accumulates floating error; treat dust as flat.
  constexpr double kDust = 1e-12;
  if (std::abs(signed_qty) <= kDust) {
    pos.side = domain::PositionSide::Flat;
    pos.size = 0.0;
    pos.average_entry_price = 0.0;
    return;
  }
  pos.side = signed_qty > 0.0 ? domain::PositionSide::Long
                              : domain::PositionSide::Short;
  pos.size = std::abs(signed_qty);
}

}  // namespace

PositionTracker::PositionTracker(
    EventBus& bus, const ITimeProvider& clock,
    const std::vector<config::InstrumentConfig>& instruments,
    const domain::RiskLimits& limits)
    : bus_(bus), clock_(clock), limits_(limits) {
  for (const auto& cfg : instruments) {
    auto b = std::make_unique<Book>();
    b->instrument = cfg.instrument;
    b->limits = cfg.limits;
    b->position.instrument = cfg.instrument.id;
    books_.emplace(cfg.instrument.id, std::move(b));
  }
}

PositionTracker::Book& PositionTracker::book(
    const std::string& instrument) const {
  auto it = books_.find(instrument);
  if (it == books_.end()) {
    throw UnknownInstrument(instrument);
  }
  return *it->second;
}

RiskDecision PositionTracker::deny(const std::string& instrument,
                                   const std::string& reason) const {
  std::cerr << "[PositionTracker] DENY " << instrument << ": " << reason
            << "\n";
  RiskDecision d;
  d.allowed = false;
  d.reason = reason;
  return d;
}

// -----------------------------------------------------------------------------
// authorize(): pre-trade checks, reserve notional on an allowed entry
// -----------------------------------------------------------------------------
RiskDecision PositionTracker::authorize(const std::string& instrument,
                                        const domain::Signal& signal) {
  Book& b = book(instrument);
  std::lock_guard lock(b.mutex);
  const domain::Position& pos = b.position;

  if (signal.type == domain::SignalType::Hold) {
    return deny(instrument, "HOLD is not an order");
  }

  if (signal.type == domain::SignalType::Exit) {
    if (pos.side == domain::PositionSide::Flat) {
      return deny(instrument, "no open position to exit");
    }
    RiskDecision d;
    d.allowed = true;
    d.side = pos.side == domain::PositionSide::Long ? domain::Side::Sell
                                                    : domain::Side::Buy;
    d.size = pos.size;
    d.price = b.mark_price;
    if (const auto* close = signal.snapshot.find("close");
        close != nullptr && std::isfinite(close->current) &&
        close->current > 0.0) {
      d.price = close->current;
    }
    return d;
  }

  // Entries.
  if (halted_.load()) {
    return deny(instrument, "trading halted");
  }
  if (pos.side != domain::PositionSide::Flat) {
    return deny(instrument, "position already open");
  }

  double size = domain::entryOrderSize(b.instrument);
  if (size <= 0.0 || size < b.instrument.min_order_size) {
    return deny(instrument, "entry size below exchange minimum");
  }
  if (size > b.limits.max_position_size) {
    return deny(instrument, "max position size exceeded");
  }

  double price = b.mark_price;
  if (const auto* close = signal.snapshot.find("close");
      close != nullptr && std::isfinite(close->current) &&
      close->current > 0.0) {
    price = close->current;
  }
  if (!(price > 0.0) || !std::isfinite(price)) {
    return deny(instrument, "no valid reference price");
  }

  double notional = size * price;
  if (notional > b.limits.max_notional) {
    return deny(instrument, "max notional per instrument exceeded");
  }

  {
    std::lock_guard exposure_lock(exposure_mutex_);

    std::set<std::string> busy = open_;
    double gross = 0.0;
    for (const auto& [id, value] : committed_) {
      gross += value;
    }
    for (const auto& [id, value] : reserved_) {
      if (id != instrument) {
        gross += value;
        busy.insert(id);
      }
    }
    busy.erase(instrument);

    if (busy.size() + 1 > limits_.max_open_positions) {
      return deny(instrument, "max open positions reached");
    }
    if (gross + notional > limits_.max_gross_notional) {
      return deny(instrument, "gross notional cap exceeded");
    }
    reserved_[instrument] = notional;
  }

  RiskDecision d;
  d.allowed = true;
  d.side = signal.type == domain::SignalType::EnterLong ? domain::Side::Buy
                                                        : domain::Side::Sell;
  d.size = size;
  d.price = price;
  d.notional = notional;
  return d;
}

void PositionTracker::release(const std::string& instrument) {
  std::lock_guard lock(exposure_mutex_);
  reserved_.erase(instrument);
}

// -----------------------------------------------------------------------------
// apply(): dedupe, mutate under the book lock, publish outside
// -----------------------------------------------------------------------------
bool PositionTracker::apply(const domain::FillEvent& fill) {
  Book& b = book(fill.instrument);

  if (!(fill.quantity > 0.0)) {
    std::cerr << "[PositionTracker] ignoring fill " << fill.fill_id
              << " with quantity " << fill.quantity << "\n";
    return false;
  }

  PositionUpdateEvent update;
  std::optional<RiskViolationEvent> violation;

  {
    std::lock_guard lock(b.mutex);
    if (!b.applied_fills.insert(fill.fill_id).second) {
      return false;
    }

    double signed_qty = fill.side == domain::Side::Buy ? fill.quantity
                                                       : -fill.quantity;
    applyFill(b.position, signed_qty, fill.price);
    if (b.mark_price <= 0.0) {
      b.mark_price = fill.price;
    }

    double total_realized = 0.0;
    {
      std::lock_guard exposure_lock(exposure_mutex_);
      realized_[fill.instrument] = b.position.realized_pnl;
      for (const auto& [id, pnl] : realized_) {
        total_realized += pnl;
      }
    }
    refreshExposure(b);

    update.position = b.position;
    update.mark_price = b.mark_price;
    update.timestamp = ms_to_timestamp(clock_.now_ms());

    if (total_realized < limits_.max_drawdown) {
      bool expected = false;
      if (halted_.compare_exchange_strong(expected, true)) {
        RiskViolationEvent v;
        v.instrument = fill.instrument;
        v.reason = "Max Drawdown Exceeded";
        v.current_value = total_realized;
        v.limit_value = limits_.max_drawdown;
        v.timestamp = update.timestamp;
        violation = v;
      }
    }
  }

  bus_.publish(update);

  if (violation) {
    std::cerr << "[PositionTracker] CRITICAL: " << violation->reason
              << " (realized=" << violation->current_value
              << ", floor=" << violation->limit_value
              << "). New entries halted.\n";
    bus_.publish(*violation);
  }
  return true;
}

void PositionTracker::refreshExposure(const Book& b) {
  const std::string& id = b.instrument.id;
  std::lock_guard lock(exposure_mutex_);
  if (b.position.side == domain::PositionSide::Flat) {
    committed_.erase(id);
    open_.erase(id);
    return;
  }
  double mark = b.mark_price > 0.0 ? b.mark_price
                                   : b.position.average_entry_price;
  committed_[id] = b.position.size * mark;
  open_.insert(id);
}

void PositionTracker::mark(const std::string& instrument, double price) {
  Book& b = book(instrument);
  if (!(price > 0.0) || !std::isfinite(price)) {
    return;
  }
  std::lock_guard lock(b.mutex);
  b.mark_price = price;
  refreshExposure(b);
}

void PositionTracker::hydratePosition(const domain::Position& position) {
  Book& b = book(position.instrument);
  std::lock_guard lock(b.mutex);
  b.position = position;
  if (b.position.side == domain::PositionSide::Flat) {
    b.position.size = 0.0;
  }
  {
    std::lock_guard exposure_lock(exposure_mutex_);
    realized_[position.instrument] = position.realized_pnl;
  }
  refreshExposure(b);
  std::cout << "[PositionTracker] hydrated " << position.instrument << " "
            << domain::positionSideToString(b.position.side) << " "
            << b.position.size << " @ " << b.position.average_entry_price
            << "\n";
}

domain::Position PositionTracker::position(
    const std::string& instrument) const {
  Book& b = book(instrument);
  std::lock_guard lock(b.mutex);
  return b.position;
}

double PositionTracker::markPrice(const std::string& instrument) const {
  Book& b = book(instrument);
  std::lock_guard lock(b.mutex);
  return b.mark_price;
}

std::vector<PositionSnapshot> PositionTracker::snapshots() const {
  std::set<std::string> ids;
  for (const auto& [id, b] : books_) {
    ids.insert(id);
  }

  std::vector<PositionSnapshot> out;
  out.reserve(ids.size());
  for (const auto& id : ids) {
    const Book& b = *books_.at(id);
    std::lock_guard lock(b.mutex);
    PositionSnapshot s;
    s.position = b.position;
    s.mark_price = b.mark_price;
    s.unrealized_pnl = domain::unrealizedPnl(b.position, b.mark_price);
    s.notional = b.position.size * b.mark_price;
    out.push_back(s);
  }
  return out;
}

ExposureSummary PositionTracker::exposure() const {
  std::lock_guard lock(exposure_mutex_);
  ExposureSummary s;
  for (const auto& [id, value] : committed_) {
    s.gross_notional += value;
  }
  for (const auto& [id, value] : reserved_) {
    s.reserved_notional += value;
  }
  for (const auto& [id, pnl] : realized_) {
    s.realized_pnl += pnl;
  }
  s.open_positions = open_.size();
  s.halted = halted_.load();
  return s;
}

void PositionTracker::haltTrading(const std::string& reason) {
  bool expected = false;
  if (!halted_.compare_exchange_strong(expected, true)) {
    return;
  }
  std::cerr << "[PositionTracker] CRITICAL: " << reason
            << ". New entries halted.\n";
  RiskViolationEvent v;
  v.reason = reason;
  v.timestamp = ms_to_timestamp(clock_.now_ms());
  bus_.publish(v);
}

bool PositionTracker::resumeTrading(const std::string& reason) {
  bool expected = true;
  if (!halted_.compare_exchange_strong(expected, false)) {
    return false;
  }

  TradingResumedEvent e;
  e.reason = reason;
  {
    std::lock_guard lock(exposure_mutex_);
    for (const auto& [id, pnl] : realized_) {
      e.realized_pnl += pnl;
    }
  }
  e.timestamp = ms_to_timestamp(clock_.now_ms());

  std::cout << "[PositionTracker] trading resumed: " << reason
            << " (realized pnl " << e.realized_pnl << ")\n";
  bus_.publish(e);
  return true;
}

// -----------------------------------------------------------------------------
// applyFill(): signed-quantity position arithmetic
// -----------------------------------------------------------------------------
void PositionTracker::applyFill(domain::Position& pos, double signed_fill_qty,
                                double fill_price) {
  double current_qty = domain::signedQuantity(pos);

  if (current_qty == 0.0) {
    setFromSigned(pos, signed_fill_qty);
    if (pos.side != domain::PositionSide::Flat) {
      pos.average_entry_price = fill_price;
    }
    return;
  }

  bool same_direction = (current_qty > 0.0) == (signed_fill_qty > 0.0);
  if (same_direction) {
    double new_total = current_qty + signed_fill_qty;
    pos.average_entry_price =
        (current_qty * pos.average_entry_price + signed_fill_qty * fill_price) /
        new_total;
    setFromSigned(pos, new_total);
    return;
  }

  double abs_current = std::abs(current_qty);
  double abs_fill = std::abs(signed_fill_qty);
  double direction_sign = current_qty > 0.0 ? 1.0 : -1.0;

  if (abs_fill <= abs_current) {
    pos.realized_pnl +=
        abs_fill * (fill_price - pos.average_entry_price) * direction_sign;
    setFromSigned(pos, current_qty + signed_fill_qty);
    return;
  }

  // Crossing zero: close everything, open the remainder at the fill price.
  pos.realized_pnl +=
      abs_current * (fill_price - pos.average_entry_price) * direction_sign;
  double open_qty = abs_fill - abs_current;
  double new_sign = signed_fill_qty > 0.0 ? 1.0 : -1.0;
  setFromSigned(pos, new_sign * open_qty);
  pos.average_entry_price = fill_price;
}

}  // namespace tradeagent
