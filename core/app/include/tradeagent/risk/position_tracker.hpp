#pragma once

#include "tradeagent/config/instrument_config.hpp"
#include "tradeagent/domain/fill.hpp"
#include "tradeagent/domain/order.hpp"
#include "tradeagent/domain/position.hpp"
#include "tradeagent/domain/risk_limits.hpp"
#include "tradeagent/domain/signal.hpp"
#include "tradeagent/eventbus/event_bus.hpp"
#include "tradeagent/time/i_time_provider.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace tradeagent {

// -----------------------------------------------------------------------------
// RiskDecision: result of PositionTracker::authorize()
// -----------------------------------------------------------------------------
// When allowed, side/size/price describe the order to place. price is the
// reference price the notional was computed with. When denied, reason says
// which limit was hit.
// -----------------------------------------------------------------------------
struct RiskDecision {
  bool allowed{false};
  std::string reason;
  domain::Side side{domain::Side::Buy};
  double size{0.0};
  double price{0.0};
  double notional{0.0};
};

struct PositionSnapshot {
  domain::Position position;
  double mark_price{0.0};
  double unrealized_pnl{0.0};
  double notional{0.0};
};

struct ExposureSummary {
  double gross_notional{0.0};     // Sum of |size| * mark over open positions
  double reserved_notional{0.0};  // Held by entries still in flight
  std::size_t open_positions{0};
  double realized_pnl{0.0};
  bool halted{false};
};

// -----------------------------------------------------------------------------
// PositionTracker: positions, exposure and pre-trade risk
// -----------------------------------------------------------------------------
//
// @brief  Owns the authoritative Position of every configured instrument,
//         applies fills to it and decides whether a signal may trade.
//
// @details
// authorize(instrument, signal):
//   EXIT   allowed whenever the position is not flat. Side is opposite to
//          the position, size is the full position size.
//   ENTER  denied when trading is halted, when the position is not flat, when
//          the entry size exceeds the instrument's max_position_size, when
//          size * price exceeds its max_notional, when another open position
//          would exceed max_open_positions, or when the resulting gross
//          notional would exceed max_gross_notional.
//   An allowed entry reserves its notional. The reservation counts towards
//   the gross cap and the open-position count until release() is called
//   (the order reached a terminal state), so two instruments authorizing at
//   the same moment cannot jointly overshoot the cap.
//
// apply(fill):
//   Idempotent per fill_id. Uses signed-quantity arithmetic: a fill in the
//   direction of the position averages the entry price, an opposite fill
//   realizes PnL on the closed quantity and keeps the entry price, a fill
//   that crosses zero realizes the whole old position and opens the rest at
//   the fill price. Publishes PositionUpdateEvent.
//
// Kill switch:
//   haltTrading() or total realized PnL below RiskLimits::max_drawdown stops
//   new entries. Exits stay allowed so open risk can still be closed.
//   resumeTrading() clears the switch; a later fill that leaves realized PnL
//   below the floor trips it again.
//
// Locking:
//   Each instrument has its own Book mutex guarding its Position. The
//   exposure_mutex_ guards the cross-instrument aggregates. Order is always
//   Book mutex first, then exposure_mutex_. Events are published after both
//   are released.
//
// Ownership:
//   Books are created for the configured instruments at construction and
//   never added or removed, so book lookup needs no lock.
// -----------------------------------------------------------------------------
class PositionTracker {
 public:
  PositionTracker(EventBus& bus, const ITimeProvider& clock,
                  const std::vector<config::InstrumentConfig>& instruments,
                  const domain::RiskLimits& limits);

  PositionTracker(const PositionTracker&) = delete;
  PositionTracker& operator=(const PositionTracker&) = delete;
  PositionTracker(PositionTracker&&) = delete;
  PositionTracker& operator=(PositionTracker&&) = delete;

  // Throws UnknownInstrument.
  RiskDecision authorize(const std::string& instrument,
                         const domain::Signal& signal);

  // Drops the entry reservation of `instrument`, if any.
  void release(const std::string& instrument);

  // Returns false for a duplicate fill id or a non-positive quantity.
  // Throws UnknownInstrument.
  bool apply(const domain::FillEvent& fill);

  // Ignores non-positive or non-finite prices. Throws UnknownInstrument.
  void mark(const std::string& instrument, double price);

  void hydratePosition(const domain::Position& position);

  // Throws UnknownInstrument.
  domain::Position position(const std::string& instrument) const;
  double markPrice(const std::string& instrument) const;

  std::vector<PositionSnapshot> snapshots() const;
  ExposureSummary exposure() const;

  void haltTrading(const std::string& reason);
  // Returns false when trading was not halted.
  bool resumeTrading(const std::string& reason);
  bool isHalted() const { return halted_.load(); }

  static void applyFill(domain::Position& pos, double signed_fill_qty,
                        double fill_price);

 private:
  struct Book {
    mutable std::mutex mutex;
    domain::Instrument instrument;
    domain::InstrumentLimits limits;
    domain::Position position;
    double mark_price{0.0};
    std::unordered_set<std::string> applied_fills;
  };

  Book& book(const std::string& instrument) const;

  // Caller holds b.mutex.
  void refreshExposure(const Book& b);

  RiskDecision deny(const std::string& instrument,
                    const std::string& reason) const;

  EventBus& bus_;
  const ITimeProvider& clock_;
  const domain::RiskLimits limits_;
  std::unordered_map<std::string, std::unique_ptr<Book>> books_;

  mutable std::mutex exposure_mutex_;
  std::unordered_map<std::string, double> committed_;
  std::unordered_map<std::string, double> reserved_;
  std::unordered_map<std::string, double> realized_;
  std::set<std::string> open_;

  std::atomic<bool> halted_{false};
};

}  // namespace tradeagent
