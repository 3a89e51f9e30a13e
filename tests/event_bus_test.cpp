// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for tradeagent::EventBus.
//
// Validates:
//   - Generic subscription receives every reporting event type
//   - Typed subscription receives only its own type
//   - Unsubscribe stops delivery; unknown ids are harmless
//   - Re-entrant publish (subscriber publishes inside callback), no deadlock
//   - A throwing subscriber does not stop delivery to the others
//
// All tests are single-threaded; cross-thread delivery is covered by the
// scheduler and engine tests.
// =============================================================================

#include "tradeagent/eventbus/event_bus.hpp"
#include "tradeagent/events/event.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

class EventBusTest : public ::testing::Test {
 protected:
  tradeagent::EventBus bus;

  static tradeagent::SignalEvent makeSignal(const std::string& instrument,
                                            std::uint64_t sequence) {
    tradeagent::SignalEvent e;
    e.instrument = instrument;
    e.type = tradeagent::domain::SignalType::EnterLong;
    e.sequence = sequence;
    e.rule = "cross_up";
    e.close = 101.5;
    return e;
  }

  static tradeagent::RiskRejectEvent makeReject(const std::string& instrument) {
    tradeagent::RiskRejectEvent e;
    e.instrument = instrument;
    e.signal_type = tradeagent::domain::SignalType::EnterShort;
    e.reason = "max_notional";
    return e;
  }
};

// -----------------------------------------------------------------------------
// 1. A generic subscriber must be invoked for every event type.
// Why: The IPC telemetry bridge subscribes generically; a skipped alternative
//      would silently drop a whole class of operator notifications.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  int call_count = 0;
  bus.subscribe([&call_count](const tradeagent::Event&) { ++call_count; });

  bus.publish(makeSignal("BTC-USDT", 1));
  bus.publish(makeReject("BTC-USDT"));
  bus.publish(tradeagent::OrderUpdateEvent{});
  bus.publish(tradeagent::PositionUpdateEvent{});
  bus.publish(tradeagent::RiskViolationEvent{});
  bus.publish(tradeagent::CycleErrorEvent{});

  EXPECT_EQ(call_count, 6);
}

// -----------------------------------------------------------------------------
// 2. A typed subscriber must fire only for its registered event type.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersCorrectly) {
  int reject_count = 0;
  bus.subscribe<tradeagent::RiskRejectEvent>(
      [&reject_count](const tradeagent::RiskRejectEvent&) { ++reject_count; });

  bus.publish(makeSignal("BTC-USDT", 1));
  bus.publish(makeReject("BTC-USDT"));

  EXPECT_EQ(reject_count, 1);
}

// -----------------------------------------------------------------------------
// 3. After unsubscribe(id), the callback must not fire again.
// Why: TradingEngine unsubscribes the telemetry bridge before destroying the
//      IPC server; a late callback would touch a dead object.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int call_count = 0;
  auto id = bus.subscribe<tradeagent::SignalEvent>(
      [&call_count](const tradeagent::SignalEvent&) { ++call_count; });

  bus.publish(makeSignal("BTC-USDT", 1));
  EXPECT_EQ(call_count, 1);

  bus.unsubscribe(id);
  EXPECT_EQ(bus.subscriberCount(), 0u);

  bus.publish(makeSignal("BTC-USDT", 2));
  EXPECT_EQ(call_count, 1);
}

// -----------------------------------------------------------------------------
// 4. Unsubscribing an unknown id and publishing to an empty bus are no-ops.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, EmptyBusEdgeCases) {
  EXPECT_NO_FATAL_FAILURE(bus.unsubscribe(9999));
  EXPECT_NO_FATAL_FAILURE(bus.publish(makeSignal("ETH-USDT", 3)));
}

// -----------------------------------------------------------------------------
// 5. A subscriber that publishes inside its callback must not deadlock.
// Why: publish() copies the subscriber list and releases the lock before
//      invoking callbacks. Holding it would hang this test.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberCanPublishInsideCallback) {
  int rejects = 0;
  bus.subscribe<tradeagent::RiskRejectEvent>(
      [&rejects](const tradeagent::RiskRejectEvent&) { ++rejects; });
  bus.subscribe<tradeagent::SignalEvent>(
      [this](const tradeagent::SignalEvent& s) {
        bus.publish(makeReject(s.instrument));
      });

  bus.publish(makeSignal("BTC-USDT", 1));

  EXPECT_EQ(rejects, 1);
}

// -----------------------------------------------------------------------------
// 6. A throwing subscriber is logged and the remaining subscribers still run.
// Why: Reporting must never break the order path that published the event.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, ThrowingSubscriberDoesNotStopDelivery) {
  int after = 0;
  bus.subscribe<tradeagent::SignalEvent>([](const tradeagent::SignalEvent&) {
    throw std::runtime_error("telemetry sink down");
  });
  bus.subscribe<tradeagent::SignalEvent>(
      [&after](const tradeagent::SignalEvent&) { ++after; });

  EXPECT_NO_THROW(bus.publish(makeSignal("BTC-USDT", 1)));
  EXPECT_EQ(after, 1);
}

// -----------------------------------------------------------------------------
// 7. Field values survive the variant dispatch.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberReceivesCorrectData) {
  tradeagent::SignalEvent received;
  bus.subscribe<tradeagent::SignalEvent>(
      [&received](const tradeagent::SignalEvent& e) { received = e; });

  bus.publish(makeSignal("ETH-USDT", 42));

  EXPECT_EQ(received.instrument, "ETH-USDT");
  EXPECT_EQ(received.sequence, 42u);
  EXPECT_EQ(received.rule, "cross_up");
  EXPECT_DOUBLE_EQ(received.close, 101.5);
}
