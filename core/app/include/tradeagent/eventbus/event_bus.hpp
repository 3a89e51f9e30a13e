#pragma once

#include "tradeagent/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace tradeagent {

// -----------------------------------------------------------------------------
// EventBus: reporting channel for signals, orders, positions and risk
// -----------------------------------------------------------------------------
//
// @brief  Synchronous publish/subscribe over the Event variant.
//
// @details
// The bus is the engine's reporting surface. Core components publish what
// happened (an order changed state, a fill moved a position, a signal was
// risk-rejected, a cycle failed); observers such as the IPC telemetry feed
// and tests subscribe. Core components never call each other through the
// bus: the trading path is direct calls on the instrument's lane, the bus
// only carries the record of it.
//
// Callbacks run on the publishing thread, which is usually an instrument
// lane. A callback must therefore be short and must not block; IpcServer
// only enqueues.
//
// A subscriber that throws is logged and skipped. The exception never
// reaches the publisher, so a faulty observer cannot abort an order
// transition half way.
//
// Thread model:
//   subscribe, unsubscribe and publish are safe from any thread. publish()
//   copies the subscriber list under the lock and invokes callbacks outside
//   it, so a callback may publish or unsubscribe without deadlocking.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Receives every event.
  SubscriptionId subscribe(GenericCallback callback);

  // Receives only events holding EventType.
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // Unknown ids are ignored. A publish already in progress may still invoke
  // the removed callback once.
  void unsubscribe(SubscriptionId id);

  void publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace tradeagent
