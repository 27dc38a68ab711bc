#pragma once

#include "arb/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace arb {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
//
// @brief  Synchronous publish-subscribe channel over the Event variant.
//
// @details
// Every brokerage connection owns one bus, MultiBrokerageManager owns the
// aggregate bus, and each EventLoopThread owns the bus it dispatches on.
//
// Thread model:
//   subscribe(), unsubscribe() and publish() are safe from any thread.
//   Callbacks run on the publishing thread before publish() returns. The
//   subscriber list is copied under the mutex and callbacks run with the
//   mutex released, so:
//     - a callback may publish or unsubscribe without deadlocking;
//     - two brokerage I/O threads publishing at once never wait on each
//       other's subscribers, only on the short list copy.
//   A subscriber removed while a publish is in flight may still see that
//   one event.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Registers a callback for every event. Returns the id for unsubscribe().
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<EventType>(callback)
  // -------------------------------------------------------------------------
  // Registers a callback that fires only when the published variant holds
  // EventType. Implemented as a generic subscription with a std::get_if
  // filter, so it shares ids and ordering with subscribe(GenericCallback).
  // -------------------------------------------------------------------------
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // Unknown ids are ignored.
  void unsubscribe(SubscriptionId id);

  void publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;      // Guards subscribers_ and next_id_
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

}  // namespace arb
