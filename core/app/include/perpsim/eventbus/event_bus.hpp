#pragma once

#include "perpsim/events/event.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace perpsim {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: Synchronous publish-subscribe over the Event variant. The
// tick loop publishes; the logger in main(), the IPC telemetry bridge and
// tests subscribe.
//
// Thread model: subscribe / unsubscribe / publish are safe from any thread.
// Callbacks run on the publishing thread (the tick thread) before publish()
// returns, so a slow subscriber slows the tick. Subscribers that do I/O
// must hand the event to their own thread (see IpcServer::pushTelemetry).
//
// Failure isolation: the tick loop publishes between state changes, so a
// subscriber exception must not unwind into it. publish() logs the
// exception, counts it, and carries on with the next subscriber.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Callback receives every published event.
  SubscriptionId subscribe(GenericCallback callback);

  // Callback receives only events holding EventType.
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // Unknown ids are ignored.
  void unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(event)
  // -------------------------------------------------------------------------
  // Invokes every subscriber in registration order. The subscriber list is
  // copied under the lock and the callbacks run without it, so a callback
  // may itself publish or unsubscribe.
  //
  // @return number of subscribers that threw.
  // -------------------------------------------------------------------------
  std::size_t publish(const Event& event);

  std::size_t subscriberCount() const;

  // Subscriber exceptions caught since construction.
  std::uint64_t failureCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
  std::uint64_t failures_{0};
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

}  // namespace perpsim
