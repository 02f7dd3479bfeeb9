#include "perpsim/eventbus/event_bus.hpp"

#include <algorithm>
#include <exception>
#include <iostream>

namespace perpsim {

EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  std::lock_guard lock(mutex_);
  SubscriptionId id = next_id_++;
  subscribers_.emplace_back(id, std::move(callback));
  return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  subscribers_.erase(
      std::remove_if(subscribers_.begin(), subscribers_.end(),
                     [id](const SubscriberEntry& e) { return e.first == id; }),
      subscribers_.end());
}

// -----------------------------------------------------------------------------
// publish: snapshot the subscriber list, then dispatch without the lock
// -----------------------------------------------------------------------------
std::size_t EventBus::publish(const Event& event) {
  std::vector<SubscriberEntry> copy;
  {
    std::lock_guard lock(mutex_);
    copy = subscribers_;
  }

  std::size_t failed = 0;
  for (const auto& [id, callback] : copy) {
    try {
      callback(event);
    } catch (const std::exception& e) {
      ++failed;
      std::cerr << "[EventBus] subscriber " << id << " failed on "
                << eventName(event) << ": " << e.what() << "\n";
    }
  }

  if (failed != 0) {
    std::lock_guard lock(mutex_);
    failures_ += failed;
  }
  return failed;
}

std::size_t EventBus::subscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

std::uint64_t EventBus::failureCount() const {
  std::lock_guard lock(mutex_);
  return failures_;
}

}  // namespace perpsim
