#pragma once

#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "apirest/event-source.hpp"

namespace apirest {

// In-process EventSource keeping a bounded history of the last published events.
class EventBus : public EventSource {
 public:
  static constexpr std::size_t kDefaultHistorySize = 1024;

  explicit EventBus(std::size_t historySize = kDefaultHistorySize) : _historySize(historySize) {}

  SubscriptionId subscribe(Listener listener) override;

  void unsubscribe(SubscriptionId id) override;

  // Record the event in history and deliver it to all current listeners, in the calling thread.
  void publish(std::string_view tag, std::string payload);

  // Copy of the retained events, oldest first.
  [[nodiscard]] std::vector<Event> history() const;

  void clear();

  [[nodiscard]] std::size_t nbSubscribers() const;

 private:
  // Serializes deliveries with unsubscribe, so that a listener is never called after unsubscribe returned.
  mutable std::recursive_mutex _deliveryMutex;
  mutable std::mutex _mutex;
  std::size_t _historySize;
  std::deque<Event> _history;
  std::map<SubscriptionId, Listener> _listeners;
  SubscriptionId _nextId{1};
};

}  // namespace apirest
