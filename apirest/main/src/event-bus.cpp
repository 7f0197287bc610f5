#include "apirest/event-bus.hpp"

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "apirest/event-source.hpp"

namespace apirest {

EventSource::SubscriptionId EventBus::subscribe(Listener listener) {
  std::scoped_lock lock(_mutex);
  const auto id = _nextId++;
  _listeners.emplace(id, std::move(listener));
  return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
  // Waits for any in-flight delivery. Recursive so that a listener may unsubscribe itself.
  std::scoped_lock deliveryLock(_deliveryMutex);
  std::scoped_lock lock(_mutex);
  _listeners.erase(id);
}

void EventBus::publish(std::string_view tag, std::string payload) {
  Event event{std::string(tag), std::move(payload), std::chrono::system_clock::now()};

  std::scoped_lock deliveryLock(_deliveryMutex);
  std::vector<std::pair<SubscriptionId, Listener>> listeners;
  {
    std::scoped_lock lock(_mutex);
    _history.push_back(event);
    if (_history.size() > _historySize) {
      _history.pop_front();
    }
    listeners.assign(_listeners.begin(), _listeners.end());
  }
  for (const auto& [id, listener] : listeners) {
    {
      // skip listeners removed by a previous listener of this same delivery
      std::scoped_lock lock(_mutex);
      if (!_listeners.contains(id)) {
        continue;
      }
    }
    listener(event);
  }
}

std::vector<Event> EventBus::history() const {
  std::scoped_lock lock(_mutex);
  return {_history.begin(), _history.end()};
}

void EventBus::clear() {
  std::scoped_lock lock(_mutex);
  _history.clear();
}

std::size_t EventBus::nbSubscribers() const {
  std::scoped_lock lock(_mutex);
  return _listeners.size();
}

}  // namespace apirest
