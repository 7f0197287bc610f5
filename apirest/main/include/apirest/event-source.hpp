#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace apirest {

// A record pushed to the event streaming channel. The payload is opaque text (typically JSON) produced by the
// session the service exposes, and is sent as is.
struct Event {
  std::string tag;
  std::string payload;
  std::chrono::system_clock::time_point time;
};

// Producer of events consumed by the streaming channel.
class EventSource {
 public:
  using SubscriptionId = uint64_t;
  using Listener = std::function<void(const Event&)>;

  virtual ~EventSource() = default;

  // Register a listener called for each new event, from the producing thread. Listeners must not block.
  virtual SubscriptionId subscribe(Listener listener) = 0;

  // Unregister a listener. When this returns, the listener is not running and will never be called again.
  // Unknown ids are ignored.
  virtual void unsubscribe(SubscriptionId id) = 0;
};

}  // namespace apirest
