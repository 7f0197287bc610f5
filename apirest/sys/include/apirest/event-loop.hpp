#pragma once

#include <sys/epoll.h>

#include <chrono>
#include <cstdint>
#include <span>
#include <vector>

#include "apirest/base-fd.hpp"
#include "apirest/event.hpp"

namespace apirest {

// Thin RAII wrapper over epoll.
// The event buffer doubles its capacity each time a poll saturates it, and never shrinks.
class EventLoop {
 public:
  static constexpr uint32_t kInitialCapacity = 64;

  struct EventFd {
    EventBmp eventBmp;
    int fd;
  };

  explicit EventLoop(std::chrono::milliseconds pollTimeout, uint32_t initialCapacity = kInitialCapacity);

  // Register fd with given events.
  // On error, throws std::system_error.
  void addOrThrow(EventFd event) const;

  // Register fd with given events.
  // Returns true on success, false on failure (logged).
  [[nodiscard]] bool add(EventFd event) const;

  // Modify fd with given events.
  // Returns true on success, false on failure (logged).
  [[nodiscard]] bool mod(EventFd event) const;

  // Delete fd from monitoring.
  void del(int fd) const;

  // Polls for ready events up to the poll timeout.
  // Returns an empty span on timeout or EINTR.
  // Throws std::system_error on unrecoverable epoll_wait failure.
  [[nodiscard]] std::span<const EventFd> poll();

  [[nodiscard]] uint32_t capacity() const noexcept { return static_cast<uint32_t>(_epollEvents.size()); }

 private:
  int _pollTimeoutMs;
  BaseFd _baseFd;
  std::vector<epoll_event> _epollEvents;
  std::vector<EventFd> _readyEvents;
};

}  // namespace apirest
