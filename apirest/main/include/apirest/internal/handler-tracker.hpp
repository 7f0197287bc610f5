#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace apirest::internal {

// Counts the resource handler threads currently running. Shared by a module and its successive listeners, so that
// handlers abandoned by a forced drain can still be waited for before the module goes away.
class HandlerTracker {
 public:
  // Returns false, without registering anything, if limit handlers are already running.
  [[nodiscard]] bool tryEnter(std::size_t limit) {
    std::scoped_lock lock(_mutex);
    if (_nbRunning >= limit) {
      return false;
    }
    ++_nbRunning;
    return true;
  }

  void leave() noexcept {
    {
      std::scoped_lock lock(_mutex);
      --_nbRunning;
    }
    _idle.notify_all();
  }

  // Blocks until no handler is running anymore.
  void waitIdle() {
    std::unique_lock lock(_mutex);
    _idle.wait(lock, [this] { return _nbRunning == 0; });
  }

  [[nodiscard]] std::size_t nbRunning() const {
    std::scoped_lock lock(_mutex);
    return _nbRunning;
  }

 private:
  mutable std::mutex _mutex;
  std::condition_variable _idle;
  std::size_t _nbRunning{0};
};

}  // namespace apirest::internal
