#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stop_token>

namespace apirest {

// Broadcast notification of the intent to stop the service. Notifying never blocks and can be observed by any
// number of waiters, through stop tokens or by waiting. The signal is re-armed at each start.
class QuitSignal {
 public:
  // Reset the signal for a new running period. Tokens obtained before arming keep their previous state.
  void arm();

  // Notify all current and future observers of the current period. Idempotent.
  void notify();

  [[nodiscard]] bool notified() const;

  [[nodiscard]] std::stop_token token() const;

  // Wait until notified or until timeout elapses. Returns true if notified.
  [[nodiscard]] bool waitFor(std::chrono::milliseconds timeout) const;

 private:
  mutable std::mutex _mutex;
  mutable std::condition_variable _cv;
  std::stop_source _source;
};

}  // namespace apirest
