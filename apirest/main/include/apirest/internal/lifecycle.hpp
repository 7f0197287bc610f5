#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

#include "apirest/event-fd.hpp"
#include "apirest/timedef.hpp"

namespace apirest::internal {

// Run state of the listener reactor. State changes happen on the reactor thread, except drain requests which may be
// posted from any thread and are picked up at the next loop iteration.
struct Lifecycle {
  enum class State : uint8_t { Idle, Running, Draining };

  static constexpr int64_t kNoDrainRequest = -1;

  // A drain requested before entering the running state is kept, and applied at the first loop iteration.
  void enterRunning() noexcept {
    state.store(State::Running, std::memory_order_release);
  }

  // Thread-safe. A second request can only shorten the deadline.
  void requestDrain(std::chrono::milliseconds maxWait) noexcept {
    const int64_t requested = maxWait.count() < 0 ? 0 : static_cast<int64_t>(maxWait.count());
    int64_t current = drainRequestMs.load(std::memory_order_relaxed);
    while ((current == kNoDrainRequest || requested < current) &&
           !drainRequestMs.compare_exchange_weak(current, requested, std::memory_order_acq_rel)) {
    }
    wakeupFd.send();
  }

  // Called by the reactor thread. Returns true if a (new or shorter) drain deadline was just applied.
  bool applyDrainRequest() noexcept {
    const int64_t requested = drainRequestMs.exchange(kNoDrainRequest, std::memory_order_acq_rel);
    if (requested == kNoDrainRequest) {
      return false;
    }
    const auto deadline = SteadyClock::now() + std::chrono::milliseconds(requested);
    if (isDraining() && deadline >= drainDeadline) {
      return false;
    }
    drainDeadline = deadline;
    state.store(State::Draining, std::memory_order_release);
    return true;
  }

  void reset() noexcept {
    drainDeadline = {};
    state.store(State::Idle, std::memory_order_release);
  }

  [[nodiscard]] bool isIdle() const noexcept { return state.load(std::memory_order_acquire) == State::Idle; }
  [[nodiscard]] bool isRunning() const noexcept { return state.load(std::memory_order_acquire) == State::Running; }
  [[nodiscard]] bool isDraining() const noexcept { return state.load(std::memory_order_acquire) == State::Draining; }
  [[nodiscard]] SteadyTimePoint deadline() const noexcept { return drainDeadline; }

  SteadyTimePoint drainDeadline;
  // Wakeup fd (eventfd) used to interrupt epoll_wait promptly when a drain is requested from another thread.
  EventFd wakeupFd;
  std::atomic<State> state{State::Idle};
  std::atomic<int64_t> drainRequestMs{kNoDrainRequest};
};

}  // namespace apirest::internal
