#include "apirest/quit-signal.hpp"

#include <chrono>
#include <mutex>
#include <stop_token>

namespace apirest {

void QuitSignal::arm() {
  std::scoped_lock lock(_mutex);
  _source = std::stop_source();
}

void QuitSignal::notify() {
  {
    std::scoped_lock lock(_mutex);
    _source.request_stop();
  }
  _cv.notify_all();
}

bool QuitSignal::notified() const {
  std::scoped_lock lock(_mutex);
  return _source.stop_requested();
}

std::stop_token QuitSignal::token() const {
  std::scoped_lock lock(_mutex);
  return _source.get_token();
}

bool QuitSignal::waitFor(std::chrono::milliseconds timeout) const {
  std::unique_lock lock(_mutex);
  return _cv.wait_for(lock, timeout, [this] { return _source.stop_requested(); });
}

}  // namespace apirest
