#include "apirest/fatal-fault-signal.hpp"

#include <exception>
#include <mutex>
#include <string_view>
#include <utility>

#include "apirest/log.hpp"

namespace apirest {

void FatalFaultSignal::setHandler(Handler handler) {
  std::scoped_lock lock(_mutex);
  _handler = std::move(handler);
}

void FatalFaultSignal::raise(std::exception_ptr fault, std::string_view reason) {
  Handler handler;
  {
    std::scoped_lock lock(_mutex);
    _fault = fault;
    handler = _handler;
  }
  log::critical("api server fatal fault: {}", reason);
  if (handler) {
    handler(std::move(fault));
  }
}

bool FatalFaultSignal::raised() const {
  std::scoped_lock lock(_mutex);
  return static_cast<bool>(_fault);
}

void FatalFaultSignal::rethrowIfRaised() const {
  std::exception_ptr fault;
  {
    std::scoped_lock lock(_mutex);
    fault = _fault;
  }
  if (fault) {
    std::rethrow_exception(fault);
  }
}

void FatalFaultSignal::clear() {
  std::scoped_lock lock(_mutex);
  _fault = nullptr;
}

}  // namespace apirest
