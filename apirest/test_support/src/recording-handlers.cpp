#include "apirest/recording-handlers.hpp"

#include <chrono>
#include <cstddef>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "apirest/http-method.hpp"
#include "apirest/http-request.hpp"
#include "apirest/http-response.hpp"
#include "apirest/http-status-code.hpp"
#include "apirest/route-table.hpp"

namespace apirest::test {

HttpResponse RecordingHandlers::events(const HttpRequest& request) {
  return record(request, RouteMatch{Resource::Events, {}, {}});
}

HttpResponse RecordingHandlers::session(const HttpRequest& request, const RouteMatch& match) {
  return record(request, match);
}

HttpResponse RecordingHandlers::file(const HttpRequest& request) {
  return record(request, RouteMatch{Resource::File, {}, {}});
}

HttpResponse RecordingHandlers::record(const HttpRequest& request, const RouteMatch& match) {
  ++_inFlight;
  {
    std::scoped_lock lock(_mutex);
    _calls.push_back(Call{match.resource, std::string(http::MethodToStr(request.method())), std::string(request.path()), match});
  }
  const auto delay = std::chrono::milliseconds{_delayMs.load()};
  if (delay.count() > 0) {
    std::this_thread::sleep_for(delay);
  }
  --_inFlight;
  if (_throw.load()) {
    throw std::runtime_error("handler failure");
  }
  std::string body(ResourceName(match.resource));
  if (!match.subresource.empty()) {
    body.push_back('/');
    body.append(match.subresource);
  }
  if (!match.id.empty()) {
    body.push_back('/');
    body.append(match.id);
  }
  return {http::StatusCodeOK, std::move(body), "text/plain"};
}

bool RecordingHandlers::waitInFlight(int nb, std::chrono::milliseconds timeout) const {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (_inFlight.load() != nb) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds{1});
  }
  return true;
}

std::vector<RecordingHandlers::Call> RecordingHandlers::calls() const {
  std::scoped_lock lock(_mutex);
  return _calls;
}

std::size_t RecordingHandlers::nbCalls() const {
  std::scoped_lock lock(_mutex);
  return _calls.size();
}

}  // namespace apirest::test
