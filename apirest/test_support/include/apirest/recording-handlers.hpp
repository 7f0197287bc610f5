#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

#include "apirest/http-request.hpp"
#include "apirest/http-response.hpp"
#include "apirest/resource-handlers.hpp"
#include "apirest/route-table.hpp"

namespace apirest::test {

// ResourceHandlers recording every call. Each handler answers 200 with a body naming the resource, after an optional
// delay. It can be told to throw instead.
class RecordingHandlers : public ResourceHandlers {
 public:
  struct Call {
    Resource resource;
    std::string method;
    std::string path;
    RouteMatch match;
  };

  HttpResponse events(const HttpRequest& request) override;

  HttpResponse session(const HttpRequest& request, const RouteMatch& match) override;

  HttpResponse file(const HttpRequest& request) override;

  void setDelay(std::chrono::milliseconds delay) { _delayMs.store(delay.count()); }

  void setThrow(bool throwOnCall) { _throw.store(throwOnCall); }

  [[nodiscard]] std::vector<Call> calls() const;

  [[nodiscard]] std::size_t nbCalls() const;

  // Number of calls that entered a handler and have not returned yet.
  [[nodiscard]] int inFlight() const noexcept { return _inFlight.load(); }

  // Polls until exactly nb calls are in flight. Returns false on timeout.
  [[nodiscard]] bool waitInFlight(int nb, std::chrono::milliseconds timeout = std::chrono::seconds{2}) const;

 private:
  HttpResponse record(const HttpRequest& request, const RouteMatch& match);

  mutable std::mutex _mutex;
  std::vector<Call> _calls;
  std::atomic<std::chrono::milliseconds::rep> _delayMs{0};
  std::atomic<int> _inFlight{0};
  std::atomic<bool> _throw{false};
};

}  // namespace apirest::test
