#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string_view>
#include <thread>
#include <utility>

#include "apirest/cert-generator.hpp"
#include "apirest/event-source.hpp"
#include "apirest/fatal-fault-signal.hpp"
#include "apirest/http-listener.hpp"
#include "apirest/internal/handler-tracker.hpp"
#include "apirest/parameter-store.hpp"
#include "apirest/quit-signal.hpp"
#include "apirest/resource-handlers.hpp"

namespace apirest {

// Lifecycle controller of the REST API service.
//
// Idle -> Starting -> Running -> Stopping -> Idle
//
// start() resolves the configuration from the parameter store, bootstraps the TLS identity if requested, binds the
// listener and serves it from a background thread. Any failure before that point leaves the module Idle with no
// listener. stop() notifies the quit signal, then drains the listener for at most the shutdown timeout.
// Handlers still running after a forced drain are abandoned by stop(), but waited for by the destructor: the handlers
// and whatever they reference may be destroyed right after the module.
// Transitions are serialized, so that a stop always completes before a new start is accepted.
class ApiRestModule {
 public:
  static constexpr std::string_view kName = "api.rest";
  static constexpr std::chrono::milliseconds kDefaultShutdownTimeout{std::chrono::seconds{60}};

  enum class State : uint8_t { Idle, Starting, Running, Stopping };

  struct Options {
    std::chrono::milliseconds shutdownTimeout{kDefaultShutdownTimeout};
    // Generator used when TLS material is missing. Defaults to a SelfSignedCertGenerator.
    std::shared_ptr<CertGenerator> certGenerator;
    HttpListenerOptions listenerOptions;
  };

  // Registers the api.rest parameters into given store, which must outlive the module.
  // events may be null, in which case the websocket channel never pushes anything.
  ApiRestModule(ParameterStore& params, std::shared_ptr<ResourceHandlers> handlers,
                std::shared_ptr<EventSource> events, Options options);

  ApiRestModule(ParameterStore& params, std::shared_ptr<ResourceHandlers> handlers,
                std::shared_ptr<EventSource> events)
      : ApiRestModule(params, std::move(handlers), std::move(events), Options{}) {}

  ApiRestModule(const ApiRestModule&) = delete;
  ApiRestModule(ApiRestModule&&) = delete;
  ApiRestModule& operator=(const ApiRestModule&) = delete;
  ApiRestModule& operator=(ApiRestModule&&) = delete;

  // Stops the module if running, then blocks until no resource handler is running anymore.
  ~ApiRestModule();

  // Throws ApiRestError: AlreadyStarted, InvalidConfiguration, TlsBootstrapFailed or BindFailed.
  void start();

  // Returns false (and does nothing) if the module is not running.
  // Must not be called from the fatal fault handler, which runs on the listener thread.
  bool stop();

  [[nodiscard]] State state() const noexcept { return _state.load(std::memory_order_acquire); }

  [[nodiscard]] bool running() const noexcept { return state() == State::Running; }

  // Bound port of the running listener, 0 when idle.
  [[nodiscard]] uint16_t port() const noexcept { return _port.load(std::memory_order_acquire); }

  [[nodiscard]] bool isTls() const noexcept { return _tls.load(std::memory_order_acquire); }

  [[nodiscard]] QuitSignal& quitSignal() noexcept { return _quit; }

  // Set the callback invoked (from the listener thread) when the listener fails after start() returned.
  void setFatalFaultHandler(FatalFaultSignal::Handler handler) { _fault.setHandler(std::move(handler)); }

  // Rethrow the fault raised by the listener of the current (or last) running period, if any.
  void rethrowIfFault() const { _fault.rethrowIfRaised(); }

 private:
  [[nodiscard]] std::unique_ptr<HttpListener> configure();

  ParameterStore& _params;
  std::shared_ptr<ResourceHandlers> _handlers;
  std::shared_ptr<EventSource> _events;
  Options _options;

  std::mutex _transitionMutex;
  std::atomic<State> _state{State::Idle};
  std::atomic<uint16_t> _port{0};
  std::atomic<bool> _tls{false};
  QuitSignal _quit;
  FatalFaultSignal _fault;
  std::shared_ptr<internal::HandlerTracker> _handlerTracker{std::make_shared<internal::HandlerTracker>()};
  std::unique_ptr<HttpListener> _listener;
  std::jthread _thread;
};

[[nodiscard]] std::string_view StateName(ApiRestModule::State state) noexcept;

}  // namespace apirest
