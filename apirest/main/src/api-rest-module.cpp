#include "apirest/api-rest-module.hpp"

#include <exception>
#include <format>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>

#include "apirest/api-rest-config.hpp"
#include "apirest/api-rest-error.hpp"
#include "apirest/cert-generator.hpp"
#include "apirest/config-resolver.hpp"
#include "apirest/dispatch-gate.hpp"
#include "apirest/http-listener.hpp"
#include "apirest/log.hpp"
#include "apirest/parameter-store.hpp"
#include "apirest/route-table.hpp"
#include "apirest/tls-context.hpp"
#include "apirest/tls-identity.hpp"

namespace apirest {

std::string_view StateName(ApiRestModule::State state) noexcept {
  switch (state) {
    case ApiRestModule::State::Idle:
      return "idle";
    case ApiRestModule::State::Starting:
      return "starting";
    case ApiRestModule::State::Running:
      return "running";
    case ApiRestModule::State::Stopping:
      return "stopping";
    default:
      return "unknown";
  }
}

ApiRestModule::ApiRestModule(ParameterStore& params, std::shared_ptr<ResourceHandlers> handlers,
                             std::shared_ptr<EventSource> events, Options options)
    : _params(params), _handlers(std::move(handlers)), _events(std::move(events)), _options(std::move(options)) {
  if (!_handlers) {
    throw std::invalid_argument("ApiRestModule requires resource handlers");
  }
  if (!_options.certGenerator) {
    _options.certGenerator = std::make_shared<SelfSignedCertGenerator>();
  }
  RegisterApiRestParameters(_params);
}

ApiRestModule::~ApiRestModule() {
  stop();
  _handlerTracker->waitIdle();
}

std::unique_ptr<HttpListener> ApiRestModule::configure() {
  const ConfigResolver resolver(_params);
  auto config = std::make_shared<const ApiRestConfig>(resolver.resolve());

  std::shared_ptr<const TlsContext> tlsContext;
  if (config->isTls()) {
    const TlsIdentityProvider identityProvider(_options.certGenerator);
    const auto identity = identityProvider.ensure(config->certFile, config->keyFile,
                                                  [&resolver] { return resolver.resolveCertProfile(); });
    try {
      tlsContext = std::make_shared<const TlsContext>(identity.certFile, identity.keyFile);
    } catch (const std::runtime_error& ex) {
      throw ApiRestError(ApiRestErrc::TlsBootstrapFailed, ex.what());
    }
  }

  if (!config->authEnabled()) {
    log::warn("api.rest.username and/or api.rest.password parameters are empty, authentication is disabled.");
  }

  // Routes and gate are rebuilt from scratch at each start.
  auto gate = std::make_shared<const DispatchGate>(config, std::make_shared<const RouteTable>());

  try {
    return std::make_unique<HttpListener>(std::move(gate), _handlers, _events, std::move(tlsContext), _handlerTracker,
                                          _options.listenerOptions);
  } catch (const std::invalid_argument& ex) {
    throw ApiRestError(ApiRestErrc::BindFailed, ex.what());
  } catch (const std::system_error& ex) {
    throw ApiRestError(ApiRestErrc::BindFailed, ex.what());
  }
}

void ApiRestModule::start() {
  std::scoped_lock lock(_transitionMutex);
  State expected = State::Idle;
  if (!_state.compare_exchange_strong(expected, State::Starting, std::memory_order_acq_rel)) {
    throw ApiRestError(ApiRestErrc::AlreadyStarted, std::format("{} is already started", kName));
  }

  try {
    _listener = configure();

    _quit.arm();
    _fault.clear();
    _port.store(_listener->port(), std::memory_order_release);
    _tls.store(_listener->isTls(), std::memory_order_release);
    _state.store(State::Running, std::memory_order_release);

    log::info("api server starting on {}://{}:{}", _listener->isTls() ? "https" : "http",
              _listener->config().address, _listener->port());

    _thread = std::jthread([this, listener = _listener.get()] {
      try {
        listener->run();
      } catch (const std::exception& ex) {
        _fault.raise(std::current_exception(), ex.what());
      }
    });
  } catch (const std::exception&) {
    _listener.reset();
    _port.store(0, std::memory_order_release);
    _tls.store(false, std::memory_order_release);
    _state.store(State::Idle, std::memory_order_release);
    throw;
  }
}

bool ApiRestModule::stop() {
  std::scoped_lock lock(_transitionMutex);
  State expected = State::Running;
  if (!_state.compare_exchange_strong(expected, State::Stopping, std::memory_order_acq_rel)) {
    return false;
  }

  // Observers of the quit signal are notified before the listener socket is closed.
  _quit.notify();

  _listener->beginDrain(_options.shutdownTimeout);
  if (_thread.joinable()) {
    _thread.join();
  }
  _listener.reset();

  _port.store(0, std::memory_order_release);
  _tls.store(false, std::memory_order_release);
  _state.store(State::Idle, std::memory_order_release);
  log::info("api server stopped");
  return true;
}

}  // namespace apirest
