#include "apirest/http-listener.hpp"

#include <sys/socket.h>

#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <exception>
#include <iterator>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include "apirest/base-fd.hpp"
#include "apirest/dispatch-gate.hpp"
#include "apirest/event-loop.hpp"
#include "apirest/event-source.hpp"
#include "apirest/event.hpp"
#include "apirest/http-method.hpp"
#include "apirest/http-parser.hpp"
#include "apirest/http-request.hpp"
#include "apirest/http-response.hpp"
#include "apirest/http-status-code.hpp"
#include "apirest/log.hpp"
#include "apirest/resource-handlers.hpp"
#include "apirest/socket-ops.hpp"
#include "apirest/socket.hpp"
#include "apirest/stream-selector.hpp"
#include "apirest/timedef.hpp"
#include "apirest/tls-context.hpp"
#include "apirest/tls-transport.hpp"
#include "apirest/transport.hpp"
#include "apirest/websocket-constants.hpp"
#include "apirest/websocket-frame.hpp"

namespace apirest {

namespace {

constexpr std::size_t kReadChunkSize = 16UL * 1024UL;

bool UseWebsocket(const std::shared_ptr<const DispatchGate>& gate) {
  if (!gate) {
    throw std::invalid_argument("HttpListener requires a dispatch gate");
  }
  return gate->config().useWebsocket;
}

// Unregisters a handler thread from its tracker when destroyed. Owned by the thread callable, so that a thread which
// fails to start is unregistered as well.
class TrackedHandler {
 public:
  explicit TrackedHandler(std::shared_ptr<internal::HandlerTracker> tracker) noexcept : _tracker(std::move(tracker)) {}

  TrackedHandler(const TrackedHandler&) = delete;
  TrackedHandler(TrackedHandler&&) noexcept = default;
  TrackedHandler& operator=(const TrackedHandler&) = delete;
  TrackedHandler& operator=(TrackedHandler&&) = delete;

  ~TrackedHandler() {
    if (_tracker) {
      _tracker->leave();
    }
  }

 private:
  std::shared_ptr<internal::HandlerTracker> _tracker;
};

}  // namespace

void HttpListener::Mailbox::postCompletion(Completion completion) {
  {
    std::scoped_lock lock(mutex);
    completions.push_back(std::move(completion));
  }
  eventFd.send();
}

void HttpListener::Mailbox::postPush(Push push) {
  {
    std::scoped_lock lock(mutex);
    pushes.push_back(std::move(push));
  }
  eventFd.send();
}

HttpListener::HttpListener(std::shared_ptr<const DispatchGate> gate, std::shared_ptr<ResourceHandlers> handlers,
                           std::shared_ptr<EventSource> events, std::shared_ptr<const TlsContext> tlsContext,
                           std::shared_ptr<internal::HandlerTracker> handlerTracker, HttpListenerOptions options)
    : _gate(std::move(gate)),
      _handlers(std::move(handlers)),
      _events(std::move(events)),
      _tlsContext(std::move(tlsContext)),
      _handlerTracker(std::move(handlerTracker)),
      _options(std::move(options)),
      _selector(UseWebsocket(_gate)),
      _listenSocket(Socket::Type::StreamNonBlock),
      _port(_gate->config().port),
      _eventLoop(_options.pollInterval),
      _mailbox(std::make_shared<Mailbox>()),
      _readBuffer(kReadChunkSize, '\0') {
  if (!_handlers) {
    throw std::invalid_argument("HttpListener requires resource handlers");
  }
  if (!_handlerTracker) {
    throw std::invalid_argument("HttpListener requires a handler tracker");
  }

  _listenSocket.bindAndListen(_gate->config().address, _port);

  _eventLoop.addOrThrow(EventLoop::EventFd{EventIn, _listenSocket.fd()});
  _eventLoop.addOrThrow(EventLoop::EventFd{EventIn, _lifecycle.wakeupFd.fd()});
  _eventLoop.addOrThrow(EventLoop::EventFd{EventIn, _mailbox->eventFd.fd()});
}

HttpListener::~HttpListener() {
  closeAllConnections();
  closeListener();
}

void HttpListener::run() {
  if (!_lifecycle.isIdle()) {
    throw std::logic_error("HttpListener is already running");
  }
  if (!_listenSocket) {
    throw std::logic_error("HttpListener cannot be run again once drained");
  }
  _lifecycle.enterRunning();
  try {
    while (!_lifecycle.isIdle()) {
      eventLoopIteration();
    }
  } catch (const std::exception&) {
    closeAllConnections();
    closeListener();
    _lifecycle.reset();
    throw;
  }
  closeListener();
}

void HttpListener::beginDrain(std::chrono::milliseconds maxWait) noexcept { _lifecycle.requestDrain(maxWait); }

void HttpListener::eventLoopIteration() {
  if (_options.iterationHook) {
    _options.iterationHook();
  }

  const bool wasDraining = _lifecycle.isDraining();
  if (_lifecycle.applyDrainRequest() && !wasDraining) {
    startDrain();
  }

  const auto events = _eventLoop.poll();
  for (const auto event : events) {
    const int fd = event.fd;
    if (fd == _listenSocket.fd()) {
      acceptNewConnections();
    } else if (fd == _lifecycle.wakeupFd.fd()) {
      _lifecycle.wakeupFd.read();
    } else if (fd == _mailbox->eventFd.fd()) {
      _mailbox->eventFd.read();
      processMailbox();
    } else {
      const auto bmp = event.eventBmp;
      if ((bmp & EventOut) != 0) {
        handleWritable(fd);
      }
      // EPOLLERR/EPOLLHUP/EPOLLRDHUP can be delivered without EPOLLIN, treat them as a read trigger.
      if ((bmp & (EventIn | EventErr | EventHup | EventRdHup)) != 0) {
        handleReadable(fd, bmp);
      }
    }
  }

  maintenance();
}

void HttpListener::acceptNewConnections() {
  while (_listenSocket) {
    const int cnxFd = ::accept4(_listenSocket.fd(), nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (cnxFd == -1) {
      const auto err = errno;
      if (err == EINTR || err == ECONNABORTED) {
        continue;
      }
      if (err != EAGAIN) {
        log::error("accept failed on fd # {} err={}: {}", _listenSocket.fd(), err, std::strerror(err));
      }
      break;
    }
    BaseFd fd(cnxFd);
    if (!SetTcpNoDelay(cnxFd)) {
      const auto err = errno;
      log::error("setsockopt(TCP_NODELAY) failed for fd # {} err={} ({})", cnxFd, err, std::strerror(err));
    }

    Connection cnx;
    cnx.id = _nextConnectionId++;
    if (_tlsContext) {
      try {
        cnx.transport = std::make_unique<TlsTransport>(_tlsContext->newServerSsl(cnxFd));
      } catch (const std::runtime_error& ex) {
        log::error("TLS setup failed for fd # {}: {}", cnxFd, ex.what());
        continue;
      }
    } else {
      cnx.transport = std::make_unique<PlainTransport>(cnxFd);
    }
    if (!_eventLoop.add(EventLoop::EventFd{EventIn | EventRdHup, cnxFd})) {
      continue;
    }
    cnx.fd = std::move(fd);
    cnx.lastActivity = SteadyClock::now();
    _connections.emplace(cnxFd, std::move(cnx));
    _nbConnections.store(_connections.size(), std::memory_order_relaxed);
    log::debug("connection fd # {} accepted", cnxFd);
  }
}

void HttpListener::handleReadable(int fd, EventBmp eventBmp) {
  auto cnxIt = _connections.find(fd);
  if (cnxIt == _connections.end()) {
    return;
  }
  Connection& cnx = cnxIt->second;
  if (cnx.peerClosed || cnx.phase == Connection::Phase::Processing) {
    // Only hang-ups are monitored here: pending input stays in the socket until the response is sent.
    if ((eventBmp & (EventErr | EventHup)) != 0) {
      closeConnection(cnxIt);
    } else if ((eventBmp & EventRdHup) != 0 && !cnx.peerClosed) {
      // half-closed by the peer, the request being processed still gets its response
      cnx.peerClosed = true;
      cnx.closeAfterWrite = true;
      updateInterest(cnx);
    }
    return;
  }

  // input left over by a previous request
  if (!processInput(cnxIt)) {
    return;
  }
  while (cnx.phase != Connection::Phase::Processing) {
    const auto [bytesRead, want] = cnx.transport->read(_readBuffer.data(), _readBuffer.size());
    if (want == TransportHint::Error || (bytesRead == 0 && want == TransportHint::None)) {
      closeConnection(cnxIt);
      return;
    }
    if (bytesRead == 0) {
      if (want == TransportHint::WriteReady) {
        updateWriteInterest(cnx, true);
      }
      break;
    }
    cnx.lastActivity = SteadyClock::now();
    if (cnx.closeAfterWrite) {
      // the last response is queued, anything else is discarded
      continue;
    }
    cnx.inBuffer.append(_readBuffer.data(), bytesRead);
    if (!processInput(cnxIt)) {
      return;
    }
  }
}

void HttpListener::handleWritable(int fd) {
  auto cnxIt = _connections.find(fd);
  if (cnxIt == _connections.end()) {
    return;
  }
  Connection& cnx = cnxIt->second;
  if (!cnx.transport->handshakeDone()) {
    // the TLS handshake wanted to write, resume it through the read path
    updateWriteInterest(cnx, !cnx.outBuffer.empty());
    handleReadable(fd, EventIn);
    return;
  }
  flushOutput(cnxIt);
}

bool HttpListener::processInput(ConnectionIt cnxIt) {
  Connection& cnx = cnxIt->second;
  switch (cnx.phase) {
    case Connection::Phase::Http: {
      if (!processHttpInput(cnxIt)) {
        return false;
      }
      const auto maxBuffered = _options.parserLimits.maxHeaderBytes + _options.parserLimits.maxBodyBytes;
      if (cnx.phase == Connection::Phase::Http && !cnx.closeAfterWrite && cnx.inBuffer.size() > maxBuffered) {
        return rejectInput(cnxIt, http::StatusCodePayloadTooLarge, "request too large");
      }
      return true;
    }
    case Connection::Phase::WebSocket:
      return processWebSocketInput(cnxIt);
    default:
      return true;
  }
}

bool HttpListener::rejectInput(ConnectionIt cnxIt, http::StatusCode status, std::string_view reason) {
  Connection& cnx = cnxIt->second;
  log::debug("rejecting input of fd # {} with {}: {}", cnxIt->first, status, reason);
  HttpResponse response(status, std::string(reason) + '\n');
  queueOutput(cnx, response.serialize(true));
  cnx.closeAfterWrite = true;
  cnx.inBuffer.clear();
  return flushOutput(cnxIt);
}

bool HttpListener::processHttpInput(ConnectionIt cnxIt) {
  Connection& cnx = cnxIt->second;
  while (cnx.phase == Connection::Phase::Http && !cnx.closeAfterWrite && !cnx.inBuffer.empty()) {
    auto result = ParseHttpRequest(cnx.inBuffer, _options.parserLimits);
    if (result.status == HttpParseResult::Status::Incomplete) {
      return true;
    }
    if (result.status == HttpParseResult::Status::Error) {
      return rejectInput(cnxIt, result.errorStatus, result.errorReason);
    }
    cnx.inBuffer.erase(0, result.bytesConsumed);
    if (!dispatchRequest(cnxIt, std::move(result.request))) {
      return false;
    }
  }
  if (cnx.phase == Connection::Phase::WebSocket && !cnx.inBuffer.empty()) {
    return processWebSocketInput(cnxIt);
  }
  return true;
}

bool HttpListener::dispatchRequest(ConnectionIt cnxIt, HttpRequest request) {
  Connection& cnx = cnxIt->second;
  const bool closeConnection = !request.keepAlive() || !_lifecycle.isRunning();
  const bool headRequest = request.method() == http::Method::HEAD;

  const auto admission = _gate->admit(request);
  if (admission.decision != DispatchGate::Decision::Proceed) {
    // Short-circuit answers do not involve any handler, the reactor writes them directly.
    queueOutput(cnx, _gate->rejection(admission.decision).serialize(closeConnection, headRequest));
    cnx.closeAfterWrite = closeConnection;
    return flushOutput(cnxIt);
  }
  if (_selector.select(*admission.match) == StreamSelector::Channel::WebSocket) {
    return upgradeToWebSocket(cnxIt, request);
  }

  if (!_handlerTracker->tryEnter(_options.maxConcurrentHandlers)) {
    log::warn("{} handlers already running, rejecting {}", _options.maxConcurrentHandlers, request.path());
    return serviceUnavailable(cnxIt, headRequest);
  }
  cnx.phase = Connection::Phase::Processing;
  try {
    std::thread([tracked = TrackedHandler(_handlerTracker), gate = _gate, handlers = _handlers, mailbox = _mailbox,
                 fd = cnxIt->first, cnxId = cnx.id, request = std::move(request), closeConnection, headRequest]() {
      std::string data;
      try {
        data = gate->dispatch(request, *handlers).serialize(closeConnection, headRequest);
      } catch (const std::exception& ex) {
        log::error("unable to produce a response for {}: {}", request.path(), ex.what());
        HttpResponse response(http::StatusCodeInternalServerError, "Internal Server Error\n");
        gate->decorate(response);
        data = response.serialize(closeConnection, headRequest);
      }
      mailbox->postCompletion({fd, cnxId, std::move(data), closeConnection});
    }).detach();
  } catch (const std::system_error& ex) {
    log::error("unable to start a handler thread: {}", ex.what());
    cnx.phase = Connection::Phase::Http;
    return serviceUnavailable(cnxIt, headRequest);
  }
  // stop reading until the response is sent
  updateInterest(cnx);
  return true;
}

bool HttpListener::serviceUnavailable(ConnectionIt cnxIt, bool headRequest) {
  Connection& cnx = cnxIt->second;
  HttpResponse response(http::StatusCodeServiceUnavailable, "Service Unavailable\n");
  _gate->decorate(response);
  queueOutput(cnx, response.serialize(true, headRequest));
  cnx.closeAfterWrite = true;
  return flushOutput(cnxIt);
}

bool HttpListener::upgradeToWebSocket(ConnectionIt cnxIt, const HttpRequest& request) {
  Connection& cnx = cnxIt->second;
  auto negotiation = StreamSelector::negotiate(request);
  HttpResponse& response = negotiation.response;
  if (negotiation.accepted && !_lifecycle.isRunning()) {
    response = HttpResponse(http::StatusCodeServiceUnavailable, "Service Unavailable\n");
    negotiation.accepted = false;
  }
  _gate->decorate(response);
  if (!negotiation.accepted) {
    queueOutput(cnx, response.serialize(true));
    cnx.closeAfterWrite = true;
    return flushOutput(cnxIt);
  }

  queueOutput(cnx, response.serialize(false));
  cnx.phase = Connection::Phase::WebSocket;
  if (_events) {
    cnx.subscription = _events->subscribe(
        [mailbox = _mailbox, fd = cnxIt->first, cnxId = cnx.id](const Event& event) {
          mailbox->postPush({fd, cnxId, event.payload});
        });
    cnx.subscribed = true;
  }
  log::debug("websocket channel established on fd # {}", cnxIt->first);
  return flushOutput(cnxIt);
}

bool HttpListener::processWebSocketInput(ConnectionIt cnxIt) {
  Connection& cnx = cnxIt->second;
  while (!cnx.inBuffer.empty() && !cnx.closeAfterWrite) {
    auto frame = websocket::ParseFrame(cnx.inBuffer, _options.maxWebSocketPayload, true);
    switch (frame.status) {
      case websocket::FrameParseResult::Status::Incomplete:
        return true;
      case websocket::FrameParseResult::Status::ProtocolError:
        log::debug("websocket protocol error on fd # {}: {}", cnxIt->first, frame.errorMessage);
        return closeWebSocket(cnxIt, websocket::CloseCode::ProtocolError, frame.errorMessage);
      case websocket::FrameParseResult::Status::PayloadTooLarge:
        return closeWebSocket(cnxIt, websocket::CloseCode::MessageTooBig, frame.errorMessage);
      default:
        break;
    }
    cnx.inBuffer.erase(0, frame.bytesConsumed);
    switch (frame.header.opcode) {
      case websocket::Opcode::Ping: {
        std::string pong;
        websocket::BuildFrame(pong, websocket::Opcode::Pong, frame.payload);
        queueOutput(cnx, pong);
        if (!flushOutput(cnxIt)) {
          return false;
        }
        break;
      }
      case websocket::Opcode::Close:
        return closeWebSocket(cnxIt, websocket::CloseReplyCode(frame.payload), {});
      default:
        // data sent by clients on the events channel is ignored
        break;
    }
  }
  return true;
}

bool HttpListener::closeWebSocket(ConnectionIt cnxIt, websocket::CloseCode code, std::string_view reason) {
  Connection& cnx = cnxIt->second;
  if (cnx.subscribed) {
    _events->unsubscribe(cnx.subscription);
    cnx.subscribed = false;
  }
  if (!cnx.closeFrameSent) {
    std::string closeFrame;
    websocket::BuildCloseFrame(closeFrame, code, reason);
    queueOutput(cnx, closeFrame);
    cnx.closeFrameSent = true;
  }
  cnx.inBuffer.clear();
  cnx.closeAfterWrite = true;
  return flushOutput(cnxIt);
}

void HttpListener::processMailbox() {
  std::vector<Mailbox::Completion> completions;
  std::vector<Mailbox::Push> pushes;
  {
    std::scoped_lock lock(_mailbox->mutex);
    completions.swap(_mailbox->completions);
    pushes.swap(_mailbox->pushes);
  }

  for (auto& completion : completions) {
    auto cnxIt = _connections.find(completion.fd);
    if (cnxIt == _connections.end() || cnxIt->second.id != completion.cnxId) {
      // connection closed (forced drain or peer reset) before the handler returned
      continue;
    }
    Connection& cnx = cnxIt->second;
    cnx.phase = Connection::Phase::Http;
    cnx.closeAfterWrite = cnx.closeAfterWrite || completion.closeAfterWrite || !_lifecycle.isRunning();
    cnx.lastActivity = SteadyClock::now();
    updateInterest(cnx);
    queueOutput(cnx, completion.data);
    if (flushOutput(cnxIt) && !cnx.closeAfterWrite) {
      // resume reading (TLS may hold already decrypted data that epoll will not report)
      handleReadable(completion.fd, EventIn);
    }
  }

  for (auto& push : pushes) {
    auto cnxIt = _connections.find(push.fd);
    if (cnxIt == _connections.end() || cnxIt->second.id != push.cnxId ||
        cnxIt->second.phase != Connection::Phase::WebSocket || cnxIt->second.closeFrameSent) {
      continue;
    }
    std::string frame;
    websocket::BuildFrame(frame, websocket::Opcode::Text, push.payload);
    queueOutput(cnxIt->second, frame);
    flushOutput(cnxIt);
  }
}

void HttpListener::maintenance() {
  const auto now = SteadyClock::now();
  if (_lifecycle.isDraining()) {
    if (_connections.empty()) {
      log::debug("api server drained");
      _lifecycle.reset();
    } else if (now >= _lifecycle.deadline()) {
      log::warn("Drain deadline reached with {} active connection(s); forcing close", _connections.size());
      closeAllConnections();
      _lifecycle.reset();
    }
    return;
  }

  for (auto cnxIt = _connections.begin(); cnxIt != _connections.end();) {
    const Connection& cnx = cnxIt->second;
    if (cnx.phase == Connection::Phase::Http && cnx.outBuffer.empty() &&
        now - cnx.lastActivity > _options.keepAliveTimeout) {
      log::debug("closing idle connection fd # {}", cnxIt->first);
      cnxIt = closeConnection(cnxIt);
    } else {
      ++cnxIt;
    }
  }
}

void HttpListener::queueOutput(Connection& cnx, std::string_view data) { cnx.outBuffer.append(data); }

bool HttpListener::flushOutput(ConnectionIt cnxIt) {
  Connection& cnx = cnxIt->second;
  while (!cnx.outBuffer.empty()) {
    const auto [bytesWritten, want] = cnx.transport->write(cnx.outBuffer);
    cnx.outBuffer.erase(0, bytesWritten);
    if (want == TransportHint::Error) {
      closeConnection(cnxIt);
      return false;
    }
    if (want == TransportHint::WriteReady) {
      updateWriteInterest(cnx, true);
      return true;
    }
    if (want == TransportHint::ReadReady || bytesWritten == 0) {
      // TLS needs to read first (handshake), retried on next readable event
      return true;
    }
  }
  updateWriteInterest(cnx, false);
  if (cnx.closeAfterWrite) {
    closeConnection(cnxIt);
    return false;
  }
  return true;
}

void HttpListener::updateWriteInterest(Connection& cnx, bool enable) {
  if (cnx.writeInterest != enable) {
    cnx.writeInterest = enable;
    updateInterest(cnx);
  }
}

void HttpListener::updateInterest(Connection& cnx) {
  EventBmp bmp = 0;
  if (!cnx.peerClosed) {
    bmp = cnx.phase == Connection::Phase::Processing ? EventRdHup : (EventIn | EventRdHup);
  }
  if (cnx.writeInterest) {
    bmp |= EventOut;
  }
  if (!_eventLoop.mod(EventLoop::EventFd{bmp, cnx.fd.fd()})) {
    // cannot be monitored anymore, let the drain or the next write error close it
    cnx.closeAfterWrite = true;
  }
}

void HttpListener::startDrain() {
  log::info("Initiating graceful drain (connections={})", _connections.size());
  closeListener();
  for (auto cnxIt = _connections.begin(); cnxIt != _connections.end();) {
    Connection& cnx = cnxIt->second;
    auto nextIt = std::next(cnxIt);
    switch (cnx.phase) {
      case Connection::Phase::Http:
        if (cnx.outBuffer.empty()) {
          // idle keep-alive connection
          closeConnection(cnxIt);
        } else {
          cnx.closeAfterWrite = true;
        }
        break;
      case Connection::Phase::Processing:
        cnx.closeAfterWrite = true;
        break;
      case Connection::Phase::WebSocket:
        closeWebSocket(cnxIt, websocket::CloseCode::GoingAway, "server shutdown");
        break;
      default:
        break;
    }
    cnxIt = nextIt;
  }
}

void HttpListener::closeListener() noexcept {
  if (_listenSocket) {
    _eventLoop.del(_listenSocket.fd());
    _listenSocket.close();
  }
}

HttpListener::ConnectionIt HttpListener::closeConnection(ConnectionIt cnxIt) {
  Connection& cnx = cnxIt->second;
  if (cnx.subscribed) {
    _events->unsubscribe(cnx.subscription);
    cnx.subscribed = false;
  }
  if (auto* tlsTransport = dynamic_cast<TlsTransport*>(cnx.transport.get()); tlsTransport != nullptr) {
    tlsTransport->shutdown();
  }
  const int fd = cnxIt->first;
  _eventLoop.del(fd);
  log::debug("connection fd # {} closed", fd);
  auto nextIt = _connections.erase(cnxIt);
  _nbConnections.store(_connections.size(), std::memory_order_relaxed);
  return nextIt;
}

void HttpListener::closeAllConnections() {
  for (auto cnxIt = _connections.begin(); cnxIt != _connections.end();) {
    cnxIt = closeConnection(cnxIt);
  }
}

}  // namespace apirest
